#ifndef INCLUDE_FLUXFLOW_UTILS_H_
#define INCLUDE_FLUXFLOW_UTILS_H_

#include <string>

#include "execution.h"

const char* OutcomeDesc(Outcome);
const char* PhaseName(Phase);

// keep at most max_size UTF-8 characters, cutting between sequences;
// 0 means unlimited
std::string Truncate(std::string&& str, size_t max_size);
std::string ToLower(std::string str);
// number of code points in a UTF-8 string
size_t Utf8Length(const std::string&);

#endif  // INCLUDE_FLUXFLOW_UTILS_H_
