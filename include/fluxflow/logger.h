#ifndef INCLUDE_FLUXFLOW_LOGGER_H_
#define INCLUDE_FLUXFLOW_LOGGER_H_

// Must be called before any worker thread forks a sandboxed child
void InitLogger();

#endif  // INCLUDE_FLUXFLOW_LOGGER_H_
