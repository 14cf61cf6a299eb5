#ifndef INCLUDE_CODEJUDGE_LOGGER_H_
#define INCLUDE_CODEJUDGE_LOGGER_H_

// Keep the console sink usable in children forked by the sandbox launcher.
// Call once from the main thread before starting any worker.
void InitLogger();

#endif  // INCLUDE_CODEJUDGE_LOGGER_H_
