#ifndef INCLUDE_CODEJUDGE_PATHS_H_
#define INCLUDE_CODEJUDGE_PATHS_H_

#include <filesystem>

#include "submission.h"

namespace fs = std::filesystem;

extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
// holds sandbox-exec and the language runners
extern fs::path kDataDir;

} // internal

fs::path RunnerPath(Language lang);
fs::path SandboxExecPath();

#endif  // INCLUDE_CODEJUDGE_PATHS_H_
