#ifndef CODEJUDGE_PATHS_H_
#define CODEJUDGE_PATHS_H_

#include <codejudge/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// for sandbox
// if inside_box = true, id is not used and the path is the one seen by the runner
fs::path ExecutionBoxPath(long id);
fs::path ExecutionBoxSource(long id, Language lang, bool inside_box = false);
fs::path ExecutionBoxInput(long id, bool inside_box = false);
fs::path ExecutionBoxReport(long id, bool inside_box = false);
fs::path ExecutionBoxRunnerError(long id, bool inside_box = false);

#endif  // CODEJUDGE_PATHS_H_
