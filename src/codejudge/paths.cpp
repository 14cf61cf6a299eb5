#include "paths.h"

#include <codejudge/utils.h>

fs::path kBoxRoot = "/tmp/codejudge_box";

namespace internal {
fs::path kDataDir = fs::path(CODEJUDGE_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path RunnerPath(Language lang) {
  return internal::kDataDir / LanguageRunnerName(lang);
}

fs::path SandboxExecPath() {
  return internal::kDataDir / "sandbox-exec";
}

fs::path ExecutionBoxPath(long id) {
  return kBoxRoot / PadInt(id, 8);
}
fs::path ExecutionBoxSource(long id, Language lang, bool inside_box) {
  return Workdir(BoxRoot(ExecutionBoxPath(id), inside_box)) / LanguageSourceName(lang);
}
fs::path ExecutionBoxInput(long id, bool inside_box) {
  return Workdir(BoxRoot(ExecutionBoxPath(id), inside_box)) / "input.txt";
}
fs::path ExecutionBoxReport(long id, bool inside_box) {
  return Workdir(BoxRoot(ExecutionBoxPath(id), inside_box)) / "report";
}
fs::path ExecutionBoxRunnerError(long id, bool inside_box) {
  return Workdir(BoxRoot(ExecutionBoxPath(id), inside_box)) / "runner_error";
}
