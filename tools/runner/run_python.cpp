#include "runner.h"

namespace {

std::vector<std::string> Check(const RunContext& ctx) {
  return {"python3", "-m", "py_compile", ctx.source};
}

std::vector<std::string> Execute(const RunContext& ctx) {
  return {"python3", "-B", "-S", "-I", ctx.source};
}

const LanguageSpec kSpec = {
  "Python", {".py"}, false, 10,
  Check, Execute, nullptr,
  true, 32, {"PYTHONDONTWRITEBYTECODE=1", "PYTHONPYCACHEPREFIX=${WORKDIR}/.pycache"},
  {"Interpreter: python3"},
};

} // namespace

int main(int argc, char** argv) {
  return RunnerMain(argc, argv, kSpec);
}
