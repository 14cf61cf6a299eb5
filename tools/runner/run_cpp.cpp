#include "runner.h"

namespace {

std::vector<std::string> Compile(const RunContext& ctx) {
  return {"g++", "-std=c++17", "-O2", "-static", "-o", ctx.stem, ctx.source, "-lm"};
}

std::vector<std::string> Execute(const RunContext& ctx) {
  return {"./" + ctx.stem};
}

std::string Executable(const RunContext& ctx) { return ctx.stem; }

const LanguageSpec kSpec = {
  "C++", {".cpp", ".cc", ".cxx"}, true, 30,
  Compile, Execute, Executable,
  true, 32, {},
  {"Compiler: g++", "Standard: -std=c++17"},
};

} // namespace

int main(int argc, char** argv) {
  return RunnerMain(argc, argv, kSpec);
}
