#include "runner.h"

namespace {

std::vector<std::string> Compile(const RunContext& ctx) {
  return {"gcc", "-std=c11", "-O2", "-static", "-o", ctx.stem, ctx.source, "-lm"};
}

std::vector<std::string> Execute(const RunContext& ctx) {
  return {"./" + ctx.stem};
}

std::string Executable(const RunContext& ctx) { return ctx.stem; }

const LanguageSpec kSpec = {
  "C", {".c"}, true, 30,
  Compile, Execute, Executable,
  true, 32, {},
  {"Compiler: gcc", "Standard: -std=c11"},
};

} // namespace

int main(int argc, char** argv) {
  return RunnerMain(argc, argv, kSpec);
}
