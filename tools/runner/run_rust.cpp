#include "runner.h"

namespace {

std::vector<std::string> Compile(const RunContext& ctx) {
  return {"rustc", "-O", "-o", ctx.stem, ctx.source};
}

std::vector<std::string> Execute(const RunContext& ctx) {
  return {"./" + ctx.stem};
}

std::string Executable(const RunContext& ctx) { return ctx.stem; }

const LanguageSpec kSpec = {
  "Rust", {".rs"}, true, 30,
  Compile, Execute, Executable,
  true, 32, {},
  {"Compiler: rustc -O"},
};

} // namespace

int main(int argc, char** argv) {
  return RunnerMain(argc, argv, kSpec);
}
