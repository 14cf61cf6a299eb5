#include "runner.h"

namespace {

std::vector<std::string> Compile(const RunContext& ctx) {
  return {"go", "build", "-o", ctx.stem, ctx.source};
}

std::vector<std::string> Execute(const RunContext& ctx) {
  return {"./" + ctx.stem};
}

std::string Executable(const RunContext& ctx) { return ctx.stem; }

// the go tool needs a writable cache and home
const LanguageSpec kSpec = {
  "Go", {".go"}, true, 30,
  Compile, Execute, Executable,
  false, 4096, {"GOCACHE=${WORKDIR}/.gocache", "HOME=${WORKDIR}", "GO111MODULE=off", "CGO_ENABLED=0"},
  {"Compiler: go build"},
};

} // namespace

int main(int argc, char** argv) {
  return RunnerMain(argc, argv, kSpec);
}
