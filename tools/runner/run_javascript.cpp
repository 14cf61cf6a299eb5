#include "runner.h"

#include <fmt/format.h>

namespace {

std::vector<std::string> Check(const RunContext& ctx) {
  return {"node", "--check", ctx.source};
}

std::vector<std::string> Execute(const RunContext& ctx) {
  return {"node", fmt::format("--max-old-space-size={}", ctx.memory_limit), ctx.source};
}

const LanguageSpec kSpec = {
  "JavaScript", {".js"}, false, 10,
  Check, Execute, nullptr,
  false, 4096, {},
  {"Interpreter: node"},
};

} // namespace

int main(int argc, char** argv) {
  return RunnerMain(argc, argv, kSpec);
}
