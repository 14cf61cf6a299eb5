#include "runner.h"

#include <fmt/format.h>

namespace {

std::vector<std::string> Compile(const RunContext& ctx) {
  return {"javac", "-cp", ".", ctx.source};
}

// the class name is the file name
std::vector<std::string> Execute(const RunContext& ctx) {
  return {"java", fmt::format("-Xmx{}m", ctx.memory_limit), "-XX:+UseSerialGC",
          "-XX:MaxMetaspaceSize=64m", "-Djava.awt.headless=true",
          "-Dfile.encoding=UTF-8", "-cp", ".", ctx.stem};
}

std::string ClassFile(const RunContext& ctx) { return ctx.stem + ".class"; }

const LanguageSpec kSpec = {
  "Java", {".java"}, true, 30,
  Compile, Execute, ClassFile,
  false, 4096, {},
  {"Compiler: javac", "Runtime: java -XX:+UseSerialGC"},
};

} // namespace

int main(int argc, char** argv) {
  return RunnerMain(argc, argv, kSpec);
}
