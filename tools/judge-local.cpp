#include <unistd.h>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <codejudge/judge.h>
#include <codejudge/utils.h>
#include <codejudge/logger.h>
#include <codejudge/executor.h>

namespace fs = std::filesystem;

namespace {

struct LocalProblem {
  ProblemLimits limits;
  std::vector<TestCase> test_cases;
};

std::string ReadAll(const fs::path& path) {
  std::ifstream fin(path);
  if (!fin) throw std::runtime_error("Cannot open " + path.string());
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}

LocalProblem ParseProblem(const std::string& text) {
  using nlohmann::json;
  json data = json::parse(text);
  LocalProblem ret;
  ret.limits.time_limit = data.value("time_limit", ret.limits.time_limit);
  ret.limits.memory_limit = data.value("memory_limit", ret.limits.memory_limit);
  if (data.contains("compare")) {
    auto mode = ParseCompareMode(data["compare"].get<std::string>());
    if (!mode) throw std::runtime_error("Unknown compare mode");
    ret.limits.compare_mode = *mode;
  }
  long id = 0;
  for (auto& i : data.at("test_cases")) {
    ret.test_cases.emplace_back(++id, 0, i.at("input").get<std::string>(),
                                i.at("expected_output").get<std::string>(),
                                i.value("hidden", false));
  }
  return ret;
}

nlohmann::json ResultJSON(const JudgeResult& res) {
  nlohmann::json cases = nlohmann::json::array();
  for (auto& i : res.outcomes) {
    cases.push_back({
      {"passed", i.passed},
      {"verdict", StatusName(OutcomeVerdict(i))},
      {"time", i.time_ms},
      {"memory", i.memory_kib},
      {"exit_code", i.exit_code},
      {"message", i.message},
    });
  }
  return {
    {"verdict", StatusName(res.verdict)},
    {"score", res.score},
    {"time", res.max_time_ms},
    {"memory", res.max_memory_kib},
    {"message", res.message},
    {"skipped", res.skipped},
    {"test_cases", cases},
  };
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "codejudge-local");
  parser.add_argument("--problem")
    .required()
    .help("JSON file with the limits and test cases");
  parser.add_argument("--source")
    .required()
    .help("Source file to judge");
  parser.add_argument("--language")
    .required()
    .help("Language of the source file (C, CPP, JAVA, PYTHON, JAVASCRIPT, GO, RUST)");
  parser.add_argument("--max-score")
    .default_value(100)
    .scan<'d', int>()
    .help("Score of an accepted submission");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  if (geteuid() != 0) {
    spdlog::error("Must be run as root.");
    return 1;
  }

  auto lang = ParseLanguage(parser.get<std::string>("--language"));
  if (!lang) {
    spdlog::error("Unknown language {}", parser.get<std::string>("--language"));
    return 1;
  }
  LocalProblem problem;
  Submission sub;
  try {
    problem = ParseProblem(ReadAll(parser.get<std::string>("--problem")));
    sub.code = ReadAll(parser.get<std::string>("--source"));
  } catch (const nlohmann::json::exception& err) {
    spdlog::error("Invalid problem file: {}", err.what());
    return 1;
  } catch (const std::exception& err) {
    spdlog::error("{}", err.what());
    return 1;
  }
  sub.language = *lang;

  SandboxedExecutor executor;
  if (!executor.Supports(*lang)) {
    spdlog::error("Runner for {} is not installed", LanguageName(*lang));
    return 1;
  }
  Judge judge(executor, parser.get<int>("--max-score"));
  JudgeResult res;
  try {
    res = judge.Run(sub, problem.test_cases, problem.limits);
  } catch (const std::exception& err) {
    spdlog::error("Judging failed: {}", err.what());
    return 1;
  }
  std::cout << ResultJSON(res).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  return res.verdict == SubmissionStatus::ACCEPTED ? 0 : 2;
}
