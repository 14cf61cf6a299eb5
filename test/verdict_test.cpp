#include <unistd.h>
#include <gtest/gtest.h>
#include <codejudge/judge.h>
#include <codejudge/paths.h>
#include <codejudge/utils.h>
#include <codejudge/executor.h>

#include "utils.h"

namespace {

struct SubParam {
  std::string name;
  SubmissionStatus verdict;
  Language lang;
  std::string code;
};

std::string ParamName(const ::testing::TestParamInfo<SubParam>& info) {
  return info.param.name;
}

constexpr char kTwoSumPython[] = R"(n = int(input())
nums = list(map(int, input().split()))
target = int(input())
seen = {}
for i, x in enumerate(nums):
    if target - x in seen:
        print(seen[target - x], i)
        break
    seen[x] = i
)";

// correct for the first case only
constexpr char kFirstCaseOnly[] = "input()\ninput()\ninput()\nprint('0 1')\n";

} // namespace

class SandboxVerdict : public ::testing::TestWithParam<SubParam> {
 protected:
  void SetUp() override {
    if (geteuid() != 0) GTEST_SKIP() << "sandbox requires root";
    if (access(SandboxExecPath().c_str(), X_OK) != 0) GTEST_SKIP() << "sandbox-exec not built";
  }
};

TEST_P(SandboxVerdict, TwoSum) {
  auto& param = GetParam();
  SandboxedExecutor executor;
  if (!executor.Supports(param.lang)) GTEST_SKIP() << "runner not built";
  Judge judge(executor, 100);
  Submission sub = MakeSubmission(1, 1, param.lang, param.code);
  std::vector<TestCase> cases = {
    TestCase(1, 1, "4\n2 7 11 15\n9", "0 1"),
    TestCase(2, 1, "3\n3 2 4\n6", "1 2", true),
  };
  JudgeResult res = judge.Run(sub, cases, ProblemLimits(2, 128));
  EXPECT_EQ(res.verdict, param.verdict) << res.message;
  if (param.verdict == SubmissionStatus::ACCEPTED) {
    EXPECT_EQ(res.score, 100);
    EXPECT_GT(res.max_time_ms, 0);
  } else {
    EXPECT_EQ(res.score, 0);
  }
  if (param.verdict == SubmissionStatus::COMPILATION_ERROR) EXPECT_EQ(res.skipped, 1);
  if (param.verdict == SubmissionStatus::TIME_LIMIT_EXCEEDED) EXPECT_GE(res.max_time_ms, 2000);
}

INSTANTIATE_TEST_SUITE_P(Python, SandboxVerdict,
    testing::Values(
      SubParam{"accepted", SubmissionStatus::ACCEPTED, Language::PYTHON, kTwoSumPython},
      SubParam{"wrong_answer", SubmissionStatus::WRONG_ANSWER, Language::PYTHON, kFirstCaseOnly},
      SubParam{"syntax_error", SubmissionStatus::COMPILATION_ERROR, Language::PYTHON, "def main(:\n"},
      SubParam{"time_limit", SubmissionStatus::TIME_LIMIT_EXCEEDED, Language::PYTHON, "while True:\n    pass\n"},
      SubParam{"runtime_error", SubmissionStatus::RUNTIME_ERROR, Language::PYTHON, "raise SystemExit(3)\n"}
    ),
    ParamName);

INSTANTIATE_TEST_SUITE_P(Cpp, SandboxVerdict,
    testing::Values(
      SubParam{"accepted", SubmissionStatus::ACCEPTED, Language::CPP, R"(#include <cstdio>
#include <map>
int main() {
  int n, t; scanf("%d", &n);
  int a[100]; for (int i = 0; i < n; i++) scanf("%d", &a[i]);
  scanf("%d", &t);
  std::map<int, int> seen;
  for (int i = 0; i < n; i++) {
    if (seen.count(t - a[i])) { printf("%d %d\n", seen[t - a[i]], i); return 0; }
    seen[a[i]] = i;
  }
})"},
      SubParam{"compilation_error", SubmissionStatus::COMPILATION_ERROR, Language::CPP, "int main() {\n"},
      SubParam{"memory_limit", SubmissionStatus::MEMORY_LIMIT_EXCEEDED, Language::CPP, R"(#include <cstdlib>
#include <cstring>
int main() { while (true) memset(malloc(65536), 0x1, 65536); })"},
      SubParam{"segfault", SubmissionStatus::RUNTIME_ERROR, Language::CPP, "char* p; int main() { *p = 123; }"}
    ),
    ParamName);

TEST(SandboxExecutorTest, UnsupportedRunner) {
  SandboxedExecutorOptions opt;
  fs::path saved = internal::kDataDir;
  internal::kDataDir = "/nonexistent";
  SandboxedExecutor executor(opt);
  EXPECT_FALSE(executor.Supports(Language::RUST));
  ExecutionResult res = executor.Run(Language::RUST, "fn main() {}", "", 1, 64);
  internal::kDataDir = saved;
  EXPECT_EQ(res.failure, FailureKind::SYSTEM_ERROR);
}
