#include <gtest/gtest.h>
#include <codejudge/judge.h>

#include <memory>

#include "utils.h"

namespace {

std::vector<TestCase> TwoSumCases(size_t hidden) {
  std::vector<TestCase> ret;
  ret.emplace_back(1, 1, "4\n2 7 11 15\n9", "0 1");
  for (size_t i = 0; i < hidden; i++) {
    ret.emplace_back(2 + i, 1, "2\n1 " + std::to_string(i) + "\n" + std::to_string(i + 1), "0 1", true);
  }
  return ret;
}

// runs the scripted result of each test case in order
FakeExecutor::Script Sequence(std::vector<ExecutionResult> results) {
  auto idx = std::make_shared<size_t>(0);
  return [results = std::move(results), idx](const FakeExecutor::Call&) {
    return results.at((*idx)++);
  };
}

} // namespace

TEST(VerdictRankTest, Precedence) {
  std::vector<SubmissionStatus> order = {
    SubmissionStatus::ACCEPTED, SubmissionStatus::WRONG_ANSWER, SubmissionStatus::RUNTIME_ERROR,
    SubmissionStatus::MEMORY_LIMIT_EXCEEDED, SubmissionStatus::TIME_LIMIT_EXCEEDED,
    SubmissionStatus::SYSTEM_ERROR, SubmissionStatus::COMPILATION_ERROR,
  };
  for (size_t i = 1; i < order.size(); i++) {
    EXPECT_LT(VerdictRank(order[i - 1]), VerdictRank(order[i]));
  }
  EXPECT_LT(VerdictRank(SubmissionStatus::RUNNING), 0);
}

TEST(JudgeTest, AllPassedIsAccepted) {
  FakeExecutor executor([](const FakeExecutor::Call& call) {
    return OkResult("0 1\n", 10 + call.input.size(), 1000);
  });
  Judge judge(executor, 100);
  Submission sub = MakeSubmission(1, 1, Language::PYTHON, "print('0 1')");
  JudgeResult res = judge.Run(sub, TwoSumCases(3), ProblemLimits(2, 64));
  EXPECT_EQ(res.verdict, SubmissionStatus::ACCEPTED);
  EXPECT_EQ(res.score, 100);
  EXPECT_EQ(res.outcomes.size(), 4);
  EXPECT_EQ(res.skipped, 0);
  EXPECT_EQ(res.max_time_ms, 10 + 13);
  EXPECT_EQ(res.max_memory_kib, 1000);
  EXPECT_EQ(res.message, "All 4 test cases passed successfully");
  EXPECT_EQ(executor.Calls().size(), 4);
}

TEST(JudgeTest, CompilationErrorSkipsRemaining) {
  FakeExecutor executor([](const FakeExecutor::Call&) {
    return FailResult(FailureKind::COMPILATION_ERROR, "solution.cpp:3:1: error: expected '}'");
  });
  Judge judge(executor);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::CPP, "int main() {"), TwoSumCases(2), ProblemLimits());
  EXPECT_EQ(res.verdict, SubmissionStatus::COMPILATION_ERROR);
  EXPECT_EQ(res.score, 0);
  EXPECT_EQ(res.outcomes.size(), 1);
  EXPECT_EQ(res.skipped, 2);
  EXPECT_EQ(res.message, "Compilation error:\nsolution.cpp:3:1: error: expected '}'");
  EXPECT_EQ(executor.Calls().size(), 1);
}

TEST(JudgeTest, SystemErrorOnFirstCaseSkipsRemaining) {
  FakeExecutor executor([](const FakeExecutor::Call&) {
    return FailResult(FailureKind::SYSTEM_ERROR, "Sandbox failed to start");
  });
  Judge judge(executor);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::CPP, ""), TwoSumCases(2), ProblemLimits());
  EXPECT_EQ(res.verdict, SubmissionStatus::SYSTEM_ERROR);
  EXPECT_EQ(res.skipped, 2);
  EXPECT_EQ(res.message, "Passed 0/3 test cases. System error on test case 1\nSandbox failed to start\n"
                         "2 test cases skipped");
}

TEST(JudgeTest, CompilationErrorWinsOverEverything) {
  // a compile failure after the first case is not expected from a real runner, but still decides
  FakeExecutor executor(Sequence({
    OkResult("0 1"),
    FailResult(FailureKind::TIME_LIMIT_EXCEEDED, "Time limit exceeded", 124),
    FailResult(FailureKind::COMPILATION_ERROR, "boom"),
    FailResult(FailureKind::SYSTEM_ERROR, "Sandbox failed to start"),
  }));
  Judge judge(executor);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::CPP, ""), TwoSumCases(3), ProblemLimits());
  EXPECT_EQ(res.verdict, SubmissionStatus::COMPILATION_ERROR);
  EXPECT_EQ(res.score, 0);
  EXPECT_EQ(res.outcomes.size(), 4);
}

TEST(JudgeTest, HighestRankedFirstCaseReported) {
  FakeExecutor executor(Sequence({
    OkResult("0 1"),
    FailResult(FailureKind::RUNTIME_ERROR, "Runtime error (exit code 1)", 1),
    FailResult(FailureKind::TIME_LIMIT_EXCEEDED, "Time limit exceeded", 124),
    FailResult(FailureKind::TIME_LIMIT_EXCEEDED, "Time limit exceeded", 124),
  }));
  Judge judge(executor);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::CPP, ""), TwoSumCases(3), ProblemLimits());
  EXPECT_EQ(res.verdict, SubmissionStatus::TIME_LIMIT_EXCEEDED);
  EXPECT_EQ(res.message, "Passed 1/4 test cases. Time limit exceeded on test case 3 (hidden)");
}

TEST(JudgeTest, WrongAnswerNoPartialCredit) {
  FakeExecutor executor(Sequence({OkResult("0 1"), OkResult("1 0")}));
  Judge judge(executor);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::CPP, ""), TwoSumCases(1), ProblemLimits());
  EXPECT_EQ(res.verdict, SubmissionStatus::WRONG_ANSWER);
  EXPECT_EQ(res.score, 0);
  // the difference of a hidden case is not shown
  EXPECT_EQ(res.message, "Passed 1/2 test cases. Wrong answer on test case 2 (hidden)");
}

TEST(JudgeTest, VisibleWrongAnswerShowsDifference) {
  FakeExecutor executor(Sequence({OkResult("1 0")}));
  Judge judge(executor);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::CPP, ""), TwoSumCases(0), ProblemLimits());
  EXPECT_EQ(res.verdict, SubmissionStatus::WRONG_ANSWER);
  EXPECT_EQ(res.message, "Passed 0/1 test cases. Wrong answer on test case 1\n"
                         "Line 1 differ.\nExpected: 0 1\nGot: 1 0");
}

TEST(JudgeTest, HiddenRuntimeErrorShowsDiagnostic) {
  FakeExecutor executor(Sequence({
    OkResult("0 1"),
    FailResult(FailureKind::RUNTIME_ERROR, "Segmentation fault (exit code 139)", 139),
  }));
  Judge judge(executor);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::C, ""), TwoSumCases(1), ProblemLimits());
  EXPECT_EQ(res.verdict, SubmissionStatus::RUNTIME_ERROR);
  EXPECT_EQ(res.message, "Passed 1/2 test cases. Runtime error on test case 2 (hidden): "
                         "Segmentation fault (exit code 139)");
}

TEST(JudgeTest, NoTestCases) {
  FakeExecutor executor;
  Judge judge(executor);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::CPP, ""), {}, ProblemLimits());
  EXPECT_EQ(res.verdict, SubmissionStatus::SYSTEM_ERROR);
  EXPECT_EQ(res.score, 0);
  EXPECT_TRUE(executor.Calls().empty());
}

TEST(JudgeTest, CustomScoringPolicy) {
  FakeExecutor executor(Sequence({OkResult("0 1"), OkResult("1 0"), OkResult("0 1")}));
  auto by_cases = [](SubmissionStatus, const std::vector<ExecutionOutcome>& outcomes, int max_score) {
    int passed = 0;
    for (auto& i : outcomes) passed += i.passed;
    return max_score * passed / (int)outcomes.size();
  };
  Judge judge(executor, 90, by_cases);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::CPP, ""), TwoSumCases(2), ProblemLimits());
  EXPECT_EQ(res.verdict, SubmissionStatus::WRONG_ANSWER);
  EXPECT_EQ(res.score, 60);
}

TEST(JudgeTest, LongMessageTruncated) {
  FakeExecutor executor([](const FakeExecutor::Call&) {
    return FailResult(FailureKind::COMPILATION_ERROR, std::string(5000, 'e'));
  });
  Judge judge(executor);
  JudgeResult res = judge.Run(MakeSubmission(1, 1, Language::CPP, ""), TwoSumCases(0), ProblemLimits());
  EXPECT_LE(res.message.size(), kMaxResultLength);
  EXPECT_EQ(res.message.substr(res.message.size() - 3), "...");
}
