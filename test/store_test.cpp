#include <gtest/gtest.h>
#include <codejudge/store.h>
#include <codejudge/utils.h>

namespace {

const std::vector<SubmissionStatus> kAllStatuses = {
#define X(name, str, desc) SubmissionStatus::name,
  ENUM_SUBMISSION_STATUS_
#undef X
};

} // namespace

TEST(TransitionTest, Lifecycle) {
  EXPECT_TRUE(IsValidTransition(SubmissionStatus::PENDING, SubmissionStatus::QUEUED));
  EXPECT_TRUE(IsValidTransition(SubmissionStatus::QUEUED, SubmissionStatus::RUNNING));
  EXPECT_TRUE(IsValidTransition(SubmissionStatus::QUEUED, SubmissionStatus::SYSTEM_ERROR));
  EXPECT_FALSE(IsValidTransition(SubmissionStatus::QUEUED, SubmissionStatus::ACCEPTED));
  EXPECT_FALSE(IsValidTransition(SubmissionStatus::PENDING, SubmissionStatus::RUNNING));
  EXPECT_FALSE(IsValidTransition(SubmissionStatus::RUNNING, SubmissionStatus::RUNNING));
  EXPECT_FALSE(IsValidTransition(SubmissionStatus::RUNNING, SubmissionStatus::QUEUED));
}

TEST(TransitionTest, RunningReachesEveryTerminal) {
  for (auto status : kAllStatuses) {
    EXPECT_EQ(IsValidTransition(SubmissionStatus::RUNNING, status), IsTerminal(status)) << StatusName(status);
  }
}

TEST(TransitionTest, TerminalIsAbsorbing) {
  for (auto from : kAllStatuses) {
    if (!IsTerminal(from)) continue;
    for (auto to : kAllStatuses) {
      EXPECT_FALSE(IsValidTransition(from, to)) << StatusName(from) << " -> " << StatusName(to);
    }
  }
}

TEST(TransitionTest, TerminalSet) {
  EXPECT_FALSE(IsTerminal(SubmissionStatus::PENDING));
  EXPECT_FALSE(IsTerminal(SubmissionStatus::QUEUED));
  EXPECT_FALSE(IsTerminal(SubmissionStatus::RUNNING));
  EXPECT_TRUE(IsTerminal(SubmissionStatus::ACCEPTED));
  EXPECT_TRUE(IsTerminal(SubmissionStatus::PRESENTATION_ERROR));
  EXPECT_TRUE(IsTerminal(SubmissionStatus::SYSTEM_ERROR));
}

TEST(NamesTest, StatusRoundTrip) {
  for (auto status : kAllStatuses) {
    EXPECT_EQ(ParseStatus(StatusName(status)), status);
  }
  EXPECT_FALSE(ParseStatus("AC"));
}

TEST(NamesTest, Languages) {
  EXPECT_EQ(ParseLanguage("CPP"), Language::CPP);
  EXPECT_EQ(ParseLanguage("cpp"), Language::CPP);
  EXPECT_EQ(ParseLanguage("python"), Language::PYTHON);
  EXPECT_EQ(ParseLanguage("JAVASCRIPT"), Language::JAVASCRIPT);
  EXPECT_FALSE(ParseLanguage("COBOL"));
  EXPECT_STREQ(LanguageRunnerName(Language::JAVA), "run-java");
  EXPECT_STREQ(LanguageSourceName(Language::JAVA), "Solution.java");
  EXPECT_STREQ(LanguageSourceName(Language::RUST), "solution.rs");
}

TEST(NamesTest, FailureKinds) {
  EXPECT_EQ(FailureKindToStatus(FailureKind::COMPILATION_ERROR), SubmissionStatus::COMPILATION_ERROR);
  EXPECT_EQ(FailureKindToStatus(FailureKind::TIME_LIMIT_EXCEEDED), SubmissionStatus::TIME_LIMIT_EXCEEDED);
  EXPECT_EQ(FailureKindToStatus(FailureKind::MEMORY_LIMIT_EXCEEDED), SubmissionStatus::MEMORY_LIMIT_EXCEEDED);
  EXPECT_EQ(FailureKindToStatus(FailureKind::RUNTIME_ERROR), SubmissionStatus::RUNTIME_ERROR);
  EXPECT_EQ(FailureKindToStatus(FailureKind::SYSTEM_ERROR), SubmissionStatus::SYSTEM_ERROR);
  EXPECT_EQ(ParseCompareMode("EXACT"), CompareMode::EXACT);
  EXPECT_FALSE(ParseCompareMode("FLOAT"));
}

TEST(TruncateMessageTest, Utf8Boundary) {
  EXPECT_EQ(TruncateMessage("short", 10), "short");
  EXPECT_EQ(TruncateMessage("abcdefghij", 8), "abcde...");
  // "é" is two bytes; cutting inside it drops the whole character
  std::string str = "abcd\xc3\xa9xyz";
  EXPECT_EQ(TruncateMessage(str, 8), "abcd...");
  EXPECT_EQ(TruncateMessage(str + "w", 9), "abcd\xc3\xa9...");
}
