#ifndef INCLUDE_CODEJUDGE_UTILS_H_
#define INCLUDE_CODEJUDGE_UTILS_H_

#include <string>
#include <optional>

#include "submission.h"

long GetUniqueExecutionId();

const char* LanguageName(Language);
const char* LanguageRunnerName(Language);
const char* LanguageSourceName(Language);
std::optional<Language> ParseLanguage(const std::string&);

const char* StatusName(SubmissionStatus);
const char* StatusToDesc(SubmissionStatus);
std::optional<SubmissionStatus> ParseStatus(const std::string&);

const char* FailureKindName(FailureKind);
// the terminal status a single failing test case stands for
SubmissionStatus FailureKindToStatus(FailureKind);

const char* CompareModeName(CompareMode);
std::optional<CompareMode> ParseCompareMode(const std::string&);

// cut at a UTF-8 character boundary, appending "..." if anything was removed
std::string TruncateMessage(const std::string&, size_t max_len = kMaxResultLength);

#endif  // INCLUDE_CODEJUDGE_UTILS_H_
