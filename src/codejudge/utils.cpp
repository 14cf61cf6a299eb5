#include "utils.h"

#include <atomic>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long execution_id_seq = 0;

} // namespace

long GetUniqueExecutionId() {
  return ++execution_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;

static const char* kLanguageNameTable[] = {
#define X(name, str, runner, source) str,
  ENUM_LANGUAGE_
#undef X
};

const char* LanguageName(Language lang) {
  return kLanguageNameTable[(int)lang];
}

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageRunnerName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG4(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageSourceName, Language, ENUM_LANGUAGE_)
#undef X

std::optional<Language> ParseLanguage(const std::string& str) {
  for (size_t i = 0; i < sizeof(kLanguageNameTable) / sizeof(kLanguageNameTable[0]); i++) {
    if (str == kLanguageNameTable[i]) return (Language)i;
  }
  // lowercase aliases accepted by the local tool
  if (str == "C++" || str == "cpp" || str == "c++") return Language::CPP;
  if (str == "python3" || str == "python") return Language::PYTHON;
  if (str == "node" || str == "javascript") return Language::JAVASCRIPT;
  if (str == "java") return Language::JAVA;
  if (str == "c") return Language::C;
  if (str == "go") return Language::GO;
  if (str == "rust") return Language::RUST;
  return std::nullopt;
}

static const char* kStatusNameTable[] = {
#define X(name, str, desc) str,
  ENUM_SUBMISSION_STATUS_
#undef X
};

const char* StatusName(SubmissionStatus status) {
  return kStatusNameTable[(int)status];
}

#define X(...) X_RETURN_ARG3(SubmissionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* StatusToDesc, SubmissionStatus, ENUM_SUBMISSION_STATUS_)
#undef X

std::optional<SubmissionStatus> ParseStatus(const std::string& str) {
  for (size_t i = 0; i < sizeof(kStatusNameTable) / sizeof(kStatusNameTable[0]); i++) {
    if (str == kStatusNameTable[i]) return (SubmissionStatus)i;
  }
  return std::nullopt;
}

#define X(...) X_RETURN_ARG1(FailureKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* FailureKindName, FailureKind, ENUM_FAILURE_KIND_)
#undef X

SubmissionStatus FailureKindToStatus(FailureKind kind) {
  switch (kind) {
    case FailureKind::NONE: return SubmissionStatus::ACCEPTED;
    case FailureKind::COMPILATION_ERROR: return SubmissionStatus::COMPILATION_ERROR;
    case FailureKind::TIME_LIMIT_EXCEEDED: return SubmissionStatus::TIME_LIMIT_EXCEEDED;
    case FailureKind::MEMORY_LIMIT_EXCEEDED: return SubmissionStatus::MEMORY_LIMIT_EXCEEDED;
    case FailureKind::RUNTIME_ERROR: return SubmissionStatus::RUNTIME_ERROR;
    case FailureKind::SYSTEM_ERROR: return SubmissionStatus::SYSTEM_ERROR;
  }
  __builtin_unreachable();
}

static const char* kCompareModeTable[] = {
#define X(name) #name,
  ENUM_COMPARE_MODE_
#undef X
};

const char* CompareModeName(CompareMode mode) {
  return kCompareModeTable[(int)mode];
}

std::optional<CompareMode> ParseCompareMode(const std::string& str) {
  for (size_t i = 0; i < sizeof(kCompareModeTable) / sizeof(kCompareModeTable[0]); i++) {
    if (str == kCompareModeTable[i]) return (CompareMode)i;
  }
  if (str == "trailing" || str == "lenient") return CompareMode::TRAILING_WHITESPACE;
  if (str == "exact" || str == "strict") return CompareMode::EXACT;
  return std::nullopt;
}

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4

std::string TruncateMessage(const std::string& str, size_t max_len) {
  if (str.size() <= max_len) return str;
  constexpr char kEllipsis[] = "...";
  size_t len = max_len > 3 ? max_len - 3 : 0;
  // do not split a multi-byte character
  while (len > 0 && (static_cast<unsigned char>(str[len]) & 0xC0) == 0x80) len--;
  return str.substr(0, len) + kEllipsis;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), strerror(ec.value()));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  {
    std::ofstream fout(path, std::ios::binary | std::ios::trunc);
    if (!fout || !fout.write(content.data(), content.size())) {
      spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
      return false;
    }
  }
  if (perms == fs::perms::unknown) return true;
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) {
    spdlog::warn("Failed setting permission of {}: {}", path.c_str(), strerror(ec.value()));
    return false;
  }
  return true;
}

std::string ReadFileHead(const fs::path& path, size_t max_bytes) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) return "";
  std::string buf(max_bytes, '\0');
  fin.read(buf.data(), max_bytes);
  buf.resize(fin.gcount());
  return buf;
}
