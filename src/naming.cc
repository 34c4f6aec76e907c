#include "src/naming.h"

#include <algorithm>
#include <iterator>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace protorpc_generator {
namespace {

// Sorted, for binary search.
const char *const kKeywords[] = {
    "alignas",      "alignof",     "and",          "and_eq",
    "asm",          "auto",        "bitand",       "bitor",
    "bool",         "break",       "case",         "catch",
    "char",         "char16_t",    "char32_t",     "char8_t",
    "class",        "co_await",    "co_return",    "co_yield",
    "compl",        "concept",     "const",        "const_cast",
    "consteval",    "constexpr",   "constinit",    "continue",
    "decltype",     "default",     "delete",       "do",
    "double",       "dynamic_cast", "else",        "enum",
    "explicit",     "export",      "extern",       "false",
    "float",        "for",         "friend",       "goto",
    "if",           "inline",      "int",          "long",
    "mutable",      "namespace",   "new",          "noexcept",
    "not",          "not_eq",      "nullptr",      "operator",
    "or",           "or_eq",       "private",      "protected",
    "public",       "register",    "reinterpret_cast", "requires",
    "return",       "short",       "signed",       "sizeof",
    "static",       "static_assert", "static_cast", "struct",
    "switch",       "template",    "this",         "thread_local",
    "throw",        "true",        "try",          "typedef",
    "typeid",       "typename",    "union",        "unsigned",
    "using",        "virtual",     "void",         "volatile",
    "wchar_t",      "while",       "xor",          "xor_eq",
};

bool IsKeyword(absl::string_view name) {
  return std::binary_search(
      std::begin(kKeywords), std::end(kKeywords), name,
      [](absl::string_view a, absl::string_view b) { return a < b; });
}

// Splits on non-alphanumerics and on case boundaries:
// "HTTPServerV2_status" -> {"HTTP", "Server", "V2", "status"}.
std::vector<std::string> SplitWords(absl::string_view name) {
  std::vector<std::string> words;
  std::string current;
  for (size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (!absl::ascii_isalnum(c)) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
      continue;
    }
    if (absl::ascii_isupper(c) && !current.empty()) {
      const char prev = current.back();
      const bool next_is_lower =
          i + 1 < name.size() && absl::ascii_islower(name[i + 1]);
      if (absl::ascii_islower(prev) || absl::ascii_isdigit(prev) ||
          (absl::ascii_isupper(prev) && next_is_lower)) {
        words.push_back(std::move(current));
        current.clear();
      }
    }
    current.push_back(c);
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

} // namespace

std::string IdentifierCase(absl::string_view name) {
  std::vector<std::string> words = SplitWords(name);
  for (std::string &word : words) {
    absl::AsciiStrToLower(&word);
  }
  return absl::StrJoin(words, "_");
}

std::string TypeCase(absl::string_view name) {
  std::string fused;
  for (std::string &word : SplitWords(name)) {
    word[0] = absl::ascii_toupper(word[0]);
    fused.append(word);
  }
  return fused;
}

std::string SafeIdentifier(absl::string_view name) {
  if (!name.empty() && absl::ascii_isdigit(name[0])) {
    return absl::StrCat("_", name);
  }
  if (IsKeyword(name)) {
    return absl::StrCat(name, "_");
  }
  return std::string(name);
}

std::string NamespaceOf(absl::string_view package) {
  const size_t last_dot = package.rfind('.');
  if (last_dot == absl::string_view::npos) {
    return std::string(package);
  }
  return std::string(package.substr(last_dot + 1));
}

absl::StatusOr<std::string> QualifyType(absl::string_view path,
                                        absl::string_view proto_root) {
  std::vector<absl::string_view> segments = absl::StrSplit(path, '.');
  const std::string type_name = TypeCase(segments.back());
  if (type_name.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("cannot resolve type path \"", path, "\""));
  }
  std::string qualified(proto_root);
  for (size_t i = 0; i + 1 < segments.size(); ++i) {
    // Skip root.
    if (segments[i].empty()) {
      continue;
    }
    absl::StrAppend(&qualified, kNamespaceSeparator, segments[i]);
  }
  absl::StrAppend(&qualified, kNamespaceSeparator, type_name);
  return qualified;
}

std::string StripProto(absl::string_view file_name) {
  for (absl::string_view suffix : {".protodevel", ".proto"}) {
    if (absl::EndsWith(file_name, suffix)) {
      return std::string(
          file_name.substr(0, file_name.size() - suffix.size()));
    }
  }
  return std::string(file_name);
}

} // namespace protorpc_generator
