#include "name_parser.hpp"

#include <cctype>
#include <limits>

namespace {

bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_word_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

} // namespace

std::optional<SubdirMatch> match_subdir(const std::string& name) {
  if(name.size() < 4) return std::nullopt;
  for(std::size_t i = 0; i < 3; ++i) {
    if(!is_digit(name[i])) return std::nullopt;
  }
  if(is_digit(name[3])) return std::nullopt;

  SubdirMatch match;
  match.number = (name[0] - '0') * 100 + (name[1] - '0') * 10 + (name[2] - '0');
  match.name = name;
  return match;
}

std::optional<FileMatch> match_file(const std::string& name) {
  constexpr std::size_t kPrefixLength = 4;
  if(name.size() < kPrefixLength + 3) return std::nullopt;
  for(std::size_t i = 0; i < kPrefixLength; ++i) {
    if(!is_word_char(name[i])) return std::nullopt;
  }

  std::size_t pos = kPrefixLength;
  long long value = 0;
  while(pos < name.size() && is_digit(name[pos])) {
    value = value * 10 + (name[pos] - '0');
    if(value >= std::numeric_limits<int>::max()) return std::nullopt;
    ++pos;
  }
  if(pos == kPrefixLength) return std::nullopt;
  if(pos >= name.size() || name[pos] != '.') return std::nullopt;

  std::string extension = name.substr(pos + 1);
  if(extension.empty() || extension.find('.') != std::string::npos) {
    return std::nullopt;
  }

  FileMatch match;
  match.number = static_cast<int>(value);
  match.extension = std::move(extension);
  return match;
}
