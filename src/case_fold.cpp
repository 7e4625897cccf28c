#include "case_fold.hpp"

#include <algorithm>
#include <cctype>

#include "directory_index.hpp"

CaseFold decide_case_fold(const DirectoryIndex& destination, bool force_lower, bool force_upper) {
  if(!destination.has_uppercase() || force_lower) return CaseFold::ToLower;
  if(!destination.has_lowercase() || force_upper) return CaseFold::ToUpper;
  return CaseFold::Identity;
}

std::string apply_case_fold(CaseFold fold, std::string name) {
  switch(fold) {
    case CaseFold::ToLower:
      std::transform(name.begin(), name.end(), name.begin(),
                     [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
      break;
    case CaseFold::ToUpper:
      std::transform(name.begin(), name.end(), name.begin(),
                     [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
      break;
    case CaseFold::Identity:
      break;
  }
  return name;
}

const char* to_string(CaseFold fold) {
  switch(fold) {
    case CaseFold::ToLower: return "lowercase";
    case CaseFold::ToUpper: return "uppercase";
    case CaseFold::Identity: return "unchanged";
  }
  return "unknown";
}
