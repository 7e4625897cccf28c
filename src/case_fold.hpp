#pragma once

#include <string>

class DirectoryIndex;

enum class CaseFold {
  Identity,
  ToLower,
  ToUpper
};

// First match wins: no uppercase seen or force_lower -> ToLower, then no
// lowercase seen or force_upper -> ToUpper, otherwise Identity. An empty or
// all-lowercase destination folds to lower even with force_upper set.
CaseFold decide_case_fold(const DirectoryIndex& destination, bool force_lower, bool force_upper);

std::string apply_case_fold(CaseFold fold, std::string name);

const char* to_string(CaseFold fold);
