#pragma once

#include <optional>
#include <string>

// Recognizers for camera-style names: "100CANON" directories holding
// "IMG_0001.JPG" files. Both are pure and never throw.

struct SubdirMatch {
  int number = 0;
  std::string name; // the whole entry name, digits included
};

struct FileMatch {
  int number = 0;
  std::string extension;
};

// Three ASCII digits followed by at least one non-digit: "017abc" -> 17.
std::optional<SubdirMatch> match_subdir(const std::string& name);

// Four [A-Za-z0-9_] characters, a digit run, '.', and a non-empty extension
// without further dots. The digit run is the file number.
std::optional<FileMatch> match_file(const std::string& name);
