#include "FileNames.hpp"

#include <cctype>

std::string SanitizeForFilename(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  auto ok = [](unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '-' || c == '_';
  };
  for (unsigned char c : s)
    out.push_back(ok(c) ? char(c) : '_');
  // never let a component climb out of its parent directory
  if (out.empty() || out == "." || out == "..")
    out.insert(out.begin(), '_');
  return out;
}
