#include "report/json_pointer.hpp"

namespace jtdv::report {

std::string EscapePointerSegment(std::string_view segment) {
  std::string escaped;
  escaped.reserve(segment.size());

  // Single pass is equivalent to replacing `~` before `/`: a `~1` produced
  // for a slash is never revisited.
  for (const char c : segment) {
    if (c == '~') {
      escaped += "~0";
    } else if (c == '/') {
      escaped += "~1";
    } else {
      escaped.push_back(c);
    }
  }
  return escaped;
}

std::string ToJsonPointer(const PathSegments& segments) {
  std::string pointer;
  for (const auto& segment : segments) {
    pointer.push_back('/');
    pointer += EscapePointerSegment(segment);
  }
  return pointer;
}

bool ParseJsonPointer(std::string_view pointer, PathSegments& segments, std::string& error) {
  segments.clear();
  if (pointer.empty()) {
    return true;
  }
  if (pointer.front() != '/') {
    error = "json pointer must be empty or start with '/': " + std::string(pointer);
    return false;
  }

  std::string current;
  for (std::size_t i = 1; i <= pointer.size(); ++i) {
    if (i == pointer.size() || pointer[i] == '/') {
      segments.push_back(std::move(current));
      current.clear();
      continue;
    }

    const char c = pointer[i];
    if (c != '~') {
      current.push_back(c);
      continue;
    }

    if (i + 1 >= pointer.size() || (pointer[i + 1] != '0' && pointer[i + 1] != '1')) {
      error = "invalid escape in json pointer at index " + std::to_string(i) + ": " +
              std::string(pointer);
      return false;
    }
    current.push_back(pointer[i + 1] == '0' ? '~' : '/');
    ++i;
  }

  return true;
}

} // namespace jtdv::report
