#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace jtdv::report {

// Path through a JSON document as raw (unescaped) object keys and array
// indices, root first. An empty path is the document root.
using PathSegments = std::vector<std::string>;

// Escapes one segment per RFC 6901: `~` -> `~0` first, then `/` -> `~1`.
std::string EscapePointerSegment(std::string_view segment);

// Renders `segments` as a JSON Pointer. The root renders as "" (not "/").
std::string ToJsonPointer(const PathSegments& segments);

// Inverse of ToJsonPointer.
//
// Contract:
// - "" parses to an empty path.
// - Any other pointer must start with '/'.
// - `~` must be followed by `0` or `1`.
// - Returns false with `error` populated on malformed input.
bool ParseJsonPointer(std::string_view pointer, PathSegments& segments, std::string& error);

} // namespace jtdv::report
