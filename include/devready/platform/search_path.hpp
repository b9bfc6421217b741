#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace devready::platform {

// Split a search path value into its segments, in order. Segments are
// returned untrimmed; an empty value yields no segments.
auto SplitSearchPath(std::string_view value, char delimiter)
    -> std::vector<std::string>;

// Strip leading and trailing spaces, tabs and line breaks.
auto TrimSegment(std::string_view segment) -> std::string_view;

// Windows directory names are case-insensitive; POSIX ones are not.
#ifdef _WIN32
inline constexpr bool kIgnoreSegmentCase = true;
#else
inline constexpr bool kIgnoreSegmentCase = false;
#endif

// Compare two directories the way segment membership is decided: trimmed,
// and ASCII case-insensitive when `ignore_case` is set.
auto SegmentsEqual(
    std::string_view lhs, std::string_view rhs,
    bool ignore_case = kIgnoreSegmentCase) -> bool;

// Number of segments of `value` equal to `directory` under SegmentsEqual.
auto CountSegment(
    std::string_view value, std::string_view directory, char delimiter,
    bool ignore_case = kIgnoreSegmentCase) -> std::size_t;

auto ContainsSegment(
    std::string_view value, std::string_view directory, char delimiter,
    bool ignore_case = kIgnoreSegmentCase) -> bool;

// `value + delimiter + directory`, or just `directory` when `value` is empty.
// Existing segments are never rewritten.
auto AppendSegment(
    std::string_view value, std::string_view directory, char delimiter)
    -> std::string;

}  // namespace devready::platform
