#include "devready/platform/search_path.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace devready::platform {

auto SplitSearchPath(std::string_view value, char delimiter)
    -> std::vector<std::string> {
  std::vector<std::string> segments;
  if (value.empty()) {
    return segments;
  }

  size_t start = 0;
  while (true) {
    size_t end = value.find(delimiter, start);
    if (end == std::string_view::npos) {
      segments.emplace_back(value.substr(start));
      break;
    }
    segments.emplace_back(value.substr(start, end - start));
    start = end + 1;
  }
  return segments;
}

auto TrimSegment(std::string_view segment) -> std::string_view {
  constexpr std::string_view kWhitespace = " \t\r\n";
  auto begin = segment.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = segment.find_last_not_of(kWhitespace);
  return segment.substr(begin, end - begin + 1);
}

auto SegmentsEqual(
    std::string_view lhs, std::string_view rhs, bool ignore_case) -> bool {
  lhs = TrimSegment(lhs);
  rhs = TrimSegment(rhs);
  if (!ignore_case) {
    return lhs == rhs;
  }
  return std::ranges::equal(lhs, rhs, [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

auto CountSegment(
    std::string_view value, std::string_view directory, char delimiter,
    bool ignore_case) -> std::size_t {
  auto segments = SplitSearchPath(value, delimiter);
  return static_cast<std::size_t>(
      std::ranges::count_if(segments, [&](const std::string& segment) {
        return SegmentsEqual(segment, directory, ignore_case);
      }));
}

auto ContainsSegment(
    std::string_view value, std::string_view directory, char delimiter,
    bool ignore_case) -> bool {
  return CountSegment(value, directory, delimiter, ignore_case) > 0;
}

auto AppendSegment(
    std::string_view value, std::string_view directory, char delimiter)
    -> std::string {
  std::string result(value);
  if (!result.empty()) {
    result += delimiter;
  }
  result += directory;
  return result;
}

}  // namespace devready::platform
