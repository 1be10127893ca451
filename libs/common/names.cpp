/**
 * @file names.cpp
 * @brief Qualified-name helpers
 */

#include "hexarch/common.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ranges>

namespace hexarch::common {

std::string_view simple_name(std::string_view qualified_name)
{
    const auto pos = qualified_name.rfind('.');
    if (pos == std::string_view::npos) {
        return qualified_name;
    }
    return qualified_name.substr(pos + 1);
}

std::string_view package_name(std::string_view qualified_name)
{
    const auto pos = qualified_name.rfind('.');
    if (pos == std::string_view::npos) {
        return {};
    }
    return qualified_name.substr(0, pos);
}

std::string lower_camel(std::string_view name)
{
    std::string result(name);
    if (!result.empty()) {
        result.front() =
            static_cast<char>(std::tolower(static_cast<unsigned char>(result.front())));
    }
    return result;
}

std::string to_lower(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    std::ranges::transform(text, std::back_inserter(result), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return result;
}

std::vector<std::string> split_segments(std::string_view dotted)
{
    std::vector<std::string> segments;
    if (dotted.empty()) {
        return segments;
    }
    for (auto part : std::views::split(dotted, '.')) {
        segments.emplace_back(part.begin(), part.end());
    }
    return segments;
}

bool has_package_segment(std::string_view package, std::string_view segment)
{
    return std::ranges::any_of(split_segments(package),
                               [segment](const std::string& s) { return s == segment; });
}

}  // namespace hexarch::common
