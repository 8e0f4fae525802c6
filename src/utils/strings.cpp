#include "utils/strings.hpp"
#include <algorithm>
#include <cctype>

std::string trim_ascii(const std::string& s) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto first = std::find_if_not(s.begin(), s.end(), is_space);
    auto last  = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return first < last ? std::string(first, last) : std::string();
}
