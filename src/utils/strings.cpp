#include "utils/strings.hpp"
#include "domain/address.hpp"
#include <algorithm>
#include <cctype>

std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return s;
}

std::string trim_ascii(const std::string& s) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto b = std::find_if_not(s.begin(), s.end(), is_space);
    auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
    return (b < e) ? std::string(b, e) : std::string();
}

Address normalize_address(Address a) {
    return to_lower_ascii(trim_ascii(a));
}
