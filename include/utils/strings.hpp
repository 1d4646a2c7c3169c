#pragma once
#include <string>

std::string to_lower_ascii(std::string s);
std::string trim_ascii(const std::string& s);
