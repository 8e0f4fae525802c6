#pragma once
#include <string>

std::string trim_ascii(const std::string& s);
