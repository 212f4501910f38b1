#pragma once

#include <string>

namespace stringutils {
    std::string toLower(std::string str);
    std::string trim(const std::string &s);
    // parses a whole string as an unsigned decimal number, returns false if there is anything else in it
    bool parse_uint(const std::string &s, unsigned long &value);
}
