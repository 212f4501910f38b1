#include "StringUtils.h"

#include <cctype>
#include <algorithm>
#include <cstdlib>

std::string stringutils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

std::string stringutils::trim(const std::string &s)
{
    auto wsfront = std::find_if_not(s.begin(), s.end(), [](int c) {return std::isspace(c);});
    auto wsback = std::find_if_not(s.rbegin(), s.rend(), [](int c) {return std::isspace(c);}).base();
    return (wsback <= wsfront ? std::string() : std::string(wsfront, wsback));
}

bool stringutils::parse_uint(const std::string &s, unsigned long &value)
{
    if(s.empty() || !std::isdigit((unsigned char)s[0])) return false;

    char *end;
    unsigned long v= strtoul(s.c_str(), &end, 10);
    if(*end != '\0') return false;

    value= v;
    return true;
}
