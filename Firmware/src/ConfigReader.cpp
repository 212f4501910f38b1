#include "ConfigReader.h"
#include "StringUtils.h"

#include <cstring>
#include <cstdlib>

// match the line for a section header
bool ConfigReader::match_section(const char *line, std::string& section_name)
{
    if(strlen(line) < 3) return false;
    if(line[0] != '[') return false;

    const char *p = strchr(line, ']');
    if(p == nullptr) return false;

    section_name.assign(&line[1], p - line - 1);

    return true;
}

bool ConfigReader::extract_key_value(const char *line, std::string& key, std::string& value)
{
    if(strlen(line) < 3) return false;

    const char *p = strchr(line, '=');
    if(p == nullptr) return false;
    key.assign(line, p - line);
    key = stringutils::trim(key);
    value.assign(p+1);
    value = stringutils::trim(value);
    return !key.empty();
}

bool ConfigReader::extract_sub_key_value(const char *line, std::string& key1, std::string& key2, std::string& value)
{
    if(strlen(line) < 5) return false;

    const char *p = strchr(line, '=');
    if(p == nullptr) return false;

    const char *p1 = strchr(line, '.');
    if(p1 == nullptr) return false; // no sub key
    if(p1 > p) return false; // make sure the a.b is before the =

    key1.assign(line, p1 - line);
    key1 = stringutils::trim(key1);

    key2.assign(p1 + 1, p - p1 - 1);
    key2 = stringutils::trim(key2);

    value.assign(p+1);
    value = stringutils::trim(value);
    return !key1.empty() && !key2.empty();
}

void ConfigReader::strip_comments(std::string& s)
{
    auto n= s.find_first_of("#");
    if(n != std::string::npos) {
        s= stringutils::trim(s.substr(0, n));
    }
}

// section == nullptr means every line that is not a section header
void ConfigReader::scan_section(const char *section, line_fnc_t fnc)
{
    reset();
    bool in_section = false;
    std::string s;
    while (std::getline(is, s)) {
        s = stringutils::trim(s);
        if(s.empty() || s[0] == '#') continue;

        strip_comments(s);

        std::string sec;
        if (match_section(s.c_str(), sec)) {
            if(section == nullptr) {
                fnc(s);

            } else if(sec == section) {
                in_section = true;

            } else if(in_section) {
                // we are no longer in the section we want
                break;
            }
            continue;
        }

        if(in_section) fnc(s);
    }
}

bool ConfigReader::get_section(const char *section, section_map_t& config)
{
    current_section = section;
    scan_section(section, [&config](const std::string& line) {
        std::string key;
        std::string value;
        if(extract_key_value(line.c_str(), key, value)) {
            config[key] = value;
        }
    });

    return !config.empty();
}

// extract the key/values from the specified section and split them into sub sections
bool ConfigReader::get_sub_sections(const char *section, sub_section_map_t& config)
{
    current_section = section;
    scan_section(section, [&config](const std::string& line) {
        std::string key1;
        std::string key2;
        std::string value;
        if(extract_sub_key_value(line.c_str(), key1, key2, value)) {
            config[key1][key2] = value;
        }
    });

    return !config.empty();
}

bool ConfigReader::get_sections(sections_t& sections)
{
    current_section = "";
    scan_section(nullptr, [&sections](const std::string& line) {
        std::string sec;
        if(match_section(line.c_str(), sec)) {
            sections.insert(sec);
        }
    });

    return !sections.empty();
}

const char *ConfigReader::get_string(const section_map_t& m, const char *key, const char *def) const
{
    auto s = m.find(key);
    if(s != m.end()) {
        return s->second.c_str();
    }

    return def;
}

bool ConfigReader::get_bool(const section_map_t& m, const char *key, bool def) const
{
    auto s = m.find(key);
    if(s != m.end()) {
        return s->second == "true" || s->second == "t" || s->second == "1";
    }

    return def;
}

int ConfigReader::get_int(const section_map_t& m, const char *key, int def) const
{
    auto s = m.find(key);
    if(s != m.end()) {
        return strtol(s->second.c_str(), nullptr, 0);
    }

    return def;
}
