#include "Utils.h"
#include <stdexcept>
#include <cctype>
#include <algorithm>

int safe_stoi(const std::string& str, int default_value = 0) {
    if (str.empty()) return default_value;
    try {
        return std::stoi(str);
    } catch (const std::invalid_argument&) {
        return default_value;
    } catch (const std::out_of_range&) {
        return default_value;
    }
}

int utf8_char_len(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 1;
}

// Providers count columns in UTF-16 code units. Offsets past the end clamp to the line length.
ColIdx utf16_to_byte_offset(const std::string& line, uint32_t utf16_units) {
    ColIdx pos = 0;
    ColIdx len = static_cast<ColIdx>(line.size());
    uint32_t units = 0;
    while (pos < len && units < utf16_units) {
        int char_len = utf8_char_len(static_cast<unsigned char>(line[pos]));
        units += (char_len == 4) ? 2 : 1;
        pos = std::min(pos + char_len, len);
    }
    return pos;
}

uint32_t byte_to_utf16_offset(const std::string& line, ColIdx byte_pos) {
    ColIdx pos = 0;
    ColIdx end = std::min(byte_pos, static_cast<ColIdx>(line.size()));
    uint32_t units = 0;
    while (pos < end) {
        int char_len = utf8_char_len(static_cast<unsigned char>(line[pos]));
        units += (char_len == 4) ? 2 : 1;
        pos += char_len;
    }
    return units;
}

std::string upper_first(std::string_view sv) {
    std::string result(sv);
    if (!result.empty()) {
        result[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(result[0])));
    }
    return result;
}

std::string to_lower(std::string_view sv) {
    std::string result;
    result.reserve(sv.size());
    for (char c : sv) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string trim(std::string_view sv) {
    size_t start = sv.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    size_t end = sv.find_last_not_of(" \t\r\n");
    return std::string(sv.substr(start, end - start + 1));
}

std::vector<std::string> split(std::string_view sv, char delim) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t pos = sv.find(delim);
    while (pos != std::string_view::npos) {
        result.emplace_back(sv.substr(start, pos - start));
        start = pos + 1;
        pos = sv.find(delim, start);
    }
    result.emplace_back(sv.substr(start));
    return result;
}

bool contains(const std::vector<std::string>& list, std::string_view value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}
