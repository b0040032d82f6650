#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <cstdint>
#include "Types.h"

int safe_stoi(const std::string& str, int default_value);
int utf8_char_len(unsigned char c);
ColIdx utf16_to_byte_offset(const std::string& line, uint32_t utf16_units);
uint32_t byte_to_utf16_offset(const std::string& line, ColIdx byte_pos);
std::string upper_first(std::string_view sv);
std::string to_lower(std::string_view sv);
std::string trim(std::string_view sv);
std::vector<std::string> split(std::string_view sv, char delim);
bool contains(const std::vector<std::string>& list, std::string_view value);
