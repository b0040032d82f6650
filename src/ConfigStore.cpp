#include "ConfigStore.h"
#include "Constants.h"
#include "Utils.h"
#include <SDL2/SDL.h>
#include <fstream>
#include <sstream>

std::expected<void, std::string> ConfigStore::load_from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + filepath);
    }
    std::stringstream contents;
    contents << file.rdbuf();
    load_from_string(contents.str());
    return {};
}

void ConfigStore::load_from_string(std::string_view text) {
    sections_.clear();
    parse(text);
    changed_.fire();
}

void ConfigStore::set(const std::string& section, const std::string& key, std::string value) {
    sections_[section][key] = std::move(value);
    changed_.fire();
}

void ConfigStore::parse(std::string_view text) {
    std::string current_section;
    int line_number = 0;

    for (const auto& raw_line : split(text, '\n')) {
        line_number++;
        std::string line = trim(raw_line);
        if (line.empty() || line[0] == '#' || line.starts_with("//")) continue;

        if (line.front() == '[' && line.back() == ']') {
            current_section = trim(std::string_view(line).substr(1, line.size() - 2));
            continue;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos || current_section.empty()) {
            SDL_LogWarn(LOG_CATEGORY_SEMANTIC, "config line %d ignored: %s", line_number, line.c_str());
            continue;
        }

        std::string key = trim(std::string_view(line).substr(0, colon_pos));
        std::string value = trim(std::string_view(line).substr(colon_pos + 1));
        if (!value.empty() && value.front() == '"') value.erase(0, 1);
        if (!value.empty() && value.back() == '"') value.pop_back();
        sections_[current_section][key] = value;
    }
}

std::optional<std::string> ConfigStore::get_raw(const std::string& feature, const std::string& filetype,
                                                const std::string& key) const {
    if (!filetype.empty()) {
        auto scoped = sections_.find(feature + ":" + filetype);
        if (scoped != sections_.end()) {
            if (auto it = scoped->second.find(key); it != scoped->second.end()) {
                return it->second;
            }
        }
    }
    auto plain = sections_.find(feature);
    if (plain != sections_.end()) {
        if (auto it = plain->second.find(key); it != plain->second.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

bool ConfigStore::get_bool(const std::string& feature, const std::string& filetype, const std::string& key,
                           bool default_value) const {
    auto raw = get_raw(feature, filetype, key);
    if (!raw) return default_value;
    std::string value = to_lower(*raw);
    if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
    if (value == "false" || value == "0" || value == "no" || value == "off") return false;
    return default_value;
}

int ConfigStore::get_int(const std::string& feature, const std::string& filetype, const std::string& key,
                         int default_value) const {
    auto raw = get_raw(feature, filetype, key);
    if (!raw) return default_value;
    return safe_stoi(*raw, default_value);
}

std::vector<std::string> ConfigStore::get_list(const std::string& feature, const std::string& filetype,
                                               const std::string& key,
                                               std::vector<std::string> default_value) const {
    auto raw = get_raw(feature, filetype, key);
    if (!raw) return default_value;

    std::string value = *raw;
    if (!value.empty() && value.front() == '[' && value.back() == ']') {
        value = value.substr(1, value.size() - 2);
    }

    std::vector<std::string> result;
    for (const auto& part : split(value, ',')) {
        std::string item = trim(part);
        if (!item.empty() && item.front() == '"') item.erase(0, 1);
        if (!item.empty() && item.back() == '"') item.pop_back();
        if (!item.empty()) result.push_back(item);
    }
    return result;
}
