#pragma once

#include "Emitter.h"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <expected>
#include <unordered_map>
#include <functional>

// Sectioned key/value settings. A section is either a feature name
// ("semanticTokens") or a feature scoped to a filetype ("semanticTokens:cpp");
// the scoped section wins over the plain one.
//
//   # comment
//   [semanticTokens]
//   enable: true
//   incrementTypes: variable, string
class ConfigStore {
public:
    std::expected<void, std::string> load_from_file(const std::string& filepath);
    void load_from_string(std::string_view text);
    void set(const std::string& section, const std::string& key, std::string value);

    std::optional<std::string> get_raw(const std::string& feature, const std::string& filetype,
                                       const std::string& key) const;
    bool get_bool(const std::string& feature, const std::string& filetype, const std::string& key,
                  bool default_value) const;
    int get_int(const std::string& feature, const std::string& filetype, const std::string& key,
                int default_value) const;
    std::vector<std::string> get_list(const std::string& feature, const std::string& filetype,
                                      const std::string& key, std::vector<std::string> default_value) const;
    bool has(const std::string& feature, const std::string& filetype, const std::string& key) const {
        return get_raw(feature, filetype, key).has_value();
    }

    SubscriptionId on_did_change(std::function<void()> listener) { return changed_.subscribe(std::move(listener)); }
    void unsubscribe(SubscriptionId id) { changed_.unsubscribe(id); }

private:
    using Section = std::unordered_map<std::string, std::string>;

    std::unordered_map<std::string, Section> sections_;
    Emitter<> changed_;

    void parse(std::string_view text);
};
