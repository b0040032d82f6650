#pragma once

#include "Types.h"
#include <vector>
#include <string>
#include <expected>
#include <filesystem>
#include <functional>

class TextDocument {
public:
    std::vector<std::string> lines;
    std::string file_path;
    std::string filetype;

    explicit TextDocument(BufferId id, std::string filetype = "");

    std::expected<void, std::string> load(const std::filesystem::path& path);
    void load_text(const std::string& text);

    BufferId id() const { return id_; }
    DocVersion version() const { return version_; }

    // Edited since the last sync with language providers.
    bool dirty() const { return dirty_; }
    void mark_synced() { dirty_ = false; }

    LineIdx line_count() const { return static_cast<LineIdx>(lines.size()); }
    const std::string& get_line(LineIdx idx) const;

    void replace_line(LineIdx idx, std::string content);

    using ChangeCallback = std::function<void(const TextDocument& doc)>;
    void set_change_callback(ChangeCallback callback);

private:
    BufferId id_;
    DocVersion version_ = 0;
    bool dirty_ = false;
    ChangeCallback change_callback_;

    void split_into_lines(const std::string& text);
    void bump_version();
};

std::string detect_filetype(const std::filesystem::path& path);
