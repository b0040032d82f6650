#include "TextDocument.h"
#include "Utils.h"
#include <cstdio>

TextDocument::TextDocument(BufferId id, std::string filetype)
    : filetype(std::move(filetype)), id_(id) {
    lines.emplace_back("");
}

std::expected<void, std::string> TextDocument::load(const std::filesystem::path& path) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) {
        return std::unexpected("Failed to open file: " + path.string());
    }

    fseek(f, 0, SEEK_END);
    long fsize = ftell(f);
    fseek(f, 0, SEEK_SET);

    if (fsize < 0) {
        fclose(f);
        return std::unexpected("Failed to determine file size: " + path.string());
    }

    std::string buffer;
    buffer.resize(fsize);
    size_t read_size = fread(buffer.data(), 1, fsize, f);
    fclose(f);
    buffer.resize(read_size);

    split_into_lines(buffer);
    file_path = path.string();
    if (filetype.empty()) {
        filetype = detect_filetype(path);
    }
    bump_version();
    dirty_ = false;
    return {};
}

void TextDocument::load_text(const std::string& text) {
    split_into_lines(text);
    bump_version();
    dirty_ = false;
}

const std::string& TextDocument::get_line(LineIdx idx) const {
    static const std::string empty;
    if (idx < 0 || idx >= line_count()) return empty;
    return lines[idx];
}

void TextDocument::replace_line(LineIdx idx, std::string content) {
    if (idx < 0 || idx >= line_count()) return;
    lines[idx] = std::move(content);
    dirty_ = true;
    bump_version();
}

void TextDocument::set_change_callback(ChangeCallback callback) {
    change_callback_ = std::move(callback);
}

void TextDocument::split_into_lines(const std::string& text) {
    lines.clear();

    const char* ptr = text.data();
    const char* end = ptr + text.size();
    const char* line_start = ptr;

    while (ptr < end) {
        if (*ptr == '\n') {
            lines.emplace_back(line_start, ptr - line_start);
            line_start = ptr + 1;
        }
        ptr++;
    }

    if (line_start < end) {
        lines.emplace_back(line_start, end - line_start);
    } else {
        lines.emplace_back("");
    }
}

void TextDocument::bump_version() {
    version_++;
    if (change_callback_) {
        change_callback_(*this);
    }
}

std::string detect_filetype(const std::filesystem::path& path) {
    std::string ext = to_lower(path.extension().string());
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);

    if (ext == "c") return "c";
    if (ext == "h") return "cpp";
    static const std::vector<std::string> cpp_exts = {"cpp", "cc", "cxx", "hpp", "hxx", "hh", "ipp", "tpp"};
    if (contains(cpp_exts, ext)) return "cpp";
    return ext;
}
