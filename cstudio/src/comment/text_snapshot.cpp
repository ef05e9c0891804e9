#include "comment/text_snapshot.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace cstudio::comment {

TextSnapshot::TextSnapshot(std::string name, std::string content)
    : name_(std::move(name)), content_(std::move(content)) {
    build_line_index();
}

void TextSnapshot::build_line_index() {
    line_starts_.clear();
    line_starts_.push_back(0);
    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n') {
            line_starts_.push_back(i + 1);
        }
    }
}

auto TextSnapshot::line(size_t index) const -> std::string_view {
    if (index >= line_starts_.size()) {
        return {};
    }
    auto start = line_starts_[index];
    return std::string_view(content_).substr(start, line_end(index) - start);
}

auto TextSnapshot::line_start(size_t index) const -> size_t {
    if (index >= line_starts_.size()) {
        return content_.size();
    }
    return line_starts_[index];
}

auto TextSnapshot::line_end(size_t index) const -> size_t {
    if (index >= line_starts_.size()) {
        return content_.size();
    }
    size_t start = line_starts_[index];
    size_t end = index + 1 < line_starts_.size() ? line_starts_[index + 1] : content_.size();
    if (end > start && content_[end - 1] == '\n') {
        --end;
    }
    if (end > start && content_[end - 1] == '\r') {
        --end;
    }
    return end;
}

auto TextSnapshot::line_from_offset(size_t offset) const -> size_t {
    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    return static_cast<size_t>(std::distance(line_starts_.begin(), it)) - 1;
}

auto TextSnapshot::line_ending() const -> std::string_view {
    auto newline = content_.find('\n');
    if (newline != std::string::npos && newline > 0 && content_[newline - 1] == '\r') {
        return "\r\n";
    }
    return "\n";
}

auto TextSnapshot::ends_with_newline() const -> bool {
    return !content_.empty() && content_.back() == '\n';
}

auto TextSnapshot::from_string(std::string content, std::string name) -> TextSnapshot {
    return TextSnapshot(std::move(name), std::move(content));
}

auto TextSnapshot::from_lines(const std::vector<std::string>& lines) -> TextSnapshot {
    std::string joined;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        joined += lines[i];
    }
    return TextSnapshot("<lines>", std::move(joined));
}

auto TextSnapshot::from_file(const std::string& path) -> Result<TextSnapshot, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "Failed to open file: " + path;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return "Failed to read file: " + path;
    }

    return TextSnapshot(path, buffer.str());
}

} // namespace cstudio::comment
