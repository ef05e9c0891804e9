#include "tags/tag_exporter.hpp"

#include "util/text.hpp"

#include <array>
#include <cstdio>
#include <sstream>

namespace cstudio::tags {

using namespace cstudio::util;

namespace {

constexpr std::array<std::string_view, 7> HEADERS = {
    "Type", "Message", "File", "Line", "Owner", "Issue", "Anchor ID",
};

auto issue_text(const TagMatch& tag) -> std::optional<std::string> {
    if (!tag.issue) {
        return std::nullopt;
    }
    return "#" + std::to_string(*tag.issue);
}

/// Replaces tabs and line breaks with spaces.
auto flatten(std::string_view cell) -> std::string {
    std::string out;
    out.reserve(cell.size());
    for (char c : cell) {
        out += (c == '\n' || c == '\r' || c == '\t') ? ' ' : c;
    }
    return out;
}

} // namespace

// ============================================================================
// Formats
// ============================================================================

auto format_from_extension(std::string_view extension) -> ExportFormat {
    if (extension.starts_with('.')) {
        extension.remove_prefix(1);
    }
    if (equals_ignore_case(extension, "csv")) {
        return ExportFormat::Csv;
    }
    if (equals_ignore_case(extension, "md")) {
        return ExportFormat::Markdown;
    }
    if (equals_ignore_case(extension, "json")) {
        return ExportFormat::Json;
    }
    return ExportFormat::Tsv;
}

auto parse_export_format(std::string_view name) -> std::optional<ExportFormat> {
    if (equals_ignore_case(name, "tsv")) {
        return ExportFormat::Tsv;
    }
    if (equals_ignore_case(name, "csv")) {
        return ExportFormat::Csv;
    }
    if (equals_ignore_case(name, "md") || equals_ignore_case(name, "markdown")) {
        return ExportFormat::Markdown;
    }
    if (equals_ignore_case(name, "json")) {
        return ExportFormat::Json;
    }
    return std::nullopt;
}

auto format_name(ExportFormat format) -> std::string_view {
    switch (format) {
    case ExportFormat::Tsv:
        return "tsv";
    case ExportFormat::Csv:
        return "csv";
    case ExportFormat::Markdown:
        return "md";
    case ExportFormat::Json:
        return "json";
    }
    return "tsv";
}

// ============================================================================
// Cell Helpers
// ============================================================================

auto row_values(const TagItem& item) -> std::vector<std::string> {
    const auto& tag = item.tag;
    return {
        to_upper(tag.tag_name),
        tag.message,
        item.file,
        std::to_string(item.line),
        tag.owner.value_or(""),
        issue_text(tag).value_or(""),
        tag.anchor_id.value_or(""),
    };
}

auto escape_csv_field(std::string_view field) -> std::string {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

auto escape_markdown_cell(std::string_view cell) -> std::string {
    std::string out;
    for (char c : flatten(cell)) {
        if (c == '|') {
            out += "\\|";
        } else {
            out += c;
        }
    }
    return out;
}

// ============================================================================
// TagExporter
// ============================================================================

TagExporter::TagExporter(ExportFormat format) : format_(format) {}

void TagExporter::generate(const std::vector<TagItem>& items, std::ostream& out) {
    switch (format_) {
    case ExportFormat::Tsv:
        write_delimited(items, out, '\t');
        break;
    case ExportFormat::Csv:
        write_delimited(items, out, ',');
        break;
    case ExportFormat::Markdown:
        write_markdown(items, out);
        break;
    case ExportFormat::Json:
        write_json(items, out);
        break;
    }
}

auto TagExporter::to_string(const std::vector<TagItem>& items) -> std::string {
    std::ostringstream out;
    generate(items, out);
    return out.str();
}

void TagExporter::write_delimited(const std::vector<TagItem>& items, std::ostream& out,
                                  char separator) {
    for (size_t i = 0; i < HEADERS.size(); ++i) {
        out << (i > 0 ? std::string(1, separator) : "") << HEADERS[i];
    }
    out << "\n";

    for (const auto& item : items) {
        auto values = row_values(item);
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                out << separator;
            }
            if (separator == ',') {
                out << escape_csv_field(values[i]);
            } else {
                out << flatten(values[i]);
            }
        }
        out << "\n";
    }
}

void TagExporter::write_markdown(const std::vector<TagItem>& items, std::ostream& out) {
    out << "# Code Anchors\n\n";

    out << "|";
    for (auto header : HEADERS) {
        out << " " << header << " |";
    }
    out << "\n|";
    for (size_t i = 0; i < HEADERS.size(); ++i) {
        out << "------|";
    }
    out << "\n";

    for (const auto& item : items) {
        out << "|";
        for (const auto& value : row_values(item)) {
            out << " " << escape_markdown_cell(value) << " |";
        }
        out << "\n";
    }

    out << "\n*Exported by cstudio: " << items.size() << " anchor"
        << (items.size() == 1 ? "" : "s") << "*\n";
}

void TagExporter::write_json(const std::vector<TagItem>& items, std::ostream& out) {
    out << "{\n";
    write_indent(out, 1);
    out << "\"count\": " << items.size() << ",\n";
    write_indent(out, 1);
    out << "\"anchors\": [";
    if (items.empty()) {
        out << "]\n}\n";
        return;
    }
    out << "\n";

    for (size_t i = 0; i < items.size(); ++i) {
        write_indent(out, 2);
        write_json_item(items[i], out, 2);
        out << (i + 1 < items.size() ? ",\n" : "\n");
    }

    write_indent(out, 1);
    out << "]\n}\n";
}

void TagExporter::write_json_item(const TagItem& item, std::ostream& out, int indent) {
    const auto& tag = item.tag;
    out << "{\n";

    write_indent(out, indent + 1);
    out << "\"type\": ";
    write_string(to_upper(tag.tag_name), out);
    out << ",\n";

    write_indent(out, indent + 1);
    out << "\"message\": ";
    write_string(tag.message, out);
    out << ",\n";

    write_indent(out, indent + 1);
    out << "\"file\": ";
    write_string(item.file, out);
    out << ",\n";

    write_indent(out, indent + 1);
    out << "\"line\": " << item.line << ",\n";

    write_indent(out, indent + 1);
    out << "\"column\": " << item.column << ",\n";

    write_indent(out, indent + 1);
    out << "\"owner\": ";
    write_optional(tag.owner, out);
    out << ",\n";

    write_indent(out, indent + 1);
    out << "\"issue\": ";
    write_optional(issue_text(tag), out);
    out << ",\n";

    write_indent(out, indent + 1);
    out << "\"dueDate\": ";
    write_optional(tag.due_date ? std::optional(format_date(*tag.due_date)) : std::nullopt, out);
    out << ",\n";

    write_indent(out, indent + 1);
    out << "\"anchorId\": ";
    write_optional(tag.anchor_id, out);
    out << "\n";

    write_indent(out, indent);
    out << "}";
}

void TagExporter::write_string(std::string_view str, std::ostream& out) {
    out << "\"";
    for (char c : str) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 32) {
                char buf[8];
                snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out << buf;
            } else {
                out << c;
            }
            break;
        }
    }
    out << "\"";
}

void TagExporter::write_optional(const std::optional<std::string>& value, std::ostream& out) {
    if (value) {
        write_string(*value, out);
    } else {
        out << "null";
    }
}

void TagExporter::write_indent(std::ostream& out, int indent) {
    for (int i = 0; i < indent; ++i) {
        out << "  ";
    }
}

} // namespace cstudio::tags
