//! # Tag Exporter
//!
//! Writes scanned tags as a table or a JSON document.
//!
//! | Format     | Extension | Notes                                 |
//! |------------|-----------|---------------------------------------|
//! | TSV        | `.tsv`    | Tabs and line breaks in cells become spaces |
//! | CSV        | `.csv`    | RFC 4180 quoting                      |
//! | Markdown   | `.md`     | `# Code Anchors` table with a count footer |
//! | JSON       | `.json`   | `{"count": N, "anchors": [...]}`      |
//!
//! Every format has the columns Type, Message, File, Line, Owner, Issue and
//! Anchor ID, in that order.

#ifndef CSTUDIO_TAGS_TAG_EXPORTER_HPP
#define CSTUDIO_TAGS_TAG_EXPORTER_HPP

#include "tags/tag_tokenizer.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cstudio::tags {

enum class ExportFormat { Tsv, Csv, Markdown, Json };

/// Maps a file extension (`".csv"`, `"md"`, any case) to a format. Unknown
/// extensions map to TSV.
[[nodiscard]] auto format_from_extension(std::string_view extension) -> ExportFormat;

/// Parses a format name as given on the command line (`tsv`, `csv`, `md`,
/// `markdown`, `json`).
[[nodiscard]] auto parse_export_format(std::string_view name) -> std::optional<ExportFormat>;

[[nodiscard]] auto format_name(ExportFormat format) -> std::string_view;

/// Serializes tag items in one format.
class TagExporter {
public:
    explicit TagExporter(ExportFormat format);

    void generate(const std::vector<TagItem>& items, std::ostream& out);

    [[nodiscard]] auto to_string(const std::vector<TagItem>& items) -> std::string;

    [[nodiscard]] auto format() const -> ExportFormat {
        return format_;
    }

private:
    ExportFormat format_;

    void write_delimited(const std::vector<TagItem>& items, std::ostream& out, char separator);
    void write_markdown(const std::vector<TagItem>& items, std::ostream& out);
    void write_json(const std::vector<TagItem>& items, std::ostream& out);
    void write_json_item(const TagItem& item, std::ostream& out, int indent);
    void write_string(std::string_view str, std::ostream& out);
    void write_optional(const std::optional<std::string>& value, std::ostream& out);
    void write_indent(std::ostream& out, int indent);
};

/// Returns the seven cell values of an item, in column order.
[[nodiscard]] auto row_values(const TagItem& item) -> std::vector<std::string>;

/// Quotes a CSV field when it holds a comma, quote or line break.
[[nodiscard]] auto escape_csv_field(std::string_view field) -> std::string;

/// Escapes pipes and flattens line breaks for a Markdown table cell.
[[nodiscard]] auto escape_markdown_cell(std::string_view cell) -> std::string;

} // namespace cstudio::tags

#endif // CSTUDIO_TAGS_TAG_EXPORTER_HPP
