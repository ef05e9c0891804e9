//! # Reflow Configuration
//!
//! Formatting options for the reflow engine. A configuration is validated
//! once, when it is built, and is immutable afterwards.

#ifndef CSTUDIO_REFLOW_REFLOW_CONFIG_HPP
#define CSTUDIO_REFLOW_REFLOW_CONFIG_HPP

#include "common.hpp"

namespace cstudio::reflow {

/// Line length used when no configuration says otherwise.
constexpr int DEFAULT_MAX_LINE_LENGTH = 120;

/// Reflow options.
///
/// # Fields
///
/// - `max_line_length`: Target width in characters, counting indentation, marker and the
///   space after it. Always at least 1 once built by `make_reflow_config`.
/// - `use_compact_style`: Put short elements on one line
///   (`/// <summary>Gets the name.</summary>`).
/// - `preserve_blank_lines`: Keep marker-only separator lines. When false
///   they are dropped and the paragraphs around them merge.
struct ReflowConfig {
    int max_line_length = DEFAULT_MAX_LINE_LENGTH;
    bool use_compact_style = true;
    bool preserve_blank_lines = true;
};

/// Builds a validated configuration.
///
/// Returns an error if `max_line_length` is below 1.
[[nodiscard]] auto make_reflow_config(int max_line_length, bool use_compact_style = true,
                                      bool preserve_blank_lines = true)
    -> Result<ReflowConfig, std::string>;

} // namespace cstudio::reflow

#endif // CSTUDIO_REFLOW_REFLOW_CONFIG_HPP
