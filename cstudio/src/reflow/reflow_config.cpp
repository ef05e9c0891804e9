#include "reflow/reflow_config.hpp"

namespace cstudio::reflow {

auto make_reflow_config(int max_line_length, bool use_compact_style, bool preserve_blank_lines)
    -> Result<ReflowConfig, std::string> {
    if (max_line_length < 1) {
        return "max line length must be a positive integer, got " +
               std::to_string(max_line_length);
    }
    return ReflowConfig{.max_line_length = max_line_length,
                        .use_compact_style = use_compact_style,
                        .preserve_blank_lines = preserve_blank_lines};
}

} // namespace cstudio::reflow
