#ifndef DIFFTREE_CORE_CONFIG_HPP
#define DIFFTREE_CORE_CONFIG_HPP

#include <difftree/core/utilities.hpp>

namespace difftree {

struct diff_options
{
    // the largest LCS table (in cells) that the sequence differ will build -
    // Sequence pairs that would need a larger table are replaced wholesale.
    // The default is 2^24 cells.
    optional<size_t> max_sequence_table_cells;

    // whether or not to log a warning when the above limit forces a
    // wholesale replacement (defaults to true)
    optional<bool> log_sequence_fallbacks;
};

inline size_t
get_max_sequence_table_cells(diff_options const& options)
{
    return options.max_sequence_table_cells
               ? *options.max_sequence_table_cells
               : size_t(0x1'00'00'00);
}

inline bool
should_log_sequence_fallbacks(diff_options const& options)
{
    return options.log_sequence_fallbacks ? *options.log_sequence_fallbacks
                                          : true;
}

// Parse diff options from YAML text, e.g.:
//
//   max_sequence_table_cells: 1000000
//   log_sequence_fallbacks: false
//
// Fields that are absent keep their defaults. Malformed input throws a
// parsing_error.
diff_options
parse_diff_options_yaml(string const& yaml);

} // namespace difftree

#endif
