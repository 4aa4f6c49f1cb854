#include <difftree/core/sequence_diff.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>

#include <difftree/core/logging.hpp>

namespace difftree {

bool
operator==(edit_run const& a, edit_run const& b)
{
    return a.op == b.op && a.offset == b.offset && a.count == b.count;
}
bool
operator!=(edit_run const& a, edit_run const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, edit_run const& run)
{
    return s << run.op << "(" << run.offset << ", " << run.count << ")";
}

namespace {

// run_builder accumulates single-element operations into coalesced runs.
// Between two kept runs, the pending deletes and inserts are each contiguous,
// so a gap always flushes as (at most) one DELETE run followed by one INSERT
// run.
struct run_builder
{
    std::vector<edit_run> runs;

    size_t keep_offset = 0, keep_count = 0;
    size_t delete_offset = 0, delete_count = 0;
    size_t insert_offset = 0, insert_count = 0;

    void
    keep(size_t a_offset, size_t count)
    {
        if (count == 0)
            return;
        flush_gap();
        if (keep_count == 0)
            keep_offset = a_offset;
        keep_count += count;
    }

    void
    remove(size_t a_offset, size_t count)
    {
        if (count == 0)
            return;
        flush_keep();
        if (delete_count == 0)
            delete_offset = a_offset;
        delete_count += count;
    }

    void
    insert(size_t b_offset, size_t count)
    {
        if (count == 0)
            return;
        flush_keep();
        if (insert_count == 0)
            insert_offset = b_offset;
        insert_count += count;
    }

    void
    flush_keep()
    {
        if (keep_count != 0)
        {
            runs.push_back(
                edit_run{sequence_edit_op::KEEP, keep_offset, keep_count});
            keep_count = 0;
        }
    }

    void
    flush_gap()
    {
        if (delete_count != 0)
        {
            runs.push_back(edit_run{
                sequence_edit_op::DELETE, delete_offset, delete_count});
            delete_count = 0;
        }
        if (insert_count != 0)
        {
            runs.push_back(edit_run{
                sequence_edit_op::INSERT, insert_offset, insert_count});
            insert_count = 0;
        }
    }

    std::vector<edit_run>
    finish()
    {
        flush_keep();
        flush_gap();
        return std::move(runs);
    }
};

// lcs_table holds, for each (i, j), the length of the longest common
// subsequence of a[i..] and b[j..] (relative to the untrimmed middle section
// of the inputs).
struct lcs_table
{
    size_t columns;
    std::vector<uint32_t> cells;

    lcs_table(size_t rows, size_t cols)
        : columns(cols + 1), cells((rows + 1) * (cols + 1), 0)
    {
    }

    uint32_t&
    at(size_t i, size_t j)
    {
        return cells[i * columns + j];
    }
};

} // namespace

optional<std::vector<edit_run>>
compute_edit_runs(
    size_t a_size,
    size_t b_size,
    function_view<bool(size_t, size_t)> items_equal,
    size_t max_table_cells)
{
    run_builder builder;

    // Trim the common prefix and suffix. These are always kept.
    size_t prefix = 0;
    while (prefix < a_size && prefix < b_size && items_equal(prefix, prefix))
        ++prefix;
    size_t suffix = 0;
    while (suffix < a_size - prefix && suffix < b_size - prefix
           && items_equal(a_size - 1 - suffix, b_size - 1 - suffix))
    {
        ++suffix;
    }
    size_t const rows = a_size - prefix - suffix;
    size_t const cols = b_size - prefix - suffix;

    builder.keep(0, prefix);

    if (rows != 0 && cols != 0)
    {
        if (rows + 1 > max_table_cells / (cols + 1)
            || std::min(rows, cols) > std::numeric_limits<uint32_t>::max())
        {
            return none;
        }

        lcs_table table(rows, cols);
        for (size_t i = rows; i-- > 0;)
        {
            for (size_t j = cols; j-- > 0;)
            {
                table.at(i, j)
                    = items_equal(prefix + i, prefix + j)
                          ? table.at(i + 1, j + 1) + 1
                          : std::max(table.at(i + 1, j), table.at(i, j + 1));
            }
        }

        size_t i = 0, j = 0;
        while (i != rows && j != cols)
        {
            if (items_equal(prefix + i, prefix + j))
            {
                builder.keep(prefix + i, 1);
                ++i;
                ++j;
            }
            else if (table.at(i + 1, j) >= table.at(i, j + 1))
            {
                builder.remove(prefix + i, 1);
                ++i;
            }
            else
            {
                builder.insert(prefix + j, 1);
                ++j;
            }
        }
        builder.remove(prefix + i, rows - i);
        builder.insert(prefix + j, cols - j);
    }
    else
    {
        builder.remove(prefix, rows);
        builder.insert(prefix, cols);
    }

    builder.keep(a_size - suffix, suffix);

    return builder.finish();
}

void
note_sequence_fallback(
    size_t a_size, size_t b_size, diff_options const& options)
{
    if (!should_log_sequence_fallbacks(options))
        return;
    get_logger()->warn(
        "sequence diff of {} and {} items exceeds the limit of {} table "
        "cells; replacing the whole sequence",
        a_size,
        b_size,
        get_max_sequence_table_cells(options));
}

void
check_sequence_edit(
    sequence_edit const& edit,
    size_t inserted_count,
    size_t edit_index,
    size_t source_length,
    size_t consumed_count)
{
    bool valid;
    switch (edit.op)
    {
        case sequence_edit_op::KEEP:
        case sequence_edit_op::DELETE:
            valid = edit.count != 0
                    && edit.count <= source_length - consumed_count;
            break;
        case sequence_edit_op::INSERT:
            valid = edit.count != 0 && inserted_count == edit.count;
            break;
        default:
            valid = false;
    }
    if (!valid)
    {
        DIFFTREE_THROW(
            sequence_out_of_bounds()
            << edit_index_info(edit_index)
            << source_length_info(source_length)
            << consumed_count_info(consumed_count));
    }
}

void
check_sequence_fully_consumed(
    size_t edit_count, size_t source_length, size_t consumed_count)
{
    if (consumed_count != source_length)
    {
        DIFFTREE_THROW(
            sequence_out_of_bounds()
            << edit_index_info(edit_count)
            << source_length_info(source_length)
            << consumed_count_info(consumed_count));
    }
}

} // namespace difftree
