#ifndef DIFFTREE_CORE_SEQUENCE_DIFF_HPP
#define DIFFTREE_CORE_SEQUENCE_DIFF_HPP

#include <vector>

#include <difftree/core/patch.hpp>

// SEQUENCE DIFFS - Sequences are diffed with whole-element semantics: each
// element of the source is either kept verbatim or deleted, and elements of
// the target that aren't kept are inserted. The resulting edit script is
// minimal (in deleted + inserted elements) and canonical.

namespace difftree {

// An edit_run is one operation of an edit script, expressed as a range of
// one of the two input sequences. For KEEP and DELETE, :offset indexes the
// source (a). For INSERT, it indexes the target (b).
struct edit_run
{
    sequence_edit_op op;
    size_t offset;
    size_t count;
};

bool
operator==(edit_run const& a, edit_run const& b);
bool
operator!=(edit_run const& a, edit_run const& b);

std::ostream&
operator<<(std::ostream& s, edit_run const& run);

// Compute the canonical edit script that transforms a sequence of length
// :a_size into one of length :b_size. :items_equal(i, j) tells whether a[i]
// equals b[j].
//
// The script has these properties:
// - It consumes the source exactly.
// - Adjacent runs of the same operation are coalesced and no run is empty.
// - Between any two kept runs, deletes come before inserts.
// - Equal elements are always matched, and where deleting and inserting
//   leave equally long common subsequences, the delete is taken first.
//
// If solving the problem would require an LCS table with more than
// :max_table_cells cells, this returns none.
optional<std::vector<edit_run>>
compute_edit_runs(
    size_t a_size,
    size_t b_size,
    function_view<bool(size_t, size_t)> items_equal,
    size_t max_table_cells);

// Log (if enabled) that a sequence diff fell back to replacing the whole
// sequence.
void
note_sequence_fallback(
    size_t a_size, size_t b_size, diff_options const& options);

// Check that :edit can be applied at the current position of a sequence
// patch and throw a sequence_out_of_bounds if it can't.
// :inserted_count is the number of items actually carried by an INSERT edit.
void
check_sequence_edit(
    sequence_edit const& edit,
    size_t inserted_count,
    size_t edit_index,
    size_t source_length,
    size_t consumed_count);

// Check that a sequence patch consumed its entire source.
void
check_sequence_fully_consumed(
    size_t edit_count, size_t source_length, size_t consumed_count);

template<class Item>
struct sequence_delta_interface
{
    typedef std::vector<Item> sequence_type;

    static delta<sequence_type>
    compute(
        sequence_type const& a,
        sequence_type const& b,
        diff_options const& options)
    {
        if (a == b)
            return make_no_change_delta<sequence_type>();

        auto runs = compute_edit_runs(
            a.size(),
            b.size(),
            [&](size_t i, size_t j) -> bool { return a[i] == b[j]; },
            get_max_sequence_table_cells(options));
        if (!runs)
        {
            note_sequence_fallback(a.size(), b.size(), options);
            return make_replace_delta(b);
        }

        std::vector<sequence_edit> edits;
        edits.reserve(runs->size());
        for (auto const& run : *runs)
        {
            switch (run.op)
            {
                case sequence_edit_op::KEEP:
                    edits.push_back(make_keep_edit(run.count));
                    break;
                case sequence_edit_op::DELETE:
                    edits.push_back(make_delete_edit(run.count));
                    break;
                case sequence_edit_op::INSERT:
                    edits.push_back(make_insert_edit(sequence_type(
                        b.begin() + run.offset,
                        b.begin() + run.offset + run.count)));
                    break;
            }
        }
        return make_sequence_edits_delta<sequence_type>(std::move(edits));
    }

    static sequence_type
    apply(sequence_type const& source, delta<sequence_type> const& d)
    {
        if (auto patched = apply_whole_value_delta(source, d))
            return std::move(*patched);
        check_delta_kind(d.untyped, delta_kind::SEQUENCE_EDITS);

        auto const& edits = get_edits(d);
        sequence_type result;
        result.reserve(source.size());
        size_t consumed = 0;
        for (size_t i = 0; i != edits.size(); ++i)
        {
            auto const& edit = edits[i];
            if (edit.op == sequence_edit_op::INSERT)
            {
                auto const& items = get_inserted_items<Item>(edit);
                check_sequence_edit(
                    edit, items.size(), i, source.size(), consumed);
                result.insert(result.end(), items.begin(), items.end());
            }
            else
            {
                check_sequence_edit(edit, 0, i, source.size(), consumed);
                if (edit.op == sequence_edit_op::KEEP)
                {
                    result.insert(
                        result.end(),
                        source.begin() + consumed,
                        source.begin() + consumed + edit.count);
                }
                consumed += edit.count;
            }
        }
        check_sequence_fully_consumed(edits.size(), source.size(), consumed);
        return result;
    }
};

template<class Item>
struct delta_interface<std::vector<Item>> : sequence_delta_interface<Item>
{
};

} // namespace difftree

#endif
