#include <difftree/core/sequence_diff.hpp>

#include <algorithm>

#include <boost/lexical_cast.hpp>

#include <difftree/core/testing.hpp>

#include "fixtures.hpp"

using namespace difftree;

using boost::lexical_cast;

typedef std::vector<int32_t> int_vector;

namespace {

// Compute the length of the longest common subsequence of :a and :b the
// straightforward way, as a reference for the differ's results.
size_t
reference_lcs_length(int_vector const& a, int_vector const& b)
{
    std::vector<std::vector<size_t>> table(
        a.size() + 1, std::vector<size_t>(b.size() + 1, 0));
    for (size_t i = 1; i <= a.size(); ++i)
    {
        for (size_t j = 1; j <= b.size(); ++j)
        {
            table[i][j] = a[i - 1] == b[j - 1]
                              ? table[i - 1][j - 1] + 1
                              : std::max(table[i - 1][j], table[i][j - 1]);
        }
    }
    return table[a.size()][b.size()];
}

// a small deterministic generator of test sequences
struct sequence_generator
{
    uint32_t state = 12345;

    uint32_t
    next()
    {
        state = state * 1103515245 + 12345;
        return (state >> 16) & 0x7fff;
    }

    int_vector
    generate(size_t max_length, int32_t alphabet_size)
    {
        int_vector sequence(next() % (max_length + 1));
        for (auto& item : sequence)
            item = int32_t(next() % uint32_t(alphabet_size));
        return sequence;
    }
};

// Check that :edits is a canonical edit script from :a to :b and return the
// number of elements that it deletes or inserts.
size_t
check_canonical_script(
    int_vector const& a,
    int_vector const& b,
    std::vector<sequence_edit> const& edits)
{
    size_t consumed = 0, produced = 0, edited = 0;
    for (size_t i = 0; i != edits.size(); ++i)
    {
        auto const& edit = edits[i];
        REQUIRE(edit.count != 0);
        if (i != 0)
        {
            auto const& previous = edits[i - 1];
            // Runs are coalesced.
            REQUIRE(previous.op != edit.op);
            // Within a gap, deletes come before inserts.
            REQUIRE(
                !(previous.op == sequence_edit_op::INSERT
                  && edit.op == sequence_edit_op::DELETE));
        }
        switch (edit.op)
        {
            case sequence_edit_op::KEEP:
                for (size_t j = 0; j != edit.count; ++j)
                    REQUIRE(a[consumed + j] == b[produced + j]);
                consumed += edit.count;
                produced += edit.count;
                break;
            case sequence_edit_op::DELETE:
                consumed += edit.count;
                edited += edit.count;
                break;
            case sequence_edit_op::INSERT:
                REQUIRE(
                    get_inserted_items<int32_t>(edit)
                    == int_vector(
                        b.begin() + produced,
                        b.begin() + produced + edit.count));
                produced += edit.count;
                edited += edit.count;
                break;
        }
    }
    REQUIRE(consumed == a.size());
    REQUIRE(produced == b.size());
    return edited;
}

void
check_sequence_out_of_bounds(
    int_vector const& source,
    std::vector<sequence_edit> const& edits,
    size_t edit_index,
    size_t consumed_count)
{
    try
    {
        apply_delta(source, make_sequence_edits_delta<int_vector>(edits));
        FAIL("no exception thrown");
    }
    catch (sequence_out_of_bounds& e)
    {
        REQUIRE(get_required_error_info<edit_index_info>(e) == edit_index);
        REQUIRE(
            get_required_error_info<source_length_info>(e) == source.size());
        REQUIRE(
            get_required_error_info<consumed_count_info>(e)
            == consumed_count);
    }
}

} // namespace

TEST_CASE("sequence minimality scenario", "[core][sequence]")
{
    int_vector a = {1, 2, 3, 4};
    int_vector b = {1, 3, 4, 5};

    auto d = test_delta_round_trip(a, b);
    REQUIRE(
        d
        == make_sequence_edits_delta<int_vector>(
            {make_keep_edit(1),
             make_delete_edit(1),
             make_keep_edit(2),
             make_insert_edit(int_vector{5})}));
    REQUIRE(check_canonical_script(a, b, get_edits(d)) == 2);
}

TEST_CASE("sequence edit scripts", "[core][sequence]")
{
    auto script = [](int_vector const& a, int_vector const& b) {
        return lexical_cast<string>(compute_delta(a, b));
    };

    REQUIRE(script({}, {}) == "no_change");
    REQUIRE(script({1, 2}, {1, 2}) == "no_change");
    REQUIRE(script({1, 2, 3}, {}) == "sequence_edits[delete(3)]");
    REQUIRE(script({}, {7, 8}) == "sequence_edits[insert([7, 8])]");
    REQUIRE(
        script({1, 2}, {1, 2, 3}) == "sequence_edits[keep(2), insert([3])]");
    REQUIRE(script({0, 1, 2}, {1, 2}) == "sequence_edits[delete(1), keep(2)]");

    // Deletes come before inserts in the same gap.
    REQUIRE(
        script({1, 2, 3}, {1, 4, 3})
        == "sequence_edits[keep(1), delete(1), insert([4]), keep(1)]");
    REQUIRE(
        script({1, 5, 6, 3}, {1, 7, 3})
        == "sequence_edits[keep(1), delete(2), insert([7]), keep(1)]");

    // On ties, deleting is preferred over inserting.
    REQUIRE(
        script({1, 2}, {2, 1})
        == "sequence_edits[delete(1), keep(1), insert([1])]");

    // Equal leading elements are always matched.
    REQUIRE(script({1, 2, 1}, {1}) == "sequence_edits[keep(1), delete(2)]");
}

TEST_CASE("sequence edit runs", "[core][sequence]")
{
    int_vector a = {1, 2, 3, 4};
    int_vector b = {1, 3, 4, 5};
    auto runs = compute_edit_runs(
        a.size(),
        b.size(),
        [&](size_t i, size_t j) { return a[i] == b[j]; },
        1000);
    REQUIRE(runs.is_initialized());
    REQUIRE(
        *runs
        == (std::vector<edit_run>{
            {sequence_edit_op::KEEP, 0, 1},
            {sequence_edit_op::DELETE, 1, 1},
            {sequence_edit_op::KEEP, 2, 2},
            {sequence_edit_op::INSERT, 3, 1}}));

    // The table for this pair needs (3 + 1) * (3 + 1) cells.
    auto too_big = compute_edit_runs(
        3, 3, [](size_t i, size_t j) { return i == j + 1; }, 15);
    REQUIRE(!too_big);
    auto big_enough = compute_edit_runs(
        3, 3, [](size_t i, size_t j) { return i == j + 1; }, 16);
    REQUIRE(big_enough.is_initialized());
}

TEST_CASE("sequence diff properties", "[core][sequence]")
{
    sequence_generator generator;
    for (int n = 0; n != 200; ++n)
    {
        auto a = generator.generate(12, 4);
        auto b = generator.generate(12, 4);
        INFO(lexical_cast<string>(compute_delta(a, b)))

        test_delta_round_trip(a, b);

        auto d = compute_delta(a, b);
        if (a == b)
        {
            REQUIRE(is_no_change(d));
            continue;
        }
        REQUIRE(get_kind(d) == delta_kind::SEQUENCE_EDITS);
        auto edited = check_canonical_script(a, b, get_edits(d));
        REQUIRE(
            edited == a.size() + b.size() - 2 * reference_lcs_length(a, b));
    }
}

TEST_CASE("sequence cost guard", "[core][sequence]")
{
    diff_options options;
    options.max_sequence_table_cells = 4;
    options.log_sequence_fallbacks = false;

    // This would need a 4x4 table, so the differ falls back to replacing the
    // whole sequence.
    int_vector a = {1, 2, 3};
    int_vector b = {4, 5, 6};
    auto d = compute_delta(a, b, options);
    REQUIRE(d == make_replace_delta(b));
    REQUIRE(apply_delta(a, d) == b);

    // Long sequences that only differ in a small region are still diffed,
    // since the common prefix and suffix don't need a table.
    int_vector long_a(1000);
    for (size_t i = 0; i != long_a.size(); ++i)
        long_a[i] = int32_t(i);
    int_vector long_b = long_a;
    long_b[500] = -1;
    auto long_d = compute_delta(long_a, long_b, options);
    REQUIRE(get_kind(long_d) == delta_kind::SEQUENCE_EDITS);
    REQUIRE(
        long_d
        == make_sequence_edits_delta<int_vector>(
            {make_keep_edit(500),
             make_delete_edit(1),
             make_insert_edit(int_vector{-1}),
             make_keep_edit(499)}));
    REQUIRE(apply_delta(long_a, long_d) == long_b);

    // The fallback can also be logged.
    options.log_sequence_fallbacks = true;
    REQUIRE(get_kind(compute_delta(a, b, options)) == delta_kind::REPLACE);
}

TEST_CASE("sequences of structures", "[core][sequence]")
{
    std::vector<child1> a = {child1{1, "a"}, child1{2, "b"}, child1{3, "c"}};
    std::vector<child1> b = {child1{1, "a"}, child1{2, "B"}, child1{3, "c"}};

    // Elements are matched as a whole, so a changed element is deleted and
    // reinserted rather than patched.
    auto d = test_delta_round_trip(a, b);
    REQUIRE(get_edits(d).size() == 4);
    REQUIRE(get_edits(d)[1] == make_delete_edit(1));
    REQUIRE(
        get_inserted_items<child1>(get_edits(d)[2])
        == (std::vector<child1>{child1{2, "B"}}));
}

TEST_CASE("sequence edit scripts that don't fit", "[core][sequence]")
{
    int_vector source = {1, 2, 3};

    // keeping past the end
    check_sequence_out_of_bounds(source, {make_keep_edit(4)}, 0, 0);
    // deleting past the end
    check_sequence_out_of_bounds(
        source, {make_keep_edit(2), make_delete_edit(2)}, 1, 2);
    // zero counts
    check_sequence_out_of_bounds(
        source, {make_keep_edit(0), make_keep_edit(3)}, 0, 0);
    // empty insertions
    check_sequence_out_of_bounds(
        source, {make_insert_edit(int_vector()), make_keep_edit(3)}, 0, 0);
    // not consuming the whole source
    check_sequence_out_of_bounds(source, {make_keep_edit(2)}, 1, 2);
    check_sequence_out_of_bounds(
        source, {make_insert_edit(int_vector{9})}, 1, 0);
    // unknown operations
    check_sequence_out_of_bounds(
        source,
        {make_keep_edit(1),
         sequence_edit{sequence_edit_op(7), 1, untyped_immutable()}},
        1,
        1);
    REQUIRE(!try_apply_delta(
        int_vector{1},
        make_sequence_edits_delta<int_vector>(
            {sequence_edit{sequence_edit_op(7), 1, untyped_immutable()}})));

    // A script can be applied to any source of the right length.
    auto d = compute_delta(int_vector{1, 2, 3}, int_vector{1, 3});
    REQUIRE(apply_delta(int_vector{7, 8, 9}, d) == (int_vector{7, 9}));
}

TEST_CASE("mistyped sequence insertions", "[core][sequence]")
{
    auto d = make_sequence_edits_delta<int_vector>(
        {make_insert_edit(std::vector<string>{"x"})});
    try
    {
        apply_delta(int_vector(), d);
        FAIL("no exception thrown");
    }
    catch (delta_shape_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<shape_mismatch_reason_info>(e)
            == shape_mismatch_reason::TYPE);
    }
}
