#include <difftree/core/map_diff.hpp>

#include <boost/lexical_cast.hpp>

#include <difftree/core/testing.hpp>

#include "fixtures.hpp"

using namespace difftree;

using boost::lexical_cast;

typedef std::map<string, int32_t> string_int_map;

TEST_CASE("map_entry_op streaming", "[core][map]")
{
    REQUIRE(lexical_cast<string>(map_entry_op::INSERT) == "insert");
    REQUIRE(lexical_cast<string>(map_entry_op::REMOVE) == "remove");
    REQUIRE(lexical_cast<string>(map_entry_op::UPDATE) == "update");
    REQUIRE_THROWS_AS(
        lexical_cast<string>(map_entry_op(-1)), invalid_enum_value);
}

TEST_CASE("map diffs", "[core][map]")
{
    string_int_map a = {{"a", 1}, {"b", 2}};
    string_int_map b = {{"b", 3}, {"c", 4}};

    auto d = test_delta_round_trip(a, b);
    REQUIRE(get_kind(d) == delta_kind::ENTRIES_CHANGED);

    auto const& entries
        = get_entries<std::map<string, map_entry_edit<int32_t>>>(d);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries.at("a") == make_remove_entry<int32_t>());
    REQUIRE(
        entries.at("b") == make_update_entry(make_replace_delta(int32_t(3))));
    REQUIRE(entries.at("c") == make_insert_entry(int32_t(4)));

    REQUIRE(
        lexical_cast<string>(d)
        == "entries_changed{a: remove, b: update(replace(3)), c: insert(4)}");

    // Keys whose values didn't change don't appear.
    string_int_map c = {{"a", 1}, {"b", 5}};
    auto only_b = compute_delta(a, c);
    REQUIRE(
        lexical_cast<string>(only_b)
        == "entries_changed{b: update(replace(5))}");

    REQUIRE(is_no_change(compute_delta(a, a)));
    test_delta_round_trip(string_int_map(), a);
    test_delta_round_trip(a, string_int_map());
}

TEST_CASE("map value deltas", "[core][map]")
{
    typedef std::map<int32_t, simple_struct> struct_map;
    struct_map a
        = {{1, simple_struct{"one", 1}}, {2, simple_struct{"two", 2}}};
    struct_map b
        = {{1, simple_struct{"one", 1}}, {2, simple_struct{"two", 3}}};

    // Updated values are diffed with their own differs.
    auto d = test_delta_round_trip(a, b);
    REQUIRE(
        lexical_cast<string>(d)
        == "entries_changed{2: update(fields_changed{y: replace(3)})}");
}

TEST_CASE("unordered map diffs", "[core][map]")
{
    typedef std::unordered_map<int32_t, string> hashed_map;
    hashed_map a = {{1, "one"}, {2, "two"}, {3, "three"}};
    hashed_map b = {{2, "two"}, {3, "THREE"}, {4, "four"}};

    auto d = test_delta_round_trip(a, b);
    auto const& entries
        = get_entries<std::unordered_map<int32_t, map_entry_edit<string>>>(d);
    REQUIRE(entries.size() == 3);
    REQUIRE(entries.at(1).op == map_entry_op::REMOVE);
    REQUIRE(entries.at(3).op == map_entry_op::UPDATE);
    REQUIRE(entries.at(4).op == map_entry_op::INSERT);

    test_delta_round_trip(hashed_map(), b);
}

TEST_CASE("map entry mismatches", "[core][map]")
{
    string_int_map a = {{"a", 1}, {"b", 2}};
    string_int_map b = {{"b", 3}, {"c", 4}};
    auto d = compute_delta(a, b);

    auto check_mismatch = [&](string_int_map const& source,
                              shape_mismatch_reason reason,
                              string const& key) {
        try
        {
            apply_delta(source, d);
            FAIL("no exception thrown");
        }
        catch (delta_shape_mismatch& e)
        {
            REQUIRE(
                get_required_error_info<shape_mismatch_reason_info>(e)
                == reason);
            REQUIRE(get_required_error_info<entry_key_info>(e) == key);
        }
    };

    // "a" is missing, so it can't be removed.
    check_mismatch(
        string_int_map{{"b", 2}}, shape_mismatch_reason::MISSING_KEY, "a");
    // "b" is missing, so it can't be updated.
    check_mismatch(
        string_int_map{{"a", 1}}, shape_mismatch_reason::MISSING_KEY, "b");
    // "c" is already present, so it can't be inserted.
    check_mismatch(
        string_int_map{{"a", 1}, {"b", 2}, {"c", 0}},
        shape_mismatch_reason::UNEXPECTED_KEY,
        "c");
}

TEST_CASE("nested map value mismatches", "[core][map]")
{
    typedef std::map<string, simple_struct> struct_map;
    std::map<string, map_entry_edit<simple_struct>> entries;
    entries.emplace(
        "k",
        make_update_entry(make_fields_changed_delta<simple_struct>(
            {field_delta{"y", erase_type(make_replace_delta(string("2")))}})));
    auto d = make_entries_changed_delta<struct_map>(std::move(entries));

    try
    {
        apply_delta(struct_map{{"k", simple_struct{"a", 1}}}, d);
        FAIL("no exception thrown");
    }
    catch (delta_shape_mismatch& e)
    {
        REQUIRE(
            get_required_error_info<shape_mismatch_reason_info>(e)
            == shape_mismatch_reason::TYPE);
        REQUIRE(
            lexical_cast<string>(get_required_error_info<delta_path_info>(e))
            == "k/y");
    }
}
