#ifndef DIFFTREE_CORE_MAP_DIFF_HPP
#define DIFFTREE_CORE_MAP_DIFF_HPP

#include <map>
#include <unordered_map>

#include <difftree/core/patch.hpp>

// MAP DIFFS - Associative containers are diffed key by key. Each key that
// differs between the two maps gets an entry edit: an insertion, a removal or
// an update carrying the delta for the value.

namespace difftree {

enum class map_entry_op
{
    INSERT,
    REMOVE,
    UPDATE
};

std::ostream&
operator<<(std::ostream& s, map_entry_op op);

template<class Value>
struct map_entry_edit
{
    map_entry_op op;
    // INSERT - the value to insert
    optional<Value> value;
    // UPDATE - the delta to apply to the existing value
    delta<Value> update;
};

template<class Value>
map_entry_edit<Value>
make_insert_entry(Value value)
{
    return map_entry_edit<Value>{
        map_entry_op::INSERT, some(std::move(value)), delta<Value>()};
}

template<class Value>
map_entry_edit<Value>
make_remove_entry()
{
    return map_entry_edit<Value>{map_entry_op::REMOVE, none, delta<Value>()};
}

template<class Value>
map_entry_edit<Value>
make_update_entry(delta<Value> update)
{
    return map_entry_edit<Value>{
        map_entry_op::UPDATE, none, std::move(update)};
}

template<class Value>
bool
operator==(map_entry_edit<Value> const& a, map_entry_edit<Value> const& b)
{
    return a.op == b.op && a.value == b.value && a.update == b.update;
}
template<class Value>
bool
operator!=(map_entry_edit<Value> const& a, map_entry_edit<Value> const& b)
{
    return !(a == b);
}

template<class Value>
std::ostream&
operator<<(std::ostream& s, map_entry_edit<Value> const& edit)
{
    s << edit.op;
    switch (edit.op)
    {
        case map_entry_op::INSERT:
            s << "(" << to_diagnostic_string(edit.value) << ")";
            break;
        case map_entry_op::UPDATE:
            s << "(" << edit.update << ")";
            break;
        default:
            break;
    }
    return s;
}

// map_entries_type<Map>::type is the container that holds the entry edits
// for a delta of Map. It's keyed (and ordered or hashed) like Map.
template<class Map>
struct map_entries_type
{
};
template<class Key, class Value, class Compare, class Allocator>
struct map_entries_type<std::map<Key, Value, Compare, Allocator>>
{
    typedef std::map<Key, map_entry_edit<Value>, Compare> type;
};
template<
    class Key,
    class Value,
    class Hash,
    class Equal,
    class Allocator>
struct map_entries_type<
    std::unordered_map<Key, Value, Hash, Equal, Allocator>>
{
    typedef std::unordered_map<Key, map_entry_edit<Value>, Hash, Equal> type;
};

// Throw a delta_shape_mismatch for an entry edit that can't be applied to the
// source map.
[[noreturn]] void
throw_entry_mismatch(shape_mismatch_reason reason, string const& key);

template<class Map>
struct map_delta_interface
{
    typedef typename Map::mapped_type value_type;
    typedef typename map_entries_type<Map>::type entries_type;

    static delta<Map>
    compute(Map const& a, Map const& b, diff_options const& options)
    {
        entries_type entries;
        for (auto const& entry : a)
        {
            auto other = b.find(entry.first);
            if (other == b.end())
            {
                entries.emplace(
                    entry.first, make_remove_entry<value_type>());
            }
            else
            {
                auto change
                    = compute_delta(entry.second, other->second, options);
                if (!is_no_change(change))
                {
                    entries.emplace(
                        entry.first, make_update_entry(std::move(change)));
                }
            }
        }
        for (auto const& entry : b)
        {
            if (a.find(entry.first) == a.end())
                entries.emplace(entry.first, make_insert_entry(entry.second));
        }
        if (entries.empty())
            return make_no_change_delta<Map>();
        return make_entries_changed_delta<Map>(std::move(entries));
    }

    static Map
    apply(Map const& source, delta<Map> const& d)
    {
        if (auto patched = apply_whole_value_delta(source, d))
            return std::move(*patched);
        check_delta_kind(d.untyped, delta_kind::ENTRIES_CHANGED);

        Map result = source;
        for (auto const& entry : get_entries<entries_type>(d))
        {
            auto const& key = entry.first;
            auto const& edit = entry.second;
            auto existing = result.find(key);
            switch (edit.op)
            {
                case map_entry_op::INSERT:
                    if (existing != result.end())
                    {
                        throw_entry_mismatch(
                            shape_mismatch_reason::UNEXPECTED_KEY,
                            to_diagnostic_string(key));
                    }
                    if (!edit.value)
                    {
                        throw_entry_mismatch(
                            shape_mismatch_reason::KIND,
                            to_diagnostic_string(key));
                    }
                    result.emplace(key, *edit.value);
                    break;
                case map_entry_op::REMOVE:
                    if (existing == result.end())
                    {
                        throw_entry_mismatch(
                            shape_mismatch_reason::MISSING_KEY,
                            to_diagnostic_string(key));
                    }
                    result.erase(existing);
                    break;
                case map_entry_op::UPDATE:
                    if (existing == result.end())
                    {
                        throw_entry_mismatch(
                            shape_mismatch_reason::MISSING_KEY,
                            to_diagnostic_string(key));
                    }
                    try
                    {
                        existing->second
                            = apply_delta(existing->second, edit.update);
                    }
                    catch (boost::exception& e)
                    {
                        add_delta_path_element(e, to_diagnostic_string(key));
                        throw;
                    }
                    break;
            }
        }
        return result;
    }
};

template<class Key, class Value, class Compare, class Allocator>
struct delta_interface<std::map<Key, Value, Compare, Allocator>>
    : map_delta_interface<std::map<Key, Value, Compare, Allocator>>
{
};

template<
    class Key,
    class Value,
    class Hash,
    class Equal,
    class Allocator>
struct delta_interface<std::unordered_map<Key, Value, Hash, Equal, Allocator>>
    : map_delta_interface<
          std::unordered_map<Key, Value, Hash, Equal, Allocator>>
{
};

} // namespace difftree

#endif
