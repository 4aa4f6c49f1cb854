#ifndef DIFFTREE_CORE_DELTA_HPP
#define DIFFTREE_CORE_DELTA_HPP

#include <list>
#include <memory>
#include <ostream>
#include <typeindex>
#include <vector>

#include <difftree/core/immutable.hpp>

// This file defines the delta model - the representation of a structural
// difference between two values of the same type.

namespace difftree {

enum class delta_kind
{
    // the two values compared equal
    NO_CHANGE,
    // the target value is carried in full
    REPLACE,
    // some fields of a structure changed
    FIELDS_CHANGED,
    // a union switched to another alternative (carried in full)
    VARIANT_CHANGED,
    // the active alternative of a union stayed the same but its payload
    // changed
    SAME_VARIANT,
    // an edit script transforms one sequence into another
    SEQUENCE_EDITS,
    // some entries of an associative container were inserted, removed or
    // updated
    ENTRIES_CHANGED
};

std::ostream&
operator<<(std::ostream& s, delta_kind kind);

// Fields are identified by their declared names. Positional fields (tuple
// elements and non-structure union payloads) are identified by their decimal
// positions ("0", "1", ...).
typedef string field_id;

struct delta_node;

// untyped_delta is the type-erased form of delta<T>.
// A null node means NO_CHANGE.
struct untyped_delta
{
    std::shared_ptr<delta_node const> node;
};

struct field_delta
{
    field_id field;
    untyped_delta delta;
};

enum class sequence_edit_op
{
    // copy items from the source
    KEEP,
    // skip items in the source
    DELETE,
    // add new items to the result
    INSERT
};

std::ostream&
operator<<(std::ostream& s, sequence_edit_op op);

struct sequence_edit
{
    sequence_edit_op op;
    // For KEEP and DELETE, this is the number of source items consumed.
    // For INSERT, it's the number of items inserted.
    size_t count;
    // the inserted items (as an immutable std::vector) - only for INSERT
    untyped_immutable items;
};

// delta_node is immutable once constructed. Which of the payload members is
// meaningful depends on :kind.
struct delta_node
{
    delta_node(delta_kind kind, std::type_index type) : kind(kind), type(type)
    {
    }

    delta_kind kind;
    // the type that the delta was computed for
    std::type_index type;
    // REPLACE and VARIANT_CHANGED - the full target value
    untyped_immutable value;
    // VARIANT_CHANGED and SAME_VARIANT - the index of the alternative
    size_t variant = 0;
    // FIELDS_CHANGED and SAME_VARIANT
    std::vector<field_delta> fields;
    // SEQUENCE_EDITS
    std::vector<sequence_edit> edits;
    // ENTRIES_CHANGED - an immutable container of entry edits, keyed like the
    // original container
    untyped_immutable entries;
};

static inline delta_kind
get_kind(untyped_delta const& d)
{
    return d.node ? d.node->kind : delta_kind::NO_CHANGE;
}

static inline bool
is_no_change(untyped_delta const& d)
{
    return !d.node;
}

bool
operator==(untyped_delta const& a, untyped_delta const& b);
bool
operator!=(untyped_delta const& a, untyped_delta const& b);

bool
operator==(field_delta const& a, field_delta const& b);
bool
operator!=(field_delta const& a, field_delta const& b);

bool
operator==(sequence_edit const& a, sequence_edit const& b);
bool
operator!=(sequence_edit const& a, sequence_edit const& b);

std::ostream&
operator<<(std::ostream& s, untyped_delta const& d);

std::ostream&
operator<<(std::ostream& s, field_delta const& d);

std::ostream&
operator<<(std::ostream& s, sequence_edit const& edit);

// delta<T> is an immutable description of how to transform one value of
// type T into another. Copying a delta is cheap, and a delta can be shared
// freely between threads.
template<class T>
struct delta
{
    untyped_delta untyped;
};

template<class T>
delta_kind
get_kind(delta<T> const& d)
{
    return get_kind(d.untyped);
}

template<class T>
bool
is_no_change(delta<T> const& d)
{
    return is_no_change(d.untyped);
}

template<class T>
bool
operator==(delta<T> const& a, delta<T> const& b)
{
    return a.untyped == b.untyped;
}
template<class T>
bool
operator!=(delta<T> const& a, delta<T> const& b)
{
    return !(a == b);
}

template<class T>
std::ostream&
operator<<(std::ostream& s, delta<T> const& d)
{
    return s << d.untyped;
}

// ERRORS

// The reason a delta couldn't be applied to a source value.
enum class shape_mismatch_reason
{
    // The delta was computed for a different type.
    TYPE,
    // The delta's kind doesn't make sense for the source type.
    KIND,
    // The delta references a field that the structure doesn't have.
    UNKNOWN_FIELD,
    // The delta's field entries aren't in declaration order (or repeat).
    FIELD_ORDER,
    // The source holds a different union alternative than the one the delta
    // was computed against.
    VARIANT,
    // The delta removes or updates a key that the source doesn't contain.
    MISSING_KEY,
    // The delta inserts a key that the source already contains.
    UNEXPECTED_KEY
};

std::ostream&
operator<<(std::ostream& s, shape_mismatch_reason reason);

// delta_shape_mismatch signals that a delta was computed against a different
// (or differently-shaped) value than the one being patched.
DIFFTREE_DEFINE_EXCEPTION(delta_shape_mismatch)
DIFFTREE_DEFINE_ERROR_INFO(shape_mismatch_reason, shape_mismatch_reason)
DIFFTREE_DEFINE_ERROR_INFO(string, expected_type)
DIFFTREE_DEFINE_ERROR_INFO(string, actual_type)
DIFFTREE_DEFINE_ERROR_INFO(delta_kind, expected_delta_kind)
DIFFTREE_DEFINE_ERROR_INFO(delta_kind, actual_delta_kind)
DIFFTREE_DEFINE_ERROR_INFO(string, field_id)
DIFFTREE_DEFINE_ERROR_INFO(size_t, expected_variant)
DIFFTREE_DEFINE_ERROR_INFO(size_t, actual_variant)
DIFFTREE_DEFINE_ERROR_INFO(string, entry_key)

// sequence_out_of_bounds signals that a sequence edit script doesn't fit the
// source sequence (or contains an invalid edit).
DIFFTREE_DEFINE_EXCEPTION(sequence_out_of_bounds)
DIFFTREE_DEFINE_ERROR_INFO(size_t, source_length)
DIFFTREE_DEFINE_ERROR_INFO(size_t, consumed_count)
DIFFTREE_DEFINE_ERROR_INFO(size_t, edit_index)

// When a patch error occurs inside a nested value, this provides the path to
// the location within the value where the error occurred. Elements are field
// ids, sequence positions and map keys.
struct delta_path
{
    std::list<string> elements;
};

bool
operator==(delta_path const& a, delta_path const& b);

std::ostream&
operator<<(std::ostream& s, delta_path const& path);

DIFFTREE_DEFINE_ERROR_INFO(delta_path, delta_path)

// Given an exception :e, this will add :element to the beginning of the
// delta_path info associated with :e. If there is currently no path info
// associated with :e, a path containing only :element is associated with it.
void
add_delta_path_element(boost::exception& e, string const& element);

// Check that :d was computed for the type :expected.
void
check_delta_type(untyped_delta const& d, std::type_index const& expected);

// Check that :d has the kind :expected.
void
check_delta_kind(untyped_delta const& d, delta_kind expected);

// Throw a delta_shape_mismatch indicating that :d's kind isn't one that
// applies to the type being patched.
[[noreturn]] void
throw_unsupported_delta_kind(untyped_delta const& d);

// Check that an immutable payload holds a value of type :expected.
void
check_payload_type(
    untyped_immutable const& payload, std::type_index const& expected);

// CASTING

template<class T>
untyped_delta
erase_type(delta<T> const& d)
{
    return d.untyped;
}

// Cast an untyped_delta to a typed one.
// If the delta was computed for a different type, this throws a
// delta_shape_mismatch.
template<class T>
delta<T>
cast_delta(untyped_delta const& untyped)
{
    check_delta_type(untyped, std::type_index(typeid(T)));
    return delta<T>{untyped};
}

template<class T>
T const&
cast_payload(untyped_immutable const& payload)
{
    check_payload_type(payload, std::type_index(typeid(T)));
    // The value is owned by :payload, so the reference outlives the cast.
    return cast_immutable<T>(payload).ptr->value;
}

// CONSTRUCTION

namespace detail {

template<class T>
std::shared_ptr<delta_node>
make_delta_node(delta_kind kind)
{
    return std::make_shared<delta_node>(kind, std::type_index(typeid(T)));
}

} // namespace detail

template<class T>
delta<T>
make_no_change_delta()
{
    return delta<T>();
}

template<class T>
delta<T>
make_replace_delta(T value)
{
    auto node = detail::make_delta_node<T>(delta_kind::REPLACE);
    node->value = erase_type(make_immutable(std::move(value)));
    return delta<T>{untyped_delta{std::move(node)}};
}

template<class T>
delta<T>
make_fields_changed_delta(std::vector<field_delta> fields)
{
    auto node = detail::make_delta_node<T>(delta_kind::FIELDS_CHANGED);
    node->fields = std::move(fields);
    return delta<T>{untyped_delta{std::move(node)}};
}

template<class T>
delta<T>
make_variant_changed_delta(size_t variant, T value)
{
    auto node = detail::make_delta_node<T>(delta_kind::VARIANT_CHANGED);
    node->variant = variant;
    node->value = erase_type(make_immutable(std::move(value)));
    return delta<T>{untyped_delta{std::move(node)}};
}

template<class T>
delta<T>
make_same_variant_delta(size_t variant, std::vector<field_delta> fields)
{
    auto node = detail::make_delta_node<T>(delta_kind::SAME_VARIANT);
    node->variant = variant;
    node->fields = std::move(fields);
    return delta<T>{untyped_delta{std::move(node)}};
}

static inline sequence_edit
make_keep_edit(size_t count)
{
    return sequence_edit{sequence_edit_op::KEEP, count, untyped_immutable()};
}

static inline sequence_edit
make_delete_edit(size_t count)
{
    return sequence_edit{
        sequence_edit_op::DELETE, count, untyped_immutable()};
}

template<class Item>
sequence_edit
make_insert_edit(std::vector<Item> items)
{
    size_t count = items.size();
    return sequence_edit{
        sequence_edit_op::INSERT,
        count,
        erase_type(make_immutable(std::move(items)))};
}

template<class Sequence>
delta<Sequence>
make_sequence_edits_delta(std::vector<sequence_edit> edits)
{
    auto node = detail::make_delta_node<Sequence>(delta_kind::SEQUENCE_EDITS);
    node->edits = std::move(edits);
    return delta<Sequence>{untyped_delta{std::move(node)}};
}

template<class Map, class Entries>
delta<Map>
make_entries_changed_delta(Entries entries)
{
    auto node = detail::make_delta_node<Map>(delta_kind::ENTRIES_CHANGED);
    node->entries = erase_type(make_immutable(std::move(entries)));
    return delta<Map>{untyped_delta{std::move(node)}};
}

// ACCESSORS
// These are only valid for deltas of the kinds noted.

// REPLACE and VARIANT_CHANGED
template<class T>
T const&
get_replacement(delta<T> const& d)
{
    return cast_payload<T>(d.untyped.node->value);
}

// VARIANT_CHANGED and SAME_VARIANT
template<class T>
size_t
get_variant(delta<T> const& d)
{
    return d.untyped.node->variant;
}

// FIELDS_CHANGED and SAME_VARIANT
template<class T>
std::vector<field_delta> const&
get_fields(delta<T> const& d)
{
    return d.untyped.node->fields;
}

// SEQUENCE_EDITS
template<class T>
std::vector<sequence_edit> const&
get_edits(delta<T> const& d)
{
    return d.untyped.node->edits;
}

// the items of an INSERT edit
template<class Item>
std::vector<Item> const&
get_inserted_items(sequence_edit const& edit)
{
    return cast_payload<std::vector<Item>>(edit.items);
}

// ENTRIES_CHANGED
template<class Entries, class Map>
Entries const&
get_entries(delta<Map> const& d)
{
    return cast_payload<Entries>(d.untyped.node->entries);
}

} // namespace difftree

#endif
