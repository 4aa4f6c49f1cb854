#ifndef DIFFTREE_CORE_STRUCTURE_DIFF_HPP
#define DIFFTREE_CORE_STRUCTURE_DIFF_HPP

#include <string>
#include <tuple>
#include <utility>

#include <difftree/core/patch.hpp>

// STRUCTURE DIFFS - Structures (and other product types) are diffed field by
// field. Only fields that changed appear in the delta.

namespace difftree {

// A field descriptor provides:
//
//   typedef ... field_type;
//   field_id id() const;
//   field_type const& get(Value const& v) const;
//   field_type& get(Value& v) const;
//
// Products are described by tuples of field descriptors, listed in
// declaration order.

// structure_field describes a named data member of a structure.
template<class Structure, class Field>
struct structure_field
{
    typedef Field field_type;

    char const* name;
    Field Structure::*member;

    field_id
    id() const
    {
        return name;
    }
    Field const&
    get(Structure const& s) const
    {
        return s.*member;
    }
    Field&
    get(Structure& s) const
    {
        return s.*member;
    }
};

template<class Structure, class Field>
structure_field<Structure, Field>
make_structure_field(char const* name, Field Structure::*member)
{
    return structure_field<Structure, Field>{name, member};
}

// tuple_field describes an element of a std::tuple or std::pair.
template<class Tuple, size_t Index>
struct tuple_field
{
    typedef std::tuple_element_t<Index, Tuple> field_type;

    field_id
    id() const
    {
        return std::to_string(Index);
    }
    field_type const&
    get(Tuple const& t) const
    {
        return std::get<Index>(t);
    }
    field_type&
    get(Tuple& t) const
    {
        return std::get<Index>(t);
    }
};

template<class Tuple, size_t... Indices>
auto
make_tuple_fields(std::index_sequence<Indices...>)
{
    return std::make_tuple(tuple_field<Tuple, Indices>()...);
}

template<class Tuple>
auto
make_tuple_fields()
{
    return make_tuple_fields<Tuple>(
        std::make_index_sequence<std::tuple_size<Tuple>::value>());
}

// whole_value_field presents an entire value as the single positional field
// "0" of a product.
template<class T>
struct whole_value_field
{
    typedef T field_type;

    field_id
    id() const
    {
        return "0";
    }
    T const&
    get(T const& v) const
    {
        return v;
    }
    T&
    get(T& v) const
    {
        return v;
    }
};

// structure_fields<T>::get() should return a tuple of structure_field
// descriptors for the fields of T, in declaration order, e.g.:
//
//   template<>
//   struct structure_fields<point>
//   {
//       static auto
//       get()
//       {
//           return std::make_tuple(
//               make_structure_field("x", &point::x),
//               make_structure_field("y", &point::y));
//       }
//   };
//
// Providing this specialization makes T diffable as a structure. It's what a
// code generator would emit for each structure type.
//
template<class T>
struct structure_fields
{
};

template<class T, class = void>
struct has_structure_fields : std::false_type
{
};
template<class T>
struct has_structure_fields<
    T,
    std::void_t<decltype(structure_fields<T>::get())>> : std::true_type
{
};

// Compute the deltas for the fields of a product.
// Only the fields that changed are included, in declaration order.
template<class Value, class Fields>
std::vector<field_delta>
compute_field_deltas(
    Fields const& fields,
    Value const& a,
    Value const& b,
    diff_options const& options)
{
    std::vector<field_delta> changes;
    for_each_indexed(fields, [&](auto, auto const& field) {
        auto field_change
            = compute_delta(field.get(a), field.get(b), options);
        if (!is_no_change(field_change))
        {
            changes.push_back(
                field_delta{field.id(), erase_type(field_change)});
        }
    });
    return changes;
}

// Apply a list of field deltas to a product.
template<class Value, class Fields>
Value
apply_field_deltas(
    Fields const& fields,
    Value const& source,
    std::vector<field_delta> const& changes)
{
    Value result = source;
    // Field entries must appear in declaration order, so this tracks the
    // first field that the next entry is allowed to reference.
    size_t next_allowed_field = 0;
    for (auto const& change : changes)
    {
        bool found = false;
        for_each_indexed(fields, [&](auto index, auto const& field) {
            if (found || field.id() != change.field)
                return;
            found = true;
            if (index < next_allowed_field)
            {
                DIFFTREE_THROW(
                    delta_shape_mismatch()
                    << shape_mismatch_reason_info(
                           shape_mismatch_reason::FIELD_ORDER)
                    << field_id_info(change.field));
            }
            next_allowed_field = index + 1;
            typedef typename std::decay_t<decltype(field)>::field_type
                field_type;
            try
            {
                field.get(result) = apply_delta(
                    field.get(source), cast_delta<field_type>(change.delta));
            }
            catch (boost::exception& e)
            {
                add_delta_path_element(e, change.field);
                throw;
            }
        });
        if (!found)
        {
            DIFFTREE_THROW(
                delta_shape_mismatch()
                << shape_mismatch_reason_info(
                       shape_mismatch_reason::UNKNOWN_FIELD)
                << field_id_info(change.field));
        }
    }
    return result;
}

// product_delta_interface implements the delta interface for any type whose
// fields are described by FieldList::get().
template<class T, class FieldList>
struct product_delta_interface
{
    static delta<T>
    compute(T const& a, T const& b, diff_options const& options)
    {
        auto changes
            = compute_field_deltas(FieldList::get(), a, b, options);
        return changes.empty()
                   ? make_no_change_delta<T>()
                   : make_fields_changed_delta<T>(std::move(changes));
    }

    static T
    apply(T const& source, delta<T> const& d)
    {
        if (auto patched = apply_whole_value_delta(source, d))
            return std::move(*patched);
        check_delta_kind(d.untyped, delta_kind::FIELDS_CHANGED);
        return apply_field_deltas(FieldList::get(), source, get_fields(d));
    }
};

template<class T>
struct structure_delta_interface
    : product_delta_interface<T, structure_fields<T>>
{
};

template<class Tuple>
struct tuple_field_list
{
    static auto
    get()
    {
        return make_tuple_fields<Tuple>();
    }
};

template<class Tuple>
struct tuple_delta_interface
    : product_delta_interface<Tuple, tuple_field_list<Tuple>>
{
};

template<class T>
struct delta_interface<T, std::enable_if_t<has_structure_fields<T>::value>>
    : structure_delta_interface<T>
{
};

template<class... Elements>
struct delta_interface<std::tuple<Elements...>>
    : tuple_delta_interface<std::tuple<Elements...>>
{
};

template<class First, class Second>
struct delta_interface<std::pair<First, Second>>
    : tuple_delta_interface<std::pair<First, Second>>
{
};

} // namespace difftree

#endif
