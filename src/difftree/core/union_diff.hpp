#ifndef DIFFTREE_CORE_UNION_DIFF_HPP
#define DIFFTREE_CORE_UNION_DIFF_HPP

#include <variant>

#include <difftree/core/atomic_diff.hpp>
#include <difftree/core/structure_diff.hpp>

// UNION DIFFS - A union that switches alternatives is replaced as a whole
// (VARIANT_CHANGED). A union that keeps its alternative is diffed by viewing
// the alternative's payload as a product (SAME_VARIANT).

namespace difftree {

template<class T>
struct is_tuple_like : std::false_type
{
};
template<class... Elements>
struct is_tuple_like<std::tuple<Elements...>> : std::true_type
{
};
template<class First, class Second>
struct is_tuple_like<std::pair<First, Second>> : std::true_type
{
};

// Get the field descriptors for a union payload of type Payload.
// - Unit types have no fields.
// - Structures have their declared fields.
// - Tuples and pairs have positional fields.
// - Anything else is a single positional field, "0".
template<class Payload>
auto
get_payload_fields()
{
    if constexpr (
        std::is_same<Payload, nil_t>::value
        || std::is_same<Payload, std::monostate>::value)
    {
        return std::tuple<>();
    }
    else if constexpr (has_structure_fields<Payload>::value)
    {
        return structure_fields<Payload>::get();
    }
    else if constexpr (is_tuple_like<Payload>::value)
    {
        return make_tuple_fields<Payload>();
    }
    else
    {
        return std::make_tuple(whole_value_field<Payload>());
    }
}

// Invoke :fn with std::integral_constant<size_t, :index>().
// :index must be less than Count.
template<size_t Count, size_t Index = 0, class Fn>
auto
dispatch_index(size_t index, Fn&& fn)
    -> decltype(fn(std::integral_constant<size_t, 0>()))
{
    if constexpr (Index < Count)
    {
        if (index == Index)
            return fn(std::integral_constant<size_t, Index>());
        return dispatch_index<Count, Index + 1>(index, std::forward<Fn>(fn));
    }
    else
    {
        DIFFTREE_THROW(
            internal_check_failed() << internal_error_message_info(
                "alternative index out of range"));
    }
}

template<class Variant>
struct variant_delta_interface
{
    static constexpr size_t alternative_count
        = std::variant_size<Variant>::value;

    static delta<Variant>
    compute(Variant const& a, Variant const& b, diff_options const& options)
    {
        if (a.index() != b.index())
            return make_variant_changed_delta(b.index(), b);
        // Two valueless variants have no payload to compare.
        if (a.valueless_by_exception())
            return make_no_change_delta<Variant>();
        return dispatch_index<alternative_count>(
            a.index(), [&](auto index) -> delta<Variant> {
                constexpr size_t i = decltype(index)::value;
                typedef std::variant_alternative_t<i, Variant> payload_type;
                auto changes = compute_field_deltas(
                    get_payload_fields<payload_type>(),
                    std::get<i>(a),
                    std::get<i>(b),
                    options);
                if (changes.empty())
                    return make_no_change_delta<Variant>();
                return make_same_variant_delta<Variant>(i, std::move(changes));
            });
    }

    static Variant
    apply(Variant const& source, delta<Variant> const& d)
    {
        if (auto patched = apply_whole_value_delta(source, d))
            return std::move(*patched);
        switch (get_kind(d))
        {
            case delta_kind::VARIANT_CHANGED:
                return get_replacement(d);
            case delta_kind::SAME_VARIANT:
                break;
            default:
                throw_unsupported_delta_kind(d.untyped);
        }
        auto const variant = get_variant(d);
        if (source.index() != variant)
        {
            DIFFTREE_THROW(
                delta_shape_mismatch()
                << shape_mismatch_reason_info(shape_mismatch_reason::VARIANT)
                << expected_variant_info(variant)
                << actual_variant_info(source.index()));
        }
        return dispatch_index<alternative_count>(
            variant, [&](auto index) -> Variant {
                constexpr size_t i = decltype(index)::value;
                typedef std::variant_alternative_t<i, Variant> payload_type;
                return Variant(
                    std::in_place_index<i>,
                    apply_field_deltas(
                        get_payload_fields<payload_type>(),
                        std::get<i>(source),
                        get_fields(d)));
            });
    }
};

template<class... Alternatives>
struct delta_interface<std::variant<Alternatives...>>
    : variant_delta_interface<std::variant<Alternatives...>>
{
};

// boost::optional<T> is diffed as a union with two alternatives: none (0)
// and some (1). The payload of some is the positional field "0".
template<class T>
struct optional_delta_interface
{
    static std::tuple<whole_value_field<T>>
    payload_fields()
    {
        return std::make_tuple(whole_value_field<T>());
    }

    static size_t
    index_of(optional<T> const& x)
    {
        return x ? 1 : 0;
    }

    static delta<optional<T>>
    compute(
        optional<T> const& a,
        optional<T> const& b,
        diff_options const& options)
    {
        if (index_of(a) != index_of(b))
            return make_variant_changed_delta(index_of(b), b);
        if (!a)
            return make_no_change_delta<optional<T>>();
        auto changes = compute_field_deltas(payload_fields(), *a, *b, options);
        if (changes.empty())
            return make_no_change_delta<optional<T>>();
        return make_same_variant_delta<optional<T>>(1, std::move(changes));
    }

    static optional<T>
    apply(optional<T> const& source, delta<optional<T>> const& d)
    {
        if (auto patched = apply_whole_value_delta(source, d))
            return std::move(*patched);
        switch (get_kind(d))
        {
            case delta_kind::VARIANT_CHANGED:
                return get_replacement(d);
            case delta_kind::SAME_VARIANT:
                break;
            default:
                throw_unsupported_delta_kind(d.untyped);
        }
        auto const variant = get_variant(d);
        if (!source || variant != 1)
        {
            DIFFTREE_THROW(
                delta_shape_mismatch()
                << shape_mismatch_reason_info(shape_mismatch_reason::VARIANT)
                << expected_variant_info(variant)
                << actual_variant_info(index_of(source)));
        }
        return some(
            apply_field_deltas(payload_fields(), *source, get_fields(d)));
    }
};

template<class T>
struct delta_interface<optional<T>> : optional_delta_interface<T>
{
};

} // namespace difftree

#endif
