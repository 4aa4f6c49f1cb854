#ifndef DIFFTREE_CORE_ATOMIC_DIFF_HPP
#define DIFFTREE_CORE_ATOMIC_DIFF_HPP

#include <type_traits>
#include <variant>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <difftree/core/patch.hpp>

// ATOMIC DIFFS - Atomic values are either unchanged or replaced as a whole.

namespace difftree {

template<class T>
struct atomic_delta_interface
{
    static delta<T>
    compute(T const& a, T const& b, diff_options const&)
    {
        return a == b ? make_no_change_delta<T>() : make_replace_delta(b);
    }

    static T
    apply(T const& source, delta<T> const& d)
    {
        if (auto patched = apply_whole_value_delta(source, d))
            return std::move(*patched);
        throw_unsupported_delta_kind(d.untyped);
    }
};

// numbers, bools and plain enums
template<class T>
struct delta_interface<
    T,
    std::enable_if_t<std::is_arithmetic<T>::value || std::is_enum<T>::value>>
    : atomic_delta_interface<T>
{
};

template<>
struct delta_interface<string> : atomic_delta_interface<string>
{
};

template<>
struct delta_interface<nil_t> : atomic_delta_interface<nil_t>
{
};

template<>
struct delta_interface<std::monostate> : atomic_delta_interface<std::monostate>
{
};

template<>
struct delta_interface<boost::uuids::uuid>
    : atomic_delta_interface<boost::uuids::uuid>
{
};

} // namespace difftree

#endif
