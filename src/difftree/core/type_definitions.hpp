#ifndef DIFFTREE_CORE_TYPE_DEFINITIONS_HPP
#define DIFFTREE_CORE_TYPE_DEFINITIONS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <type_traits>
#include <utility>

#include <boost/core/demangle.hpp>
#include <boost/optional.hpp>

namespace difftree {

using std::size_t;
using std::string;

using boost::none;
using boost::optional;

// some(x) creates a boost::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

typedef int64_t integer;

// nil_t is a unit type. It has only one possible value, :nil.
struct nil_t
{
};
static nil_t nil;

static inline bool
operator==(nil_t, nil_t)
{
    return true;
}

static inline bool
operator!=(nil_t, nil_t)
{
    return false;
}

static inline bool
operator<(nil_t, nil_t)
{
    return false;
}

// Get a human-readable name for a C++ type.
static inline string
type_name(std::type_index const& type)
{
    return boost::core::demangle(type.name());
}

template<class T>
string
type_name()
{
    return type_name(std::type_index(typeid(T)));
}

} // namespace difftree

#endif
