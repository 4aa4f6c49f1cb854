#ifndef DIFFTREE_CORE_IMMUTABLE_HPP
#define DIFFTREE_CORE_IMMUTABLE_HPP

#include <map>
#include <memory>
#include <ostream>
#include <sstream>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <variant>
#include <vector>

#include <difftree/core/utilities.hpp>

namespace difftree {

// immutable<T> holds (by shared_ptr) an immutable value of type T.
// immutable also provides the ability to efficiently store values in a
// dynamically-typed way. Any immutable<T> can be cast to and from
// untyped_immutable.

namespace detail {

template<class T, class = void>
struct is_streamable : std::false_type
{
};
template<class T>
struct is_streamable<
    T,
    std::void_t<decltype(std::declval<std::ostream&>() << std::declval<T>())>>
    : std::true_type
{
};

// print_value writes a diagnostic rendering of a value. Values that can't be
// streamed are rendered as their type name.
template<class T>
void
print_value(std::ostream& s, T const& x);
template<class T, class Allocator>
void
print_value(std::ostream& s, std::vector<T, Allocator> const& x);
template<class K, class V, class C, class A>
void
print_value(std::ostream& s, std::map<K, V, C, A> const& x);
template<class K, class V, class H, class E, class A>
void
print_value(std::ostream& s, std::unordered_map<K, V, H, E, A> const& x);
template<class T>
void
print_value(std::ostream& s, optional<T> const& x);
template<class... Alternatives>
void
print_value(std::ostream& s, std::variant<Alternatives...> const& x);

template<class T>
void
print_value(std::ostream& s, T const& x)
{
    if constexpr (is_streamable<T const&>::value)
        s << x;
    else
        s << "<" << type_name<T>() << ">";
}

template<class T, class Allocator>
void
print_value(std::ostream& s, std::vector<T, Allocator> const& x)
{
    s << "[";
    bool first = true;
    for (auto const& item : x)
    {
        if (!first)
            s << ", ";
        print_value(s, item);
        first = false;
    }
    s << "]";
}

template<class Map>
void
print_map(std::ostream& s, Map const& x)
{
    s << "{";
    bool first = true;
    for (auto const& entry : x)
    {
        if (!first)
            s << ", ";
        print_value(s, entry.first);
        s << ": ";
        print_value(s, entry.second);
        first = false;
    }
    s << "}";
}

template<class K, class V, class C, class A>
void
print_value(std::ostream& s, std::map<K, V, C, A> const& x)
{
    print_map(s, x);
}

template<class K, class V, class H, class E, class A>
void
print_value(std::ostream& s, std::unordered_map<K, V, H, E, A> const& x)
{
    print_map(s, x);
}

template<class T>
void
print_value(std::ostream& s, optional<T> const& x)
{
    if (x)
        print_value(s, *x);
    else
        s << "none";
}

template<class... Alternatives>
void
print_value(std::ostream& s, std::variant<Alternatives...> const& x)
{
    s << "<" << x.index() << ">(";
    std::visit([&](auto const& payload) { print_value(s, payload); }, x);
    s << ")";
}

} // namespace detail

// Get a diagnostic string representation of a value.
template<class T>
string
to_diagnostic_string(T const& x)
{
    std::ostringstream s;
    detail::print_value(s, x);
    return s.str();
}

struct untyped_immutable_value
{
    virtual ~untyped_immutable_value()
    {
    }
    virtual std::type_index
    type() const = 0;
    virtual bool
    equals(untyped_immutable_value const* other) const = 0;
    virtual void
    print(std::ostream& s) const = 0;
};

struct untyped_immutable
{
    std::shared_ptr<untyped_immutable_value const> ptr;
};

static inline bool
is_initialized(untyped_immutable const& x)
{
    return x.ptr ? true : false;
}

static inline bool
operator==(untyped_immutable const& a, untyped_immutable const& b)
{
    return a.ptr == b.ptr
           || (a.ptr ? (b.ptr && a.ptr->equals(b.ptr.get())) : !b.ptr);
}
static inline bool
operator!=(untyped_immutable const& a, untyped_immutable const& b)
{
    return !(a == b);
}

static inline std::ostream&
operator<<(std::ostream& s, untyped_immutable const& x)
{
    if (x.ptr)
        x.ptr->print(s);
    else
        s << "(empty)";
    return s;
}

template<class T>
struct immutable_value : untyped_immutable_value
{
    T value;

    immutable_value(T const& value) : value(value)
    {
    }
    immutable_value(T&& value) : value(std::move(value))
    {
    }

    std::type_index
    type() const
    {
        return std::type_index(typeid(T));
    }
    bool
    equals(untyped_immutable_value const* other) const
    {
        auto const* typed_other
            = dynamic_cast<immutable_value<T> const*>(other);
        return typed_other && this->value == typed_other->value;
    }
    void
    print(std::ostream& s) const
    {
        detail::print_value(s, this->value);
    }
};

template<class T>
struct immutable
{
    std::shared_ptr<immutable_value<T> const> ptr;
};

template<class T>
bool
is_initialized(immutable<T> const& x)
{
    return x.ptr ? true : false;
}

template<class T>
T const&
operator*(immutable<T> const& x)
{
    return x.ptr->value;
}

template<class T>
immutable<T>
make_immutable(T value)
{
    immutable<T> x;
    x.ptr = std::make_shared<immutable_value<T> const>(std::move(value));
    return x;
}

template<class T>
bool
operator==(immutable<T> const& a, immutable<T> const& b)
{
    // First test if the two immutables are actually pointing to the same
    // thing, which avoids having to do a deep comparison for this case.
    return a.ptr == b.ptr || (a.ptr ? (b.ptr && *a == *b) : !b.ptr);
}
template<class T>
bool
operator!=(immutable<T> const& a, immutable<T> const& b)
{
    return !(a == b);
}

// If a cast fails, it throws this exception.
DIFFTREE_DEFINE_EXCEPTION(immutable_type_mismatch)
DIFFTREE_DEFINE_ERROR_INFO(string, expected_immutable_type)
DIFFTREE_DEFINE_ERROR_INFO(string, actual_immutable_type)

// Cast an untyped_immutable to a typed one.
template<class T>
immutable<T>
cast_immutable(untyped_immutable const& untyped)
{
    immutable<T> typed;
    if (untyped.ptr)
    {
        typed.ptr = std::dynamic_pointer_cast<immutable_value<T> const>(
            untyped.ptr);
        if (!typed.ptr)
        {
            DIFFTREE_THROW(
                immutable_type_mismatch()
                << expected_immutable_type_info(type_name<T>())
                << actual_immutable_type_info(
                       type_name(untyped.ptr->type())));
        }
    }
    return typed;
}

// Erase the compile-time type information associated with the given immutable
// to produce an untyped_immutable.
template<class T>
untyped_immutable
erase_type(immutable<T> const& typed)
{
    untyped_immutable untyped;
    untyped.ptr = typed.ptr;
    return untyped;
}

} // namespace difftree

#endif
