#ifndef DIFFTREE_TESTS_CORE_FIXTURES_HPP
#define DIFFTREE_TESTS_CORE_FIXTURES_HPP

#include <cstdint>
#include <tuple>
#include <unordered_map>
#include <variant>
#include <vector>

#include <difftree/core.hpp>

// Types used across the core tests. The structure_fields specializations are
// what a code generator would emit for these declarations.

namespace difftree {

struct simple_struct
{
    string x;
    int32_t y;
};

static inline bool
operator==(simple_struct const& a, simple_struct const& b)
{
    return a.x == b.x && a.y == b.y;
}
static inline bool
operator!=(simple_struct const& a, simple_struct const& b)
{
    return !(a == b);
}

template<>
struct structure_fields<simple_struct>
{
    static auto
    get()
    {
        return std::make_tuple(
            make_structure_field("x", &simple_struct::x),
            make_structure_field("y", &simple_struct::y));
    }
};

// a structure with no fields
struct unit_struct
{
};

static inline bool
operator==(unit_struct const&, unit_struct const&)
{
    return true;
}
static inline bool
operator!=(unit_struct const&, unit_struct const&)
{
    return false;
}

template<>
struct structure_fields<unit_struct>
{
    static std::tuple<>
    get()
    {
        return std::tuple<>();
    }
};

struct strange_struct
{
    optional<std::tuple<uint32_t, std::pair<string, uint64_t>>> attempt;
};

static inline bool
operator==(strange_struct const& a, strange_struct const& b)
{
    return a.attempt == b.attempt;
}
static inline bool
operator!=(strange_struct const& a, strange_struct const& b)
{
    return !(a == b);
}

template<>
struct structure_fields<strange_struct>
{
    static auto
    get()
    {
        return std::make_tuple(
            make_structure_field("attempt", &strange_struct::attempt));
    }
};

// the payload of the third alternative of simple_enum
struct third_payload
{
    string x;
    nil_t y;
};

static inline bool
operator==(third_payload const& a, third_payload const& b)
{
    return a.x == b.x && a.y == b.y;
}
static inline bool
operator!=(third_payload const& a, third_payload const& b)
{
    return !(a == b);
}

template<>
struct structure_fields<third_payload>
{
    static auto
    get()
    {
        return std::make_tuple(
            make_structure_field("x", &third_payload::x),
            make_structure_field("y", &third_payload::y));
    }
};

// simple_enum has the alternatives first (no payload), second (an integer)
// and third (a structure).
typedef std::variant<std::monostate, int32_t, third_payload> simple_enum;

static inline simple_enum
make_first()
{
    return simple_enum(std::in_place_index<0>);
}
static inline simple_enum
make_second(int32_t value)
{
    return simple_enum(std::in_place_index<1>, value);
}
static inline simple_enum
make_third(string x)
{
    return simple_enum(std::in_place_index<2>, third_payload{x, nil});
}

// nested fixtures

struct child1
{
    int32_t x;
    string y;
};

static inline bool
operator==(child1 const& a, child1 const& b)
{
    return a.x == b.x && a.y == b.y;
}
static inline bool
operator!=(child1 const& a, child1 const& b)
{
    return !(a == b);
}

template<>
struct structure_fields<child1>
{
    static auto
    get()
    {
        return std::make_tuple(
            make_structure_field("x", &child1::x),
            make_structure_field("y", &child1::y));
    }
};

typedef std::variant<child1, std::vector<child1>> some_child;

struct child2
{
    string a;
    some_child b;
    nil_t c;
};

static inline bool
operator==(child2 const& a, child2 const& b)
{
    return a.a == b.a && a.b == b.b && a.c == b.c;
}
static inline bool
operator!=(child2 const& a, child2 const& b)
{
    return !(a == b);
}

template<>
struct structure_fields<child2>
{
    static auto
    get()
    {
        return std::make_tuple(
            make_structure_field("a", &child2::a),
            make_structure_field("b", &child2::b),
            make_structure_field("c", &child2::c));
    }
};

struct parent
{
    child1 c1;
    std::vector<child1> c2;
    std::unordered_map<int32_t, child2> c3;
    string val;
};

static inline bool
operator==(parent const& a, parent const& b)
{
    return a.c1 == b.c1 && a.c2 == b.c2 && a.c3 == b.c3 && a.val == b.val;
}
static inline bool
operator!=(parent const& a, parent const& b)
{
    return !(a == b);
}

template<>
struct structure_fields<parent>
{
    static auto
    get()
    {
        return std::make_tuple(
            make_structure_field("c1", &parent::c1),
            make_structure_field("c2", &parent::c2),
            make_structure_field("c3", &parent::c3),
            make_structure_field("val", &parent::val));
    }
};

static inline parent
make_parent()
{
    parent p;
    p.c1 = child1{1, "one"};
    p.c2 = {child1{2, "two"}, child1{3, "three"}};
    p.c3[10] = child2{"ten", some_child(child1{10, "x"}), nil};
    p.c3[20] = child2{
        "twenty",
        some_child(std::vector<child1>{child1{20, "y"}, child1{21, "z"}}),
        nil};
    p.val = "parent";
    return p;
}

} // namespace difftree

#endif
