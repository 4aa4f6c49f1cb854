#ifndef DIFFTREE_CORE_TESTING_HPP
#define DIFFTREE_CORE_TESTING_HPP

#include <catch2/catch.hpp>

#include <difftree/core/diffable.hpp>

namespace difftree {

// Comparisons of values of the type under test are wrapped in an extra set of
// parentheses so that Catch doesn't try to print them. (Not every diffable
// type is printable.)

// Test that a type correctly implements the diffable interface for the given
// value. This checks the identity properties, which only require one value.
template<class T>
void
test_diffable_value(T const& x)
{
    BOOST_CONCEPT_ASSERT((Diffable<T>) );

    {
        INFO("Diffing a value against itself should produce no change.")
        auto d = compute_delta(x, x);
        REQUIRE(is_no_change(d));
    }

    {
        INFO("Applying a no-change delta should reproduce the source.")
        REQUIRE((apply_delta(x, make_no_change_delta<T>()) == x));
    }

    {
        INFO("Diffing against an equal copy should produce no change.")
        T y = x;
        REQUIRE(is_no_change(compute_delta(x, y)));
    }
}

// Test that a type correctly diffs the given pair of values.
// This checks the round trip in both directions and determinism.
// It returns the delta from :a to :b so that callers can check its form.
template<class T>
delta<T>
test_delta_round_trip(T const& a, T const& b)
{
    test_diffable_value(a);
    test_diffable_value(b);

    auto forward = compute_delta(a, b);
    {
        INFO("Applying the delta from a to b should produce b.")
        REQUIRE((apply_delta(a, forward) == b));
    }

    {
        INFO("Diffing the same values again should produce an equal delta.")
        REQUIRE(compute_delta(a, b) == forward);
        T a_copy = a;
        T b_copy = b;
        REQUIRE(compute_delta(a_copy, b_copy) == forward);
    }

    {
        INFO("The delta should be a no-change delta iff a == b.")
        REQUIRE(is_no_change(forward) == (a == b));
    }

    {
        INFO("Applying the delta from b to a should produce a.")
        REQUIRE((apply_delta(b, compute_delta(b, a)) == a));
    }

    return forward;
}

} // namespace difftree

#endif
