#ifndef DIFFTREE_CORE_DIFFABLE_HPP
#define DIFFTREE_CORE_DIFFABLE_HPP

#include <boost/concept_check.hpp>

#include <difftree/core/config.hpp>
#include <difftree/core/delta.hpp>

namespace difftree {

// delta_interface<T> provides the diff/apply capability for the type T:
//
//   static delta<T>
//   compute(T const& a, T const& b, diff_options const& options);
//
//     Compute a delta that transforms :a into :b. This never fails.
//
//   static T
//   apply(T const& source, delta<T> const& d);
//
//     Apply :d to :source to produce the patched value. If :d wasn't computed
//     against a value compatible with :source, this throws a
//     delta_shape_mismatch or a sequence_out_of_bounds. Nothing is partially
//     applied.
//
// Implementations are provided for each shape category (see
// atomic_delta_interface, structure_delta_interface,
// variant_delta_interface, sequence_delta_interface and
// map_delta_interface). A type is made diffable either by specializing
// structure_fields<T> or by specializing delta_interface<T> to derive from
// one of the category implementations. Whichever way it's produced, every
// delta must be expressible with the kinds in delta_kind.
//
// The second parameter is for enabling partial specializations.
//
template<class T, class Enable = void>
struct delta_interface
{
};

template<class T>
delta<T>
compute_delta(T const& a, T const& b, diff_options const& options)
{
    return delta_interface<T>::compute(a, b, options);
}

template<class T>
delta<T>
compute_delta(T const& a, T const& b)
{
    return compute_delta(a, b, diff_options());
}

template<class T>
T
apply_delta(T const& source, delta<T> const& d)
{
    check_delta_type(d.untyped, std::type_index(typeid(T)));
    return delta_interface<T>::apply(source, d);
}

// The Diffable concept describes types that can be diffed and patched.
template<class T>
struct Diffable : boost::CopyConstructible<T>,
                  boost::Assignable<T>,
                  boost::EqualityComparable<T>
{
    BOOST_CONCEPT_USAGE(Diffable)
    {
        check_same_type(d, delta_interface<T>::compute(t, t, options));
        check_same_type(t, delta_interface<T>::apply(t, d));
    }

 private:
    T t;
    delta<T> d;
    diff_options options;

    // Check that the types of the two arguments are the same.
    // (Type deduction will fail if they're not.)
    template<class U>
    void
    check_same_type(U const&, U const&)
    {
    }
};

} // namespace difftree

#endif
