#ifndef DIFFTREE_CORE_PATCH_HPP
#define DIFFTREE_CORE_PATCH_HPP

#include <difftree/core/diffable.hpp>

// This file provides the parts of delta application that are shared by all
// shape categories.

namespace difftree {

// Handle the delta kinds whose application doesn't depend on the shape of T
// (NO_CHANGE and REPLACE). If :d is one of these, this returns the patched
// value. Otherwise, it returns none and the caller must interpret :d itself.
template<class T>
optional<T>
apply_whole_value_delta(T const& source, delta<T> const& d)
{
    switch (get_kind(d))
    {
        case delta_kind::NO_CHANGE:
            return source;
        case delta_kind::REPLACE:
            return get_replacement(d);
        default:
            return none;
    }
}

// Log a patch failure that was caught by try_apply_delta.
void
log_patch_failure(string const& type, boost::exception const& e);

// Apply :d to :source, but rather than throwing on a mismatch, log the failure
// and return none.
template<class T>
optional<T>
try_apply_delta(T const& source, delta<T> const& d)
{
    try
    {
        return some(apply_delta(source, d));
    }
    catch (delta_shape_mismatch& e)
    {
        log_patch_failure(type_name<T>(), e);
    }
    catch (sequence_out_of_bounds& e)
    {
        log_patch_failure(type_name<T>(), e);
    }
    return none;
}

} // namespace difftree

#endif
