#include <difftree/core/patch.hpp>

#include <sstream>

#include <fmt/format.h>

#include <difftree/core/logging.hpp>

namespace difftree {

void
log_patch_failure(string const& type, boost::exception const& e)
{
    std::ostringstream description;
    if (auto const* reason = get_error_info<shape_mismatch_reason_info>(e))
    {
        description << "shape mismatch (" << *reason << ")";
    }
    else
    {
        auto const* index = get_error_info<edit_index_info>(e);
        auto const* length = get_error_info<source_length_info>(e);
        auto const* consumed = get_error_info<consumed_count_info>(e);
        description << fmt::format(
            "sequence out of bounds at edit {} ({} of {} items consumed)",
            index ? *index : 0,
            consumed ? *consumed : 0,
            length ? *length : 0);
    }
    if (auto const* path = get_error_info<delta_path_info>(e))
        description << " at " << *path;
    get_logger()->debug(
        "failed to apply delta to {}: {}", type, description.str());
}

} // namespace difftree
