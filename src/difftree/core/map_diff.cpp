#include <difftree/core/map_diff.hpp>

namespace difftree {

std::ostream&
operator<<(std::ostream& s, map_entry_op op)
{
    switch (op)
    {
        case map_entry_op::INSERT:
            s << "insert";
            break;
        case map_entry_op::REMOVE:
            s << "remove";
            break;
        case map_entry_op::UPDATE:
            s << "update";
            break;
        default:
            DIFFTREE_THROW(
                invalid_enum_value() << enum_id_info("map_entry_op")
                                     << enum_value_info(int(op)));
    }
    return s;
}

void
throw_entry_mismatch(shape_mismatch_reason reason, string const& key)
{
    DIFFTREE_THROW(
        delta_shape_mismatch() << shape_mismatch_reason_info(reason)
                               << entry_key_info(key));
}

} // namespace difftree
