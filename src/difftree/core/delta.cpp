#include <difftree/core/delta.hpp>

namespace difftree {

std::ostream&
operator<<(std::ostream& s, delta_kind kind)
{
    switch (kind)
    {
        case delta_kind::NO_CHANGE:
            s << "no_change";
            break;
        case delta_kind::REPLACE:
            s << "replace";
            break;
        case delta_kind::FIELDS_CHANGED:
            s << "fields_changed";
            break;
        case delta_kind::VARIANT_CHANGED:
            s << "variant_changed";
            break;
        case delta_kind::SAME_VARIANT:
            s << "same_variant";
            break;
        case delta_kind::SEQUENCE_EDITS:
            s << "sequence_edits";
            break;
        case delta_kind::ENTRIES_CHANGED:
            s << "entries_changed";
            break;
        default:
            DIFFTREE_THROW(
                invalid_enum_value() << enum_id_info("delta_kind")
                                     << enum_value_info(int(kind)));
    }
    return s;
}

std::ostream&
operator<<(std::ostream& s, sequence_edit_op op)
{
    switch (op)
    {
        case sequence_edit_op::KEEP:
            s << "keep";
            break;
        case sequence_edit_op::DELETE:
            s << "delete";
            break;
        case sequence_edit_op::INSERT:
            s << "insert";
            break;
        default:
            DIFFTREE_THROW(
                invalid_enum_value() << enum_id_info("sequence_edit_op")
                                     << enum_value_info(int(op)));
    }
    return s;
}

std::ostream&
operator<<(std::ostream& s, shape_mismatch_reason reason)
{
    switch (reason)
    {
        case shape_mismatch_reason::TYPE:
            s << "type";
            break;
        case shape_mismatch_reason::KIND:
            s << "kind";
            break;
        case shape_mismatch_reason::UNKNOWN_FIELD:
            s << "unknown field";
            break;
        case shape_mismatch_reason::FIELD_ORDER:
            s << "field order";
            break;
        case shape_mismatch_reason::VARIANT:
            s << "variant";
            break;
        case shape_mismatch_reason::MISSING_KEY:
            s << "missing key";
            break;
        case shape_mismatch_reason::UNEXPECTED_KEY:
            s << "unexpected key";
            break;
        default:
            DIFFTREE_THROW(
                invalid_enum_value() << enum_id_info("shape_mismatch_reason")
                                     << enum_value_info(int(reason)));
    }
    return s;
}

bool
operator==(field_delta const& a, field_delta const& b)
{
    return a.field == b.field && a.delta == b.delta;
}
bool
operator!=(field_delta const& a, field_delta const& b)
{
    return !(a == b);
}

bool
operator==(sequence_edit const& a, sequence_edit const& b)
{
    return a.op == b.op && a.count == b.count && a.items == b.items;
}
bool
operator!=(sequence_edit const& a, sequence_edit const& b)
{
    return !(a == b);
}

bool
operator==(untyped_delta const& a, untyped_delta const& b)
{
    if (a.node == b.node)
        return true;
    if (!a.node || !b.node)
        return false;
    delta_node const& x = *a.node;
    delta_node const& y = *b.node;
    if (x.kind != y.kind || x.type != y.type)
        return false;
    switch (x.kind)
    {
        case delta_kind::NO_CHANGE:
        default:
            return true;
        case delta_kind::REPLACE:
            return x.value == y.value;
        case delta_kind::FIELDS_CHANGED:
            return x.fields == y.fields;
        case delta_kind::VARIANT_CHANGED:
            return x.variant == y.variant && x.value == y.value;
        case delta_kind::SAME_VARIANT:
            return x.variant == y.variant && x.fields == y.fields;
        case delta_kind::SEQUENCE_EDITS:
            return x.edits == y.edits;
        case delta_kind::ENTRIES_CHANGED:
            return x.entries == y.entries;
    }
}
bool
operator!=(untyped_delta const& a, untyped_delta const& b)
{
    return !(a == b);
}

static void
print_fields(std::ostream& s, std::vector<field_delta> const& fields)
{
    s << "{";
    bool first = true;
    for (auto const& field : fields)
    {
        if (!first)
            s << ", ";
        s << field;
        first = false;
    }
    s << "}";
}

std::ostream&
operator<<(std::ostream& s, untyped_delta const& d)
{
    s << get_kind(d);
    if (!d.node)
        return s;
    delta_node const& node = *d.node;
    switch (node.kind)
    {
        case delta_kind::NO_CHANGE:
        default:
            break;
        case delta_kind::REPLACE:
            s << "(" << node.value << ")";
            break;
        case delta_kind::FIELDS_CHANGED:
            print_fields(s, node.fields);
            break;
        case delta_kind::VARIANT_CHANGED:
            s << "(" << node.variant << ", " << node.value << ")";
            break;
        case delta_kind::SAME_VARIANT:
            s << "(" << node.variant << ", ";
            print_fields(s, node.fields);
            s << ")";
            break;
        case delta_kind::SEQUENCE_EDITS: {
            s << "[";
            bool first = true;
            for (auto const& edit : node.edits)
            {
                if (!first)
                    s << ", ";
                s << edit;
                first = false;
            }
            s << "]";
            break;
        }
        case delta_kind::ENTRIES_CHANGED:
            s << node.entries;
            break;
    }
    return s;
}

std::ostream&
operator<<(std::ostream& s, field_delta const& d)
{
    return s << d.field << ": " << d.delta;
}

std::ostream&
operator<<(std::ostream& s, sequence_edit const& edit)
{
    s << edit.op << "(";
    if (edit.op == sequence_edit_op::INSERT)
        s << edit.items;
    else
        s << edit.count;
    return s << ")";
}

bool
operator==(delta_path const& a, delta_path const& b)
{
    return a.elements == b.elements;
}

std::ostream&
operator<<(std::ostream& s, delta_path const& path)
{
    bool first = true;
    for (auto const& element : path.elements)
    {
        if (!first)
            s << "/";
        s << element;
        first = false;
    }
    return s;
}

void
add_delta_path_element(boost::exception& e, string const& element)
{
    delta_path* info = get_error_info<delta_path_info>(e);
    if (info)
    {
        info->elements.push_front(element);
    }
    else
    {
        e << delta_path_info(delta_path{std::list<string>({element})});
    }
}

void
check_delta_type(untyped_delta const& d, std::type_index const& expected)
{
    // NO_CHANGE deltas aren't tied to a type.
    if (d.node && d.node->type != expected)
    {
        DIFFTREE_THROW(
            delta_shape_mismatch()
            << shape_mismatch_reason_info(shape_mismatch_reason::TYPE)
            << expected_type_info(type_name(expected))
            << actual_type_info(type_name(d.node->type)));
    }
}

void
check_delta_kind(untyped_delta const& d, delta_kind expected)
{
    auto actual = get_kind(d);
    if (actual != expected)
    {
        DIFFTREE_THROW(
            delta_shape_mismatch()
            << shape_mismatch_reason_info(shape_mismatch_reason::KIND)
            << expected_delta_kind_info(expected)
            << actual_delta_kind_info(actual));
    }
}

void
throw_unsupported_delta_kind(untyped_delta const& d)
{
    DIFFTREE_THROW(
        delta_shape_mismatch()
        << shape_mismatch_reason_info(shape_mismatch_reason::KIND)
        << actual_delta_kind_info(get_kind(d)));
}

void
check_payload_type(
    untyped_immutable const& payload, std::type_index const& expected)
{
    if (!payload.ptr || payload.ptr->type() != expected)
    {
        DIFFTREE_THROW(
            delta_shape_mismatch()
            << shape_mismatch_reason_info(shape_mismatch_reason::TYPE)
            << expected_type_info(type_name(expected))
            << actual_type_info(
                   payload.ptr ? type_name(payload.ptr->type())
                               : string("(empty)")));
    }
}

} // namespace difftree
