#include <difftree/core/config.hpp>

#include <boost/lexical_cast.hpp>

#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <yaml-cpp/yaml.h>
#pragma GCC diagnostic pop
#else
#include <yaml-cpp/yaml.h>
#endif

namespace difftree {

static YAML::Node
load_yaml(string const& yaml)
{
    try
    {
        return YAML::Load(yaml);
    }
    catch (YAML::Exception& e)
    {
        DIFFTREE_THROW(
            parsing_error() << expected_format_info("YAML")
                            << parsed_text_info(yaml)
                            << parsing_error_info(e.what()));
    }
}

// Read a scalar field as text, checking that it's actually a scalar.
static string
read_scalar_text(YAML::Node const& node, string const& field)
{
    if (!node.IsScalar())
    {
        DIFFTREE_THROW(
            parsing_error() << expected_format_info(field + ": scalar")
                            << parsed_text_info(YAML::Dump(node)));
    }
    return node.Scalar();
}

static size_t
read_positive_integer(YAML::Node const& node, string const& field)
{
    auto text = read_scalar_text(node, field);
    integer value;
    if (!boost::conversion::try_lexical_convert(text, value) || value <= 0)
    {
        DIFFTREE_THROW(
            parsing_error()
            << expected_format_info(field + ": positive integer")
            << parsed_text_info(text));
    }
    return size_t(value);
}

static bool
read_boolean(YAML::Node const& node, string const& field)
{
    auto text = read_scalar_text(node, field);
    if (text == "true")
        return true;
    if (text == "false")
        return false;
    DIFFTREE_THROW(
        parsing_error() << expected_format_info(field + ": boolean")
                        << parsed_text_info(text));
}

diff_options
parse_diff_options_yaml(string const& yaml)
{
    auto root = load_yaml(yaml);

    diff_options options;
    // An empty document just means that everything is defaulted.
    if (root.IsNull())
        return options;
    if (!root.IsMap())
    {
        DIFFTREE_THROW(
            parsing_error() << expected_format_info("YAML map")
                            << parsed_text_info(yaml));
    }

    if (auto node = root["max_sequence_table_cells"])
    {
        options.max_sequence_table_cells
            = read_positive_integer(node, "max_sequence_table_cells");
    }
    if (auto node = root["log_sequence_fallbacks"])
    {
        options.log_sequence_fallbacks
            = read_boolean(node, "log_sequence_fallbacks");
    }

    return options;
}

} // namespace difftree
