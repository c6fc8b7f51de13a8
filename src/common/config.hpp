#ifndef LATTICE_COMMON_CONFIG_HPP
#define LATTICE_COMMON_CONFIG_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "error.hpp"

namespace Lattice {
    using PropertyTree = boost::property_tree::ptree;
}

namespace Lattice::Common::Config {
    inline std::string to_lower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
            return static_cast<char>(std::tolower(character));
        });
        return value;
    }

    template <class Numeric>
    Numeric get_numeric(const PropertyTree& tree, const std::string& key, const std::string& context)
    {
        static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
        const auto value = tree.get_optional<Numeric>(key);
        if (!value) {
            std::ostringstream message;
            message << "Missing numeric field '" << key << "' in " << context;
            throw ConfigError(message.str());
        }
        return *value;
    }

    template <class Numeric>
    Numeric get_numeric_or(const PropertyTree& tree, const std::string& key, Numeric fallback)
    {
        static_assert(std::is_arithmetic_v<Numeric>, "Numeric type required for property tree extraction.");
        return tree.get_optional<Numeric>(key).value_or(fallback);
    }

    inline bool get_boolean(const PropertyTree& tree, const std::string& key, const std::string& context)
    {
        const auto value = tree.get_optional<bool>(key);
        if (!value) {
            std::ostringstream message;
            message << "Missing boolean field '" << key << "' in " << context;
            throw ConfigError(message.str());
        }
        return *value;
    }

    inline std::string get_string(const PropertyTree& tree, const std::string& key, const std::string& context)
    {
        const auto value = tree.get_optional<std::string>(key);
        if (!value) {
            std::ostringstream message;
            message << "Missing string field '" << key << "' in " << context;
            throw ConfigError(message.str());
        }
        return *value;
    }

    inline const PropertyTree& get_child(const PropertyTree& tree, const std::string& key, const std::string& context)
    {
        const auto child = tree.get_child_optional(key);
        if (!child) {
            std::ostringstream message;
            message << "Missing field '" << key << "' in " << context;
            throw ConfigError(message.str());
        }
        return *child;
    }

    template <class T>
    std::vector<T> read_array(const PropertyTree& tree, const std::string& context)
    {
        std::vector<T> values;
        values.reserve(tree.size());
        for (const auto& child : tree) {
            try {
                values.push_back(child.second.get_value<T>());
            } catch (const boost::property_tree::ptree_bad_data&) {
                std::ostringstream message;
                message << "Invalid array element in " << context;
                throw ConfigError(message.str());
            }
        }
        return values;
    }

    template <class T>
    PropertyTree write_array(const std::vector<T>& values)
    {
        PropertyTree array;
        for (const auto& value : values) {
            PropertyTree element;
            element.put("", value);
            array.push_back({"", element});
        }
        return array;
    }

    inline void push_back(PropertyTree& array, PropertyTree element)
    {
        array.push_back({"", std::move(element)});
    }

    // ptree stores JSON null and "[]" alike as an empty node.
    inline bool is_empty(const PropertyTree& tree) noexcept
    {
        return tree.empty() && tree.data().empty();
    }

    inline std::string to_json(const PropertyTree& tree, bool pretty = false)
    {
        std::ostringstream stream;
        boost::property_tree::write_json(stream, tree, pretty);
        return stream.str();
    }

    inline PropertyTree from_json(const std::string& text, const std::string& context)
    {
        PropertyTree tree;
        std::istringstream stream(text);
        try {
            boost::property_tree::read_json(stream, tree);
        } catch (const boost::property_tree::json_parser_error& error) {
            throw ConfigError("Malformed JSON in " + context + ": " + error.what());
        }
        return tree;
    }
}

#endif // LATTICE_COMMON_CONFIG_HPP
