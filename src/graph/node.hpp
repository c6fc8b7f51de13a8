#ifndef LATTICE_GRAPH_NODE_HPP
#define LATTICE_GRAPH_NODE_HPP

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "../common/config.hpp"
#include "tensor.hpp"

namespace Lattice {
    using ArgumentValue = std::variant<bool, std::int64_t, double, std::string>;
    using CallArguments = std::map<std::string, ArgumentValue>;

    // Reference to node `node_index` owned by `layer`.
    struct NodeRef {
        LayerId layer{0};
        std::size_t node_index{0};

        friend bool operator==(const NodeRef&, const NodeRef&) = default;
        friend auto operator<=>(const NodeRef&, const NodeRef&) = default;
    };

    // One invocation of a layer. Created by the call and never edited afterwards; it lives in the
    // outbound layer's inbound node list.
    struct Node {
        LayerId outbound_layer{0};
        std::vector<LayerId> inbound_layers{};
        std::vector<std::size_t> node_indices{};
        std::vector<std::size_t> tensor_indices{};
        std::vector<Tensor> input_tensors{};
        std::vector<Tensor> output_tensors{};
        std::vector<Mask> input_masks{};
        std::vector<Mask> output_masks{};
        CallArguments arguments{};

        [[nodiscard]] std::vector<Shape> input_shapes() const
        {
            std::vector<Shape> shapes;
            shapes.reserve(input_tensors.size());
            for (const auto& tensor : input_tensors) {
                shapes.push_back(tensor.shape());
            }
            return shapes;
        }

        [[nodiscard]] std::vector<Shape> output_shapes() const
        {
            std::vector<Shape> shapes;
            shapes.reserve(output_tensors.size());
            for (const auto& tensor : output_tensors) {
                shapes.push_back(tensor.shape());
            }
            return shapes;
        }
    };

    namespace Arguments {
        inline bool as_bool(const ArgumentValue& value)
        {
            if (const auto* flag = std::get_if<bool>(&value)) return *flag;
            if (const auto* integer = std::get_if<std::int64_t>(&value)) return *integer != 0;
            if (const auto* real = std::get_if<double>(&value)) return *real != 0.0;
            const auto& text = std::get<std::string>(value);
            return text == "true" || text == "1";
        }

        inline std::optional<bool> find_bool(const CallArguments& arguments, const std::string& key)
        {
            const auto it = arguments.find(key);
            if (it == arguments.end()) {
                return std::nullopt;
            }
            return as_bool(it->second);
        }

        inline PropertyTree to_tree(const CallArguments& arguments)
        {
            PropertyTree tree;
            for (const auto& [key, value] : arguments) {
                std::visit([&](const auto& concrete) { tree.put(PropertyTree::path_type(key, '\0'), concrete); }, value);
            }
            return tree;
        }

        // The JSON writer drops value types, so they are inferred back from the text.
        inline CallArguments from_tree(const PropertyTree& tree)
        {
            CallArguments arguments;
            for (const auto& [key, child] : tree) {
                const auto& text = child.data();
                if (text == "true" || text == "false") {
                    arguments.emplace(key, text == "true");
                    continue;
                }
                std::int64_t integer = 0;
                const auto* end = text.data() + text.size();
                if (!text.empty() && std::from_chars(text.data(), end, integer).ptr == end) {
                    arguments.emplace(key, integer);
                    continue;
                }
                if (const auto real = child.get_value_optional<double>(); real && !text.empty()) {
                    arguments.emplace(key, *real);
                    continue;
                }
                arguments.emplace(key, text);
            }
            return arguments;
        }
    }
}

#endif // LATTICE_GRAPH_NODE_HPP
