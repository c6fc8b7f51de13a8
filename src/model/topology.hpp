#ifndef LATTICE_MODEL_TOPOLOGY_HPP
#define LATTICE_MODEL_TOPOLOGY_HPP

#include <algorithm>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../common/error.hpp"
#include "../graph/arena.hpp"
#include "../graph/node.hpp"
#include "../graph/tensor.hpp"
#include "../layer/base.hpp"
#include "../layer/details/input.hpp"

namespace Lattice::Graph {
    // Layer, node index and tensor index locating one model input or output.
    using Coordinate = History;

    // Everything derived from (inputs, outputs) once, at model construction. Depth 0 holds the nodes
    // producing the outputs; a node feeding a node of depth d sits at depth d + 1 or deeper.
    struct Topology {
        std::vector<Tensor> inputs{};
        std::vector<Tensor> outputs{};
        std::vector<LayerPtr> input_layers{};
        std::vector<LayerPtr> output_layers{};
        std::vector<Coordinate> input_coordinates{};
        std::vector<Coordinate> output_coordinates{};
        std::vector<LayerPtr> layers{};
        std::map<std::size_t, std::vector<NodeRef>> nodes_by_depth{};
        std::map<std::size_t, std::vector<LayerPtr>> layers_by_depth{};
        std::set<NodeRef> network_nodes{};
        std::unordered_map<LayerId, LayerPtr> layer_index{};
        std::vector<std::string> input_names{};
        std::vector<std::string> output_names{};

        [[nodiscard]] bool empty() const noexcept { return outputs.empty(); }

        [[nodiscard]] const LayerPtr& layer(LayerId id) const
        {
            const auto it = layer_index.find(id);
            if (it == layer_index.end()) {
                throw AssertionError("Layer handle " + std::to_string(id) + " does not belong to this model.");
            }
            return it->second;
        }

        [[nodiscard]] const Node& node(const NodeRef& reference) const
        {
            const auto& nodes = layer(reference.layer)->inbound_nodes();
            if (reference.node_index >= nodes.size()) {
                throw AssertionError("Node " + std::to_string(reference.node_index) + " of layer "
                                     + layer(reference.layer)->name() + " does not exist.");
            }
            return nodes[reference.node_index];
        }
    };

    namespace Details {
        inline LayerPtr origin_layer(const Tensor& tensor, const std::string& role)
        {
            const auto history = tensor.history();
            if (!history) {
                throw TypeError(role + " tensors to a Model must come from Input or from a layer call. Received: '"
                                + tensor.name() + "' (missing previous layer metadata).");
            }
            auto layer = Arena::global().layer(history->layer);
            if (!layer) {
                throw TypeError(role + " tensor '" + tensor.name() + "' refers to a layer that no longer exists.");
            }
            return layer;
        }

        struct Frame {
            NodeRef node{};
            std::size_t next_inbound{0};
        };
    }

    inline Topology build_topology(std::vector<Tensor> inputs, std::vector<Tensor> outputs)
    {
        if (outputs.empty()) {
            throw CardinalityError("A Model needs at least one output tensor.");
        }
        Topology topology;
        auto& arena = Arena::global();

        std::unordered_set<TensorId> seen_inputs;
        for (const auto& input : inputs) {
            if (!seen_inputs.insert(input.id()).second) {
                throw ConfigError("The list of inputs passed to the model is redundant. All inputs should only appear once. Found: '"
                                  + input.name() + "' twice.");
            }
            auto layer = Details::origin_layer(input, "Input");
            const auto history = *input.history();
            if (!std::dynamic_pointer_cast<Layer::Details::InputLayer>(layer) || history.node_index != 0 || history.tensor_index != 0) {
                throw TypeError("Input tensors to a Model must come from Input. Received: '" + input.name()
                                + "', produced by layer " + layer->name() + ".");
            }
            topology.input_layers.push_back(layer);
            topology.input_coordinates.push_back(history);
            topology.input_names.push_back(layer->name());
        }
        for (const auto& output : outputs) {
            auto layer = Details::origin_layer(output, "Output");
            topology.output_layers.push_back(layer);
            topology.output_coordinates.push_back(*output.history());
            topology.output_names.push_back(layer->name());
        }
        topology.inputs = std::move(inputs);
        topology.outputs = std::move(outputs);

        // Iterative post-order walk from the outputs; a node is emitted after everything feeding it.
        std::vector<NodeRef> post_order;
        std::set<NodeRef> finished;
        std::set<NodeRef> in_progress;
        std::unordered_map<LayerId, std::size_t> discovery_order;

        auto resolve_layer = [&](LayerId id) -> LayerPtr {
            auto layer = arena.layer(id);
            if (!layer) {
                throw ConfigError("Layer handle " + std::to_string(id) + " in the graph no longer exists.");
            }
            return layer;
        };

        for (const auto& coordinate : topology.output_coordinates) {
            const NodeRef root{coordinate.layer, coordinate.node_index};
            if (finished.count(root) != 0) {
                continue;
            }
            std::vector<Details::Frame> stack{{root, 0}};
            in_progress.insert(root);
            while (!stack.empty()) {
                auto& frame = stack.back();
                const auto layer = resolve_layer(frame.node.layer);
                topology.layer_index.emplace(layer->id(), layer);
                discovery_order.emplace(layer->id(), discovery_order.size());
                topology.network_nodes.insert(frame.node);

                const auto& node = layer->inbound_nodes().at(frame.node.node_index);
                if (frame.next_inbound < node.inbound_layers.size()) {
                    const NodeRef next{node.inbound_layers[frame.next_inbound], node.node_indices[frame.next_inbound]};
                    ++frame.next_inbound;
                    if (in_progress.count(next) != 0) {
                        throw ConfigError("The tensor '" + node.input_tensors[frame.next_inbound - 1].name() + "' at layer \""
                                          + layer->name() + "\" is part of a cycle.");
                    }
                    if (finished.count(next) == 0) {
                        in_progress.insert(next);
                        stack.push_back({next, 0});
                    }
                    continue;
                }
                in_progress.erase(frame.node);
                finished.insert(frame.node);
                post_order.push_back(frame.node);
                stack.pop_back();
            }
        }

        // Consumers before producers: each node pushes depth + 1 onto the nodes feeding it.
        std::map<NodeRef, std::size_t> node_depths;
        std::unordered_map<LayerId, std::size_t> layer_depths;
        for (auto it = post_order.rbegin(); it != post_order.rend(); ++it) {
            auto depth = node_depths.emplace(*it, 0).first->second;
            const auto previous = layer_depths.find(it->layer);
            if (previous != layer_depths.end()) {
                depth = std::max(depth, previous->second);
            }
            layer_depths[it->layer] = depth;
            node_depths[*it] = depth;

            const auto& node = topology.node(*it);
            for (std::size_t i = 0; i < node.inbound_layers.size(); ++i) {
                const NodeRef inbound{node.inbound_layers[i], node.node_indices[i]};
                auto& inbound_depth = node_depths[inbound];
                inbound_depth = std::max(inbound_depth, depth + 1);
            }
        }

        for (const auto& [reference, depth] : node_depths) {
            topology.nodes_by_depth[depth].push_back(reference);
        }
        for (auto& [depth, references] : topology.nodes_by_depth) {
            std::sort(references.begin(), references.end(), [&](const NodeRef& lhs, const NodeRef& rhs) {
                const auto left = discovery_order.at(lhs.layer);
                const auto right = discovery_order.at(rhs.layer);
                return left != right ? left < right : lhs.node_index < rhs.node_index;
            });
        }
        for (const auto& [id, depth] : layer_depths) {
            topology.layers_by_depth[depth].push_back(topology.layer(id));
        }
        for (auto it = topology.layers_by_depth.rbegin(); it != topology.layers_by_depth.rend(); ++it) {
            auto& bucket = it->second;
            std::sort(bucket.begin(), bucket.end(), [&](const LayerPtr& lhs, const LayerPtr& rhs) {
                return discovery_order.at(lhs->id()) < discovery_order.at(rhs->id());
            });
            topology.layers.insert(topology.layers.end(), bucket.begin(), bucket.end());
        }

        // Every node must be computable from the declared inputs.
        std::unordered_set<TensorId> computable;
        for (const auto& input : topology.inputs) {
            computable.insert(input.id());
        }
        std::vector<std::string> reached;
        for (auto it = topology.nodes_by_depth.rbegin(); it != topology.nodes_by_depth.rend(); ++it) {
            for (const auto& reference : it->second) {
                const auto& layer = topology.layer(reference.layer);
                const auto& node = topology.node(reference);
                for (const auto& tensor : node.input_tensors) {
                    if (computable.count(tensor.id()) == 0) {
                        std::string previous;
                        for (const auto& name : reached) {
                            previous += (previous.empty() ? "" : ", ") + name;
                        }
                        throw ConfigError("Graph disconnected: cannot obtain value for tensor '" + tensor.name() + "' at layer \""
                                          + layer->name() + "\". The following previous layers were accessed without issue: ["
                                          + previous + "]");
                    }
                }
                for (const auto& tensor : node.output_tensors) {
                    computable.insert(tensor.id());
                }
                reached.push_back(layer->name());
            }
        }

        std::map<std::string, std::size_t> name_counts;
        for (const auto& layer : topology.layers) {
            ++name_counts[layer->name()];
        }
        for (const auto& [name, count] : name_counts) {
            if (count != 1) {
                throw ConfigError("The name \"" + name + "\" is used " + std::to_string(count)
                                  + " times in the model. All layer names should be unique.");
            }
        }
        return topology;
    }
}

#endif // LATTICE_MODEL_TOPOLOGY_HPP
