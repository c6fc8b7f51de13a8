#ifndef LATTICE_MODEL_CLONE_HPP
#define LATTICE_MODEL_CLONE_HPP

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "../common/error.hpp"
#include "../graph/arena.hpp"
#include "../graph/tensor.hpp"
#include "../layer/layer.hpp"
#include "model.hpp"
#include "sequential.hpp"

namespace Lattice {
    namespace Details {
        // Same class and hyperparameters, fresh weights.
        inline LayerPtr clone_layer(const LayerPtr& layer)
        {
            return layer->instantiate(layer->get_config());
        }

        // The wrapper is named after the injected tensor; raw values have no name and borrow `fallback_name`.
        inline std::shared_ptr<Layer::Details::InputLayer> wrap_input(const InputValue& value, const std::string& fallback_name)
        {
            const auto* handle = std::get_if<Tensor>(&value);
            Layer::Details::InputOptions options{};
            options.name = "input_wrapper_for_" + (handle != nullptr && !handle->name().empty() ? handle->name() : fallback_name);
            options.tensor = value;
            return Layer::Details::InputLayer::create(std::move(options));
        }

        inline bool is_graph_tensor(const InputValue& value)
        {
            const auto* handle = std::get_if<Tensor>(&value);
            return handle != nullptr && handle->is_graph_tensor();
        }
    }

    // Replays the nodes of `model` on new layers, deepest bucket first. `input_tensors` replaces
    // the model inputs; fresh Inputs with the same signature are created otherwise.
    inline std::shared_ptr<Model> clone_functional_model(const Model& model,
                                                         std::optional<std::vector<InputValue>> input_tensors = std::nullopt)
    {
        if (dynamic_cast<const Sequential*>(&model) != nullptr) {
            throw TypeError("Expected `model` argument to be a functional `Model` instance, but got a `Sequential` instance instead: "
                            + model.name());
        }

        const auto& topology = model.topology();
        std::unordered_map<LayerId, LayerPtr> layer_map;
        std::unordered_map<TensorId, std::pair<Tensor, Mask>> tensor_map;
        std::vector<Tensor> new_inputs;

        if (!input_tensors) {
            for (std::size_t index = 0; index < topology.inputs.size(); ++index) {
                const auto source = std::dynamic_pointer_cast<Layer::Details::InputLayer>(topology.input_layers[index]);
                InputOptions options{};
                options.batch_shape = topology.inputs[index].shape();
                options.dtype = topology.inputs[index].dtype();
                options.sparse = source != nullptr && source->sparse();
                options.name = topology.input_layers[index]->name();
                auto layer = Layer::Details::InputLayer::create(std::move(options));
                layer_map.emplace(topology.input_layers[index]->id(), layer);
                new_inputs.push_back(layer->input());
            }
        } else {
            if (input_tensors->size() != topology.inputs.size()) {
                throw CardinalityError("Model " + model.name() + " has " + std::to_string(topology.inputs.size())
                                       + " input(s), but clone_model received " + std::to_string(input_tensors->size()) + ".");
            }
            for (std::size_t index = 0; index < input_tensors->size(); ++index) {
                const auto& value = (*input_tensors)[index];
                if (Details::is_graph_tensor(value)) {
                    new_inputs.push_back(std::get<Tensor>(value));
                    continue;
                }
                auto layer = Details::wrap_input(value, topology.input_layers[index]->name());
                layer_map.emplace(topology.input_layers[index]->id(), layer);
                new_inputs.push_back(layer->input());
            }
        }
        for (std::size_t index = 0; index < topology.inputs.size(); ++index) {
            tensor_map.emplace(topology.inputs[index].id(), std::make_pair(new_inputs[index], Mask{}));
        }

        for (auto bucket = topology.nodes_by_depth.rbegin(); bucket != topology.nodes_by_depth.rend(); ++bucket) {
            for (const auto& reference : bucket->second) {
                const auto& layer = topology.layer(reference.layer);
                if (dynamic_cast<const Layer::Details::InputLayer*>(layer.get()) != nullptr) {
                    continue;
                }
                auto cached = layer_map.find(layer->id());
                if (cached == layer_map.end()) {
                    cached = layer_map.emplace(layer->id(), Details::clone_layer(layer)).first;
                }
                const auto& new_layer = cached->second;

                const auto& node = topology.node(reference);
                std::vector<Tensor> computed_tensors;
                std::vector<Mask> computed_masks;
                for (const auto& tensor : node.input_tensors) {
                    const auto it = tensor_map.find(tensor.id());
                    if (it == tensor_map.end()) {
                        break;
                    }
                    computed_tensors.push_back(it->second.first);
                    computed_masks.push_back(it->second.second);
                }
                if (computed_tensors.size() != node.input_tensors.size()) {
                    continue;
                }

                const auto outputs = (*new_layer)(computed_tensors, node.arguments, computed_masks);
                auto output_masks = new_layer->compute_mask(computed_tensors, computed_masks);
                output_masks.resize(outputs.size());
                for (std::size_t index = 0; index < outputs.size() && index < node.output_tensors.size(); ++index) {
                    tensor_map.insert_or_assign(node.output_tensors[index].id(), std::make_pair(outputs[index], output_masks[index]));
                }
            }
        }

        std::vector<Tensor> new_outputs;
        for (const auto& tensor : topology.outputs) {
            const auto it = tensor_map.find(tensor.id());
            if (it == tensor_map.end()) {
                throw AssertionError("Could not compute output " + tensor.name());
            }
            new_outputs.push_back(it->second.first);
        }
        return std::make_shared<Model>(new_inputs, new_outputs, model.name());
    }

    // Re-instantiates every layer of `model`. An injected input must be a single Input tensor or a raw value.
    inline std::shared_ptr<Sequential> clone_sequential_model(const Sequential& model,
                                                              std::optional<std::vector<InputValue>> input_tensors = std::nullopt)
    {
        std::vector<LayerPtr> layers;
        for (const auto& layer : model.layers()) {
            layers.push_back(Details::clone_layer(layer));
        }
        if (!input_tensors) {
            return std::make_shared<Sequential>(layers, model.name());
        }
        if (input_tensors->size() != 1) {
            throw CardinalityError("To clone a `Sequential` model, we expect at most one tensor as part of `input_tensors`. Received "
                                   + std::to_string(input_tensors->size()) + ".");
        }

        // The injected input replaces the source's own input layer.
        if (!layers.empty() && dynamic_cast<const Layer::Details::InputLayer*>(layers.front().get()) != nullptr) {
            layers.erase(layers.begin());
        }
        const auto& value = input_tensors->front();
        LayerPtr origin;
        if (Details::is_graph_tensor(value)) {
            const auto history = std::get<Tensor>(value).history();
            origin = Graph::Arena::global().layer(history->layer);
            if (!std::dynamic_pointer_cast<Layer::Details::InputLayer>(origin)) {
                throw UnsupportedError("Cloning a Sequential model on a tensor produced by layer "
                                       + (origin ? origin->name() : std::string("<released>"))
                                       + " is not supported. Only Input tensors can seed a Sequential clone.");
            }
        } else {
            const auto wrapped = model.layers().empty() ? model.name() : model.layers().front()->name();
            origin = Details::wrap_input(value, wrapped);
        }
        layers.insert(layers.begin(), origin);
        return std::make_shared<Sequential>(layers, model.name());
    }

    // Structurally identical model with fresh weights. The source model is left untouched.
    inline std::shared_ptr<Model> clone_model(const Model& model, std::optional<std::vector<InputValue>> input_tensors = std::nullopt)
    {
        if (const auto* sequential = dynamic_cast<const Sequential*>(&model)) {
            return clone_sequential_model(*sequential, std::move(input_tensors));
        }
        return clone_functional_model(model, std::move(input_tensors));
    }
}

#endif // LATTICE_MODEL_CLONE_HPP
