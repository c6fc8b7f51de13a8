#ifndef LATTICE_LAYER_INPUT_HPP
#define LATTICE_LAYER_INPUT_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Lattice::Layer::Details {
    struct InputOptions {
        std::optional<Shape> shape{};       // without the batch axis
        std::optional<Shape> batch_shape{};
        torch::ScalarType dtype{torch::kFloat32};
        bool sparse{false};
        std::string name{};
        std::optional<InputValue> tensor{}; // wrap an existing value instead of creating a placeholder
    };

    // Entry point of a graph. Its single node has the input tensor as both input and output.
    class InputLayer : public Base {
        struct Token {
            explicit Token() = default;
        };

    public:
        InputLayer(Token, LayerOptions options, bool sparse)
            : Base("InputLayer", std::move(options)), sparse_(sparse)
        {
            set_built(true);
        }

        static std::shared_ptr<InputLayer> create(InputOptions options)
        {
            Shape batch_shape;
            if (options.batch_shape) {
                batch_shape = *options.batch_shape;
            } else if (options.shape) {
                batch_shape.push_back(kUnknownDim);
                batch_shape.insert(batch_shape.end(), options.shape->begin(), options.shape->end());
            } else if (options.tensor) {
                batch_shape = std::visit(
                    [](const auto& value) -> Shape {
                        using T = std::decay_t<decltype(value)>;
                        if constexpr (std::is_same_v<T, Tensor>) {
                            return value.shape();
                        } else {
                            return shape_of(value);
                        }
                    },
                    *options.tensor);
            } else {
                throw ConfigError("Please provide to Input either a `shape` or a `batch_shape` argument. "
                                  "Note that `shape` does not include the batch dimension.");
            }

            if (options.name.empty()) {
                options.name = "input_" + std::to_string(Graph::Arena::global().next_uid("input"));
            }

            Tensor tensor;
            if (options.tensor) {
                if (const auto* handle = std::get_if<Tensor>(&*options.tensor)) {
                    if (handle->is_graph_tensor()) {
                        throw TypeError("Tensor '" + handle->name() + "' is already produced by a layer and cannot be wrapped by input layer "
                                        + options.name + ".");
                    }
                    tensor = *handle;
                    options.dtype = handle->dtype();
                } else {
                    const auto& raw = std::get<torch::Tensor>(*options.tensor);
                    if (!raw.defined()) {
                        throw TypeError("Input layer " + options.name + " cannot wrap an undefined tensor.");
                    }
                    options.dtype = raw.scalar_type();
                    tensor = Tensor::create(batch_shape, options.dtype, options.name, options.sparse, raw);
                }
            } else {
                tensor = Tensor::create(batch_shape, options.dtype, options.name, options.sparse);
            }

            LayerOptions common{};
            common.name = options.name;
            common.batch_input_shape = batch_shape;
            common.dtype = options.dtype;
            auto layer = std::make_shared<InputLayer>(Token{}, std::move(common), options.sparse);

            auto& arena = Graph::Arena::global();
            arena.register_layer(layer->id(), layer);
            arena.record_history(tensor.id(), {layer->id(), 0, 0});

            Node node{};
            node.outbound_layer = layer->id();
            node.input_tensors = {tensor.unowned()};
            node.output_tensors = {tensor.unowned()};
            node.input_masks = {Mask{}};
            node.output_masks = {Mask{}};
            layer->mutable_inbound_nodes().push_back(std::move(node));
            return layer;
        }

        static std::shared_ptr<InputLayer> from_config(const PropertyTree& config)
        {
            InputOptions options{};
            options.name = config.get<std::string>("name", "");
            options.dtype = dtype_from_string(config.get<std::string>("dtype", "float32"));
            options.sparse = config.get<bool>("sparse", false);
            options.batch_shape = Layer::Details::read_shape(
                Common::Config::get_child(config, "batch_input_shape", "InputLayer config"), "InputLayer config");
            return create(std::move(options));
        }

        [[nodiscard]] bool sparse() const noexcept { return sparse_; }

        // The input tensor, holding this layer alive.
        [[nodiscard]] Tensor input() const { return inbound_nodes().front().output_tensors.front().owned_by(shared_from_this()); }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments&) override
        {
            return inputs;
        }

        [[nodiscard]] PropertyTree get_config() const override
        {
            PropertyTree config;
            config.add_child("batch_input_shape", Layer::Details::write_shape(batch_input_shape().value_or(Shape{})));
            config.put("dtype", dtype_to_string(dtype()));
            config.put("sparse", sparse_);
            config.put("name", name());
            return config;
        }

        [[nodiscard]] std::shared_ptr<Base> instantiate(const PropertyTree& config) const override
        {
            return from_config(config);
        }

    private:
        bool sparse_{false};
    };
}

#endif // LATTICE_LAYER_INPUT_HPP
