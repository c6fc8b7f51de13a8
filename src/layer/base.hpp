#ifndef LATTICE_LAYER_BASE_HPP
#define LATTICE_LAYER_BASE_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/error.hpp"
#include "../common/json.hpp"
#include "../graph/arena.hpp"
#include "../graph/node.hpp"
#include "../graph/tensor.hpp"
#include "../initialization/apply.hpp"

namespace Lattice::Layer {
    // Options every layer accepts. `input_shape` excludes the batch axis, `batch_input_shape` includes it.
    struct LayerOptions {
        std::string name{};
        std::optional<Shape> input_shape{};
        std::optional<Shape> batch_input_shape{};
        torch::ScalarType dtype{torch::kFloat32};
        bool trainable{true};
    };

    struct Weight {
        std::string name{};
        torch::Tensor value{};
        bool trainable{true};
    };

    namespace Details {
        inline std::string to_snake_case(const std::string& name)
        {
            std::string out;
            out.reserve(name.size() + 4);
            for (std::size_t index = 0; index < name.size(); ++index) {
                const auto character = static_cast<unsigned char>(name[index]);
                if (std::isupper(character)) {
                    const bool previous_lower = index > 0 && !std::isupper(static_cast<unsigned char>(name[index - 1]));
                    const bool next_lower = index + 1 < name.size() && std::islower(static_cast<unsigned char>(name[index + 1]));
                    if (index > 0 && (previous_lower || next_lower)) {
                        out.push_back('_');
                    }
                    out.push_back(static_cast<char>(std::tolower(character)));
                } else {
                    out.push_back(static_cast<char>(character));
                }
            }
            return out;
        }

        inline PropertyTree write_shape(const Shape& shape)
        {
            return Common::Config::write_array(shape);
        }

        inline Shape read_shape(const PropertyTree& tree, const std::string& context)
        {
            return Common::Config::read_array<std::int64_t>(tree, context);
        }
    }

    class Base : public Common::Json::Configurable, public std::enable_shared_from_this<Base> {
    public:
        Base(std::string class_name, LayerOptions options)
            : id_(Graph::Arena::global().next_layer_id()),
              class_name_(std::move(class_name)),
              name_(std::move(options.name)),
              dtype_(options.dtype),
              trainable_(options.trainable)
        {
            if (name_.empty()) {
                const auto prefix = Details::to_snake_case(class_name_);
                name_ = prefix + "_" + std::to_string(Graph::Arena::global().next_uid(prefix));
            }
            if (options.batch_input_shape) {
                batch_input_shape_ = std::move(options.batch_input_shape);
            } else if (options.input_shape) {
                Shape batch_shape{kUnknownDim};
                batch_shape.insert(batch_shape.end(), options.input_shape->begin(), options.input_shape->end());
                batch_input_shape_ = std::move(batch_shape);
            }
        }

        Base(const Base&) = delete;
        Base& operator=(const Base&) = delete;
        ~Base() override
        {
            auto& arena = Graph::Arena::global();
            for (const auto& node : inbound_nodes_) {
                for (const auto inbound : node.inbound_layers) {
                    if (inbound == id_) {
                        continue;
                    }
                    if (auto layer = arena.layer(inbound)) {
                        layer->remove_outbound_to(id_);
                    }
                }
                for (const auto& tensor : node.output_tensors) {
                    const auto history = arena.history(tensor.id());
                    if (history && history->layer == id_) {
                        arena.forget_history(tensor.id());
                    }
                }
            }
            arena.release_layer(id_);
        }

        [[nodiscard]] LayerId id() const noexcept { return id_; }
        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] std::string class_name() const override { return class_name_; }
        [[nodiscard]] torch::ScalarType dtype() const noexcept { return dtype_; }
        [[nodiscard]] bool built() const noexcept { return built_; }
        [[nodiscard]] bool trainable() const noexcept { return trainable_; }
        [[nodiscard]] bool supports_masking() const noexcept { return supports_masking_; }
        [[nodiscard]] const std::optional<Shape>& batch_input_shape() const noexcept { return batch_input_shape_; }

        virtual void set_trainable(bool trainable) { trainable_ = trainable; }

        // Creates weights once the input shapes are known.
        virtual void build(const std::vector<Shape>& input_shapes)
        {
            (void)input_shapes;
            built_ = true;
        }

        // Concrete execution on backend tensors.
        virtual std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments& arguments) = 0;

        [[nodiscard]] virtual std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const
        {
            return input_shapes;
        }

        // One mask per output. Layers without masking support refuse incoming masks.
        [[nodiscard]] virtual std::vector<Mask> compute_mask(const std::vector<Tensor>& inputs, const std::vector<Mask>& masks) const
        {
            const bool any_mask = std::any_of(masks.begin(), masks.end(), [](const Mask& mask) { return mask.has_value(); });
            if (!supports_masking_) {
                if (any_mask) {
                    throw TypeError("Layer " + name_ + " does not support masking, but was passed an input mask.");
                }
                return std::vector<Mask>(inputs.size());
            }
            return masks;
        }

        [[nodiscard]] PropertyTree get_config() const override
        {
            PropertyTree config;
            config.put("name", name_);
            config.put("trainable", trainable_);
            config.put("dtype", dtype_to_string(dtype_));
            if (batch_input_shape_) {
                config.add_child("batch_input_shape", Details::write_shape(*batch_input_shape_));
            }
            return config;
        }

        // Fresh instance of the same class built from `config`.
        [[nodiscard]] virtual std::shared_ptr<Base> instantiate(const PropertyTree& config) const = 0;

        // Symbolic call: builds on first use, records a node and returns the new output handles.
        std::vector<Tensor> operator()(const std::vector<Tensor>& inputs, const CallArguments& arguments = {},
                                       std::optional<std::vector<Mask>> masks = std::nullopt)
        {
            if (inputs.empty()) {
                throw CardinalityError("Layer " + name_ + " must be called on at least one tensor.");
            }
            auto self = weak_from_this().lock();
            if (!self) {
                throw TypeError("Layer " + name_ + " must be owned by a std::shared_ptr before it is called.");
            }

            std::vector<Graph::History> histories;
            histories.reserve(inputs.size());
            for (const auto& input : inputs) {
                if (!input.valid()) {
                    throw TypeError("Layer " + name_ + " was called with an empty tensor handle.");
                }
                auto history = input.history();
                if (!history) {
                    throw TypeError("Layer " + name_ + " was called with an input that is not a graph tensor: '"
                                    + input.name() + "'. All inputs to the layer should be produced by Input or by another layer.");
                }
                histories.push_back(*history);
            }

            std::vector<Mask> input_masks = masks ? std::move(*masks) : collect_previous_masks(inputs);
            if (input_masks.size() != inputs.size()) {
                throw CardinalityError("Layer " + name_ + " received " + std::to_string(input_masks.size())
                                       + " masks for " + std::to_string(inputs.size()) + " inputs.");
            }

            std::vector<Shape> input_shapes;
            input_shapes.reserve(inputs.size());
            for (const auto& input : inputs) {
                input_shapes.push_back(input.shape());
            }
            if (!built_) {
                if (batch_input_shape_ && input_shapes.size() == 1 && !shape_compatible(*batch_input_shape_, input_shapes.front())) {
                    throw ShapeError("Input 0 is incompatible with layer " + name_ + ": expected shape "
                                     + format_shape(*batch_input_shape_) + ", found shape " + format_shape(input_shapes.front()));
                }
                build(input_shapes);
                built_ = true;
            }

            const auto output_shapes = compute_output_shape(input_shapes);
            auto& arena = Graph::Arena::global();
            arena.register_layer(id_, self);

            const auto node_index = inbound_nodes_.size();
            Node node{};
            node.outbound_layer = id_;
            node.input_tensors.reserve(inputs.size());
            for (const auto& input : inputs) {
                node.input_tensors.push_back(input.owner().get() == this ? input.unowned() : input);
            }
            node.input_masks = input_masks;
            node.arguments = arguments;
            for (const auto& history : histories) {
                node.inbound_layers.push_back(history.layer);
                node.node_indices.push_back(history.node_index);
                node.tensor_indices.push_back(history.tensor_index);
            }
            node.output_tensors.reserve(output_shapes.size());
            for (std::size_t index = 0; index < output_shapes.size(); ++index) {
                node.output_tensors.push_back(Tensor::create(
                    output_shapes[index], output_dtype(), name_ + "/output_" + std::to_string(node_index) + ":" + std::to_string(index)));
            }
            node.output_masks = compute_mask(inputs, input_masks);
            node.output_masks.resize(node.output_tensors.size());

            for (std::size_t index = 0; index < node.output_tensors.size(); ++index) {
                arena.record_history(node.output_tensors[index].id(), {id_, node_index, index});
            }
            for (const auto inbound : node.inbound_layers) {
                if (auto layer = arena.layer(inbound)) {
                    layer->outbound_nodes_.push_back({id_, node_index});
                }
            }
            std::vector<Tensor> outputs;
            outputs.reserve(node.output_tensors.size());
            for (const auto& output : node.output_tensors) {
                outputs.push_back(output.owned_by(self));
            }
            inbound_nodes_.push_back(std::move(node));
            return outputs;
        }

        // Single-tensor convenience; a layer producing several outputs is rolled back and rejected.
        Tensor operator()(const Tensor& input, const CallArguments& arguments = {})
        {
            auto outputs = (*this)(std::vector<Tensor>{input}, arguments);
            if (outputs.size() != 1) {
                detach_last_node();
                throw ShapeError("Layer " + name_ + " produces several outputs; call it with a tensor list.");
            }
            return outputs.front();
        }

        [[nodiscard]] const std::vector<Node>& inbound_nodes() const noexcept { return inbound_nodes_; }
        [[nodiscard]] const std::vector<NodeRef>& outbound_nodes() const noexcept { return outbound_nodes_; }

        // Output of the most recent call; ambiguous for layers called several times.
        [[nodiscard]] const std::vector<Tensor>& output() const
        {
            if (inbound_nodes_.empty()) {
                throw PreconditionError("Layer " + name_ + " has never been called and thus has no defined output.");
            }
            return inbound_nodes_.back().output_tensors;
        }

        // Undoes the most recent call: its node, the outbound edges it created and the history of its outputs.
        void detach_last_node()
        {
            if (inbound_nodes_.empty()) {
                return;
            }
            auto& arena = Graph::Arena::global();
            const auto node_index = inbound_nodes_.size() - 1;
            const auto& node = inbound_nodes_.back();
            for (const auto inbound : node.inbound_layers) {
                if (auto layer = arena.layer(inbound)) {
                    layer->remove_outbound({id_, node_index});
                }
            }
            for (const auto& tensor : node.output_tensors) {
                const auto history = tensor.history();
                if (history && history->layer == id_ && history->node_index == node_index) {
                    arena.forget_history(tensor.id());
                }
            }
            inbound_nodes_.pop_back();
        }

        void remove_outbound(const NodeRef& reference)
        {
            outbound_nodes_.erase(std::remove(outbound_nodes_.begin(), outbound_nodes_.end(), reference), outbound_nodes_.end());
        }

        void remove_outbound_to(LayerId layer)
        {
            outbound_nodes_.erase(std::remove_if(outbound_nodes_.begin(), outbound_nodes_.end(),
                                                 [layer](const NodeRef& reference) { return reference.layer == layer; }),
                                  outbound_nodes_.end());
        }

        // Weights in creation order.
        [[nodiscard]] virtual std::vector<Weight> weights() const { return weights_; }

        [[nodiscard]] std::vector<Weight> trainable_weights() const
        {
            std::vector<Weight> selected;
            if (!trainable_) {
                return selected;
            }
            for (auto& weight : weights()) {
                if (weight.trainable) {
                    selected.push_back(std::move(weight));
                }
            }
            return selected;
        }

        [[nodiscard]] std::vector<Weight> non_trainable_weights() const
        {
            std::vector<Weight> selected;
            for (auto& weight : weights()) {
                if (!trainable_ || !weight.trainable) {
                    selected.push_back(std::move(weight));
                }
            }
            return selected;
        }

        [[nodiscard]] std::vector<torch::Tensor> get_weights() const
        {
            std::vector<torch::Tensor> values;
            for (const auto& weight : weights()) {
                values.push_back(weight.value.detach().clone());
            }
            return values;
        }

        // Copies values into the existing weight tensors so optimizer bindings stay valid.
        void set_weights(const std::vector<torch::Tensor>& values)
        {
            const auto current = weights();
            if (values.size() != current.size()) {
                throw CardinalityError("You called set_weights(weights) on layer \"" + name_ + "\" with a weight list of length "
                                       + std::to_string(values.size()) + ", but the layer was expecting "
                                       + std::to_string(current.size()) + " weights.");
            }
            for (std::size_t index = 0; index < values.size(); ++index) {
                if (values[index].sizes() != current[index].value.sizes()) {
                    throw ShapeError("Layer weight shape " + format_shape(shape_of(current[index].value))
                                     + " not compatible with provided weight shape " + format_shape(shape_of(values[index]))
                                     + " for weight '" + current[index].name + "'.");
                }
            }
            torch::NoGradGuard no_grad{};
            for (std::size_t index = 0; index < values.size(); ++index) {
                auto target = current[index].value;
                target.copy_(values[index].to(target.device(), target.scalar_type()));
            }
        }

        [[nodiscard]] std::int64_t count_params() const
        {
            std::int64_t total = 0;
            for (const auto& weight : weights()) {
                total += weight.value.numel();
            }
            return total;
        }

    protected:
        // Registers a backend parameter as weight `<layer name>/<name>`, initialized in place.
        void track_weight(const std::string& name, torch::Tensor value, Initialization::Descriptor initializer, bool trainable = true)
        {
            Initialization::Details::apply(initializer, value);
            value.set_requires_grad(trainable);
            weights_.push_back(Weight{name_ + "/" + name, std::move(value), trainable});
        }

        void set_supports_masking(bool supports) noexcept { supports_masking_ = supports; }
        void set_built(bool built) noexcept { built_ = built; }
        void set_name(std::string name) { name_ = std::move(name); }

        [[nodiscard]] virtual torch::ScalarType output_dtype() const noexcept { return dtype_; }

        // Raw node list access for containers that maintain their own node 0.
        std::vector<Node>& mutable_inbound_nodes() noexcept { return inbound_nodes_; }

        // Common options parsed back from a config written by get_config().
        static LayerOptions read_options(const PropertyTree& config)
        {
            LayerOptions options;
            options.name = config.get<std::string>("name", "");
            options.trainable = config.get<bool>("trainable", true);
            options.dtype = dtype_from_string(config.get<std::string>("dtype", "float32"));
            if (const auto shape = config.get_child_optional("batch_input_shape")) {
                options.batch_input_shape = Details::read_shape(*shape, "batch_input_shape of " + options.name);
            }
            return options;
        }

        // Masks recorded on the nodes that produced `inputs`.
        static std::vector<Mask> collect_previous_masks(const std::vector<Tensor>& inputs)
        {
            std::vector<Mask> masks;
            masks.reserve(inputs.size());
            auto& arena = Graph::Arena::global();
            for (const auto& input : inputs) {
                Mask mask{};
                if (const auto history = input.history()) {
                    if (const auto layer = arena.layer(history->layer)) {
                        const auto& nodes = layer->inbound_nodes();
                        if (history->node_index < nodes.size()) {
                            const auto& masks_out = nodes[history->node_index].output_masks;
                            if (history->tensor_index < masks_out.size()) {
                                mask = masks_out[history->tensor_index];
                            }
                        }
                    }
                }
                masks.push_back(std::move(mask));
            }
            return masks;
        }

        // New mask handle for an output of `shape` with the trailing feature axis removed.
        [[nodiscard]] Tensor make_mask(const Shape& shape) const
        {
            Shape mask_shape = shape;
            if (!mask_shape.empty()) {
                mask_shape.pop_back();
            }
            return Tensor::create(std::move(mask_shape), torch::kBool, name_ + "/mask");
        }

    private:
        LayerId id_{0};
        std::string class_name_{};
        std::string name_{};
        torch::ScalarType dtype_{torch::kFloat32};
        bool trainable_{true};
        bool built_{false};
        bool supports_masking_{false};
        std::optional<Shape> batch_input_shape_{};
        std::vector<Weight> weights_{};
        std::vector<Node> inbound_nodes_{};
        std::vector<NodeRef> outbound_nodes_{};
    };

    using LayerPtr = std::shared_ptr<Base>;
}

namespace Lattice {
    using Layer::LayerPtr;
}

#endif // LATTICE_LAYER_BASE_HPP
