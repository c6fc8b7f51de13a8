#ifndef LATTICE_MODEL_SEQUENTIAL_HPP
#define LATTICE_MODEL_SEQUENTIAL_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/config.hpp"
#include "../common/custom_objects.hpp"
#include "../common/error.hpp"
#include "../layer/layer.hpp"
#include "../layer/registry.hpp"
#include "../utils/log.hpp"
#include "model.hpp"

namespace Lattice {
    // Linear stack of single-output layers. The graph is assembled by add() and materialized as an
    // inner Model on the first operation that needs it.
    class Sequential : public Model {
    public:
        static constexpr std::size_t kMaxNestingDepth = 32;

        explicit Sequential(std::string name = {}) : Model("Sequential", Layer::LayerOptions{std::move(name)}) {
            set_built(false);
        }

        explicit Sequential(const std::vector<LayerPtr>& layers, std::string name = {}) : Sequential(std::move(name)) {
            for (const auto& layer : layers) {
                add(layer);
            }
        }

        // Replays add() for every {class_name, config} record, so the same checks apply.
        static std::shared_ptr<Sequential> from_config(const PropertyTree& config, const CustomObjects& custom_objects = {}) {
            auto model = std::make_shared<Sequential>();
            for (const auto& [key, entry] : config) {
                (void)key;
                model->add(Layer::Registry::deserialize(entry, custom_objects));
            }
            return model;
        }

        void add(const LayerPtr& layer) {
            if (!layer) {
                throw TypeError("The added layer must be an instance of class Layer. Found: nullptr");
            }

            std::optional<Tensor> new_input;
            Tensor output;
            std::optional<std::size_t> call;
            if (stack_.empty()) {
                if (const auto input_layer = std::dynamic_pointer_cast<Layer::Details::InputLayer>(layer)) {
                    output = input_layer->input();
                    new_input = output;
                } else {
                    const auto [batch_shape, dtype] = infer_input_signature(layer);
                    InputOptions options{};
                    options.batch_shape = batch_shape;
                    options.dtype = dtype;
                    options.name = layer->name() + "_input";
                    new_input = Input(std::move(options));
                    call = layer->inbound_nodes().size();
                    output = call_single(layer, *new_input);
                }
            } else {
                if (dynamic_cast<const Layer::Details::InputLayer*>(layer.get()) != nullptr) {
                    throw TypeError("An input layer can only be the first layer of a Sequential model. Found " + layer->name()
                                    + " after " + layers_.back()->name() + ".");
                }
                call = layer->inbound_nodes().size();
                output = call_single(layer, stack_.back());
            }

            if (new_input) {
                inputs_ = {*new_input};
            }
            layers_.push_back(layer);
            stack_.push_back(output);
            calls_.push_back(call);
            write_container_node(inputs_, {output});
            model_.reset();
            refresh_endpoints();
            reset_compilation();
            set_built(false);
        }

        // Undoes the last add(): the call it made is detached from the graph.
        void pop() {
            if (layers_.empty()) {
                throw EmptyError("There are no layers in the model.");
            }
            const auto layer = layers_.back();
            const auto call = calls_.back();
            if (call) {
                if (*call + 1 == layer->inbound_nodes().size()) {
                    layer->detach_last_node();
                } else {
                    const auto& source = stack_.size() > 1 ? stack_[stack_.size() - 2] : inputs_.front();
                    if (const auto history = source.history()) {
                        if (const auto previous = Graph::Arena::global().layer(history->layer)) {
                            previous->remove_outbound({layer->id(), *call});
                        }
                    }
                }
            }
            layers_.pop_back();
            stack_.pop_back();
            calls_.pop_back();

            if (layers_.empty()) {
                inputs_.clear();
                mutable_inbound_nodes().clear();
            } else {
                write_container_node(inputs_, {stack_.back()});
            }
            model_.reset();
            refresh_endpoints();
            reset_compilation();
            set_built(false);
        }

        void build() {
            if (built() && model_) {
                return;
            }
            if (stack_.empty()) {
                throw ConfigError("Sequential model cannot be built: model is empty. Add some layers first.");
            }
            model_ = std::make_shared<Model>(inputs_, std::vector<Tensor>{stack_.back()}, name() + "_model");
            model_->set_trainable(trainable());
            set_topology(model_->topology());
            set_built(true);
        }

        void build(const std::vector<Shape>& input_shapes) override {
            (void)input_shapes;
            build();
        }

        [[nodiscard]] std::vector<LayerPtr> layers() const override { return layers_; }

        // Looks through the inner model, so index 0 is the implicit input layer when one was synthesized.
        [[nodiscard]] LayerPtr get_layer(const std::string& name) override {
            build();
            return model_->get_layer(name);
        }

        [[nodiscard]] LayerPtr get_layer(std::size_t index) override {
            build();
            return model_->get_layer(index);
        }

        // Inner functional model; null until built.
        [[nodiscard]] const std::shared_ptr<Model>& model() const noexcept { return model_; }

        void set_trainable(bool trainable) override {
            Layer::Base::set_trainable(trainable);
            if (model_) {
                model_->set_trainable(trainable);
            }
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments& arguments) override {
            build();
            return model_->forward(inputs, arguments);
        }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override {
            if (stack_.empty()) {
                throw ConfigError("Sequential model " + name() + " has no layers; its output shape is undefined.");
            }
            if (input_shapes.size() != 1) {
                throw CardinalityError("Sequential model " + name() + " expects 1 input shape, but received "
                                       + std::to_string(input_shapes.size()) + ".");
            }
            if (!shape_compatible(inputs_.front().shape(), input_shapes.front())) {
                throw ShapeError("Input 0 is incompatible with model " + name() + ": expected shape "
                                 + format_shape(inputs_.front().shape()) + ", found shape " + format_shape(input_shapes.front()));
            }
            auto shapes = input_shapes;
            for (const auto& layer : layers_) {
                if (dynamic_cast<const Layer::Details::InputLayer*>(layer.get()) == nullptr) {
                    shapes = layer->compute_output_shape(shapes);
                }
            }
            return shapes;
        }

        [[nodiscard]] std::vector<Mask> compute_mask(const std::vector<Tensor>& inputs, const std::vector<Mask>& masks) const override {
            auto current = masks;
            auto tensors = inputs;
            for (std::size_t index = 0; index < layers_.size(); ++index) {
                if (dynamic_cast<const Layer::Details::InputLayer*>(layers_[index].get()) != nullptr) {
                    continue;
                }
                current = layers_[index]->compute_mask(tensors, current);
                current.resize(1);
                tensors = {stack_[index]};
            }
            current.resize(1);
            return current;
        }

        [[nodiscard]] PropertyTree get_config() const override {
            PropertyTree config;
            for (const auto& layer : layers_) {
                PropertyTree entry;
                entry.put("class_name", layer->class_name());
                entry.add_child("config", layer->get_config());
                Common::Config::push_back(config, std::move(entry));
            }
            return config;
        }

        [[nodiscard]] std::shared_ptr<Layer::Base> instantiate(const PropertyTree& config) const override {
            return from_config(config);
        }

        // Output of the single output; warns when values fall outside [0, 1].
        torch::Tensor predict_proba(const TensorList& x, PredictOptions options = {}) {
            auto predictions = predict(x, options).front();
            if (predictions.min().item<double>() < 0.0 || predictions.max().item<double>() > 1.0) {
                Utils::Log::warning("Network returning invalid probability values. The last layer might not normalize predictions "
                                    "into probabilities (like softmax or sigmoid would).");
            }
            return predictions;
        }

        // Arg-max over the last axis, or a 0.5 threshold for a single unit.
        torch::Tensor predict_classes(const TensorList& x, PredictOptions options = {}) {
            auto predictions = predict(x, options).front();
            if (predictions.dim() > 1 && predictions.size(-1) > 1) {
                return predictions.argmax(-1);
            }
            return (predictions > 0.5).to(torch::kInt32);
        }

    protected:
        void ensure_graph() override { build(); }

        void require_compiled(const std::string& operation) const override {
            (void)operation;
            if (!built() || !model_ || !compiled()) {
                throw PreconditionError("The model needs to be compiled before being used.");
            }
        }

    private:
        // Batch shape and dtype for the implicit input, looked up through nested models without recursion.
        static std::pair<Shape, torch::ScalarType> infer_input_signature(const LayerPtr& layer) {
            LayerPtr current = layer;
            std::set<LayerId> visited;
            for (std::size_t level = 0; level <= kMaxNestingDepth; ++level) {
                if (!visited.insert(current->id()).second) {
                    throw ConfigError("Cannot infer the input shape of layer " + layer->name() + ": its nested models form a cycle.");
                }
                if (current->batch_input_shape()) {
                    return {*current->batch_input_shape(), current->dtype()};
                }
                const auto* nested = dynamic_cast<const Model*>(current.get());
                if (nested == nullptr) {
                    throw ConfigError("The first layer in a Sequential model must get an `input_shape` or `batch_input_shape` argument. "
                                      "Layer " + layer->name() + " declares neither.");
                }
                const auto nested_layers = nested->layers();
                if (nested_layers.empty()) {
                    throw ConfigError("Cannot add an empty model to a Sequential model: " + nested->name() + " has no layers.");
                }
                current = nested_layers.front();
            }
            throw ConfigError("Nested models around layer " + layer->name() + " exceed the maximum nesting depth of "
                              + std::to_string(kMaxNestingDepth) + ".");
        }

        static Tensor call_single(const LayerPtr& layer, const Tensor& input) {
            auto outputs = (*layer)(std::vector<Tensor>{input});
            if (outputs.size() != 1) {
                layer->detach_last_node();
                throw ShapeError("All layers in a Sequential model should have a single output tensor. "
                                 "For multi-output layers, use the functional API.");
            }
            return outputs.front();
        }

        void refresh_endpoints() {
            Graph::Topology endpoints;
            if (!stack_.empty()) {
                endpoints.inputs = inputs_;
                endpoints.outputs = {stack_.back()};
            }
            set_topology(std::move(endpoints));
        }

        std::vector<LayerPtr> layers_{};
        std::vector<Tensor> stack_{};                    // output after each layer
        std::vector<std::optional<std::size_t>> calls_{}; // node index created by add(), none for an input layer
        std::vector<Tensor> inputs_{};
        std::shared_ptr<Model> model_{};
    };

    using SequentialPtr = std::shared_ptr<Sequential>;

    namespace Details {
        inline const bool kSequentialRegistered = Layer::Registry::register_class(
            "Sequential", [](const PropertyTree& config, const CustomObjects& custom_objects) -> LayerPtr {
                return Sequential::from_config(config, custom_objects);
            });
    }
}

#endif // LATTICE_MODEL_SEQUENTIAL_HPP
