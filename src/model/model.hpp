#ifndef LATTICE_MODEL_MODEL_HPP
#define LATTICE_MODEL_MODEL_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/archive.hpp"
#include "../common/config.hpp"
#include "../common/custom_objects.hpp"
#include "../common/error.hpp"
#include "../common/json.hpp"
#include "../layer/layer.hpp"
#include "../loss/loss.hpp"
#include "../metric/metric.hpp"
#include "../optimizer/optimizer.hpp"
#include "../utils/log.hpp"
#include "../utils/progressbar.hpp"
#include "../utils/terminal.hpp"
#include "generator.hpp"
#include "topology.hpp"

namespace Lattice {
    // One or several backend tensors, in model input (or output) order.
    struct TensorList {
        std::vector<torch::Tensor> values{};

        TensorList() = default;
        TensorList(torch::Tensor value) : values{std::move(value)} {}
        TensorList(std::vector<torch::Tensor> list) : values(std::move(list)) {}
        TensorList(std::initializer_list<torch::Tensor> list) : values(list) {}

        [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
        [[nodiscard]] bool empty() const noexcept { return values.empty(); }
    };

    using OptimizerSpec = std::variant<std::string, Optimizer::OptimizerPtr>;
    using LossWeights = std::variant<std::vector<double>, std::map<std::string, double>>;

    struct CompileOptions {
        OptimizerSpec optimizer{std::string("sgd")};
        Loss::Spec loss{};
        Metric::Spec metrics{};
        std::optional<LossWeights> loss_weights{};
        std::string sample_weight_mode{};   // "" (per sample) or "temporal" (per timestep)
        CustomObjects custom_objects{};
    };

    struct FitOptions {
        std::int64_t batch_size{32};
        std::size_t epochs{1};
        int verbose{1};                     // 0 silent, 1 progress bar and epoch line, 2 epoch line only
        double validation_split{0.0};
        std::optional<std::pair<TensorList, TensorList>> validation_data{};
        bool shuffle{true};
        std::optional<torch::Tensor> sample_weight{};
        std::map<std::int64_t, double> class_weight{};
        std::size_t initial_epoch{0};
        std::ostream* stream{&std::cout};
    };

    struct EvaluateOptions {
        std::int64_t batch_size{32};
        int verbose{0};
        std::optional<torch::Tensor> sample_weight{};
        std::ostream* stream{&std::cout};
    };

    struct PredictOptions {
        std::int64_t batch_size{32};
        int verbose{0};
        std::ostream* stream{&std::cout};
    };

    // Epoch-averaged values keyed by metric name ("loss", "val_loss", ...).
    struct TrainingHistory {
        std::vector<std::size_t> epoch{};
        std::map<std::string, std::vector<double>> history{};
    };

    namespace Details {
        using WeightList = std::vector<std::optional<torch::Tensor>>;

        inline std::vector<torch::Tensor> take(const std::vector<torch::Tensor>& values, const torch::Tensor& indices)
        {
            std::vector<torch::Tensor> selected;
            selected.reserve(values.size());
            for (const auto& value : values) {
                selected.push_back(value.index_select(0, indices.to(value.device())));
            }
            return selected;
        }

        inline WeightList take(const WeightList& values, const torch::Tensor& indices)
        {
            WeightList selected;
            selected.reserve(values.size());
            for (const auto& value : values) {
                if (value) {
                    selected.emplace_back(value->index_select(0, indices.to(value->device())));
                } else {
                    selected.emplace_back(std::nullopt);
                }
            }
            return selected;
        }

        inline std::vector<torch::Tensor> slice(const std::vector<torch::Tensor>& values, std::int64_t begin, std::int64_t end)
        {
            std::vector<torch::Tensor> sliced;
            sliced.reserve(values.size());
            for (const auto& value : values) {
                sliced.push_back(value.slice(0, begin, end));
            }
            return sliced;
        }

        inline WeightList slice(const WeightList& values, std::int64_t begin, std::int64_t end)
        {
            WeightList sliced;
            sliced.reserve(values.size());
            for (const auto& value : values) {
                if (value) {
                    sliced.emplace_back(value->slice(0, begin, end));
                } else {
                    sliced.emplace_back(std::nullopt);
                }
            }
            return sliced;
        }

        inline std::string format_value(double value)
        {
            std::ostringstream stream;
            stream << std::fixed << std::setprecision(4) << value;
            return stream.str();
        }

        // Per-sample weights looked up from the class of each target row.
        inline torch::Tensor class_sample_weights(const torch::Tensor& target, const std::map<std::int64_t, double>& class_weight)
        {
            if (target.dim() > 2) {
                throw UnsupportedError("class_weight not supported for 3+ dimensional targets.");
            }
            torch::Tensor classes;
            if (target.dim() == 2 && target.size(1) > 1) {
                classes = target.argmax(1);
            } else {
                classes = target.reshape({target.size(0)}).round();
            }
            classes = classes.to(torch::kCPU, torch::kLong).contiguous();

            auto weights = torch::empty({classes.size(0)}, torch::dtype(torch::kFloat32));
            auto class_view = classes.accessor<std::int64_t, 1>();
            auto weight_view = weights.accessor<float, 1>();
            std::set<std::int64_t> missing;
            for (std::int64_t index = 0; index < classes.size(0); ++index) {
                const auto it = class_weight.find(class_view[index]);
                if (it == class_weight.end()) {
                    missing.insert(class_view[index]);
                    continue;
                }
                weight_view[index] = static_cast<float>(it->second);
            }
            if (!missing.empty()) {
                std::string listed;
                for (const auto value : missing) {
                    listed += (listed.empty() ? "" : ", ") + std::to_string(value);
                }
                throw ConfigError("`class_weight` must contain all classes in the data. The classes {" + listed
                                  + "} exist in the data but not in `class_weight`.");
            }
            return weights.to(target.device());
        }

        inline PropertyTree coordinate_entry(const std::string& layer, std::size_t node_index, std::size_t tensor_index)
        {
            PropertyTree entry;
            PropertyTree value;
            value.put_value(layer);
            Common::Config::push_back(entry, value);
            value.put_value(node_index);
            Common::Config::push_back(entry, value);
            value.put_value(tensor_index);
            Common::Config::push_back(entry, value);
            return entry;
        }

        inline std::vector<const PropertyTree*> elements(const PropertyTree& array)
        {
            std::vector<const PropertyTree*> items;
            items.reserve(array.size());
            for (const auto& child : array) {
                items.push_back(&child.second);
            }
            return items;
        }

        inline std::size_t read_index(const PropertyTree& value, const std::string& context)
        {
            const auto index = value.get_value_optional<std::size_t>();
            if (!index) {
                throw ConfigError("Expected a non-negative index in " + context + ", found '" + value.data() + "'.");
            }
            return *index;
        }

        // Layer weights as {layer_names; per layer: weight_names and one dataset per weight name}.
        inline void write_layer_weights(Common::Archive::Group& group, const std::vector<LayerPtr>& layers)
        {
            std::vector<std::string> layer_names;
            layer_names.reserve(layers.size());
            for (const auto& layer : layers) {
                layer_names.push_back(layer->name());
            }
            group.set_attribute("layer_names", Common::Archive::encode_names(layer_names));
            for (const auto& layer : layers) {
                auto& layer_group = group.create_group(layer->name());
                const auto weights = layer->weights();
                std::vector<std::string> weight_names;
                weight_names.reserve(weights.size());
                for (const auto& weight : weights) {
                    weight_names.push_back(weight.name);
                    layer_group.add_dataset(weight.name, weight.value);
                }
                layer_group.set_attribute("weight_names", Common::Archive::encode_names(weight_names));
            }
        }

        // Values in the order of the weight_names record, each looked up by name.
        inline std::vector<torch::Tensor> read_weight_values(const Common::Archive::Group& layer_group, const std::string& layer_name)
        {
            const auto recorded = layer_group.attribute("weight_names");
            if (!recorded) {
                throw ValidationError("Saved weights of layer '" + layer_name + "' carry no weight_names record.");
            }
            const auto names = Common::Archive::decode_names(*recorded, "weight_names of layer " + layer_name);
            std::vector<torch::Tensor> values;
            values.reserve(names.size());
            for (const auto& name : names) {
                const auto* value = layer_group.dataset(name);
                if (value == nullptr) {
                    throw ValidationError("Weight '" + name + "' of layer '" + layer_name + "' is missing from the archive.");
                }
                values.push_back(*value);
            }
            return values;
        }

        // Matches saved layers to `layers` by position, skipping layers without weights on both sides.
        // Every count and shape is checked before the first value is written.
        inline void load_layer_weights(const Common::Archive::Group& group, const std::vector<LayerPtr>& layers)
        {
            std::vector<LayerPtr> filtered;
            for (const auto& layer : layers) {
                if (!layer->weights().empty()) {
                    filtered.push_back(layer);
                }
            }
            const auto recorded = group.attribute("layer_names");
            if (!recorded) {
                throw ValidationError("Weight archive has no layer_names record.");
            }
            std::vector<std::pair<std::string, std::vector<torch::Tensor>>> saved;
            for (const auto& name : Common::Archive::decode_names(*recorded, "layer_names")) {
                const auto* layer_group = group.group(name);
                if (layer_group == nullptr) {
                    throw ValidationError("Weight archive lists layer '" + name + "' but holds no weights for it.");
                }
                auto values = read_weight_values(*layer_group, name);
                if (!values.empty()) {
                    saved.emplace_back(name, std::move(values));
                }
            }
            if (saved.size() != filtered.size()) {
                throw CardinalityError("You are trying to load a weight file containing " + std::to_string(saved.size())
                                       + " layers into a model with " + std::to_string(filtered.size()) + " layers.");
            }
            for (std::size_t index = 0; index < filtered.size(); ++index) {
                const auto expected = filtered[index]->weights();
                const auto& [saved_name, values] = saved[index];
                if (expected.size() != values.size()) {
                    throw CardinalityError("Layer #" + std::to_string(index) + " (named \"" + filtered[index]->name()
                                           + "\" in the current model) was found to correspond to layer " + saved_name
                                           + " in the save file. However the new layer " + filtered[index]->name() + " expects "
                                           + std::to_string(expected.size()) + " weights, but the saved weights have "
                                           + std::to_string(values.size()) + " elements.");
                }
                for (std::size_t position = 0; position < values.size(); ++position) {
                    if (expected[position].value.sizes() != values[position].sizes()) {
                        throw ShapeError("Weight '" + expected[position].name + "' has shape "
                                         + format_shape(shape_of(expected[position].value)) + " but the saved weight of layer "
                                         + saved_name + " has shape " + format_shape(shape_of(values[position])) + ".");
                    }
                }
            }
            for (std::size_t index = 0; index < filtered.size(); ++index) {
                filtered[index]->set_weights(saved[index].second);
            }
        }

        // Loads into the layers whose names appear in the archive; other layers keep their values.
        inline void load_layer_weights_by_name(const Common::Archive::Group& group, const std::vector<LayerPtr>& layers)
        {
            for (const auto& layer : layers) {
                const auto* layer_group = group.group(layer->name());
                if (layer_group == nullptr) {
                    continue;
                }
                const auto values = read_weight_values(*layer_group, layer->name());
                const auto expected = layer->weights().size();
                if (values.size() != expected) {
                    throw CardinalityError("Layer named \"" + layer->name() + "\" expects " + std::to_string(expected)
                                           + " weight(s), but the saved weights have " + std::to_string(values.size())
                                           + " element(s).");
                }
                layer->set_weights(values);
            }
        }
    }

    // Graph of layers from input tensors to output tensors. Also a layer: calling it on new
    // tensors reuses its layers and weights.
    class Model : public Layer::Base {
    public:
        Model(std::vector<Tensor> inputs, std::vector<Tensor> outputs, std::string name = {})
            : Base("Model", Layer::LayerOptions{std::move(name)}) {
            initialize(Graph::build_topology(std::move(inputs), std::move(outputs)));
        }

        Model(const Tensor& input, const Tensor& output, std::string name = {})
            : Model(std::vector<Tensor>{input}, std::vector<Tensor>{output}, std::move(name)) {}

        // Rebuilds a model from get_config(). Nodes whose inbound layers have not been called
        // yet are deferred and retried in layer order.
        static std::shared_ptr<Model> from_config(const PropertyTree& config, const CustomObjects& custom_objects = {}) {
            const auto name = config.get<std::string>("name", "");
            const auto context = "config of model " + (name.empty() ? std::string("<unnamed>") : name);

            std::vector<std::string> order;
            std::map<std::string, LayerPtr> created;
            std::map<std::string, std::vector<const PropertyTree*>> unprocessed;

            for (const auto& [key, layer_data] : Common::Config::get_child(config, "layers", context)) {
                (void)key;
                const auto layer_name = Common::Config::get_string(layer_data, "name", context);
                if (created.count(layer_name) != 0) {
                    throw ConfigError("The name \"" + layer_name + "\" is used twice in the " + context + ".");
                }
                auto layer = Layer::Registry::deserialize(layer_data, custom_objects);
                created.emplace(layer_name, layer);
                order.push_back(layer_name);
                auto& pending = unprocessed[layer_name];
                for (const auto& node_entry : layer_data.get_child("inbound_nodes", PropertyTree{})) {
                    pending.push_back(&node_entry.second);
                }
            }

            // False when an inbound layer does not yet have the requested node.
            auto process_node = [&](const LayerPtr& layer, const PropertyTree& node_data) -> bool {
                std::vector<Tensor> input_tensors;
                CallArguments arguments;
                for (const auto& [key, input_data] : node_data) {
                    (void)key;
                    const auto items = Details::elements(input_data);
                    if (items.size() < 3) {
                        throw ConfigError("Inbound node entry of layer " + layer->name() + " in the " + context
                                          + " needs [layer, node index, tensor index].");
                    }
                    const auto inbound_name = items[0]->data();
                    const auto found = created.find(inbound_name);
                    if (found == created.end()) {
                        throw ConfigError("Layer " + layer->name() + " refers to unknown layer \"" + inbound_name + "\" in the " + context + ".");
                    }
                    const auto node_index = Details::read_index(*items[1], context);
                    const auto tensor_index = Details::read_index(*items[2], context);
                    if (items.size() > 3) {
                        arguments = Arguments::from_tree(*items[3]);
                    }
                    const auto& inbound_nodes = found->second->inbound_nodes();
                    if (node_index >= inbound_nodes.size()) {
                        return false;
                    }
                    const auto& outputs = inbound_nodes[node_index].output_tensors;
                    if (tensor_index >= outputs.size()) {
                        throw ConfigError("Layer \"" + inbound_name + "\" has no output " + std::to_string(tensor_index) + " at node "
                                          + std::to_string(node_index) + " in the " + context + ".");
                    }
                    input_tensors.push_back(outputs[tensor_index].owned_by(found->second));
                }
                if (!input_tensors.empty()) {
                    (*layer)(input_tensors, arguments);
                }
                return true;
            };

            for (;;) {
                bool remaining = false;
                bool progress = false;
                for (const auto& layer_name : order) {
                    auto& pending = unprocessed[layer_name];
                    std::size_t done = 0;
                    while (done < pending.size() && process_node(created.at(layer_name), *pending[done])) {
                        ++done;
                    }
                    pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(done));
                    progress = progress || done > 0;
                    remaining = remaining || !pending.empty();
                }
                if (!remaining) {
                    break;
                }
                if (!progress) {
                    std::string blocked;
                    for (const auto& layer_name : order) {
                        if (!unprocessed[layer_name].empty()) {
                            blocked += (blocked.empty() ? "" : ", ") + layer_name;
                        }
                    }
                    throw ConfigError("Cannot rebuild the " + context + ": the nodes of layers [" + blocked
                                      + "] depend on layer calls that never happen.");
                }
            }

            auto resolve = [&](const std::string& key) {
                std::vector<Tensor> tensors;
                for (const auto& [unused, entry] : Common::Config::get_child(config, key, context)) {
                    (void)unused;
                    const auto items = Details::elements(entry);
                    if (items.size() < 3) {
                        throw ConfigError("Entries of '" + key + "' in the " + context + " need [layer, node index, tensor index].");
                    }
                    const auto found = created.find(items[0]->data());
                    if (found == created.end()) {
                        throw ConfigError("'" + key + "' refers to unknown layer \"" + items[0]->data() + "\" in the " + context + ".");
                    }
                    const auto node_index = Details::read_index(*items[1], context);
                    const auto tensor_index = Details::read_index(*items[2], context);
                    const auto& nodes = found->second->inbound_nodes();
                    if (node_index >= nodes.size() || tensor_index >= nodes[node_index].output_tensors.size()) {
                        throw ConfigError("'" + key + "' refers to a missing output of layer \"" + items[0]->data() + "\" in the " + context + ".");
                    }
                    tensors.push_back(nodes[node_index].output_tensors[tensor_index]);
                }
                return tensors;
            };
            return std::make_shared<Model>(resolve("input_layers"), resolve("output_layers"), name);
        }

        [[nodiscard]] const Graph::Topology& topology() const noexcept { return topology_; }
        [[nodiscard]] const std::vector<Tensor>& inputs() const noexcept { return topology_.inputs; }
        [[nodiscard]] const std::vector<Tensor>& outputs() const noexcept { return topology_.outputs; }
        [[nodiscard]] const std::vector<LayerPtr>& input_layers() const noexcept { return topology_.input_layers; }
        [[nodiscard]] const std::vector<LayerPtr>& output_layers() const noexcept { return topology_.output_layers; }
        [[nodiscard]] const std::vector<std::string>& input_names() const noexcept { return topology_.input_names; }
        [[nodiscard]] const std::vector<std::string>& output_names() const noexcept { return topology_.output_names; }
        [[nodiscard]] const std::map<std::size_t, std::vector<NodeRef>>& nodes_by_depth() const noexcept { return topology_.nodes_by_depth; }
        [[nodiscard]] const std::map<std::size_t, std::vector<LayerPtr>>& layers_by_depth() const noexcept { return topology_.layers_by_depth; }

        // Layers by decreasing depth (inputs first).
        [[nodiscard]] virtual std::vector<LayerPtr> layers() const { return topology_.layers; }

        [[nodiscard]] virtual LayerPtr get_layer(const std::string& name) {
            for (const auto& layer : layers()) {
                if (layer->name() == name) {
                    return layer;
                }
            }
            throw ValidationError("No such layer: " + name);
        }

        [[nodiscard]] virtual LayerPtr get_layer(std::size_t index) {
            const auto all = layers();
            if (index >= all.size()) {
                throw ValidationError("Was asked to retrieve layer at index " + std::to_string(index) + " but model only has "
                                      + std::to_string(all.size()) + " layers.");
            }
            return all[index];
        }

        // Runs the nodes bucket by bucket, deepest first. Inputs bound to a constant may be omitted.
        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments& arguments) override {
            const auto bound = bind_inputs(inputs);
            std::unordered_map<TensorId, torch::Tensor> computed;
            for (std::size_t index = 0; index < bound.size(); ++index) {
                computed[topology_.inputs[index].id()] = bound[index];
            }

            for (auto bucket = topology_.nodes_by_depth.rbegin(); bucket != topology_.nodes_by_depth.rend(); ++bucket) {
                for (const auto& reference : bucket->second) {
                    const auto& layer = topology_.layer(reference.layer);
                    if (dynamic_cast<const Layer::Details::InputLayer*>(layer.get()) != nullptr) {
                        continue;
                    }
                    const auto& node = topology_.node(reference);
                    std::vector<torch::Tensor> values;
                    values.reserve(node.input_tensors.size());
                    for (const auto& tensor : node.input_tensors) {
                        const auto it = computed.find(tensor.id());
                        if (it == computed.end()) {
                            throw AssertionError("Tensor '" + tensor.name() + "' needed by layer " + layer->name() + " was not computed.");
                        }
                        values.push_back(it->second);
                    }
                    // Arguments recorded on the node win over the ones passed to this call.
                    auto merged = node.arguments;
                    for (const auto& [key, value] : arguments) {
                        merged.emplace(key, value);
                    }
                    auto results = layer->forward(values, merged);
                    if (results.size() != node.output_tensors.size()) {
                        throw AssertionError("Layer " + layer->name() + " returned " + std::to_string(results.size())
                                             + " tensors where its node declares " + std::to_string(node.output_tensors.size()) + ".");
                    }
                    for (std::size_t index = 0; index < results.size(); ++index) {
                        computed[node.output_tensors[index].id()] = std::move(results[index]);
                    }
                }
            }

            std::vector<torch::Tensor> outputs;
            outputs.reserve(topology_.outputs.size());
            for (const auto& tensor : topology_.outputs) {
                const auto it = computed.find(tensor.id());
                if (it == computed.end()) {
                    throw AssertionError("Could not compute output " + tensor.name());
                }
                outputs.push_back(it->second);
            }
            return outputs;
        }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override {
            if (input_shapes.size() != topology_.inputs.size()) {
                throw CardinalityError("Model " + name() + " expects " + std::to_string(topology_.inputs.size())
                                       + " input shape(s), but received " + std::to_string(input_shapes.size()) + ".");
            }
            std::unordered_map<TensorId, Shape> shapes;
            for (std::size_t index = 0; index < input_shapes.size(); ++index) {
                const auto& declared = topology_.inputs[index].shape();
                if (!shape_compatible(declared, input_shapes[index])) {
                    throw ShapeError("Input " + std::to_string(index) + " is incompatible with model " + name() + ": expected shape "
                                     + format_shape(declared) + ", found shape " + format_shape(input_shapes[index]));
                }
                shapes[topology_.inputs[index].id()] = input_shapes[index];
            }
            for (auto bucket = topology_.nodes_by_depth.rbegin(); bucket != topology_.nodes_by_depth.rend(); ++bucket) {
                for (const auto& reference : bucket->second) {
                    const auto& layer = topology_.layer(reference.layer);
                    if (dynamic_cast<const Layer::Details::InputLayer*>(layer.get()) != nullptr) {
                        continue;
                    }
                    const auto& node = topology_.node(reference);
                    std::vector<Shape> node_shapes;
                    for (const auto& tensor : node.input_tensors) {
                        node_shapes.push_back(shapes.at(tensor.id()));
                    }
                    const auto results = layer->compute_output_shape(node_shapes);
                    for (std::size_t index = 0; index < results.size() && index < node.output_tensors.size(); ++index) {
                        shapes[node.output_tensors[index].id()] = results[index];
                    }
                }
            }
            std::vector<Shape> outputs;
            for (const auto& tensor : topology_.outputs) {
                outputs.push_back(shapes.at(tensor.id()));
            }
            return outputs;
        }

        [[nodiscard]] std::vector<Mask> compute_mask(const std::vector<Tensor>& inputs, const std::vector<Mask>& masks) const override {
            (void)inputs;
            std::unordered_map<TensorId, Mask> propagated;
            for (std::size_t index = 0; index < topology_.inputs.size(); ++index) {
                propagated[topology_.inputs[index].id()] = index < masks.size() ? masks[index] : Mask{};
            }
            for (auto bucket = topology_.nodes_by_depth.rbegin(); bucket != topology_.nodes_by_depth.rend(); ++bucket) {
                for (const auto& reference : bucket->second) {
                    const auto& layer = topology_.layer(reference.layer);
                    if (dynamic_cast<const Layer::Details::InputLayer*>(layer.get()) != nullptr) {
                        continue;
                    }
                    const auto& node = topology_.node(reference);
                    std::vector<Mask> node_masks;
                    for (const auto& tensor : node.input_tensors) {
                        const auto it = propagated.find(tensor.id());
                        node_masks.push_back(it == propagated.end() ? Mask{} : it->second);
                    }
                    auto results = layer->compute_mask(node.input_tensors, node_masks);
                    results.resize(node.output_tensors.size());
                    for (std::size_t index = 0; index < results.size(); ++index) {
                        propagated[node.output_tensors[index].id()] = std::move(results[index]);
                    }
                }
            }
            std::vector<Mask> outputs;
            for (const auto& tensor : topology_.outputs) {
                const auto it = propagated.find(tensor.id());
                outputs.push_back(it == propagated.end() ? Mask{} : it->second);
            }
            return outputs;
        }

        // Weights of every layer; a frozen layer contributes only non-trainable weights.
        [[nodiscard]] std::vector<Layer::Weight> weights() const override {
            std::vector<Layer::Weight> all;
            for (const auto& layer : layers()) {
                for (auto& weight : layer->weights()) {
                    weight.trainable = weight.trainable && layer->trainable();
                    all.push_back(std::move(weight));
                }
            }
            return all;
        }

        // {name, layers: [{name, class_name, config, inbound_nodes}], input_layers, output_layers}.
        // Node indices are renumbered over the nodes that belong to this model.
        [[nodiscard]] PropertyTree get_config() const override {
            const auto all = layers();
            std::map<NodeRef, std::size_t> conversion;
            for (const auto& layer : all) {
                // A nested model keeps its own node 0, so its calls start at 1.
                std::size_t kept = dynamic_cast<const Model*>(layer.get()) != nullptr ? 1 : 0;
                for (std::size_t index = 0; index < layer->inbound_nodes().size(); ++index) {
                    const NodeRef reference{layer->id(), index};
                    if (topology_.network_nodes.count(reference) != 0) {
                        conversion[reference] = kept++;
                    }
                }
            }
            auto converted = [&](LayerId layer, std::size_t node_index) -> std::size_t {
                const auto it = conversion.find({layer, node_index});
                return it == conversion.end() ? 0 : it->second;
            };

            PropertyTree layer_configs;
            for (const auto& layer : all) {
                PropertyTree inbound;
                const auto& nodes = layer->inbound_nodes();
                for (std::size_t index = 0; index < nodes.size(); ++index) {
                    if (topology_.network_nodes.count({layer->id(), index}) == 0 || nodes[index].inbound_layers.empty()) {
                        continue;
                    }
                    const auto& node = nodes[index];
                    const auto arguments = Arguments::to_tree(node.arguments);
                    PropertyTree node_data;
                    for (std::size_t position = 0; position < node.inbound_layers.size(); ++position) {
                        const auto& source = topology_.layer(node.inbound_layers[position]);
                        auto entry = Details::coordinate_entry(source->name(),
                                                               converted(source->id(), node.node_indices[position]),
                                                               node.tensor_indices[position]);
                        Common::Config::push_back(entry, arguments);
                        Common::Config::push_back(node_data, std::move(entry));
                    }
                    Common::Config::push_back(inbound, std::move(node_data));
                }
                PropertyTree entry;
                entry.put("name", layer->name());
                entry.put("class_name", layer->class_name());
                entry.add_child("config", layer->get_config());
                entry.add_child("inbound_nodes", inbound);
                Common::Config::push_back(layer_configs, std::move(entry));
            }

            auto coordinates = [&](const std::vector<Graph::Coordinate>& list) {
                PropertyTree tree;
                for (const auto& coordinate : list) {
                    const auto& layer = topology_.layer(coordinate.layer);
                    Common::Config::push_back(tree, Details::coordinate_entry(layer->name(), converted(coordinate.layer, coordinate.node_index),
                                                                              coordinate.tensor_index));
                }
                return tree;
            };

            PropertyTree config;
            config.put("name", name());
            config.add_child("layers", layer_configs);
            config.add_child("input_layers", coordinates(topology_.input_coordinates));
            config.add_child("output_layers", coordinates(topology_.output_coordinates));
            return config;
        }

        [[nodiscard]] std::shared_ptr<Layer::Base> instantiate(const PropertyTree& config) const override {
            return from_config(config);
        }

        [[nodiscard]] std::string to_json(bool pretty = false) const {
            auto tree = Common::Json::encode_configurable(*this);
            tree.put("backend", Common::Archive::default_backend()->tag());
            return Common::Config::to_json(tree, pretty);
        }

        // Binds the optimizer to the trainable weights and resolves one loss (and metric list) per output.
        void compile(CompileOptions options) {
            ensure_graph();
            if (!options.sample_weight_mode.empty() && options.sample_weight_mode != "temporal") {
                throw ConfigError("Unknown sample_weight_mode \"" + options.sample_weight_mode + "\"; expected \"temporal\" or nothing.");
            }
            Optimizer::OptimizerPtr optimizer;
            if (const auto* named = std::get_if<std::string>(&options.optimizer)) {
                optimizer = Optimizer::get(*named, options.custom_objects);
            } else {
                optimizer = std::get<Optimizer::OptimizerPtr>(options.optimizer);
            }
            if (!optimizer) {
                throw TypeError("Model " + name() + " was compiled with a null optimizer.");
            }

            const auto& names = topology_.output_names;
            const auto output_count = topology_.outputs.size();
            std::string expected_keys;
            for (const auto& output_name : names) {
                expected_keys += (expected_keys.empty() ? "" : ", ") + output_name;
            }
            auto known_output = [&](const std::string& key) {
                return std::find(names.begin(), names.end(), key) != names.end();
            };

            std::vector<std::optional<Loss::Objective>> losses(output_count);
            if (const auto* single = std::get_if<Loss::Objective>(&options.loss)) {
                if (single->name.empty() && !single->function) {
                    throw ConfigError("Model " + name() + " cannot be compiled without a loss.");
                }
                std::fill(losses.begin(), losses.end(), *single);
            } else if (const auto* list = std::get_if<std::vector<Loss::Objective>>(&options.loss)) {
                if (list->size() != output_count) {
                    throw CardinalityError("When passing a list as loss, it should have one entry per model output. The model has "
                                           + std::to_string(output_count) + " outputs, but you passed loss="
                                           + std::to_string(list->size()) + " entries.");
                }
                std::copy(list->begin(), list->end(), losses.begin());
            } else {
                const auto& table = std::get<std::map<std::string, Loss::Objective>>(options.loss);
                for (const auto& [key, objective] : table) {
                    (void)objective;
                    if (!known_output(key)) {
                        throw ConfigError("Unknown entry in loss dictionary: \"" + key + "\". Only expected the following keys: [" + expected_keys + "]");
                    }
                }
                for (std::size_t index = 0; index < output_count; ++index) {
                    const auto it = table.find(names[index]);
                    if (it == table.end()) {
                        Utils::Log::warning("Output \"" + names[index] + "\" missing from loss dictionary. We assume this was done on purpose, "
                                            "and we will not be expecting any data to be passed to \"" + names[index] + "\" during training.");
                        continue;
                    }
                    losses[index] = it->second;
                }
            }
            if (std::none_of(losses.begin(), losses.end(), [](const auto& loss) { return loss.has_value(); })) {
                throw ConfigError("Model " + name() + " has no output left to train: every output was excluded from the loss.");
            }

            std::vector<double> loss_weights(output_count, 1.0);
            if (options.loss_weights) {
                if (const auto* list = std::get_if<std::vector<double>>(&*options.loss_weights)) {
                    if (list->size() != output_count) {
                        throw CardinalityError("When passing a list as loss_weights, it should have one entry per model output. The model has "
                                               + std::to_string(output_count) + " outputs, but you passed loss_weights="
                                               + std::to_string(list->size()) + " entries.");
                    }
                    loss_weights = *list;
                } else {
                    for (const auto& [key, weight] : std::get<std::map<std::string, double>>(*options.loss_weights)) {
                        if (!known_output(key)) {
                            throw ConfigError("Unknown entry in loss_weights dictionary: \"" + key + "\". Only expected the following keys: ["
                                              + expected_keys + "]");
                        }
                        for (std::size_t index = 0; index < output_count; ++index) {
                            if (names[index] == key) {
                                loss_weights[index] = weight;
                            }
                        }
                    }
                }
            }

            std::vector<std::vector<Metric::Objective>> metrics(output_count);
            if (const auto* shared = std::get_if<std::vector<Metric::Objective>>(&options.metrics)) {
                std::fill(metrics.begin(), metrics.end(), *shared);
            } else {
                for (const auto& [key, list] : std::get<std::map<std::string, std::vector<Metric::Objective>>>(options.metrics)) {
                    if (!known_output(key)) {
                        throw ConfigError("Unknown entry in metrics dictionary: \"" + key + "\". Only expected the following keys: ["
                                          + expected_keys + "]");
                    }
                    for (std::size_t index = 0; index < output_count; ++index) {
                        if (names[index] == key) {
                            metrics[index] = list;
                        }
                    }
                }
            }

            std::vector<OutputObjective> objectives;
            for (std::size_t index = 0; index < output_count; ++index) {
                if (!losses[index]) {
                    continue;
                }
                OutputObjective objective{};
                objective.output = index;
                objective.name = names[index];
                objective.loss = Loss::resolve(*losses[index], options.custom_objects.losses);
                objective.weight = loss_weights[index];
                objective.sparse_target = losses[index]->name == "sparse_categorical_crossentropy";
                const auto& shape = topology_.outputs[index].shape();
                const auto width = shape.empty() ? std::int64_t{1} : shape.back();
                for (const auto& metric : metrics[index]) {
                    const bool accuracy = metric.name == "accuracy" || metric.name == "acc";
                    auto label = accuracy ? std::string("acc") : metric.name;
                    if (output_count > 1) {
                        label = names[index] + "_" + label;
                    }
                    auto function = accuracy && objective.sparse_target && !metric.function
                                        ? Metric::Function(Metric::Details::sparse_categorical_accuracy)
                                        : Metric::resolve(metric, width, options.custom_objects.metrics);
                    objective.metrics.emplace_back(std::move(label), std::move(function));
                }
                objectives.push_back(std::move(objective));
            }

            std::vector<std::string> metrics_names{"loss"};
            if (output_count > 1) {
                for (const auto& objective : objectives) {
                    metrics_names.push_back(objective.name + "_loss");
                }
            }
            for (const auto& objective : objectives) {
                for (const auto& metric : objective.metrics) {
                    metrics_names.push_back(metric.first);
                }
            }

            std::vector<torch::Tensor> parameters;
            for (const auto& weight : trainable_weights()) {
                parameters.push_back(weight.value);
            }
            optimizer->bind(std::move(parameters));

            options.optimizer = optimizer;
            optimizer_ = std::move(optimizer);
            objectives_ = std::move(objectives);
            metrics_names_ = std::move(metrics_names);
            compile_options_ = std::move(options);
            compiled_ = true;
        }

        [[nodiscard]] bool compiled() const noexcept { return compiled_; }
        [[nodiscard]] const Optimizer::OptimizerPtr& optimizer() const noexcept { return optimizer_; }
        [[nodiscard]] const CompileOptions& compile_options() const noexcept { return compile_options_; }
        [[nodiscard]] const std::vector<std::string>& metrics_names() const noexcept { return metrics_names_; }

        std::vector<double> train_on_batch(const TensorList& x, const TensorList& y,
                                           const std::optional<torch::Tensor>& sample_weight = std::nullopt,
                                           const std::map<std::int64_t, double>& class_weight = {}) {
            require_compiled("train_on_batch");
            const auto inputs = standardize_inputs(x);
            const auto targets = standardize_targets(y);
            const auto weights = standardize_weights(targets, sample_weight, class_weight);
            check_array_lengths(inputs, targets);
            return run_batch(inputs, targets, weights, true);
        }

        std::vector<double> test_on_batch(const TensorList& x, const TensorList& y,
                                          const std::optional<torch::Tensor>& sample_weight = std::nullopt) {
            require_compiled("test_on_batch");
            const auto inputs = standardize_inputs(x);
            const auto targets = standardize_targets(y);
            const auto weights = standardize_weights(targets, sample_weight, {});
            check_array_lengths(inputs, targets);
            return run_batch(inputs, targets, weights, false);
        }

        TrainingHistory fit(const TensorList& x, const TensorList& y, FitOptions options = {}) {
            require_compiled("fit");
            if (options.batch_size <= 0) {
                throw ConfigError("fit requires a positive batch_size, got " + std::to_string(options.batch_size) + ".");
            }
            auto inputs = standardize_inputs(x);
            auto targets = standardize_targets(y);
            auto weights = standardize_weights(targets, options.sample_weight, options.class_weight);
            check_array_lengths(inputs, targets);

            std::optional<EvaluationSet> validation;
            if (options.validation_data) {
                EvaluationSet set{};
                set.inputs = standardize_inputs(options.validation_data->first);
                set.targets = standardize_targets(options.validation_data->second);
                set.weights = Details::WeightList(set.targets.size());
                check_array_lengths(set.inputs, set.targets);
                validation = std::move(set);
            } else if (options.validation_split != 0.0) {
                if (options.validation_split < 0.0 || options.validation_split >= 1.0) {
                    throw ConfigError("validation_split must lie in [0, 1), got " + std::to_string(options.validation_split) + ".");
                }
                const auto total = sample_count(inputs);
                const auto split_at = static_cast<std::int64_t>(static_cast<double>(total) * (1.0 - options.validation_split));
                EvaluationSet set{};
                set.inputs = Details::slice(inputs, split_at, total);
                set.targets = Details::slice(targets, split_at, total);
                set.weights = Details::slice(weights, split_at, total);
                validation = std::move(set);
                inputs = Details::slice(inputs, 0, split_at);
                targets = Details::slice(targets, 0, split_at);
                weights = Details::slice(weights, 0, split_at);
            }

            const auto samples = sample_count(inputs);
            if (samples == 0) {
                throw EmptyError("fit received no training samples.");
            }
            const auto batches = (samples + options.batch_size - 1) / options.batch_size;

            TrainingHistory history;
            for (auto epoch = options.initial_epoch; epoch < options.epochs; ++epoch) {
                const auto started = std::chrono::steady_clock::now();
                const auto order = options.shuffle ? torch::randperm(samples, torch::dtype(torch::kLong))
                                                   : torch::arange(samples, torch::dtype(torch::kLong));
                Utils::ProgressBar bar(options.verbose == 1 ? options.stream : nullptr, batches,
                                       "Epoch " + std::to_string(epoch + 1) + "/" + std::to_string(options.epochs));

                std::vector<double> totals(metrics_names_.size(), 0.0);
                for (std::int64_t batch = 0; batch < batches; ++batch) {
                    const auto begin = batch * options.batch_size;
                    const auto end = std::min(samples, begin + options.batch_size);
                    const auto indices = order.slice(0, begin, end);
                    const auto results = run_batch(Details::take(inputs, indices), Details::take(targets, indices),
                                                   Details::take(weights, indices), true);
                    for (std::size_t index = 0; index < results.size(); ++index) {
                        totals[index] += results[index] * static_cast<double>(end - begin);
                    }
                    bar.update(batch + 1, "loss: " + Details::format_value(results.front()));
                }

                std::vector<std::pair<std::string, double>> logs;
                for (std::size_t index = 0; index < totals.size(); ++index) {
                    logs.emplace_back(metrics_names_[index], totals[index] / static_cast<double>(samples));
                }
                if (validation) {
                    const auto scores = evaluate_set(*validation, options.batch_size, nullptr);
                    for (std::size_t index = 0; index < scores.size(); ++index) {
                        logs.emplace_back("val_" + metrics_names_[index], scores[index]);
                    }
                }
                const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
                record_epoch(history, epoch, logs);
                if (options.verbose > 0 && options.stream != nullptr) {
                    print_epoch_line(*options.stream, epoch + 1, options.epochs, logs, elapsed.count());
                }
            }
            return history;
        }

        // Loss and metrics in metrics_names() order, averaged over the samples.
        std::vector<double> evaluate(const TensorList& x, const TensorList& y, EvaluateOptions options = {}) {
            require_compiled("evaluate");
            if (options.batch_size <= 0) {
                throw ConfigError("evaluate requires a positive batch_size, got " + std::to_string(options.batch_size) + ".");
            }
            EvaluationSet set{};
            set.inputs = standardize_inputs(x);
            set.targets = standardize_targets(y);
            set.weights = standardize_weights(set.targets, options.sample_weight, {});
            check_array_lengths(set.inputs, set.targets);
            return evaluate_set(set, options.batch_size, options.verbose == 1 ? options.stream : nullptr);
        }

        // One tensor per output, batches concatenated along the sample axis. No compile needed.
        std::vector<torch::Tensor> predict(const TensorList& x, PredictOptions options = {}) {
            ensure_graph();
            if (options.batch_size <= 0) {
                throw ConfigError("predict requires a positive batch_size, got " + std::to_string(options.batch_size) + ".");
            }
            const auto inputs = standardize_inputs(x);
            check_array_lengths(inputs, {});
            const auto samples = sample_count(inputs);
            if (samples == 0) {
                throw EmptyError("predict received no samples.");
            }
            const auto batches = (samples + options.batch_size - 1) / options.batch_size;

            torch::NoGradGuard no_grad{};
            Utils::ProgressBar bar(options.verbose == 1 ? options.stream : nullptr, batches, "Predict");
            std::vector<std::vector<torch::Tensor>> chunks;
            for (std::int64_t batch = 0; batch < batches; ++batch) {
                const auto begin = batch * options.batch_size;
                const auto end = std::min(samples, begin + options.batch_size);
                const auto results = forward(Details::slice(inputs, begin, end), CallArguments{{"training", false}});
                chunks.resize(results.size());
                for (std::size_t index = 0; index < results.size(); ++index) {
                    chunks[index].push_back(results[index]);
                }
                bar.update(batch + 1);
            }
            std::vector<torch::Tensor> outputs;
            outputs.reserve(chunks.size());
            for (const auto& pieces : chunks) {
                outputs.push_back(torch::cat(pieces, 0));
            }
            return outputs;
        }

        std::vector<torch::Tensor> predict_on_batch(const TensorList& x) {
            ensure_graph();
            const auto inputs = standardize_inputs(x);
            check_array_lengths(inputs, {});
            torch::NoGradGuard no_grad{};
            return forward(inputs, CallArguments{{"training", false}});
        }

        // Trains on batches pulled from `generator` through a GeneratorQueue, options.steps per epoch.
        TrainingHistory fit_generator(BatchGenerator generator, GeneratorOptions options = {},
                                      BatchGenerator validation = {}, std::size_t validation_steps = 0) {
            require_compiled("fit_generator");
            if (options.steps == 0) {
                throw ConfigError("fit_generator requires a positive number of steps per epoch.");
            }
            if (validation && validation_steps == 0) {
                throw ConfigError("When using a validation generator, validation_steps must be positive.");
            }
            GeneratorQueue queue(std::move(generator), options.max_queue_size, options.workers, options.use_multiprocessing);
            queue.start();

            TrainingHistory history;
            for (std::size_t epoch = 0; epoch < options.epochs; ++epoch) {
                const auto started = std::chrono::steady_clock::now();
                Utils::ProgressBar bar(options.verbose == 1 ? options.stream : nullptr, static_cast<std::int64_t>(options.steps),
                                       "Epoch " + std::to_string(epoch + 1) + "/" + std::to_string(options.epochs));
                std::vector<double> totals(metrics_names_.size(), 0.0);
                std::int64_t seen = 0;
                for (std::size_t step = 0; step < options.steps; ++step) {
                    const auto batch = queue.get();
                    const auto results = train_on_batch(batch.x, batch.y, batch.sample_weight);
                    const auto count = batch.x.empty() ? std::int64_t{0} : batch.x.front().size(0);
                    for (std::size_t index = 0; index < results.size(); ++index) {
                        totals[index] += results[index] * static_cast<double>(count);
                    }
                    seen += count;
                    bar.update(static_cast<std::int64_t>(step + 1), "loss: " + Details::format_value(results.front()));
                }

                std::vector<std::pair<std::string, double>> logs;
                for (std::size_t index = 0; index < totals.size(); ++index) {
                    logs.emplace_back(metrics_names_[index], seen > 0 ? totals[index] / static_cast<double>(seen) : 0.0);
                }
                if (validation) {
                    GeneratorOptions validation_options{};
                    validation_options.steps = validation_steps;
                    validation_options.max_queue_size = options.max_queue_size;
                    validation_options.workers = options.workers;
                    const auto scores = evaluate_generator(validation, validation_options);
                    for (std::size_t index = 0; index < scores.size(); ++index) {
                        logs.emplace_back("val_" + metrics_names_[index], scores[index]);
                    }
                }
                const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
                record_epoch(history, epoch, logs);
                if (options.verbose > 0 && options.stream != nullptr) {
                    print_epoch_line(*options.stream, epoch + 1, options.epochs, logs, elapsed.count());
                }
            }
            queue.stop();
            return history;
        }

        std::vector<double> evaluate_generator(BatchGenerator generator, GeneratorOptions options = {}) {
            require_compiled("evaluate_generator");
            if (options.steps == 0) {
                throw ConfigError("evaluate_generator requires a positive number of steps.");
            }
            GeneratorQueue queue(std::move(generator), options.max_queue_size, options.workers, options.use_multiprocessing);
            queue.start();
            Utils::ProgressBar bar(options.verbose == 1 ? options.stream : nullptr, static_cast<std::int64_t>(options.steps), "Evaluate");
            std::vector<double> totals(metrics_names_.size(), 0.0);
            std::int64_t seen = 0;
            for (std::size_t step = 0; step < options.steps; ++step) {
                const auto batch = queue.get();
                const auto results = test_on_batch(batch.x, batch.y, batch.sample_weight);
                const auto count = batch.x.empty() ? std::int64_t{0} : batch.x.front().size(0);
                for (std::size_t index = 0; index < results.size(); ++index) {
                    totals[index] += results[index] * static_cast<double>(count);
                }
                seen += count;
                bar.update(static_cast<std::int64_t>(step + 1));
            }
            queue.stop();
            for (auto& total : totals) {
                total = seen > 0 ? total / static_cast<double>(seen) : 0.0;
            }
            return totals;
        }

        std::vector<torch::Tensor> predict_generator(BatchGenerator generator, GeneratorOptions options = {}) {
            ensure_graph();
            if (options.steps == 0) {
                throw ConfigError("predict_generator requires a positive number of steps.");
            }
            GeneratorQueue queue(std::move(generator), options.max_queue_size, options.workers, options.use_multiprocessing);
            queue.start();
            Utils::ProgressBar bar(options.verbose == 1 ? options.stream : nullptr, static_cast<std::int64_t>(options.steps), "Predict");
            std::vector<std::vector<torch::Tensor>> chunks;
            for (std::size_t step = 0; step < options.steps; ++step) {
                const auto batch = queue.get();
                const auto results = predict_on_batch(batch.x);
                chunks.resize(results.size());
                for (std::size_t index = 0; index < results.size(); ++index) {
                    chunks[index].push_back(results[index]);
                }
                bar.update(static_cast<std::int64_t>(step + 1));
            }
            queue.stop();
            std::vector<torch::Tensor> outputs;
            for (const auto& pieces : chunks) {
                outputs.push_back(torch::cat(pieces, 0));
            }
            return outputs;
        }

        // Weights only, one group per layer name. Declining the overwrite prompt leaves the file untouched.
        void save_weights(const std::filesystem::path& path, bool overwrite = true,
                          const std::shared_ptr<const Common::Archive::Backend>& backend = Common::Archive::default_backend()) {
            const auto codec = Common::Archive::require_backend(backend, "save_weights");
            if (!overwrite && std::filesystem::exists(path) && !Common::Archive::confirm_overwrite_on_console(path)) {
                return;
            }
            ensure_graph();
            Common::Archive::Group root;
            root.set_attribute("format_version", Common::Archive::kFormatVersion);
            root.set_attribute("backend_tag", codec->tag());
            Details::write_layer_weights(root, layers());
            codec->write(path, root);
        }

        // Accepts weights-only archives and full model archives. Positional unless `by_name`.
        void load_weights(const std::filesystem::path& path, bool by_name = false,
                          const std::shared_ptr<const Common::Archive::Backend>& backend = Common::Archive::default_backend()) {
            const auto codec = Common::Archive::require_backend(backend, "load_weights");
            ensure_graph();
            const auto root = codec->read(path);
            const auto* nested = root.group("model_weights");
            const auto& source = (nested != nullptr && !root.attribute("layer_names")) ? *nested : root;
            if (by_name) {
                Details::load_layer_weights_by_name(source, layers());
            } else {
                Details::load_layer_weights(source, layers());
            }
        }

        void summary(std::ostream& stream = std::cout) {
            ensure_graph();
            using namespace Utils::Terminal;
            const auto color = Colors::kAzure;

            struct Row {
                std::string layer;
                std::string shape;
                std::string params;
                std::string connected;
            };
            std::vector<Row> rows;
            for (const auto& layer : layers()) {
                Row row{};
                row.layer = layer->name() + " (" + layer->class_name() + ")";
                std::vector<std::size_t> kept;
                for (std::size_t index = 0; index < layer->inbound_nodes().size(); ++index) {
                    if (topology_.network_nodes.count({layer->id(), index}) != 0) {
                        kept.push_back(index);
                    }
                }
                if (kept.size() == 1) {
                    const auto shapes = layer->inbound_nodes()[kept.front()].output_shapes();
                    if (shapes.size() == 1) {
                        row.shape = format_shape(shapes.front());
                    } else {
                        for (const auto& shape : shapes) {
                            row.shape += (row.shape.empty() ? "[" : ", ") + format_shape(shape);
                        }
                        row.shape += "]";
                    }
                } else if (kept.size() > 1) {
                    row.shape = "multiple";
                }
                row.params = std::to_string(layer->count_params());
                for (const auto index : kept) {
                    const auto& node = layer->inbound_nodes()[index];
                    for (std::size_t position = 0; position < node.inbound_layers.size(); ++position) {
                        if (!row.connected.empty()) {
                            row.connected += ", ";
                        }
                        row.connected += topology_.layer(node.inbound_layers[position])->name() + "["
                                         + std::to_string(node.node_indices[position]) + "]["
                                         + std::to_string(node.tensor_indices[position]) + "]";
                    }
                }
                rows.push_back(std::move(row));
            }

            const bool connections = class_name() != "Sequential";
            std::vector<std::string> header{"Layer (type)", "Output Shape", "Param #"};
            if (connections) {
                header.emplace_back("Connected to");
            }
            std::vector<std::size_t> widths;
            for (const auto& title : header) {
                widths.push_back(title.size());
            }
            for (const auto& row : rows) {
                widths[0] = std::max(widths[0], row.layer.size());
                widths[1] = std::max(widths[1], row.shape.size());
                widths[2] = std::max(widths[2], row.params.size());
                if (connections) {
                    widths[3] = std::max(widths[3], row.connected.size());
                }
            }
            std::vector<std::size_t> spacings;
            for (const auto width : widths) {
                spacings.push_back(width + 2);
            }

            auto print_row = [&](const std::vector<std::string>& cells) {
                std::ostringstream line;
                line << Symbols::kBoxVertical;
                for (std::size_t index = 0; index < cells.size(); ++index) {
                    line << ' ' << Cell(cells[index], widths[index]) << ' ' << Symbols::kBoxVertical;
                }
                stream << line.str() << '\n';
            };

            stream << "Model: \"" << name() << "\"\n";
            stream << HSeparator(spacings, color, HSepKind::Top) << '\n';
            print_row(header);
            stream << HSeparator(spacings, color, HSepKind::Middle) << '\n';
            for (const auto& row : rows) {
                std::vector<std::string> cells{row.layer, row.shape, row.params};
                if (connections) {
                    cells.push_back(row.connected);
                }
                print_row(cells);
            }
            stream << HSeparator(spacings, color, HSepKind::Bottom) << '\n';

            std::int64_t trainable = 0;
            std::int64_t frozen = 0;
            for (const auto& weight : trainable_weights()) {
                trainable += weight.value.numel();
            }
            for (const auto& weight : non_trainable_weights()) {
                frozen += weight.value.numel();
            }
            stream << "Total params: " << trainable + frozen << '\n';
            stream << "Trainable params: " << trainable << '\n';
            stream << "Non-trainable params: " << frozen << '\n';
        }

    protected:
        // Containers that assemble their graph later (Sequential).
        Model(std::string class_name, Layer::LayerOptions options) : Base(std::move(class_name), std::move(options)) {
            set_built(true);
        }

        // Adopts `topology` and records node 0 linking the model inputs to its outputs.
        void initialize(Graph::Topology topology) {
            topology_ = std::move(topology);
            set_built(true);
            set_supports_masking(true);
            write_container_node(topology_.inputs, topology_.outputs);
        }

        void set_topology(Graph::Topology topology) { topology_ = std::move(topology); }
        void reset_topology() { topology_ = Graph::Topology{}; }

        // Node 0 has no inbound layers and records no history.
        void write_container_node(const std::vector<Tensor>& inputs, const std::vector<Tensor>& outputs) {
            Node node{};
            node.outbound_layer = id();
            node.input_tensors = inputs;
            node.output_tensors = outputs;
            node.input_masks = std::vector<Mask>(inputs.size());
            node.output_masks = collect_previous_masks(outputs);
            auto& nodes = mutable_inbound_nodes();
            if (nodes.empty()) {
                nodes.push_back(std::move(node));
            } else {
                nodes.front() = std::move(node);
            }
        }

        // Forgets the optimizer and objectives of a previous compile().
        void reset_compilation() {
            optimizer_.reset();
            objectives_.clear();
            metrics_names_.clear();
            compile_options_ = CompileOptions{};
            compiled_ = false;
        }

        // Materializes the graph before execution; a no-op for a graph built at construction.
        virtual void ensure_graph() {}

        virtual void require_compiled(const std::string& operation) const {
            if (!compiled_) {
                throw PreconditionError("You must compile model " + name() + " before calling " + operation + ".");
            }
        }

        [[nodiscard]] torch::ScalarType output_dtype() const noexcept override {
            return topology_.outputs.empty() ? dtype() : topology_.outputs.front().dtype();
        }

    private:
        struct OutputObjective {
            std::size_t output{0};
            std::string name{};
            Loss::Function loss{};
            double weight{1.0};
            bool sparse_target{false};
            std::vector<std::pair<std::string, Metric::Function>> metrics{};
        };

        struct EvaluationSet {
            std::vector<torch::Tensor> inputs{};
            std::vector<torch::Tensor> targets{};
            Details::WeightList weights{};
        };

        [[nodiscard]] std::vector<Tensor> feed_inputs() const {
            std::vector<Tensor> feeds;
            for (const auto& input : topology_.inputs) {
                if (!input.has_constant()) {
                    feeds.push_back(input);
                }
            }
            return feeds;
        }

        [[nodiscard]] std::vector<torch::Tensor> bind_inputs(const std::vector<torch::Tensor>& inputs) const {
            if (inputs.size() == topology_.inputs.size()) {
                return inputs;
            }
            const auto feeds = feed_inputs();
            if (inputs.size() != feeds.size()) {
                throw CardinalityError("Model " + name() + " expects " + std::to_string(topology_.inputs.size())
                                       + " input tensor(s), but it received " + std::to_string(inputs.size()) + ".");
            }
            std::vector<torch::Tensor> bound;
            bound.reserve(topology_.inputs.size());
            std::size_t next = 0;
            for (const auto& input : topology_.inputs) {
                bound.push_back(input.has_constant() ? input.constant() : inputs[next++]);
            }
            return bound;
        }

        static void check_shape(const std::string& role, const std::string& name, const Shape& declared, const torch::Tensor& value,
                                bool check_batch_axis) {
            const auto concrete = shape_of(value);
            bool compatible = declared.size() == concrete.size();
            for (std::size_t axis = check_batch_axis ? 0 : 1; compatible && axis < declared.size(); ++axis) {
                compatible = declared[axis] == kUnknownDim || declared[axis] == concrete[axis];
            }
            if (!compatible) {
                throw ShapeError("Error when checking " + role + ": expected " + name + " to have shape " + format_shape(declared)
                                 + " but got array with shape " + format_shape(concrete));
            }
        }

        [[nodiscard]] std::vector<torch::Tensor> standardize_inputs(const TensorList& x) const {
            const auto feeds = feed_inputs();
            if (x.size() != feeds.size()) {
                throw CardinalityError("Error when checking model input: the list of tensors that you are passing to your model is not the size "
                                       "the model expected. Expected to see " + std::to_string(feeds.size())
                                       + " array(s), but instead got " + std::to_string(x.size()) + ".");
            }
            std::vector<torch::Tensor> inputs;
            inputs.reserve(feeds.size());
            for (std::size_t index = 0; index < feeds.size(); ++index) {
                const auto& value = x.values[index];
                if (!value.defined()) {
                    throw TypeError("Error when checking model input: array " + std::to_string(index) + " is undefined.");
                }
                check_shape("model input", feeds[index].name(), feeds[index].shape(), value, true);
                inputs.push_back(value.scalar_type() == feeds[index].dtype() ? value : value.to(feeds[index].dtype()));
            }
            return inputs;
        }

        [[nodiscard]] std::vector<torch::Tensor> standardize_targets(const TensorList& y) const {
            if (y.size() != objectives_.size()) {
                throw CardinalityError("Error when checking model target: the list of tensors that you are passing to your model is not the size "
                                       "the model expected. Expected to see " + std::to_string(objectives_.size())
                                       + " array(s), but instead got " + std::to_string(y.size()) + ".");
            }
            std::vector<torch::Tensor> targets;
            targets.reserve(y.size());
            for (std::size_t index = 0; index < objectives_.size(); ++index) {
                const auto& value = y.values[index];
                if (!value.defined()) {
                    throw TypeError("Error when checking target: array " + std::to_string(index) + " is undefined.");
                }
                if (!objectives_[index].sparse_target) {
                    check_shape("target", objectives_[index].name, topology_.outputs[objectives_[index].output].shape(), value, false);
                }
                targets.push_back(value);
            }
            return targets;
        }

        [[nodiscard]] Details::WeightList standardize_weights(const std::vector<torch::Tensor>& targets,
                                                              const std::optional<torch::Tensor>& sample_weight,
                                                              const std::map<std::int64_t, double>& class_weight) const {
            const bool temporal = compile_options_.sample_weight_mode == "temporal";
            Details::WeightList weights;
            weights.reserve(targets.size());
            for (const auto& target : targets) {
                if (sample_weight && sample_weight->defined()) {
                    const auto& weight = *sample_weight;
                    if (temporal && weight.dim() != 2) {
                        throw ShapeError("Found a sample_weight array with shape " + format_shape(shape_of(weight))
                                         + ". In order to use timestep-wise sample weighting, you should pass a 2D sample_weight array.");
                    }
                    if (!temporal && weight.dim() != 1) {
                        throw ShapeError("Found a sample_weight array with shape " + format_shape(shape_of(weight))
                                         + ". In order to use timestep-wise sample weights, you should specify sample_weight_mode=\"temporal\" "
                                           "in compile(). If you just mean to use sample-wise weights, make sure your sample_weight array is 1D.");
                    }
                    if (weight.size(0) != target.size(0)) {
                        throw CardinalityError("Found a sample_weight array with shape " + format_shape(shape_of(weight))
                                               + " for a target with shape " + format_shape(shape_of(target))
                                               + ". sample_weight cannot be broadcast.");
                    }
                    weights.emplace_back(weight);
                } else if (!class_weight.empty()) {
                    if (temporal) {
                        throw UnsupportedError("class_weight not supported for 3+ dimensional targets.");
                    }
                    weights.emplace_back(Details::class_sample_weights(target, class_weight));
                } else {
                    weights.emplace_back(std::nullopt);
                }
            }
            return weights;
        }

        static std::int64_t sample_count(const std::vector<torch::Tensor>& values) {
            return values.empty() || values.front().dim() == 0 ? 0 : values.front().size(0);
        }

        static void check_array_lengths(const std::vector<torch::Tensor>& inputs, const std::vector<torch::Tensor>& targets) {
            auto describe = [](const std::vector<torch::Tensor>& values) {
                std::string text;
                for (const auto& value : values) {
                    text += (text.empty() ? "" : ", ") + format_shape(shape_of(value));
                }
                return text;
            };
            auto same_length = [](const std::vector<torch::Tensor>& values) {
                return std::all_of(values.begin(), values.end(), [&](const torch::Tensor& value) {
                    return value.dim() > 0 && value.size(0) == values.front().size(0);
                });
            };
            if (!same_length(inputs)) {
                throw CardinalityError("All input arrays (x) should have the same number of samples. Got array shapes: " + describe(inputs));
            }
            if (!same_length(targets)) {
                throw CardinalityError("All target arrays (y) should have the same number of samples. Got array shapes: " + describe(targets));
            }
            if (!inputs.empty() && !targets.empty() && inputs.front().size(0) != targets.front().size(0)) {
                throw CardinalityError("Input arrays should have the same number of samples as target arrays. Found "
                                       + std::to_string(inputs.front().size(0)) + " input samples and "
                                       + std::to_string(targets.front().size(0)) + " target samples.");
            }
        }

        // Values in metrics_names() order; one optimizer step when `training`.
        std::vector<double> run_batch(const std::vector<torch::Tensor>& inputs, const std::vector<torch::Tensor>& targets,
                                      const Details::WeightList& weights, bool training) {
            std::optional<torch::NoGradGuard> no_grad;
            if (!training) {
                no_grad.emplace();
            }
            const auto outputs = forward(inputs, CallArguments{{"training", training}});

            torch::Tensor total;
            std::vector<double> output_losses;
            for (std::size_t index = 0; index < objectives_.size(); ++index) {
                const auto& objective = objectives_[index];
                const auto loss = Loss::compute(objective.loss, outputs[objective.output], targets[index], weights[index]);
                output_losses.push_back(loss.item<double>());
                const auto term = loss * objective.weight;
                total = total.defined() ? total + term : term;
            }
            if (training) {
                optimizer_->zero_grad();
                total.backward();
                optimizer_->step();
            }

            std::vector<double> results{total.item<double>()};
            if (topology_.outputs.size() > 1) {
                results.insert(results.end(), output_losses.begin(), output_losses.end());
            }
            torch::NoGradGuard metrics_guard{};
            for (std::size_t index = 0; index < objectives_.size(); ++index) {
                const auto& objective = objectives_[index];
                const auto prediction = outputs[objective.output].detach();
                for (const auto& metric : objective.metrics) {
                    results.push_back(metric.second(prediction, targets[index]).item<double>());
                }
            }
            return results;
        }

        std::vector<double> evaluate_set(const EvaluationSet& set, std::int64_t batch_size, std::ostream* stream) {
            const auto samples = sample_count(set.inputs);
            if (samples == 0) {
                throw EmptyError("evaluate received no samples.");
            }
            const auto batches = (samples + batch_size - 1) / batch_size;
            Utils::ProgressBar bar(stream, batches, "Evaluate");
            std::vector<double> totals(metrics_names_.size(), 0.0);
            for (std::int64_t batch = 0; batch < batches; ++batch) {
                const auto begin = batch * batch_size;
                const auto end = std::min(samples, begin + batch_size);
                const auto results = run_batch(Details::slice(set.inputs, begin, end), Details::slice(set.targets, begin, end),
                                               Details::slice(set.weights, begin, end), false);
                for (std::size_t index = 0; index < results.size(); ++index) {
                    totals[index] += results[index] * static_cast<double>(end - begin);
                }
                bar.update(batch + 1);
            }
            for (auto& total : totals) {
                total /= static_cast<double>(samples);
            }
            return totals;
        }

        static void record_epoch(TrainingHistory& history, std::size_t epoch, const std::vector<std::pair<std::string, double>>& logs) {
            history.epoch.push_back(epoch);
            for (const auto& [key, value] : logs) {
                history.history[key].push_back(value);
            }
        }

        static void print_epoch_line(std::ostream& stream, std::size_t epoch, std::size_t epochs,
                                     const std::vector<std::pair<std::string, double>>& logs, double seconds) {
            using Utils::Terminal::ApplyColor;
            namespace Colors = Utils::Terminal::Colors;

            std::ostringstream line;
            line << "Epoch [" << epoch << "/" << epochs << "]";
            for (const auto& [key, value] : logs) {
                const bool validation = key.rfind("val_", 0) == 0;
                line << " | " << ApplyColor(key, validation ? Colors::kAzure : Colors::kGoldenrod) << ": "
                     << std::fixed << std::setprecision(6) << value;
            }
            line << " | " << std::fixed << std::setprecision(2) << seconds << "sec";
            stream << line.str() << std::endl;
        }

        Graph::Topology topology_{};
        Optimizer::OptimizerPtr optimizer_{};
        std::vector<OutputObjective> objectives_{};
        std::vector<std::string> metrics_names_{};
        CompileOptions compile_options_{};
        bool compiled_{false};
    };

    using ModelPtr = std::shared_ptr<Model>;

    namespace Details {
        inline const bool kModelRegistered = Layer::Registry::register_class(
            "Model", [](const PropertyTree& config, const CustomObjects& custom_objects) -> LayerPtr {
                return Model::from_config(config, custom_objects);
            });
    }
}

#endif // LATTICE_MODEL_MODEL_HPP
