#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "check.hpp"

using namespace Lattice;
using Check::expect;
using Check::expect_throws;

namespace {
    std::vector<std::string> names_of(const std::vector<LayerPtr>& layers) {
        std::vector<std::string> names;
        for (const auto& layer : layers) {
            names.push_back(layer->name());
        }
        return names;
    }
}

void functional_model_buckets_nodes_from_the_outputs_back_to_the_inputs() {
    auto x = Input({.shape = Shape{4}, .name = "x"});
    auto h = (*Layer::Dense({.units = 8}, Activation::ReLU, {.name = "hidden"}))(x);
    auto y = (*Layer::Dense({.units = 2}, Activation::Identity, {.name = "head"}))(h);
    Model model(x, y, "mlp");

    expect(model.nodes_by_depth().size() == 3);
    expect(model.layers_by_depth().at(0).front()->name() == "head");
    expect(model.layers_by_depth().at(1).front()->name() == "hidden");
    expect(model.layers_by_depth().at(2).front()->name() == "x");
    expect((names_of(model.layers()) == std::vector<std::string>{"x", "hidden", "head"}));
    expect(model.input_names() == std::vector<std::string>{"x"});
    expect(model.output_names() == std::vector<std::string>{"head"});
    expect((model.outputs().front().shape() == Shape{kUnknownDim, 2}));
}

void a_layer_called_twice_sits_at_the_depth_of_its_deepest_node() {
    auto x = Input({.shape = Shape{4}, .name = "x"});
    auto shared = Layer::Dense({.units = 4}, Activation::Tanh, {.name = "shared"});
    auto first = (*shared)(x);
    auto second = (*shared)(first);
    Model model(x, second);

    expect(shared->inbound_nodes().size() == 2);
    expect(model.nodes_by_depth().size() == 3);
    expect(model.layers_by_depth().count(0) == 0);
    expect(model.layers_by_depth().at(1).front()->name() == "shared");
    expect(model.layers().size() == 2);
    expect(model.count_params() == 4 * 4 + 4);
}

void diamond_graphs_keep_both_branches_and_the_merge() {
    auto x = Input({.shape = Shape{3}, .name = "x"});
    auto left = (*Layer::Dense({.units = 5}, Activation::Identity, {.name = "left"}))(x);
    auto right = (*Layer::Dense({.units = 5}, Activation::Identity, {.name = "right"}))(x);
    auto merged = (*Layer::Add({.name = "merge"}))(std::vector<Tensor>{left, right}).front();
    Model model(x, merged);

    expect(model.layers_by_depth().at(1).size() == 2);
    expect(model.layers().back()->name() == "merge");

    const auto outputs = model.predict(torch::ones({6, 3}));
    expect(outputs.size() == 1);
    expect((outputs.front().sizes() == torch::IntArrayRef{6, 5}));
}

void graph_construction_rejects_bad_endpoints() {
    auto a = Input({.shape = Shape{2}, .name = "a"});
    auto b = Input({.shape = Shape{2}, .name = "b"});
    auto sum = (*Layer::Add())(std::vector<Tensor>{a, b}).front();

    expect_throws<ConfigError>([&] { (void)Model(a, sum); });
    expect_throws<ConfigError>([&] { (void)Model(std::vector<Tensor>{a, a, b}, std::vector<Tensor>{sum}); });
    expect_throws<CardinalityError>([&] { (void)Model(std::vector<Tensor>{a, b}, std::vector<Tensor>{}); });

    auto hidden = (*Layer::Dense({.units = 2}))(a);
    auto out = (*Layer::Dense({.units = 1}))(hidden);
    expect_throws<TypeError>([&] { (void)Model(hidden, out); });
}

void layer_names_must_be_unique_inside_one_model() {
    auto x = Input({.shape = Shape{2}, .name = "x"});
    auto first = (*Layer::Dense({.units = 2}, Activation::Identity, {.name = "twin"}))(x);
    auto second = (*Layer::Dense({.units = 2}, Activation::Identity, {.name = "twin"}))(first);
    expect_throws<ConfigError>([&] { (void)Model(x, second); });
}

void model_configuration_survives_a_round_trip() {
    auto x = Input({.shape = Shape{4}, .name = "features"});
    auto h = (*Layer::Dense({.units = 6}, Activation::ReLU, {.name = "dense_a"}))(x);
    auto parts = (*Layer::Split({.num_splits = 2}, {.name = "halves"}))(std::vector<Tensor>{h});
    auto merged = (*Layer::Concatenate({}, {.name = "join"}))(std::vector<Tensor>{parts[1], parts[0]}).front();
    auto y = (*Layer::Dense({.units = 1}, Activation::Sigmoid, {.name = "score"}))(merged);
    Model model(x, y, "roundtrip");

    const auto rebuilt = Model::from_config(model.get_config());
    expect(rebuilt->name() == "roundtrip");
    expect(names_of(rebuilt->layers()) == names_of(model.layers()));
    expect(rebuilt->to_json() == model.to_json());
    expect(rebuilt->count_params() == model.count_params());

    const auto predictions = rebuilt->predict(torch::randn({3, 4}));
    expect((predictions.front().sizes() == torch::IntArrayRef{3, 1}));
}

void a_model_called_on_new_inputs_reuses_its_layers() {
    auto x = Input({.shape = Shape{3}, .name = "x"});
    auto y = (*Layer::Dense({.units = 2}, Activation::Identity, {.name = "inner"}))(x);
    auto inner = std::make_shared<Model>(x, y, "inner_model");

    auto z = Input({.shape = Shape{3}, .name = "z"});
    auto w = (*inner)(z);
    Model outer(z, w, "outer");

    expect(outer.layers().size() == 2);
    expect(outer.count_params() == inner->count_params());

    const auto input = torch::randn({4, 3});
    const auto direct = inner->predict(input).front();
    const auto nested = outer.predict(input).front();
    expect(torch::allclose(direct, nested));
}

void summary_prints_one_row_per_layer_and_the_parameter_totals() {
    auto x = Input({.shape = Shape{4}, .name = "x"});
    auto y = (*Layer::Dense({.units = 3}, Activation::Identity, {.name = "out"}))(x);
    Model model(x, y, "printed");

    std::ostringstream stream;
    model.summary(stream);
    const auto text = stream.str();
    expect(text.find("out (Dense)") != std::string::npos);
    expect(text.find("x (InputLayer)") != std::string::npos);
    expect(text.find("Total params: 15") != std::string::npos);
    expect(text.find("Non-trainable params: 0") != std::string::npos);
}

void layers_are_freed_with_the_last_model_that_uses_them() {
    auto& arena = Graph::Arena::global();
    const auto before = arena.live_layers();
    std::weak_ptr<Layer::Base> hidden;
    std::weak_ptr<Layer::Base> entry;
    {
        auto x = Input({.shape = Shape{3}, .name = "x"});
        auto y = (*Layer::Dense({.units = 2}, Activation::Identity, {.name = "dense"}))(x);
        auto model = std::make_shared<Model>(x, y, "transient");
        hidden = model->get_layer("dense");
        entry = model->get_layer("x");
        expect(arena.live_layers() == before + 2);
    }
    expect(hidden.expired());
    expect(entry.expired());
    expect(arena.live_layers() == before);
}

void a_tensor_handle_keeps_its_producer_alive() {
    std::weak_ptr<Layer::Base> watched;
    Tensor output;
    {
        auto x = Input({.shape = Shape{3}, .name = "x"});
        auto dense = Layer::Dense({.units = 2}, Activation::Identity, {.name = "kept"});
        watched = dense;
        output = (*dense)(x);
    }
    expect(!watched.expired());
    expect(output.owner() == watched.lock());
    expect(output.history()->layer == watched.lock()->id());

    // The producer of the input is kept alive through the node.
    const auto input = watched.lock()->inbound_nodes().front().input_tensors.front();
    expect(input.is_graph_tensor());

    const auto id = output.id();
    output = Tensor{};
    expect(watched.expired());
    expect(!Graph::Arena::global().history(id).has_value());
}

void an_input_layer_is_shared_by_the_tensors_it_hands_out() {
    std::weak_ptr<Layer::Base> watched;
    Tensor handle;
    {
        auto layer = Layer::Input({.shape = Shape{3}, .name = "held"});
        watched = layer;
        handle = layer->input();
        expect(layer.use_count() == 2);
    }
    expect(!watched.expired());
    expect(handle.owner() == watched.lock());
    expect((handle.shape() == Shape{kUnknownDim, 3}));

    // The copy stored in the layer's own node does not own it.
    expect(watched.lock()->inbound_nodes().front().output_tensors.front().owner() == nullptr);
    handle = Tensor{};
    expect(watched.expired());
}

int main() {
    return Check::run({
        {"functional model buckets nodes from the outputs back to the inputs", functional_model_buckets_nodes_from_the_outputs_back_to_the_inputs},
        {"a layer called twice sits at the depth of its deepest node", a_layer_called_twice_sits_at_the_depth_of_its_deepest_node},
        {"diamond graphs keep both branches and the merge", diamond_graphs_keep_both_branches_and_the_merge},
        {"graph construction rejects bad endpoints", graph_construction_rejects_bad_endpoints},
        {"layer names must be unique inside one model", layer_names_must_be_unique_inside_one_model},
        {"model configuration survives a round trip", model_configuration_survives_a_round_trip},
        {"a model called on new inputs reuses its layers", a_model_called_on_new_inputs_reuses_its_layers},
        {"summary prints one row per layer and the parameter totals", summary_prints_one_row_per_layer_and_the_parameter_totals},
        {"layers are freed with the last model that uses them", layers_are_freed_with_the_last_model_that_uses_them},
        {"a tensor handle keeps its producer alive", a_tensor_handle_keeps_its_producer_alive},
        {"an input layer is shared by the tensors it hands out", an_input_layer_is_shared_by_the_tensors_it_hands_out},
    });
}
