#include <string>
#include <vector>

#include <torch/torch.h>

#include "check.hpp"

using namespace Lattice;
using Check::expect;
using Check::expect_throws;

namespace {
    std::shared_ptr<Model> make_branching_model() {
        auto x = Input({.shape = Shape{4}, .name = "x"});
        auto shared = Layer::Dense({.units = 4}, Activation::ReLU, {.name = "shared"});
        auto once = (*shared)(x);
        auto twice = (*shared)(once);
        auto merged = (*Layer::Add({.name = "sum"}))(std::vector<Tensor>{once, twice}).front();
        auto y = (*Layer::Dense({.units = 2}, Activation::Identity, {.name = "head"}))(merged);
        return std::make_shared<Model>(x, y, "branching");
    }

    std::shared_ptr<Sequential> make_stack() {
        auto model = std::make_shared<Sequential>("stack");
        model->add(Layer::Dense({.units = 6}, Activation::Tanh, {.name = "d1", .input_shape = Shape{4}}));
        model->add(Layer::Dense({.units = 2}, Activation::Identity, {.name = "d2"}));
        return model;
    }

    bool same_weights(const LayerPtr& lhs, const LayerPtr& rhs) {
        const auto left = lhs->get_weights();
        const auto right = rhs->get_weights();
        if (left.size() != right.size()) {
            return false;
        }
        for (std::size_t index = 0; index < left.size(); ++index) {
            if (!torch::equal(left[index], right[index])) {
                return false;
            }
        }
        return true;
    }

    // A split whose re-instantiated copy only produces one part.
    class NarrowingSplit : public Layer::Details::Split {
    public:
        using Split::Split;

        [[nodiscard]] std::shared_ptr<Layer::Base> instantiate(const PropertyTree& config) const override {
            auto narrowed = config;
            narrowed.put("num_splits", 1);
            return Layer::Details::Split::from_config(narrowed);
        }
    };
}

void functional_clone_replays_the_graph_on_fresh_layers() {
    const auto source = make_branching_model();
    const auto shared_calls = source->get_layer("shared")->inbound_nodes().size();

    const auto copy = clone_model(*source);
    expect(copy->name() == "branching");
    expect(copy->layers().size() == source->layers().size());
    expect(copy->nodes_by_depth().size() == source->nodes_by_depth().size());
    expect(copy->count_params() == source->count_params());
    for (std::size_t index = 0; index < copy->layers().size(); ++index) {
        const auto& original = source->layers()[index];
        const auto& cloned = copy->layers()[index];
        expect(cloned->name() == original->name());
        expect(cloned->class_name() == original->class_name());
        expect(cloned->id() != original->id());
    }
    expect(copy->get_layer("shared")->inbound_nodes().size() == 2);
    expect(!same_weights(copy->get_layer("head"), source->get_layer("head")));
    expect(source->get_layer("shared")->inbound_nodes().size() == shared_calls);
    expect(copy->to_json() == source->to_json());
}

void functional_clone_can_be_seeded_with_new_inputs() {
    const auto source = make_branching_model();

    auto seed = Input({.shape = Shape{4}, .name = "seed"});
    const auto seeded = clone_model(*source, std::vector<InputValue>{seed});
    expect(seeded->inputs().front().id() == seed.id());
    expect((seeded->predict(torch::randn({3, 4})).front().sizes() == torch::IntArrayRef{3, 2}));

    const auto wrapped = clone_model(*source, std::vector<InputValue>{torch::randn({3, 4})});
    expect(wrapped->input_names().front() == "input_wrapper_for_x");

    expect_throws<CardinalityError>([&] { (void)(clone_model(*source, std::vector<InputValue>{seed, seed})); });
}

void functional_clone_refuses_a_sequential_model() {
    const auto stack = make_stack();
    expect_throws<TypeError>([&] { (void)(clone_functional_model(*stack)); });
}

void sequential_clone_re_instantiates_every_layer() {
    const auto source = make_stack();
    const auto copy = std::dynamic_pointer_cast<Sequential>(clone_model(*source));
    expect(copy != nullptr);
    expect(copy->name() == "stack");
    expect(copy->layers().size() == 2);
    expect(copy->layers().front()->id() != source->layers().front()->id());
    expect(!same_weights(copy->layers().front(), source->layers().front()));
    expect((copy->predict(torch::randn({2, 4})).front().sizes() == torch::IntArrayRef{2, 2}));
}

void sequential_clone_accepts_one_input_tensor_or_raw_value() {
    const auto source = make_stack();

    auto seed = Input({.shape = Shape{4}, .name = "seed"});
    const auto seeded = std::dynamic_pointer_cast<Sequential>(clone_sequential_model(*source, std::vector<InputValue>{seed}));
    expect(seeded->layers().size() == 3);
    expect(seeded->layers().front()->name() == "seed");
    expect(seeded->inputs().front().id() == seed.id());

    const auto wrapped = clone_sequential_model(*source, std::vector<InputValue>{torch::randn({5, 4})});
    expect(wrapped->layers().front()->name() == "input_wrapper_for_d1");
    expect(wrapped->layers().size() == 3);

    auto intermediate = (*Layer::Dense({.units = 4}))(seed);
    expect_throws<UnsupportedError>([&] { (void)(clone_sequential_model(*source, std::vector<InputValue>{intermediate})); });
    expect_throws<CardinalityError>([&] { (void)(clone_sequential_model(*source, std::vector<InputValue>{seed, seed})); });
}

void an_injected_input_replaces_the_cloned_input_layer() {
    Sequential source("explicit");
    source.add(Layer::Input({.shape = Shape{3}, .name = "entry"}));
    source.add(Layer::Dense({.units = 1}, Activation::Identity, {.name = "out"}));

    auto seed = Input({.shape = Shape{3}, .name = "replacement"});
    const auto copy = clone_sequential_model(source, std::vector<InputValue>{seed});
    expect(copy->layers().size() == 2);
    expect(copy->layers().front()->name() == "replacement");
    expect(copy->layers().back()->name() == "out");
}

void a_clone_that_cannot_reach_every_output_fails() {
    auto x = Input({.shape = Shape{4}, .name = "x"});
    auto split = std::make_shared<NarrowingSplit>(Layer::Details::SplitOptions{.num_splits = 2}, Layer::LayerOptions{.name = "halves"});
    const auto parts = (*split)(std::vector<Tensor>{x});
    Model source(std::vector<Tensor>{x}, parts, "halved");
    expect(source.outputs().size() == 2);

    expect_throws<AssertionError>([&] { (void)(clone_model(source)); });
    expect(split->inbound_nodes().size() == 1);
}

void a_sequential_clone_cannot_be_seeded_from_an_intermediate_tensor() {
    const auto source = make_stack();
    const auto first_calls = source->layers().front()->inbound_nodes().size();

    auto seed = Input({.shape = Shape{4}, .name = "upstream"});
    auto intermediate = (*Layer::Dense({.units = 4}, Activation::Identity, {.name = "projection"}))(seed);
    try {
        (void)clone_sequential_model(*source, std::vector<InputValue>{intermediate});
        expect(false);
    } catch (const UnsupportedError& error) {
        expect(std::string(error.what()).find("projection") != std::string::npos);
    }
    expect(source->layers().front()->inbound_nodes().size() == first_calls);
    expect(source->layers().size() == 2);
}

void input_wrappers_are_named_after_the_injected_tensor() {
    const auto stack = make_stack();
    auto feed = Tensor::create(Shape{kUnknownDim, 4}, torch::kFloat32, "feed", false, torch::randn({3, 4}));
    expect(!feed.is_graph_tensor());
    const auto sequential = clone_sequential_model(*stack, std::vector<InputValue>{feed});
    expect(sequential->layers().front()->name() == "input_wrapper_for_feed");

    const auto branching = make_branching_model();
    auto stream = Tensor::create(Shape{kUnknownDim, 4}, torch::kFloat32, "stream", false, torch::randn({2, 4}));
    const auto functional = clone_model(*branching, std::vector<InputValue>{stream});
    expect(functional->input_names().front() == "input_wrapper_for_stream");
    expect(functional->inputs().front().id() == stream.id());
}

int main() {
    return Check::run({
        {"functional clone replays the graph on fresh layers", functional_clone_replays_the_graph_on_fresh_layers},
        {"functional clone can be seeded with new inputs", functional_clone_can_be_seeded_with_new_inputs},
        {"functional clone refuses a sequential model", functional_clone_refuses_a_sequential_model},
        {"sequential clone re-instantiates every layer", sequential_clone_re_instantiates_every_layer},
        {"sequential clone accepts one input tensor or raw value", sequential_clone_accepts_one_input_tensor_or_raw_value},
        {"an injected input replaces the cloned input layer", an_injected_input_replaces_the_cloned_input_layer},
        {"a clone that cannot reach every output fails", a_clone_that_cannot_reach_every_output_fails},
        {"a sequential clone cannot be seeded from an intermediate tensor", a_sequential_clone_cannot_be_seeded_from_an_intermediate_tensor},
        {"input wrappers are named after the injected tensor", input_wrappers_are_named_after_the_injected_tensor},
    });
}
