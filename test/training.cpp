#include <cmath>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "check.hpp"

using namespace Lattice;
using Check::expect;
using Check::expect_throws;

namespace {
    std::shared_ptr<Model> make_two_headed() {
        auto x = Input({.shape = Shape{4}, .name = "x"});
        auto trunk = (*Layer::Dense({.units = 8}, Activation::Tanh, {.name = "trunk"}))(x);
        auto a = (*Layer::Dense({.units = 1}, Activation::Identity, {.name = "a"}))(trunk);
        auto b = (*Layer::Dense({.units = 2}, Activation::Softmax, {.name = "b"}))(trunk);
        return std::make_shared<Model>(std::vector<Tensor>{x}, std::vector<Tensor>{a, b}, "two_headed");
    }

    std::shared_ptr<Sequential> make_linear() {
        auto model = std::make_shared<Sequential>("linear");
        model->add(Layer::Dense({.units = 1}, Activation::Identity, {.name = "fit", .input_shape = Shape{3}}));
        return model;
    }
}

void fit_lowers_the_loss_of_a_linear_regression() {
    torch::manual_seed(7);
    const auto model = make_linear();
    model->compile({.optimizer = Optimizer::SGD({.learning_rate = 0.05}), .loss = "mse"});

    const auto x = torch::randn({64, 3});
    const auto y = x.matmul(torch::ones({3, 1}));
    const auto before = model->evaluate(x, y).front();
    const auto history = model->fit(x, y, {.batch_size = 8, .epochs = 20, .verbose = 0});
    const auto after = model->evaluate(x, y).front();

    expect(history.epoch.size() == 20);
    expect(history.history.at("loss").back() < history.history.at("loss").front());
    expect(after < before);
}

void a_validation_split_adds_validation_entries_to_the_history() {
    const auto model = make_linear();
    model->compile({.optimizer = std::string("adam"), .loss = "mae", .metrics = std::vector<Metric::Objective>{"mse"}});

    const auto x = torch::randn({20, 3});
    const auto y = torch::randn({20, 1});
    const auto history = model->fit(x, y, {.batch_size = 4, .epochs = 2, .verbose = 0, .validation_split = 0.25});
    expect(history.history.count("val_loss") == 1);
    expect(history.history.count("val_mse") == 1);
    expect(history.history.at("val_loss").size() == 2);

    expect_throws<ConfigError>([&] { (void)(model->fit(x, y, {.verbose = 0, .validation_split = 1.0})); });
    expect_throws<ConfigError>([&] { (void)(model->fit(x, y, {.batch_size = 0, .verbose = 0})); });
}

void initial_epoch_resumes_the_epoch_counter() {
    const auto model = make_linear();
    model->compile({.loss = "mse"});
    const auto history = model->fit(torch::randn({6, 3}), torch::randn({6, 1}),
                                    {.batch_size = 3, .epochs = 4, .verbose = 0, .initial_epoch = 2});
    expect((history.epoch == std::vector<std::size_t>{2, 3}));
}

void verbose_fit_prints_one_line_per_epoch() {
    const auto model = make_linear();
    model->compile({.loss = "mse"});
    std::ostringstream stream;
    model->fit(torch::randn({6, 3}), torch::randn({6, 1}), {.batch_size = 3, .epochs = 2, .verbose = 2, .stream = &stream});
    const auto text = stream.str();
    expect(text.find("Epoch [1/2]") != std::string::npos);
    expect(text.find("Epoch [2/2]") != std::string::npos);
}

void sample_weights_scale_the_per_sample_loss() {
    const auto model = make_linear();
    model->compile({.loss = "mse"});
    const auto x = torch::randn({4, 3});
    const auto y = torch::zeros({4, 1});

    const auto plain = model->test_on_batch(x, y).front();
    const auto zeroed = model->test_on_batch(x, y, torch::zeros({4})).front();
    expect(zeroed == 0.0);
    expect(plain >= 0.0);

    expect_throws<ShapeError>([&] { (void)(model->test_on_batch(x, y, torch::ones({4, 2}))); });
    expect_throws<CardinalityError>([&] { (void)(model->test_on_batch(x, y, torch::ones({3}))); });
}

void temporal_weighting_requires_a_2d_weight_array() {
    auto x = Input({.shape = Shape{5, 2}, .name = "sequence"});
    auto y = (*Layer::Dense({.units = 1}, Activation::Identity, {.name = "per_step"}))(x);
    Model model(x, y, "temporal");
    model.compile({.loss = "mse", .sample_weight_mode = "temporal"});

    const auto inputs = torch::randn({3, 5, 2});
    const auto targets = torch::randn({3, 5, 1});
    expect(model.test_on_batch(inputs, targets, torch::zeros({3, 5})).front() == 0.0);
    expect_throws<ShapeError>([&] { (void)(model.test_on_batch(inputs, targets, torch::ones({3}))); });
    expect_throws<UnsupportedError>([&] { (void)(model.train_on_batch(inputs, targets, std::nullopt, {{0, 2.0}})); });

    expect_throws<ConfigError>([&] { (void)(model.compile({.loss = "mse", .sample_weight_mode = "stepwise"})); });
}

void class_weights_apply_to_one_hot_targets() {
    const auto model = std::make_shared<Sequential>("weighted_classes");
    model->add(Layer::Dense({.units = 2}, Activation::Softmax, {.name = "probs", .input_shape = Shape{3}}));
    model->compile({.loss = "categorical_crossentropy"});

    const auto x = torch::randn({4, 3});
    const auto y = torch::one_hot(torch::tensor({0, 0, 0, 0}, torch::kLong), 2).to(torch::kFloat32);
    const auto ignored = model->train_on_batch(x, y, std::nullopt, {{0, 0.0}, {1, 1.0}});
    expect(ignored.front() == 0.0);
}

void multi_output_compile_names_every_loss_and_metric() {
    const auto model = make_two_headed();
    model->compile({.optimizer = std::string("adam"),
                    .loss = std::vector<Loss::Objective>{"mse", "categorical_crossentropy"},
                    .metrics = std::map<std::string, std::vector<Metric::Objective>>{{"b", {"accuracy"}}},
                    .loss_weights = std::vector<double>{1.0, 0.5}});
    expect((model->metrics_names() == std::vector<std::string>{"loss", "a_loss", "b_loss", "b_acc"}));

    const auto x = torch::randn({6, 4});
    const auto a = torch::randn({6, 1});
    const auto b = torch::one_hot(torch::randint(0, 2, {6}), 2).to(torch::kFloat32);
    const auto results = model->test_on_batch(x, {a, b});
    expect(results.size() == 4);
    expect(std::abs(results[0] - (results[1] + 0.5 * results[2])) < 1e-4);
    expect(results[3] >= 0.0 && results[3] <= 1.0);

    const auto scores = model->evaluate(x, {a, b}, {.batch_size = 4});
    expect(scores.size() == 4);
    const auto predictions = model->predict(x, {.batch_size = 4});
    expect(predictions.size() == 2);
    expect((predictions[1].sizes() == torch::IntArrayRef{6, 2}));
}

void loss_dictionaries_may_leave_an_output_untrained() {
    const auto model = make_two_headed();
    model->compile({.loss = std::map<std::string, Loss::Objective>{{"a", "mae"}},
                    .loss_weights = std::map<std::string, double>{{"a", 2.0}}});
    expect((model->metrics_names() == std::vector<std::string>{"loss", "a_loss"}));

    const auto x = torch::randn({5, 4});
    const auto results = model->train_on_batch(x, torch::randn({5, 1}));
    expect(results.size() == 2);
    expect(std::abs(results[0] - 2.0 * results[1]) < 1e-4);
}

void compile_rejects_inconsistent_objectives() {
    const auto model = make_two_headed();
    expect_throws<CardinalityError>([&] { (void)(model->compile({.loss = std::vector<Loss::Objective>{"mse"}})); });
    expect_throws<ConfigError>([&] { (void)(model->compile({.loss = std::map<std::string, Loss::Objective>{{"c", "mse"}}})); });
    expect_throws<ConfigError>([&] { (void)(model->compile({.loss = std::map<std::string, Loss::Objective>{}})); });
    expect_throws<CardinalityError>([&] { (void)(model->compile({.loss = "mse", .loss_weights = std::vector<double>{1.0}})); });
    expect_throws<ConfigError>([&] { (void)(model->compile({.loss = "mse", .loss_weights = std::map<std::string, double>{{"c", 1.0}}})); });
    expect_throws<ConfigError>([&] { (void)(model->compile({.loss = "mse",
                                  .metrics = std::map<std::string, std::vector<Metric::Objective>>{{"c", {"acc"}}}})); });
    expect_throws<ValidationError>([&] { (void)(model->compile({.optimizer = std::string("nadam"), .loss = "mse"})); });
    expect_throws<ValidationError>([&] { (void)(model->compile({.loss = "hinge_of_doom"})); });
    expect(!model->compiled());
}

void batch_inputs_are_checked_against_the_declared_shapes() {
    const auto model = make_linear();
    model->compile({.loss = "mse"});
    expect_throws<ShapeError>([&] { (void)(model->train_on_batch(torch::randn({4, 5}), torch::randn({4, 1}))); });
    expect_throws<ShapeError>([&] { (void)(model->train_on_batch(torch::randn({4, 3}), torch::randn({4, 2}))); });
    expect_throws<CardinalityError>([&] { (void)(model->train_on_batch(torch::randn({4, 3}), torch::randn({3, 1}))); });
    expect_throws<CardinalityError>([&] { (void)(model->train_on_batch(TensorList{torch::randn({4, 3}), torch::randn({4, 3})}, torch::randn({4, 1}))); });
    expect_throws<EmptyError>([&] { (void)(model->predict(torch::randn({0, 3}))); });
}

void sparse_targets_skip_the_shape_check() {
    const auto model = std::make_shared<Sequential>("sparse");
    model->add(Layer::Dense({.units = 4}, Activation::Softmax, {.name = "scores", .input_shape = Shape{3}}));
    model->compile({.loss = "sparse_categorical_crossentropy", .metrics = std::vector<Metric::Objective>{"acc"}});
    const auto results = model->train_on_batch(torch::randn({5, 3}), torch::randint(0, 4, {5, 1}));
    expect(results.size() == 2);
}

void optimizers_resolve_by_name_and_report_their_configuration() {
    const auto sgd = Optimizer::get("SGD");
    expect(sgd->class_name() == "SGD");
    const auto adam = Optimizer::get("adam");
    expect(adam->get_config().get<double>("learning_rate") > 0.0);
    expect(Optimizer::get("adamw")->class_name() == "AdamW");
    expect_throws<ValidationError>([&] { (void)(Optimizer::get("nadam")); });

    const auto restored = Optimizer::deserialize(Common::Json::encode_configurable(*Optimizer::SGD({.learning_rate = 0.3, .momentum = 0.5})));
    expect(restored->get_config().get<double>("momentum") == 0.5);
}

int main() {
    return Check::run({
        {"fit lowers the loss of a linear regression", fit_lowers_the_loss_of_a_linear_regression},
        {"a validation split adds validation entries to the history", a_validation_split_adds_validation_entries_to_the_history},
        {"initial_epoch resumes the epoch counter", initial_epoch_resumes_the_epoch_counter},
        {"verbose fit prints one line per epoch", verbose_fit_prints_one_line_per_epoch},
        {"sample weights scale the per-sample loss", sample_weights_scale_the_per_sample_loss},
        {"temporal weighting requires a 2D weight array", temporal_weighting_requires_a_2d_weight_array},
        {"class weights apply to one-hot targets", class_weights_apply_to_one_hot_targets},
        {"multi-output compile names every loss and metric", multi_output_compile_names_every_loss_and_metric},
        {"loss dictionaries may leave an output untrained", loss_dictionaries_may_leave_an_output_untrained},
        {"compile rejects inconsistent objectives", compile_rejects_inconsistent_objectives},
        {"batch inputs are checked against the declared shapes", batch_inputs_are_checked_against_the_declared_shapes},
        {"sparse targets skip the shape check", sparse_targets_skip_the_shape_check},
        {"optimizers resolve by name and report their configuration", optimizers_resolve_by_name_and_report_their_configuration},
    });
}
