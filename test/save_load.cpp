#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "check.hpp"

using namespace Lattice;
using Check::expect;
using Check::expect_throws;

namespace {
    std::filesystem::path scratch(const std::string& name) {
        const auto directory = std::filesystem::temp_directory_path() / "lattice_tests";
        std::filesystem::create_directories(directory);
        const auto path = directory / name;
        std::filesystem::remove(path);
        return path;
    }

    // Captures library warnings for the lifetime of the object.
    struct WarningCapture {
        std::ostringstream text{};
        WarningCapture() { Utils::Log::set_stream(&text, false); }
        ~WarningCapture() { Utils::Log::set_stream(nullptr); }
        [[nodiscard]] bool contains(const std::string& fragment) const { return text.str().find(fragment) != std::string::npos; }
    };

    std::shared_ptr<Model> make_regressor() {
        auto x = Input({.shape = Shape{4}, .name = "x"});
        auto h = (*Layer::Dense({.units = 8}, Activation::ReLU, {.name = "hidden"}))(x);
        auto y = (*Layer::Dense({.units = 1}, Activation::Identity, {.name = "value"}))(h);
        return std::make_shared<Model>(x, y, "regressor");
    }

    std::shared_ptr<Sequential> make_classifier() {
        auto model = std::make_shared<Sequential>("classifier");
        model->add(Layer::Dense({.units = 6}, Activation::Tanh, {.name = "features", .input_shape = Shape{3}}));
        model->add(Layer::Dense({.units = 3}, Activation::Softmax, {.name = "probabilities"}));
        return model;
    }

    // A codec that is never usable in this process.
    class OfflineBackend : public Common::Archive::Backend {
    public:
        [[nodiscard]] bool available() const noexcept override { return false; }
        [[nodiscard]] std::string tag() const override { return "offline"; }
        void write(const std::filesystem::path& path, const Common::Archive::Group&) const override {
            throw SerializationError("Offline codec cannot write '" + path.string() + "'.");
        }
        [[nodiscard]] Common::Archive::Group read(const std::filesystem::path& path) const override {
            throw ValidationError("Offline codec cannot read '" + path.string() + "'.");
        }
    };

    bool same_state(const Optimizer::OptimizerPtr& lhs, const Optimizer::OptimizerPtr& rhs) {
        const auto left = lhs->weights();
        const auto right = rhs->weights();
        if (left.size() != right.size()) {
            return false;
        }
        for (std::size_t index = 0; index < left.size(); ++index) {
            if (left[index].name != right[index].name || !torch::allclose(left[index].value.to(torch::kDouble), right[index].value.to(torch::kDouble))) {
                return false;
            }
        }
        return true;
    }
}

void a_compiled_functional_model_reloads_and_keeps_training_identically() {
    const auto model = make_regressor();
    CompileOptions options{};
    options.optimizer = Optimizer::Adam({.learning_rate = 1e-2});
    options.loss = "mse";
    options.metrics = std::vector<Metric::Objective>{"mae"};
    model->compile(options);

    const auto x = torch::randn({16, 4});
    const auto y = x.matmul(torch::ones({4, 1}));
    model->train_on_batch(x, y);

    const auto path = scratch("regressor.pt");
    save_model(*model, path);
    const auto loaded = load_model(path);

    expect(loaded->compiled());
    expect(loaded->name() == "regressor");
    expect(loaded->metrics_names() == model->metrics_names());
    expect(loaded->optimizer()->class_name() == "Adam");
    expect(same_state(loaded->optimizer(), model->optimizer()));
    expect(torch::allclose(loaded->predict(x).front(), model->predict(x).front()));

    const auto before = model->train_on_batch(x, y);
    const auto after = loaded->train_on_batch(x, y);
    expect(std::abs(before.front() - after.front()) < 1e-5);
    expect(torch::allclose(loaded->predict(x).front(), model->predict(x).front(), 1e-5, 1e-6));
}

void a_sequential_model_round_trips_with_its_momentum_buffers() {
    const auto model = make_classifier();
    CompileOptions options{};
    options.optimizer = Optimizer::SGD({.learning_rate = 0.1, .momentum = 0.9});
    options.loss = "categorical_crossentropy";
    options.metrics = std::vector<Metric::Objective>{"accuracy"};
    model->compile(options);

    const auto x = torch::randn({12, 3});
    const auto y = torch::one_hot(torch::randint(0, 3, {12}), 3).to(torch::kFloat32);
    model->fit(x, y, {.batch_size = 4, .epochs = 2, .verbose = 0});

    const auto path = scratch("classifier.pt");
    save_model(*model, path);
    const auto loaded = load_model(path);

    expect(std::dynamic_pointer_cast<Sequential>(loaded) != nullptr);
    expect(loaded->layers().size() == 2);
    expect((loaded->metrics_names() == std::vector<std::string>{"loss", "acc"}));
    expect(!loaded->optimizer()->weights().empty());
    expect(same_state(loaded->optimizer(), model->optimizer()));
    expect(torch::allclose(loaded->predict(x).front(), model->predict(x).front()));
}

void an_archive_without_a_topology_is_rejected() {
    const auto model = make_regressor();
    const auto path = scratch("weights_only.pt");
    model->save_weights(path);
    expect_throws<ValidationError>([&] { (void)(load_model(path)); });
    expect_throws<ValidationError>([&] { (void)(load_model(scratch("missing.pt"))); });
}

void an_uncompiled_model_loads_uncompiled_with_a_warning() {
    const auto model = make_regressor();
    const auto path = scratch("uncompiled.pt");
    save_model(*model, path);

    WarningCapture capture;
    const auto loaded = load_model(path);
    expect(!loaded->compiled());
    expect(capture.contains("No training configuration found in save file"));
    expect(torch::allclose(loaded->get_layer("hidden")->get_weights().front(), model->get_layer("hidden")->get_weights().front()));
}

void compile_can_be_skipped_on_load() {
    const auto model = make_regressor();
    model->compile({.optimizer = std::string("adam"), .loss = "mae"});
    const auto path = scratch("skip_compile.pt");
    save_model(*model, path);

    const auto loaded = load_model(path, {.compile = false});
    expect(!loaded->compiled());
}

void a_mismatched_optimizer_state_falls_back_to_a_fresh_optimizer() {
    const auto model = make_regressor();
    model->compile({.optimizer = Optimizer::Adam(), .loss = "mse"});
    const auto x = torch::randn({8, 4});
    model->train_on_batch(x, x.matmul(torch::ones({4, 1})));

    const auto path = scratch("mismatch.pt");
    save_model(*model, path);

    const auto backend = Common::Archive::default_backend();
    auto root = backend->read(path);
    for (auto& [name, group] : root.groups) {
        if (name == "optimizer_weights") {
            group.set_attribute("weight_names", Common::Archive::encode_names({"Adam/step_0"}));
        }
    }
    backend->write(path, root);

    WarningCapture capture;
    const auto loaded = load_model(path);
    expect(loaded->compiled());
    expect(capture.contains("Error in loading the saved optimizer state"));
    expect(loaded->optimizer()->weights().empty());
    loaded->train_on_batch(x, x.matmul(torch::ones({4, 1})));
}

void an_external_optimizer_is_not_saved() {
    const auto model = make_regressor();
    auto optimizer = Optimizer::External("plain_sgd", [](const std::vector<torch::Tensor>& parameters) {
        return std::make_unique<torch::optim::SGD>(parameters, torch::optim::SGDOptions(0.01));
    });
    model->compile({.optimizer = optimizer, .loss = "mse"});

    const auto path = scratch("external.pt");
    WarningCapture capture;
    save_model(*model, path);
    expect(capture.contains("cannot be saved"));

    const auto loaded = load_model(path);
    expect(!loaded->compiled());
}

void custom_losses_resolve_through_custom_objects() {
    const Loss::Function scaled = [](const torch::Tensor& prediction, const torch::Tensor& target) {
        return 2.0 * (prediction - target).pow(2).mean(-1);
    };
    const auto model = make_regressor();
    model->compile({.optimizer = std::string("sgd"), .loss = Loss::Objective("scaled_mse", scaled)});

    const auto path = scratch("custom.pt");
    save_model(*model, path);

    expect_throws<ValidationError>([&] { (void)(load_model(path)); });

    CustomObjects custom{};
    custom.losses.emplace("scaled_mse", scaled);
    const auto loaded = load_model(path, {.custom_objects = custom});
    expect(loaded->compiled());
    const auto x = torch::randn({4, 4});
    const auto y = torch::zeros({4, 1});
    expect(std::abs(loaded->test_on_batch(x, y).front() - model->test_on_batch(x, y).front()) < 1e-5);
}

void an_unnamed_loss_cannot_be_written_to_an_archive() {
    const auto model = make_regressor();
    model->compile({.optimizer = std::string("sgd"),
                    .loss = Loss::Objective(std::string{}, [](const torch::Tensor& prediction, const torch::Tensor& target) {
                        return (prediction - target).abs().mean(-1);
                    })});
    const auto path = scratch("unnamed.pt");
    expect_throws<SerializationError>([&] { (void)(save_model(*model, path)); });
    expect(!std::filesystem::exists(path));
}

void a_declined_overwrite_leaves_the_file_untouched() {
    const auto path = scratch("keep.pt");
    {
        std::ofstream file(path);
        file << "keep";
    }
    const auto model = make_regressor();
    save_model(*model, path, {.overwrite = false, .confirm_overwrite = [](const std::filesystem::path&) { return false; }});

    std::ifstream file(path);
    std::string content;
    std::getline(file, content);
    expect(content == "keep");

    save_model(*model, path, {.overwrite = false, .confirm_overwrite = [](const std::filesystem::path&) { return true; }});
    expect(load_model(path)->name() == "regressor");
}

void models_rebuild_from_json_and_reject_list_configurations() {
    const auto model = make_regressor();
    const auto rebuilt = model_from_json(model->to_json());
    expect(rebuilt->to_json() == model->to_json());

    const auto stack = make_classifier();
    expect_throws<TypeError>([&] { (void)(model_from_config(stack->get_config())); });
    const auto wrapped = model_from_config(Common::Json::encode_configurable(*stack));
    expect(std::dynamic_pointer_cast<Sequential>(wrapped) != nullptr);
}

void weights_load_by_position_and_by_name() {
    const auto source = make_regressor();
    const auto path = scratch("weights.pt");
    source->save_weights(path);

    const auto target = make_regressor();
    target->load_weights(path);
    expect(torch::equal(target->get_layer("value")->get_weights().front(), source->get_layer("value")->get_weights().front()));

    auto x = Input({.shape = Shape{4}, .name = "x"});
    auto y = (*Layer::Dense({.units = 8}, Activation::ReLU, {.name = "hidden"}))(x);
    Model partial(x, y, "partial");
    const auto untouched = partial.get_layer("hidden")->get_weights().front().clone();
    expect_throws<CardinalityError>([&] { (void)(partial.load_weights(path)); });
    expect(torch::equal(partial.get_layer("hidden")->get_weights().front(), untouched));

    partial.load_weights(path, true);
    expect(torch::equal(partial.get_layer("hidden")->get_weights().front(), source->get_layer("hidden")->get_weights().front()));
}

void archives_require_an_available_backend() {
    const auto model = make_regressor();
    const auto path = scratch("no_backend.pt");
    const auto offline = std::make_shared<OfflineBackend>();

    expect_throws<DependencyError>([&] { save_model(*model, path, {.backend = nullptr}); });
    expect_throws<DependencyError>([&] { save_model(*model, path, {.backend = offline}); });
    expect(!std::filesystem::exists(path));
    expect_throws<DependencyError>([&] { model->save_weights(path, true, nullptr); });
    expect_throws<DependencyError>([&] { model->save_weights(path, true, offline); });
    expect(!std::filesystem::exists(path));

    save_model(*model, path);
    expect_throws<DependencyError>([&] { (void)(load_model(path, {.backend = nullptr})); });
    expect_throws<DependencyError>([&] { (void)(load_model(path, {.backend = offline})); });
    expect_throws<DependencyError>([&] { model->load_weights(path, false, nullptr); });
    expect_throws<DependencyError>([&] { model->load_weights(path, false, offline); });
}

void weights_are_stored_under_their_own_names() {
    const auto model = make_regressor();
    model->compile({.optimizer = Optimizer::Adam(), .loss = "mse"});
    const auto x = torch::randn({8, 4});
    model->train_on_batch(x, x.matmul(torch::ones({4, 1})));

    const auto path = scratch("named.pt");
    save_model(*model, path);
    const auto backend = Common::Archive::default_backend();
    auto root = backend->read(path);

    const auto* weights = root.group("model_weights");
    expect(weights != nullptr);
    const auto* hidden = weights->group("hidden");
    expect(hidden != nullptr);
    expect(hidden->dataset("hidden/kernel") != nullptr);
    expect(hidden->dataset("hidden/bias") != nullptr);
    expect(hidden->dataset("w0") == nullptr);
    expect(torch::equal(*hidden->dataset("hidden/kernel"), model->get_layer("hidden")->get_weights().front()));

    const auto* state = root.group("optimizer_weights");
    expect(state != nullptr);
    for (const auto& tensor : model->optimizer()->weights()) {
        expect(state->dataset(tensor.name) != nullptr);
    }

    // Entries are found by name, not by position.
    for (auto& [name, group] : root.groups) {
        if (name == "model_weights") {
            for (auto& [layer_name, layer_group] : group.groups) {
                (void)layer_name;
                std::reverse(layer_group.datasets.begin(), layer_group.datasets.end());
            }
        }
    }
    backend->write(path, root);
    const auto loaded = load_model(path);
    expect(torch::allclose(loaded->predict(x).front(), model->predict(x).front()));
}

void archive_groups_refuse_duplicate_names() {
    Common::Archive::Group root;
    auto& first = root.create_group("layer");
    first.add_dataset("layer/kernel", torch::ones({2, 2}));
    expect_throws<ValidationError>([&] { (void)(root.create_group("layer")); });
    expect_throws<ValidationError>([&] { first.add_dataset("layer/kernel", torch::zeros({2, 2})); });
    expect(root.groups.size() == 1);
    expect(torch::equal(*root.group("layer")->dataset("layer/kernel"), torch::ones({2, 2})));
}

int main() {
    return Check::run({
        {"a compiled functional model reloads and keeps training identically", a_compiled_functional_model_reloads_and_keeps_training_identically},
        {"a sequential model round-trips with its momentum buffers", a_sequential_model_round_trips_with_its_momentum_buffers},
        {"an archive without a topology is rejected", an_archive_without_a_topology_is_rejected},
        {"an uncompiled model loads uncompiled with a warning", an_uncompiled_model_loads_uncompiled_with_a_warning},
        {"compile can be skipped on load", compile_can_be_skipped_on_load},
        {"a mismatched optimizer state falls back to a fresh optimizer", a_mismatched_optimizer_state_falls_back_to_a_fresh_optimizer},
        {"an external optimizer is not saved", an_external_optimizer_is_not_saved},
        {"custom losses resolve through custom objects", custom_losses_resolve_through_custom_objects},
        {"an unnamed loss cannot be written to an archive", an_unnamed_loss_cannot_be_written_to_an_archive},
        {"a declined overwrite leaves the file untouched", a_declined_overwrite_leaves_the_file_untouched},
        {"models rebuild from JSON and reject list configurations", models_rebuild_from_json_and_reject_list_configurations},
        {"weights load by position and by name", weights_load_by_position_and_by_name},
        {"archives require an available backend", archives_require_an_available_backend},
        {"weights are stored under their own names", weights_are_stored_under_their_own_names},
        {"archive groups refuse duplicate names", archive_groups_refuse_duplicate_names},
    });
}
