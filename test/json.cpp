#include <any>
#include <memory>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "check.hpp"

using namespace Lattice;
using Check::expect;
using Check::expect_throws;

void the_encoder_renders_every_supported_value_kind() {
    const auto dense = Layer::Dense({.units = 2}, Activation::ReLU, {.name = "encoded"});
    Common::Json::Object object;
    object.emplace_back("flag", Common::Json::Value(true));
    object.emplace_back("count", Common::Json::Value(3));
    object.emplace_back("label", Common::Json::Value("text"));
    object.emplace_back("matrix", Common::Json::Value(torch::tensor({1, 2})));
    object.emplace_back("loss", Common::Json::Value(Common::Json::NamedCallable{"mse"}));
    object.emplace_back("kind", Common::Json::Value(Common::Json::TypeTag{"Dense"}));
    object.emplace_back("layer", Common::Json::Value(std::shared_ptr<const Common::Json::Configurable>(dense)));
    object.emplace_back("nothing", Common::Json::Value(Common::Json::Null{}));

    const auto tree = Common::Json::encode(Common::Json::Value(object));
    expect(tree.get<bool>("flag"));
    expect(tree.get<int>("count") == 3);
    expect(tree.get<std::string>("label") == "text");
    expect((Common::Config::read_array<int>(tree.get_child("matrix"), "matrix") == std::vector<int>{1, 2}));
    expect(tree.get<std::string>("loss") == "mse");
    expect(tree.get<std::string>("kind") == "Dense");
    expect(tree.get<std::string>("layer.class_name") == "Dense");
    expect(tree.get<int>("layer.config.units") == 2);
    expect(Common::Config::is_empty(tree.get_child("nothing")));
}

void the_encoder_rejects_payloads_without_a_json_form() {
    Common::Json::Array array;
    array.emplace_back(1);
    array.push_back(Common::Json::Value::opaque(std::any(std::vector<int>{1, 2, 3})));
    expect_throws<SerializationError>([&] { (void)(Common::Json::dumps(Common::Json::Value(array))); });
}

void call_arguments_keep_their_types_through_a_text_round_trip() {
    CallArguments arguments{{"training", true}, {"steps", std::int64_t{4}}, {"rate", 0.25}, {"mode", std::string("sum")}};
    const auto text = Common::Config::to_json(Arguments::to_tree(arguments));
    const auto restored = Arguments::from_tree(Common::Config::from_json(text, "arguments"));

    expect(std::get<bool>(restored.at("training")));
    expect(std::get<std::int64_t>(restored.at("steps")) == 4);
    expect(std::get<double>(restored.at("rate")) == 0.25);
    expect(std::get<std::string>(restored.at("mode")) == "sum");
    expect(Arguments::find_bool(restored, "training").value_or(false));
    expect(!Arguments::find_bool(restored, "missing").has_value());
}

void malformed_json_and_unknown_classes_are_reported() {
    expect_throws<ConfigError>([&] { (void)(Common::Config::from_json("{\"layers\": [", "broken input")); });
    expect_throws<ConfigError>([&] { (void)(model_from_json("{\"layers\": [")); });

    PropertyTree unknown;
    unknown.put("class_name", "NoSuchLayer");
    unknown.add_child("config", PropertyTree{});
    expect_throws<ValidationError>([&] { (void)(Layer::Registry::deserialize(unknown)); });

    PropertyTree nameless;
    nameless.add_child("config", PropertyTree{});
    expect_throws<ValidationError>([&] { (void)(Layer::Registry::deserialize(nameless)); });
}

void custom_objects_override_and_extend_the_registries() {
    const Activation::Function twice = [](torch::Tensor input) { return input * 2.0; };

    auto x = Input({.shape = Shape{3}, .name = "x"});
    auto y = (*Layer::Dense({.units = 2}, Activation::Custom("twice", twice), {.name = "doubled"}))(x);
    Model model(x, y, "custom_activation");

    const auto config = model.get_config();
    expect_throws<ValidationError>([&] { (void)(Model::from_config(config)); });

    CustomObjects custom{};
    custom.activations.emplace("twice", twice);
    const auto rebuilt = Model::from_config(config, custom);
    expect(rebuilt->get_layer("doubled")->get_config().get<std::string>("activation") == "twice");

    custom.layers.emplace("Dense", [](const PropertyTree& layer_config, const CustomObjects& objects) -> LayerPtr {
        auto options = layer_config;
        options.put("units", 5);
        return Layer::Details::Dense::from_config(options, objects);
    });
    const auto widened = Model::from_config(config, custom);
    expect((widened->outputs().front().shape() == Shape{kUnknownDim, 5}));
    expect(Layer::Registry::contains("Dense"));
    expect(Layer::Registry::contains("Sequential"));
    expect(!Layer::Registry::contains("Widened"));
}

void model_json_carries_the_backend_tag_and_the_layer_configs() {
    auto x = Input({.shape = Shape{4}, .name = "x"});
    auto y = (*Layer::Dropout({.rate = 0.25}, {.name = "drop"}))(x);
    Model model(x, y, "tagged");

    const auto tree = Common::Config::from_json(model.to_json(true), "model json");
    expect(tree.get<std::string>("class_name") == "Model");
    expect(tree.get<std::string>("backend") == "torch");
    expect(tree.get<std::string>("config.name") == "tagged");

    bool found = false;
    for (const auto& [key, layer] : tree.get_child("config.layers")) {
        (void)key;
        if (layer.get<std::string>("name") == "drop") {
            found = true;
            expect(layer.get<double>("config.rate") == 0.25);
        }
    }
    expect(found);
}

int main() {
    return Check::run({
        {"the encoder renders every supported value kind", the_encoder_renders_every_supported_value_kind},
        {"the encoder rejects payloads without a JSON form", the_encoder_rejects_payloads_without_a_json_form},
        {"call arguments keep their types through a text round trip", call_arguments_keep_their_types_through_a_text_round_trip},
        {"malformed JSON and unknown classes are reported", malformed_json_and_unknown_classes_are_reported},
        {"custom objects override and extend the registries", custom_objects_override_and_extend_the_registries},
        {"model JSON carries the backend tag and the layer configs", model_json_carries_the_backend_tag_and_the_layer_configs},
    });
}
