#ifndef LATTICE_COMMON_SAVE_LOAD_HPP
#define LATTICE_COMMON_SAVE_LOAD_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../layer/registry.hpp"
#include "../loss/loss.hpp"
#include "../metric/metric.hpp"
#include "../model/model.hpp"
#include "../model/sequential.hpp"
#include "../optimizer/optimizer.hpp"
#include "../utils/log.hpp"
#include "archive.hpp"
#include "config.hpp"
#include "custom_objects.hpp"
#include "error.hpp"
#include "json.hpp"

namespace Lattice::Common::SaveLoad {
    struct SaveOptions {
        bool overwrite{true};
        bool include_optimizer{true};
        std::shared_ptr<const Archive::Backend> backend{Archive::default_backend()};
        std::function<bool(const std::filesystem::path&)> confirm_overwrite{Archive::confirm_overwrite_on_console};
    };

    struct LoadOptions {
        CustomObjects custom_objects{};
        bool compile{true};
        std::shared_ptr<const Archive::Backend> backend{Archive::default_backend()};
    };

    namespace Details {
        template <class Objective>
        Json::Value encode_objective(const Objective& objective)
        {
            if (!objective.name.empty()) {
                return Json::Value(Json::NamedCallable{objective.name});
            }
            // Unnamed callables have no JSON form; the encoder rejects them.
            return Json::Value::opaque(objective.function);
        }

        inline Json::Value encode_loss(const Loss::Spec& spec)
        {
            if (const auto* single = std::get_if<Loss::Objective>(&spec)) {
                return encode_objective(*single);
            }
            if (const auto* list = std::get_if<std::vector<Loss::Objective>>(&spec)) {
                Json::Array array;
                for (const auto& objective : *list) {
                    array.push_back(encode_objective(objective));
                }
                return Json::Value(std::move(array));
            }
            Json::Object object;
            for (const auto& [output, objective] : std::get<std::map<std::string, Loss::Objective>>(spec)) {
                object.emplace_back(output, encode_objective(objective));
            }
            return Json::Value(std::move(object));
        }

        inline Json::Value encode_metric_list(const std::vector<Metric::Objective>& list)
        {
            Json::Array array;
            for (const auto& objective : list) {
                array.push_back(encode_objective(objective));
            }
            return Json::Value(std::move(array));
        }

        inline Json::Value encode_metrics(const Metric::Spec& spec)
        {
            if (const auto* shared = std::get_if<std::vector<Metric::Objective>>(&spec)) {
                return encode_metric_list(*shared);
            }
            Json::Object object;
            for (const auto& [output, list] : std::get<std::map<std::string, std::vector<Metric::Objective>>>(spec)) {
                object.emplace_back(output, encode_metric_list(list));
            }
            return Json::Value(std::move(object));
        }

        inline Json::Value encode_loss_weights(const std::optional<LossWeights>& weights)
        {
            if (!weights) {
                return Json::Value(Json::Null{});
            }
            if (const auto* list = std::get_if<std::vector<double>>(&*weights)) {
                Json::Array array;
                for (const auto weight : *list) {
                    array.emplace_back(weight);
                }
                return Json::Value(std::move(array));
            }
            Json::Object object;
            for (const auto& [output, weight] : std::get<std::map<std::string, double>>(*weights)) {
                object.emplace_back(output, Json::Value(weight));
            }
            return Json::Value(std::move(object));
        }

        inline PropertyTree training_config(const Optimizer::Base& optimizer, const CompileOptions& options)
        {
            Json::Object config;
            config.emplace_back("optimizer_config", Json::Value(Json::encode_configurable(optimizer)));
            config.emplace_back("loss", encode_loss(options.loss));
            config.emplace_back("metrics", encode_metrics(options.metrics));
            config.emplace_back("sample_weight_mode", Json::Value(options.sample_weight_mode));
            config.emplace_back("loss_weights", encode_loss_weights(options.loss_weights));
            return Json::encode(Json::Value(std::move(config)));
        }

        // JSON arrays come back from the property tree as children with empty keys.
        inline bool is_array(const PropertyTree& tree)
        {
            for (const auto& [key, child] : tree) {
                (void)child;
                if (!key.empty()) {
                    return false;
                }
            }
            return true;
        }

        inline Loss::Objective decode_loss_objective(const PropertyTree& tree, const CustomObjects& custom_objects)
        {
            Loss::Objective objective(tree.data());
            if (const auto it = custom_objects.losses.find(objective.name); it != custom_objects.losses.end()) {
                objective.function = it->second;
            }
            return objective;
        }

        inline Metric::Objective decode_metric_objective(const PropertyTree& tree, const CustomObjects& custom_objects)
        {
            Metric::Objective objective(tree.data());
            if (const auto it = custom_objects.metrics.find(objective.name); it != custom_objects.metrics.end()) {
                objective.function = it->second;
            }
            return objective;
        }

        inline Loss::Spec decode_loss(const PropertyTree& tree, const CustomObjects& custom_objects)
        {
            if (Config::is_empty(tree)) {
                throw ConfigError("Training configuration has an empty 'loss' entry.");
            }
            if (tree.empty()) {
                return decode_loss_objective(tree, custom_objects);
            }
            if (is_array(tree)) {
                std::vector<Loss::Objective> list;
                for (const auto& [key, child] : tree) {
                    (void)key;
                    list.push_back(decode_loss_objective(child, custom_objects));
                }
                return list;
            }
            std::map<std::string, Loss::Objective> table;
            for (const auto& [output, child] : tree) {
                table.emplace(output, decode_loss_objective(child, custom_objects));
            }
            return table;
        }

        inline std::vector<Metric::Objective> decode_metric_list(const PropertyTree& tree, const CustomObjects& custom_objects)
        {
            std::vector<Metric::Objective> list;
            if (tree.empty() && !tree.data().empty()) {
                list.push_back(decode_metric_objective(tree, custom_objects));
                return list;
            }
            for (const auto& [key, child] : tree) {
                (void)key;
                list.push_back(decode_metric_objective(child, custom_objects));
            }
            return list;
        }

        inline Metric::Spec decode_metrics(const PropertyTree& tree, const CustomObjects& custom_objects)
        {
            if (Config::is_empty(tree) || is_array(tree)) {
                return decode_metric_list(tree, custom_objects);
            }
            std::map<std::string, std::vector<Metric::Objective>> table;
            for (const auto& [output, child] : tree) {
                table.emplace(output, decode_metric_list(child, custom_objects));
            }
            return table;
        }

        inline std::optional<LossWeights> decode_loss_weights(const PropertyTree& tree)
        {
            if (Config::is_empty(tree)) {
                return std::nullopt;
            }
            if (is_array(tree)) {
                return LossWeights{Config::read_array<double>(tree, "loss_weights")};
            }
            std::map<std::string, double> table;
            for (const auto& [output, child] : tree) {
                const auto weight = child.get_value_optional<double>();
                if (!weight) {
                    throw ConfigError("Invalid loss weight for output '" + output + "' in the training configuration.");
                }
                table.emplace(output, *weight);
            }
            return LossWeights{std::move(table)};
        }
    }

    // Model (functional or Sequential) from a {class_name, config} tree.
    inline std::shared_ptr<Model> model_from_config(const PropertyTree& config, const CustomObjects& custom_objects = {})
    {
        if (!config.empty() && Details::is_array(config)) {
            throw TypeError("`model_from_config` expects a dictionary, not a list. Maybe you meant to use `Sequential::from_config(config)`?");
        }
        auto layer = Layer::Registry::deserialize(config, custom_objects);
        auto model = std::dynamic_pointer_cast<Model>(layer);
        if (!model) {
            throw TypeError("Configuration of class '" + layer->class_name() + "' describes a layer, not a model.");
        }
        return model;
    }

    inline std::shared_ptr<Model> model_from_json(const std::string& json, const CustomObjects& custom_objects = {})
    {
        return model_from_config(Config::from_json(json, "model JSON"), custom_objects);
    }

    // Topology, weights and, when compiled, the training configuration and optimizer state in one archive.
    inline void save_model(const Model& model, const std::filesystem::path& path, SaveOptions options = {})
    {
        const auto codec = Archive::require_backend(options.backend, "save_model");
        if (!options.overwrite && std::filesystem::exists(path)) {
            if (!options.confirm_overwrite || !options.confirm_overwrite(path)) {
                return;
            }
        }

        Archive::Group root;
        root.set_attribute("format_version", Archive::kFormatVersion);
        root.set_attribute("backend_tag", codec->tag());
        root.set_attribute("model_config", Config::to_json(Json::encode_configurable(model)));
        Lattice::Details::write_layer_weights(root.create_group("model_weights"), model.layers());

        const auto& optimizer = model.optimizer();
        if (options.include_optimizer && optimizer) {
            if (optimizer->is_external()) {
                Utils::Log::warning("Optimizer " + optimizer->class_name() + " wraps a backend optimizer and cannot be saved. "
                                    "The saved model will be uncompiled when loaded; compile it manually after loading.");
            } else {
                root.set_attribute("training_config", Config::to_json(Details::training_config(*optimizer, model.compile_options())));
                const auto state = optimizer->weights();
                if (!state.empty()) {
                    auto& group = root.create_group("optimizer_weights");
                    std::vector<std::string> names;
                    for (const auto& tensor : state) {
                        names.push_back(tensor.name);
                        group.add_dataset(tensor.name, tensor.value);
                    }
                    group.set_attribute("weight_names", Archive::encode_names(names));
                }
            }
        }
        codec->write(path, root);
    }

    // Rebuilds the model saved by save_model(). A missing training configuration or an optimizer
    // state that does not fit leaves a usable model and logs a warning.
    inline std::shared_ptr<Model> load_model(const std::filesystem::path& path, LoadOptions options = {})
    {
        const auto codec = Archive::require_backend(options.backend, "load_model");
        const auto root = codec->read(path);

        const auto model_config = root.attribute("model_config");
        if (!model_config) {
            throw ValidationError("No model found in config file.");
        }
        auto model = model_from_config(Config::from_json(*model_config, "model_config of " + path.string()), options.custom_objects);

        const auto* weights = root.group("model_weights");
        if (weights == nullptr) {
            throw ValidationError("No model weights found in '" + path.string() + "'.");
        }
        Lattice::Details::load_layer_weights(*weights, model->layers());

        if (!options.compile) {
            return model;
        }
        const auto training = root.attribute("training_config");
        if (!training) {
            Utils::Log::warning("No training configuration found in save file: the model was *not* compiled. Compile it manually.");
            return model;
        }
        const auto config = Config::from_json(*training, "training_config of " + path.string());
        const std::string context = "training_config of " + path.string();

        CompileOptions compile{};
        compile.optimizer = Optimizer::deserialize(Config::get_child(config, "optimizer_config", context), options.custom_objects);
        compile.loss = Details::decode_loss(Config::get_child(config, "loss", context), options.custom_objects);
        compile.metrics = Details::decode_metrics(config.get_child("metrics", PropertyTree{}), options.custom_objects);
        compile.loss_weights = Details::decode_loss_weights(config.get_child("loss_weights", PropertyTree{}));
        compile.sample_weight_mode = config.get<std::string>("sample_weight_mode", "");
        compile.custom_objects = options.custom_objects;
        model->compile(std::move(compile));

        if (const auto* state = root.group("optimizer_weights")) {
            const auto& optimizer = model->optimizer();
            try {
                const auto values = Lattice::Details::read_weight_values(*state, "optimizer");
                optimizer->ensure_state_initialized();
                optimizer->set_weights(values);
            } catch (const CardinalityError&) {
                Utils::Log::warning("Error in loading the saved optimizer state. As a result, your model is starting with a freshly "
                                    "initialized optimizer.");
                optimizer->bind(optimizer->parameters());
            } catch (const ShapeError&) {
                Utils::Log::warning("Error in loading the saved optimizer state. As a result, your model is starting with a freshly "
                                    "initialized optimizer.");
                optimizer->bind(optimizer->parameters());
            } catch (const ValidationError&) {
                Utils::Log::warning("Error in loading the saved optimizer state. As a result, your model is starting with a freshly "
                                    "initialized optimizer.");
                optimizer->bind(optimizer->parameters());
            }
        }
        return model;
    }
}

namespace Lattice {
    using Common::SaveLoad::LoadOptions;
    using Common::SaveLoad::SaveOptions;
    using Common::SaveLoad::load_model;
    using Common::SaveLoad::model_from_config;
    using Common::SaveLoad::model_from_json;
    using Common::SaveLoad::save_model;
}

#endif // LATTICE_COMMON_SAVE_LOAD_HPP
