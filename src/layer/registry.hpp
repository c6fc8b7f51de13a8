#ifndef LATTICE_LAYER_REGISTRY_HPP
#define LATTICE_LAYER_REGISTRY_HPP

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "../common/config.hpp"
#include "../common/custom_objects.hpp"
#include "../common/error.hpp"
#include "base.hpp"
#include "details/activation.hpp"
#include "details/dense.hpp"
#include "details/dropout.hpp"
#include "details/flatten.hpp"
#include "details/input.hpp"
#include "details/masking.hpp"
#include "details/merge.hpp"
#include "details/split.hpp"

namespace Lattice::Layer::Registry {
    namespace Details {
        struct Table {
            std::map<std::string, Factory> factories{};
            std::mutex mutex{};
        };

        inline Table& table()
        {
            static Table instance = [] {
                Table built{};
                built.factories.emplace("InputLayer", [](const PropertyTree& config, const CustomObjects&) -> LayerPtr {
                    return Layer::Details::InputLayer::from_config(config);
                });
                built.factories.emplace("Dense", [](const PropertyTree& config, const CustomObjects& custom) -> LayerPtr {
                    return Layer::Details::Dense::from_config(config, custom);
                });
                built.factories.emplace("Activation", [](const PropertyTree& config, const CustomObjects& custom) -> LayerPtr {
                    return Layer::Details::ActivationLayer::from_config(config, custom);
                });
                built.factories.emplace("Dropout", [](const PropertyTree& config, const CustomObjects&) -> LayerPtr {
                    return Layer::Details::Dropout::from_config(config);
                });
                built.factories.emplace("Flatten", [](const PropertyTree& config, const CustomObjects&) -> LayerPtr {
                    return Layer::Details::Flatten::from_config(config);
                });
                built.factories.emplace("Masking", [](const PropertyTree& config, const CustomObjects&) -> LayerPtr {
                    return Layer::Details::Masking::from_config(config);
                });
                built.factories.emplace("Add", [](const PropertyTree& config, const CustomObjects&) -> LayerPtr {
                    return Layer::Details::Add::from_config(config);
                });
                built.factories.emplace("Concatenate", [](const PropertyTree& config, const CustomObjects&) -> LayerPtr {
                    return Layer::Details::Concatenate::from_config(config);
                });
                built.factories.emplace("Split", [](const PropertyTree& config, const CustomObjects&) -> LayerPtr {
                    return Layer::Details::Split::from_config(config);
                });
                return built;
            }();
            return instance;
        }
    }

    // Makes `class_name` resolvable by every later deserialize call. Returns true so it can seed an inline variable.
    inline bool register_class(const std::string& class_name, Factory factory)
    {
        auto& table = Details::table();
        std::lock_guard<std::mutex> lock(table.mutex);
        table.factories[class_name] = std::move(factory);
        return true;
    }

    [[nodiscard]] inline bool contains(const std::string& class_name, const CustomObjects& custom_objects = {})
    {
        if (custom_objects.layers.count(class_name) != 0) {
            return true;
        }
        auto& table = Details::table();
        std::lock_guard<std::mutex> lock(table.mutex);
        return table.factories.count(class_name) != 0;
    }

    // Builds a layer or model from {class_name, config}; caller overrides win over built-ins.
    inline LayerPtr deserialize(const PropertyTree& tree, const CustomObjects& custom_objects = {})
    {
        const auto class_name = tree.get_optional<std::string>("class_name");
        if (!class_name || class_name->empty()) {
            throw ValidationError("Layer description is missing its 'class_name' entry.");
        }
        const auto config = tree.get_child_optional("config");
        if (!config) {
            throw ValidationError("Layer description of class '" + *class_name + "' is missing its 'config' entry.");
        }

        Factory factory;
        if (const auto it = custom_objects.layers.find(*class_name); it != custom_objects.layers.end()) {
            factory = it->second;
        } else {
            auto& table = Details::table();
            std::lock_guard<std::mutex> lock(table.mutex);
            if (const auto found = table.factories.find(*class_name); found != table.factories.end()) {
                factory = found->second;
            }
        }
        if (!factory) {
            throw ValidationError("Unknown layer: " + *class_name);
        }
        auto layer = factory(*config, custom_objects);
        if (!layer) {
            throw ValidationError("Factory for layer class '" + *class_name + "' returned no layer.");
        }
        return layer;
    }

    inline PropertyTree serialize(const Base& layer)
    {
        return Common::Json::encode_configurable(layer);
    }
}

#endif // LATTICE_LAYER_REGISTRY_HPP
