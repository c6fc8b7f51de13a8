#ifndef LATTICE_OPTIMIZER_REGISTRY_HPP
#define LATTICE_OPTIMIZER_REGISTRY_HPP

#include <map>
#include <memory>
#include <string>

#include "../common/config.hpp"
#include "../common/custom_objects.hpp"
#include "../common/error.hpp"
#include "base.hpp"
#include "details/adam.hpp"
#include "details/sgd.hpp"

namespace Lattice::Optimizer::Details {
    // Built-in classes keyed by lower-case name so that "adam" and "Adam" resolve alike.
    inline const std::map<std::string, Factory>& builtin_table() {
        static const std::map<std::string, Factory> table{
            {"sgd", [](const PropertyTree& config) -> std::shared_ptr<Base> { return SGD::from_config(config); }},
            {"adam", [](const PropertyTree& config) -> std::shared_ptr<Base> { return Adam::from_config(config); }},
            {"adamw", [](const PropertyTree& config) -> std::shared_ptr<Base> { return AdamW::from_config(config); }},
        };
        return table;
    }

    inline Factory find_factory(const std::string& class_name, const CustomObjects& custom_objects) {
        if (const auto it = custom_objects.optimizers.find(class_name); it != custom_objects.optimizers.end()) {
            return it->second;
        }
        const auto& table = builtin_table();
        if (const auto it = table.find(Common::Config::to_lower(class_name)); it != table.end()) {
            return it->second;
        }
        return {};
    }
}

namespace Lattice::Optimizer {
    // Optimizer from {class_name, config}.
    inline std::shared_ptr<Base> deserialize(const PropertyTree& tree, const CustomObjects& custom_objects = {}) {
        const auto class_name = tree.get_optional<std::string>("class_name");
        if (!class_name || class_name->empty()) {
            throw ValidationError("Optimizer description is missing its 'class_name' entry.");
        }
        const auto factory = Details::find_factory(*class_name, custom_objects);
        if (!factory) {
            throw ValidationError("Unknown optimizer: " + *class_name);
        }
        auto optimizer = factory(tree.get_child("config", PropertyTree{}));
        if (!optimizer) {
            throw ValidationError("Factory for optimizer class '" + *class_name + "' returned no optimizer.");
        }
        return optimizer;
    }

    // Optimizer with default hyperparameters by name ("sgd", "adam", "adamw").
    inline std::shared_ptr<Base> get(const std::string& name, const CustomObjects& custom_objects = {}) {
        PropertyTree tree;
        tree.put("class_name", name);
        tree.add_child("config", PropertyTree{});
        return deserialize(tree, custom_objects);
    }
}

#endif // LATTICE_OPTIMIZER_REGISTRY_HPP
