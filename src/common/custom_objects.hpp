#ifndef LATTICE_COMMON_CUSTOM_OBJECTS_HPP
#define LATTICE_COMMON_CUSTOM_OBJECTS_HPP

#include <functional>
#include <map>
#include <memory>
#include <string>

#include "../activation/activation.hpp"
#include "../loss/loss.hpp"
#include "../metric/metric.hpp"
#include "config.hpp"

namespace Lattice {
    namespace Layer {
        class Base;
    }
    namespace Optimizer {
        class Base;
    }

    struct CustomObjects;

    namespace Layer {
        using Factory = std::function<std::shared_ptr<Base>(const PropertyTree& config, const CustomObjects& custom_objects)>;
    }

    namespace Optimizer {
        using Factory = std::function<std::shared_ptr<Base>(const PropertyTree& config)>;
    }

    // Caller-supplied name overrides, consulted before the built-in registries.
    struct CustomObjects {
        std::map<std::string, Layer::Factory> layers{};
        std::map<std::string, Optimizer::Factory> optimizers{};
        std::map<std::string, Loss::Function> losses{};
        std::map<std::string, Metric::Function> metrics{};
        std::map<std::string, Activation::Function> activations{};
    };
}

#endif // LATTICE_COMMON_CUSTOM_OBJECTS_HPP
