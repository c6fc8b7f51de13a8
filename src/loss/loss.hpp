#ifndef LATTICE_LOSS_HPP
#define LATTICE_LOSS_HPP

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "details/bce.hpp"
#include "details/ce.hpp"
#include "details/helper.hpp"
#include "details/mae.hpp"
#include "details/mse.hpp"

namespace Lattice::Loss {
    // Per-sample loss: reduces every axis but the batch (and time) axes.
    using Function = std::function<torch::Tensor(const torch::Tensor& prediction, const torch::Tensor& target)>;

    // A loss referenced by name; `function` is filled for callables supplied inline.
    struct Objective {
        std::string name{};
        Function function{};

        Objective() = default;
        Objective(const char* name) : name(name) {}
        Objective(std::string name) : name(std::move(name)) {}
        Objective(std::string name, Function function) : name(std::move(name)), function(std::move(function)) {}
    };

    // One loss for every output, one per output in order, or one per output name.
    using Spec = std::variant<Objective, std::vector<Objective>, std::map<std::string, Objective>>;

    inline Function builtin(const std::string& name)
    {
        if (name == "mse" || name == "mean_squared_error") return Details::mean_squared_error;
        if (name == "mae" || name == "mean_absolute_error") return Details::mean_absolute_error;
        if (name == "binary_crossentropy") return Details::binary_crossentropy;
        if (name == "categorical_crossentropy") return Details::categorical_crossentropy;
        if (name == "sparse_categorical_crossentropy") return Details::sparse_categorical_crossentropy;
        return {};
    }

    // Inline function, then caller overrides, then built-ins.
    inline Function resolve(const Objective& objective, const std::map<std::string, Function>& custom = {})
    {
        if (objective.function) {
            return objective.function;
        }
        if (const auto it = custom.find(objective.name); it != custom.end()) {
            return it->second;
        }
        if (auto function = builtin(objective.name)) {
            return function;
        }
        throw ValidationError("Unknown loss function: " + objective.name);
    }

    inline torch::Tensor compute(const Function& function, const torch::Tensor& prediction, const torch::Tensor& target,
                                 const std::optional<torch::Tensor>& sample_weight = std::nullopt)
    {
        return Details::weighted_mean(function(prediction, target), sample_weight);
    }
}

#endif // LATTICE_LOSS_HPP
