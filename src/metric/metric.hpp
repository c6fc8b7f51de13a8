#ifndef LATTICE_METRIC_HPP
#define LATTICE_METRIC_HPP

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../loss/loss.hpp"

namespace Lattice::Metric {
    // Returns a scalar for the batch.
    using Function = std::function<torch::Tensor(const torch::Tensor& prediction, const torch::Tensor& target)>;

    struct Objective {
        std::string name{};
        Function function{};

        Objective() = default;
        Objective(const char* name) : name(name) {}
        Objective(std::string name) : name(std::move(name)) {}
        Objective(std::string name, Function function) : name(std::move(name)), function(std::move(function)) {}
    };

    // Same metrics for every output, or a list per output name.
    using Spec = std::variant<std::vector<Objective>, std::map<std::string, std::vector<Objective>>>;

    namespace Details {
        inline torch::Tensor binary_accuracy(const torch::Tensor& prediction, const torch::Tensor& target)
        {
            return (prediction.round() == target.to(prediction.scalar_type())).to(torch::kFloat32).mean();
        }

        inline torch::Tensor categorical_accuracy(const torch::Tensor& prediction, const torch::Tensor& target)
        {
            return (prediction.argmax(-1) == target.argmax(-1)).to(torch::kFloat32).mean();
        }

        inline torch::Tensor sparse_categorical_accuracy(const torch::Tensor& prediction, const torch::Tensor& target)
        {
            auto labels = target.to(torch::kLong);
            if (labels.dim() == prediction.dim()) {
                labels = labels.squeeze(-1);
            }
            return (prediction.argmax(-1) == labels).to(torch::kFloat32).mean();
        }
    }

    inline Function builtin(const std::string& name, std::int64_t output_width)
    {
        if (name == "accuracy" || name == "acc") {
            return output_width == 1 ? Function(Details::binary_accuracy) : Function(Details::categorical_accuracy);
        }
        if (name == "binary_accuracy") return Details::binary_accuracy;
        if (name == "categorical_accuracy") return Details::categorical_accuracy;
        if (name == "sparse_categorical_accuracy") return Details::sparse_categorical_accuracy;
        if (auto loss = Loss::builtin(name)) {
            return [loss](const torch::Tensor& prediction, const torch::Tensor& target) {
                return loss(prediction, target).mean();
            };
        }
        return {};
    }

    // `output_width` is the last dimension of the output the metric watches; it selects the accuracy flavour.
    inline Function resolve(const Objective& objective, std::int64_t output_width,
                            const std::map<std::string, Function>& custom = {})
    {
        if (objective.function) {
            return objective.function;
        }
        if (const auto it = custom.find(objective.name); it != custom.end()) {
            return it->second;
        }
        if (auto function = builtin(objective.name, output_width)) {
            return function;
        }
        throw ValidationError("Unknown metric function: " + objective.name);
    }
}

#endif // LATTICE_METRIC_HPP
