#ifndef LATTICE_OPTIMIZER_ADAM_HPP
#define LATTICE_OPTIMIZER_ADAM_HPP
// Adam / AdamW over torch::optim. Both share the moment bookkeeping; only the
// backend class, the defaults and the registered name differ.

#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include <torch/torch.h>

#include "../../common/config.hpp"
#include "../base.hpp"

namespace Lattice::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    struct AdamWOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-2};
        bool amsgrad{false};
    };

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options) {
        torch::optim::AdamWOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    template <class Options>
    PropertyTree write_adam_config(const Options& options) {
        PropertyTree config;
        config.put("learning_rate", options.learning_rate);
        config.put("beta_1", options.beta1);
        config.put("beta_2", options.beta2);
        config.put("epsilon", options.eps);
        config.put("weight_decay", options.weight_decay);
        config.put("amsgrad", options.amsgrad);
        return config;
    }

    template <class Options>
    Options read_adam_config(const PropertyTree& config) {
        Options options{};
        options.learning_rate = Common::Config::get_numeric_or(config, "learning_rate", options.learning_rate);
        options.beta1 = Common::Config::get_numeric_or(config, "beta_1", options.beta1);
        options.beta2 = Common::Config::get_numeric_or(config, "beta_2", options.beta2);
        options.eps = Common::Config::get_numeric_or(config, "epsilon", options.eps);
        options.weight_decay = Common::Config::get_numeric_or(config, "weight_decay", options.weight_decay);
        options.amsgrad = config.get<bool>("amsgrad", options.amsgrad);
        return options;
    }

    // State per parameter, in order: step, exp_avg, exp_avg_sq and, with amsgrad, max_exp_avg_sq.
    template <class Options, class TorchOptimizer, class ParamState>
    class AdamFamily : public Base {
    public:
        AdamFamily(std::string name, Options options) : name_(std::move(name)), options_(options) {
            if (options_.learning_rate < 0.0) {
                throw ConfigError(name_ + " learning rate must be non-negative, got " + std::to_string(options_.learning_rate) + ".");
            }
            if (options_.beta1 < 0.0 || options_.beta1 >= 1.0 || options_.beta2 < 0.0 || options_.beta2 >= 1.0) {
                throw ConfigError(name_ + " betas must lie in [0, 1).");
            }
        }

        [[nodiscard]] const Options& options() const noexcept { return options_; }

        [[nodiscard]] std::string class_name() const override { return name_; }

        [[nodiscard]] PropertyTree get_config() const override { return write_adam_config(options_); }

        void ensure_state_initialized() override {
            torch::NoGradGuard no_grad{};
            auto& state_map = instance().state();
            for (const auto& param : parameters()) {
                if (!param.defined() || !param.requires_grad()) continue;

                auto* key = param.unsafeGetTensorImpl();
                if (state_map.find(key) != state_map.end()) continue;

                auto state = std::make_unique<ParamState>();
                state->step(0);
                state->exp_avg(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                state->exp_avg_sq(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                if (options_.amsgrad) {
                    state->max_exp_avg_sq(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                }
                state_map.insert({key, std::move(state)});
            }
        }

        [[nodiscard]] std::vector<StateTensor> weights() const override {
            std::vector<StateTensor> tensors;
            if (!bound()) return tensors;
            const auto& state_map = instance().state();
            for (std::size_t index = 0; index < parameters().size(); ++index) {
                const auto it = state_map.find(parameters()[index].unsafeGetTensorImpl());
                if (it == state_map.end()) continue;
                const auto& state = static_cast<const ParamState&>(*it->second);
                const auto suffix = "_" + std::to_string(index);
                tensors.push_back({name_ + "/step" + suffix, torch::tensor(static_cast<std::int64_t>(state.step()), torch::kLong)});
                tensors.push_back({name_ + "/exp_avg" + suffix, state.exp_avg()});
                tensors.push_back({name_ + "/exp_avg_sq" + suffix, state.exp_avg_sq()});
                if (options_.amsgrad) {
                    tensors.push_back({name_ + "/max_exp_avg_sq" + suffix, state.max_exp_avg_sq()});
                }
            }
            return tensors;
        }

        // The step counter is not a tensor in the backend state, so it is assigned by value.
        void set_weights(const std::vector<torch::Tensor>& values) override {
            const auto current = weights();
            validate_state(current, values);

            torch::NoGradGuard no_grad{};
            auto& state_map = instance().state();
            const std::size_t stride = options_.amsgrad ? 4 : 3;
            std::size_t cursor = 0;
            for (const auto& param : parameters()) {
                const auto it = state_map.find(param.unsafeGetTensorImpl());
                if (it == state_map.end()) continue;
                auto& state = static_cast<ParamState&>(*it->second);
                state.step(values[cursor].item<std::int64_t>());
                state.exp_avg().copy_(values[cursor + 1].to(param.device(), param.scalar_type()));
                state.exp_avg_sq().copy_(values[cursor + 2].to(param.device(), param.scalar_type()));
                if (options_.amsgrad) {
                    state.max_exp_avg_sq().copy_(values[cursor + 3].to(param.device(), param.scalar_type()));
                }
                cursor += stride;
            }
        }

    protected:
        [[nodiscard]] std::unique_ptr<torch::optim::Optimizer> make(const std::vector<torch::Tensor>& parameters) const override {
            return std::make_unique<TorchOptimizer>(parameters, to_torch_options(options_));
        }

    private:
        std::string name_{};
        Options options_{};
    };

    class Adam : public AdamFamily<AdamOptions, torch::optim::Adam, torch::optim::AdamParamState> {
    public:
        explicit Adam(AdamOptions options = {}) : AdamFamily("Adam", options) {}

        static std::shared_ptr<Adam> from_config(const PropertyTree& config) {
            return std::make_shared<Adam>(read_adam_config<AdamOptions>(config));
        }

        [[nodiscard]] std::shared_ptr<Base> fresh() const override { return std::make_shared<Adam>(options()); }
    };

    class AdamW : public AdamFamily<AdamWOptions, torch::optim::AdamW, torch::optim::AdamWParamState> {
    public:
        explicit AdamW(AdamWOptions options = {}) : AdamFamily("AdamW", options) {}

        static std::shared_ptr<AdamW> from_config(const PropertyTree& config) {
            return std::make_shared<AdamW>(read_adam_config<AdamWOptions>(config));
        }

        [[nodiscard]] std::shared_ptr<Base> fresh() const override { return std::make_shared<AdamW>(options()); }
    };

} // namespace Lattice::Optimizer::Details

#endif // LATTICE_OPTIMIZER_ADAM_HPP
