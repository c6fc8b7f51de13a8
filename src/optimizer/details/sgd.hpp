#ifndef LATTICE_OPTIMIZER_SGD_HPP
#define LATTICE_OPTIMIZER_SGD_HPP

#include <memory>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/config.hpp"
#include "../base.hpp"

namespace Lattice::Optimizer::Details {

    struct SGDOptions {
        double learning_rate{1e-2};
        double momentum{0.0};
        double dampening{0.0};
        double weight_decay{0.0};
        bool nesterov{false};
    };

    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options) {
        torch::optim::SGDOptions torch_options(options.learning_rate);
        torch_options = torch_options.momentum(options.momentum);
        torch_options = torch_options.dampening(options.dampening);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.nesterov(options.nesterov);
        return torch_options;
    }

    class SGD : public Base {
    public:
        explicit SGD(SGDOptions options = {}) : options_(options) {
            if (options_.learning_rate < 0.0) {
                throw ConfigError("SGD learning rate must be non-negative, got " + std::to_string(options_.learning_rate) + ".");
            }
            if (options_.nesterov && (options_.momentum <= 0.0 || options_.dampening != 0.0)) {
                throw ConfigError("SGD with nesterov momentum requires a positive momentum and zero dampening.");
            }
        }

        [[nodiscard]] const SGDOptions& options() const noexcept { return options_; }

        [[nodiscard]] std::string class_name() const override { return "SGD"; }

        [[nodiscard]] PropertyTree get_config() const override {
            PropertyTree config;
            config.put("learning_rate", options_.learning_rate);
            config.put("momentum", options_.momentum);
            config.put("dampening", options_.dampening);
            config.put("weight_decay", options_.weight_decay);
            config.put("nesterov", options_.nesterov);
            return config;
        }

        static std::shared_ptr<SGD> from_config(const PropertyTree& config) {
            SGDOptions options{};
            options.learning_rate = Common::Config::get_numeric_or(config, "learning_rate", options.learning_rate);
            options.momentum = Common::Config::get_numeric_or(config, "momentum", options.momentum);
            options.dampening = Common::Config::get_numeric_or(config, "dampening", options.dampening);
            options.weight_decay = Common::Config::get_numeric_or(config, "weight_decay", options.weight_decay);
            options.nesterov = config.get<bool>("nesterov", options.nesterov);
            return std::make_shared<SGD>(options);
        }

        // Momentum buffers start at zero; without momentum there is no state.
        void ensure_state_initialized() override {
            if (options_.momentum == 0.0) return;

            torch::NoGradGuard no_grad{};
            auto& state_map = instance().state();
            for (const auto& param : parameters()) {
                if (!param.defined() || !param.requires_grad()) continue;

                auto* key = param.unsafeGetTensorImpl();
                auto it = state_map.find(key);
                if (it == state_map.end()) {
                    auto state = std::make_unique<torch::optim::SGDParamState>();
                    state->momentum_buffer(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                    state_map.insert({key, std::move(state)});
                } else {
                    auto& state = static_cast<torch::optim::SGDParamState&>(*it->second);
                    if (!state.momentum_buffer().defined()) {
                        state.momentum_buffer(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                    }
                }
            }
        }

        [[nodiscard]] std::vector<StateTensor> weights() const override {
            std::vector<StateTensor> tensors;
            if (!bound()) return tensors;
            const auto& state_map = instance().state();
            for (std::size_t index = 0; index < parameters().size(); ++index) {
                const auto it = state_map.find(parameters()[index].unsafeGetTensorImpl());
                if (it == state_map.end()) continue;
                const auto& state = static_cast<const torch::optim::SGDParamState&>(*it->second);
                if (state.momentum_buffer().defined()) {
                    tensors.push_back({"SGD/momentum_buffer_" + std::to_string(index), state.momentum_buffer()});
                }
            }
            return tensors;
        }

        [[nodiscard]] std::shared_ptr<Base> fresh() const override { return std::make_shared<SGD>(options_); }

    protected:
        [[nodiscard]] std::unique_ptr<torch::optim::Optimizer> make(const std::vector<torch::Tensor>& parameters) const override {
            return std::make_unique<torch::optim::SGD>(parameters, to_torch_options(options_));
        }

    private:
        SGDOptions options_{};
    };

} // namespace Lattice::Optimizer::Details

#endif // LATTICE_OPTIMIZER_SGD_HPP
