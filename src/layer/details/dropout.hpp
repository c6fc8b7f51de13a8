#ifndef LATTICE_LAYER_DROPOUT_HPP
#define LATTICE_LAYER_DROPOUT_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Lattice::Layer::Details {
    struct DropoutOptions {
        double rate{0.5};
    };

    // Inverted dropout, active only when the call argument "training" is true.
    class Dropout : public Base {
    public:
        explicit Dropout(DropoutOptions options, LayerOptions common = {})
            : Base("Dropout", std::move(common)), options_(options)
        {
            if (options_.rate < 0.0 || options_.rate >= 1.0) {
                throw ConfigError("Dropout rate of layer " + name() + " must be in the range [0, 1).");
            }
            set_supports_masking(true);
        }

        static std::shared_ptr<Dropout> from_config(const PropertyTree& config)
        {
            DropoutOptions options{};
            options.rate = Common::Config::get_numeric<double>(config, "rate", "Dropout config");
            return std::make_shared<Dropout>(options, read_options(config));
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments& arguments) override
        {
            const bool training = Arguments::find_bool(arguments, "training").value_or(false);
            if (!training || options_.rate == 0.0) {
                return {inputs.front()};
            }
            return {torch::dropout(inputs.front(), options_.rate, /*train=*/true)};
        }

        [[nodiscard]] PropertyTree get_config() const override
        {
            auto config = Base::get_config();
            config.put("rate", options_.rate);
            return config;
        }

        [[nodiscard]] std::shared_ptr<Base> instantiate(const PropertyTree& config) const override
        {
            return from_config(config);
        }

    private:
        DropoutOptions options_{};
    };
}

#endif // LATTICE_LAYER_DROPOUT_HPP
