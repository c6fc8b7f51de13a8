#ifndef LATTICE_LAYER_MASKING_HPP
#define LATTICE_LAYER_MASKING_HPP

#include <memory>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Lattice::Layer::Details {
    struct MaskingOptions {
        double mask_value{0.0};
    };

    // Zeroes timesteps whose features all equal `mask_value` and emits a (batch, time) mask downstream.
    class Masking : public Base {
    public:
        explicit Masking(MaskingOptions options = {}, LayerOptions common = {})
            : Base("Masking", std::move(common)), options_(options)
        {
            set_supports_masking(true);
        }

        static std::shared_ptr<Masking> from_config(const PropertyTree& config)
        {
            MaskingOptions options{};
            options.mask_value = config.get<double>("mask_value", 0.0);
            return std::make_shared<Masking>(options, read_options(config));
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments&) override
        {
            const auto& input = inputs.front();
            const auto keep = input.ne(options_.mask_value).any(-1, /*keepdim=*/true);
            return {input * keep.to(input.scalar_type())};
        }

        [[nodiscard]] std::vector<Mask> compute_mask(const std::vector<Tensor>& inputs, const std::vector<Mask>&) const override
        {
            return {make_mask(inputs.front().shape())};
        }

        [[nodiscard]] PropertyTree get_config() const override
        {
            auto config = Base::get_config();
            config.put("mask_value", options_.mask_value);
            return config;
        }

        [[nodiscard]] std::shared_ptr<Base> instantiate(const PropertyTree& config) const override
        {
            return from_config(config);
        }

    private:
        MaskingOptions options_{};
    };
}

#endif // LATTICE_LAYER_MASKING_HPP
