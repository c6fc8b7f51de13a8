#ifndef LATTICE_LAYER_ACTIVATION_HPP
#define LATTICE_LAYER_ACTIVATION_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../../activation/apply.hpp"
#include "../../common/custom_objects.hpp"
#include "../base.hpp"

namespace Lattice::Layer::Details {
    class ActivationLayer : public Base {
    public:
        explicit ActivationLayer(::Lattice::Activation::Descriptor activation, LayerOptions common = {})
            : Base("Activation", std::move(common)), activation_(std::move(activation))
        {
            set_supports_masking(true);
        }

        static std::shared_ptr<ActivationLayer> from_config(const PropertyTree& config, const CustomObjects& custom_objects = {})
        {
            auto activation = ::Lattice::Activation::from_string(
                Common::Config::get_string(config, "activation", "Activation config"), custom_objects.activations);
            return std::make_shared<ActivationLayer>(std::move(activation), read_options(config));
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments&) override
        {
            return {::Lattice::Activation::Details::apply(activation_, inputs.front())};
        }

        [[nodiscard]] PropertyTree get_config() const override
        {
            auto config = Base::get_config();
            config.put("activation", ::Lattice::Activation::to_string(activation_));
            return config;
        }

        [[nodiscard]] std::shared_ptr<Base> instantiate(const PropertyTree& config) const override
        {
            CustomObjects custom_objects{};
            if (activation_.type == ::Lattice::Activation::Type::Custom) {
                custom_objects.activations.emplace(activation_.name, activation_.function);
            }
            return from_config(config, custom_objects);
        }

    private:
        ::Lattice::Activation::Descriptor activation_{};
    };
}

#endif // LATTICE_LAYER_ACTIVATION_HPP
