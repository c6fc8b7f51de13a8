#ifndef LATTICE_LAYER_DENSE_HPP
#define LATTICE_LAYER_DENSE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/apply.hpp"
#include "../../common/custom_objects.hpp"
#include "../../initialization/apply.hpp"
#include "../base.hpp"

namespace Lattice::Layer::Details {
    struct DenseOptions {
        std::int64_t units{};
        bool use_bias{true};
    };

    // Fully connected layer over the last axis, backed by torch::nn::Linear.
    class Dense : public Base {
    public:
        Dense(DenseOptions options, ::Lattice::Activation::Descriptor activation, LayerOptions common = {},
              ::Lattice::Initialization::Descriptor kernel_initializer = ::Lattice::Initialization::GlorotUniform,
              ::Lattice::Initialization::Descriptor bias_initializer = ::Lattice::Initialization::Zeros)
            : Base("Dense", std::move(common)),
              options_(options),
              activation_(std::move(activation)),
              kernel_initializer_(kernel_initializer),
              bias_initializer_(bias_initializer)
        {
            if (options_.units <= 0) {
                throw ConfigError("Dense layer " + name() + " requires a positive number of units.");
            }
            set_supports_masking(true);
        }

        static std::shared_ptr<Dense> from_config(const PropertyTree& config, const CustomObjects& custom_objects = {})
        {
            DenseOptions options{};
            options.units = Common::Config::get_numeric<std::int64_t>(config, "units", "Dense config");
            options.use_bias = config.get<bool>("use_bias", true);
            auto activation = ::Lattice::Activation::from_string(config.get<std::string>("activation", "linear"), custom_objects.activations);
            return std::make_shared<Dense>(
                options, std::move(activation), read_options(config),
                ::Lattice::Initialization::from_string(config.get<std::string>("kernel_initializer", "glorot_uniform")),
                ::Lattice::Initialization::from_string(config.get<std::string>("bias_initializer", "zeros")));
        }

        void build(const std::vector<Shape>& input_shapes) override
        {
            const auto& shape = input_shapes.front();
            if (shape.size() < 2 || shape.back() == kUnknownDim) {
                throw ShapeError("Dense layer " + name() + " needs a defined last input dimension, found shape " + format_shape(shape));
            }
            const auto torch_options = torch::nn::LinearOptions(shape.back(), options_.units).bias(options_.use_bias);
            linear_ = torch::nn::Linear(torch_options);
            linear_->to(dtype());
            track_weight("kernel", linear_->weight, kernel_initializer_);
            if (options_.use_bias) {
                track_weight("bias", linear_->bias, bias_initializer_);
            }
            set_built(true);
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments&) override
        {
            if (!linear_) {
                throw PreconditionError("Dense layer " + name() + " was executed before being built.");
            }
            auto output = linear_->forward(inputs.front());
            return {::Lattice::Activation::Details::apply(activation_, std::move(output))};
        }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            auto shape = input_shapes.front();
            if (shape.empty()) {
                throw ShapeError("Dense layer " + name() + " cannot take a scalar input.");
            }
            shape.back() = options_.units;
            return {shape};
        }

        [[nodiscard]] PropertyTree get_config() const override
        {
            auto config = Base::get_config();
            config.put("units", options_.units);
            config.put("activation", ::Lattice::Activation::to_string(activation_));
            config.put("use_bias", options_.use_bias);
            config.put("kernel_initializer", ::Lattice::Initialization::to_string(kernel_initializer_));
            config.put("bias_initializer", ::Lattice::Initialization::to_string(bias_initializer_));
            return config;
        }

        // A custom activation is carried over when the config still names it.
        [[nodiscard]] std::shared_ptr<Base> instantiate(const PropertyTree& config) const override
        {
            CustomObjects custom_objects{};
            if (activation_.type == ::Lattice::Activation::Type::Custom) {
                custom_objects.activations.emplace(activation_.name, activation_.function);
            }
            return from_config(config, custom_objects);
        }

        [[nodiscard]] const DenseOptions& options() const noexcept { return options_; }

    private:
        DenseOptions options_{};
        ::Lattice::Activation::Descriptor activation_{};
        ::Lattice::Initialization::Descriptor kernel_initializer_{};
        ::Lattice::Initialization::Descriptor bias_initializer_{};
        torch::nn::Linear linear_{nullptr};
    };
}

#endif // LATTICE_LAYER_DENSE_HPP
