#ifndef LATTICE_LAYER_SPLIT_HPP
#define LATTICE_LAYER_SPLIT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Lattice::Layer::Details {
    struct SplitOptions {
        std::int64_t num_splits{2};
    };

    // Cuts the last axis into `num_splits` equal parts, one output tensor each.
    class Split : public Base {
    public:
        explicit Split(SplitOptions options = {}, LayerOptions common = {})
            : Base("Split", std::move(common)), options_(options)
        {
            if (options_.num_splits < 1) {
                throw ConfigError("Split layer " + name() + " needs at least one split.");
            }
        }

        static std::shared_ptr<Split> from_config(const PropertyTree& config)
        {
            SplitOptions options{};
            options.num_splits = Common::Config::get_numeric<std::int64_t>(config, "num_splits", "Split config");
            return std::make_shared<Split>(options, read_options(config));
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments&) override
        {
            auto parts = torch::chunk(inputs.front(), options_.num_splits, -1);
            return std::vector<torch::Tensor>(parts.begin(), parts.end());
        }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            const auto& shape = input_shapes.front();
            if (shape.size() < 2 || shape.back() == kUnknownDim || shape.back() % options_.num_splits != 0) {
                throw ShapeError("Split layer " + name() + " cannot divide shape " + format_shape(shape) + " into "
                                 + std::to_string(options_.num_splits) + " equal parts.");
            }
            auto part = shape;
            part.back() = shape.back() / options_.num_splits;
            return std::vector<Shape>(static_cast<std::size_t>(options_.num_splits), part);
        }

        [[nodiscard]] PropertyTree get_config() const override
        {
            auto config = Base::get_config();
            config.put("num_splits", options_.num_splits);
            return config;
        }

        [[nodiscard]] std::shared_ptr<Base> instantiate(const PropertyTree& config) const override
        {
            return from_config(config);
        }

    private:
        SplitOptions options_{};
    };
}

#endif // LATTICE_LAYER_SPLIT_HPP
