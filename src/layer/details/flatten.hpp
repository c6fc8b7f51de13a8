#ifndef LATTICE_LAYER_FLATTEN_HPP
#define LATTICE_LAYER_FLATTEN_HPP

#include <memory>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Lattice::Layer::Details {
    // Collapses every axis after the batch axis.
    class Flatten : public Base {
    public:
        explicit Flatten(LayerOptions common = {}) : Base("Flatten", std::move(common))
        {
            flatten_ = torch::nn::Flatten(torch::nn::FlattenOptions().start_dim(1).end_dim(-1));
        }

        static std::shared_ptr<Flatten> from_config(const PropertyTree& config)
        {
            return std::make_shared<Flatten>(read_options(config));
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments&) override
        {
            return {flatten_->forward(inputs.front())};
        }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            const auto& shape = input_shapes.front();
            if (shape.size() < 2) {
                throw ShapeError("Flatten layer " + name() + " expects at least 2 dimensions, found shape " + format_shape(shape));
            }
            std::int64_t features = 1;
            for (std::size_t axis = 1; axis < shape.size(); ++axis) {
                if (shape[axis] == kUnknownDim) {
                    features = kUnknownDim;
                    break;
                }
                features *= shape[axis];
            }
            return {Shape{shape.front(), features}};
        }

        [[nodiscard]] std::shared_ptr<Base> instantiate(const PropertyTree& config) const override
        {
            return from_config(config);
        }

    private:
        torch::nn::Flatten flatten_{nullptr};
    };
}

#endif // LATTICE_LAYER_FLATTEN_HPP
