#ifndef LATTICE_LAYER_MERGE_HPP
#define LATTICE_LAYER_MERGE_HPP

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Lattice::Layer::Details {
    // Shared behaviour of layers combining two or more tensors into one.
    class Merge : public Base {
    public:
        using Base::Base;

        void build(const std::vector<Shape>& input_shapes) override
        {
            if (input_shapes.size() < 2) {
                throw CardinalityError("A merge layer should be called on a list of at least 2 inputs. Got "
                                       + std::to_string(input_shapes.size()) + " inputs.");
            }
            set_built(true);
        }

        // A merged output is masked as soon as one input is.
        [[nodiscard]] std::vector<Mask> compute_mask(const std::vector<Tensor>& inputs, const std::vector<Mask>& masks) const override
        {
            const bool any_mask = std::any_of(masks.begin(), masks.end(), [](const Mask& mask) { return mask.has_value(); });
            if (!any_mask) {
                return {Mask{}};
            }
            return {make_mask(compute_output_shape(shapes_of(inputs)).front())};
        }

    protected:
        static std::vector<Shape> shapes_of(const std::vector<Tensor>& inputs)
        {
            std::vector<Shape> shapes;
            for (const auto& input : inputs) {
                shapes.push_back(input.shape());
            }
            return shapes;
        }

        static std::int64_t merge_dim(std::int64_t lhs, std::int64_t rhs, const std::string& layer)
        {
            if (lhs == kUnknownDim) return rhs;
            if (rhs == kUnknownDim || lhs == rhs) return lhs;
            throw ShapeError("Layer " + layer + " cannot merge dimensions " + std::to_string(lhs) + " and " + std::to_string(rhs) + ".");
        }
    };

    class Add : public Merge {
    public:
        explicit Add(LayerOptions common = {}) : Merge("Add", std::move(common))
        {
            set_supports_masking(true);
        }

        static std::shared_ptr<Add> from_config(const PropertyTree& config)
        {
            return std::make_shared<Add>(read_options(config));
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments&) override
        {
            auto output = inputs.front();
            for (std::size_t index = 1; index < inputs.size(); ++index) {
                output = output + inputs[index];
            }
            return {output};
        }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            auto shape = input_shapes.front();
            for (std::size_t index = 1; index < input_shapes.size(); ++index) {
                const auto& other = input_shapes[index];
                if (other.size() != shape.size()) {
                    throw ShapeError("Layer " + name() + " requires inputs of equal rank, got " + format_shape(shape)
                                     + " and " + format_shape(other));
                }
                for (std::size_t axis = 0; axis < shape.size(); ++axis) {
                    shape[axis] = merge_dim(shape[axis], other[axis], name());
                }
            }
            return {shape};
        }

        [[nodiscard]] std::shared_ptr<Base> instantiate(const PropertyTree& config) const override
        {
            return from_config(config);
        }
    };

    struct ConcatenateOptions {
        std::int64_t axis{-1};
    };

    class Concatenate : public Merge {
    public:
        explicit Concatenate(ConcatenateOptions options = {}, LayerOptions common = {})
            : Merge("Concatenate", std::move(common)), options_(options)
        {
            set_supports_masking(true);
        }

        static std::shared_ptr<Concatenate> from_config(const PropertyTree& config)
        {
            ConcatenateOptions options{};
            options.axis = config.get<std::int64_t>("axis", -1);
            return std::make_shared<Concatenate>(options, read_options(config));
        }

        std::vector<torch::Tensor> forward(const std::vector<torch::Tensor>& inputs, const CallArguments&) override
        {
            return {torch::cat(inputs, options_.axis)};
        }

        [[nodiscard]] std::vector<Shape> compute_output_shape(const std::vector<Shape>& input_shapes) const override
        {
            auto shape = input_shapes.front();
            const auto rank = static_cast<std::int64_t>(shape.size());
            const auto axis = options_.axis < 0 ? options_.axis + rank : options_.axis;
            if (axis < 0 || axis >= rank) {
                throw ShapeError("Concatenate axis " + std::to_string(options_.axis) + " is out of range for inputs of shape " + format_shape(shape));
            }
            for (std::size_t index = 1; index < input_shapes.size(); ++index) {
                const auto& other = input_shapes[index];
                if (static_cast<std::int64_t>(other.size()) != rank) {
                    throw ShapeError("Layer " + name() + " requires inputs of equal rank, got " + format_shape(shape)
                                     + " and " + format_shape(other));
                }
                for (std::int64_t dim = 0; dim < rank; ++dim) {
                    if (dim == axis) {
                        shape[dim] = (shape[dim] == kUnknownDim || other[dim] == kUnknownDim) ? kUnknownDim : shape[dim] + other[dim];
                    } else {
                        shape[dim] = merge_dim(shape[dim], other[dim], name());
                    }
                }
            }
            return {shape};
        }

        [[nodiscard]] PropertyTree get_config() const override
        {
            auto config = Base::get_config();
            config.put("axis", options_.axis);
            return config;
        }

        [[nodiscard]] std::shared_ptr<Base> instantiate(const PropertyTree& config) const override
        {
            return from_config(config);
        }

    private:
        ConcatenateOptions options_{};
    };
}

#endif // LATTICE_LAYER_MERGE_HPP
