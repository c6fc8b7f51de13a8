#ifndef LATTICE_LAYER_HPP
#define LATTICE_LAYER_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <utility>

#include "../activation/activation.hpp"
#include "../initialization/initialization.hpp"
#include "base.hpp"
#include "registry.hpp"

namespace Lattice::Layer {
    using InputOptions = Details::InputOptions;
    using DenseOptions = Details::DenseOptions;
    using DropoutOptions = Details::DropoutOptions;
    using MaskingOptions = Details::MaskingOptions;
    using ConcatenateOptions = Details::ConcatenateOptions;
    using SplitOptions = Details::SplitOptions;

    using InputLayer = Details::InputLayer;

    [[nodiscard]] inline auto Dense(const DenseOptions& options,
                                    ::Lattice::Activation::Descriptor activation = ::Lattice::Activation::Identity,
                                    LayerOptions common = {},
                                    ::Lattice::Initialization::Descriptor kernel_initializer = ::Lattice::Initialization::GlorotUniform,
                                    ::Lattice::Initialization::Descriptor bias_initializer = ::Lattice::Initialization::Zeros)
        -> std::shared_ptr<Details::Dense>
    {
        return std::make_shared<Details::Dense>(options, std::move(activation), std::move(common), kernel_initializer, bias_initializer);
    }

    [[nodiscard]] inline auto Activation(::Lattice::Activation::Descriptor activation, LayerOptions common = {})
        -> std::shared_ptr<Details::ActivationLayer>
    {
        return std::make_shared<Details::ActivationLayer>(std::move(activation), std::move(common));
    }

    [[nodiscard]] inline auto Dropout(const DropoutOptions& options, LayerOptions common = {}) -> std::shared_ptr<Details::Dropout>
    {
        return std::make_shared<Details::Dropout>(options, std::move(common));
    }

    [[nodiscard]] inline auto Flatten(LayerOptions common = {}) -> std::shared_ptr<Details::Flatten>
    {
        return std::make_shared<Details::Flatten>(std::move(common));
    }

    [[nodiscard]] inline auto Masking(const MaskingOptions& options = {}, LayerOptions common = {}) -> std::shared_ptr<Details::Masking>
    {
        return std::make_shared<Details::Masking>(options, std::move(common));
    }

    [[nodiscard]] inline auto Add(LayerOptions common = {}) -> std::shared_ptr<Details::Add>
    {
        return std::make_shared<Details::Add>(std::move(common));
    }

    [[nodiscard]] inline auto Concatenate(const ConcatenateOptions& options = {}, LayerOptions common = {})
        -> std::shared_ptr<Details::Concatenate>
    {
        return std::make_shared<Details::Concatenate>(options, std::move(common));
    }

    [[nodiscard]] inline auto Split(const SplitOptions& options = {}, LayerOptions common = {}) -> std::shared_ptr<Details::Split>
    {
        return std::make_shared<Details::Split>(options, std::move(common));
    }

    [[nodiscard]] inline auto Input(InputOptions options) -> std::shared_ptr<Details::InputLayer>
    {
        return Details::InputLayer::create(std::move(options));
    }
}

namespace Lattice {
    using InputOptions = Layer::InputOptions;

    // Output tensor of a new input layer.
    [[nodiscard]] inline Tensor Input(InputOptions options = {})
    {
        return Layer::Details::InputLayer::create(std::move(options))->input();
    }
}

#endif // LATTICE_LAYER_HPP
