#ifndef LATTICE_OPTIMIZER_HPP
#define LATTICE_OPTIMIZER_HPP

#include <memory>
#include <string>

#include "base.hpp"
#include "registry.hpp"

#include "details/adam.hpp"
#include "details/external.hpp"
#include "details/sgd.hpp"


namespace Lattice::Optimizer {
    using SGDOptions = Details::SGDOptions;
    using AdamOptions = Details::AdamOptions;
    using AdamWOptions = Details::AdamWOptions;
    using BackendFactory = Details::BackendFactory;


    [[nodiscard]] inline auto SGD(const SGDOptions& options = {}) -> std::shared_ptr<Base> {
        return std::make_shared<Details::SGD>(options);
    }

    [[nodiscard]] inline auto Adam(const AdamOptions& options = {}) -> std::shared_ptr<Base> {
        return std::make_shared<Details::Adam>(options);
    }

    [[nodiscard]] inline auto AdamW(const AdamWOptions& options = {}) -> std::shared_ptr<Base> {
        return std::make_shared<Details::AdamW>(options);
    }

    // Wraps a caller-built backend optimizer; models compiled with it cannot save their optimizer.
    [[nodiscard]] inline auto External(std::string name, BackendFactory factory) -> std::shared_ptr<Base> {
        return std::make_shared<Details::External>(std::move(name), std::move(factory));
    }

}

#endif // LATTICE_OPTIMIZER_HPP
