#ifndef LATTICE_OPTIMIZER_BASE_HPP
#define LATTICE_OPTIMIZER_BASE_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "../common/json.hpp"
#include "../graph/tensor.hpp"

namespace Lattice::Optimizer {
    // One optimizer-owned state tensor (momentum buffer, moment estimate, step counter).
    struct StateTensor {
        std::string name{};
        torch::Tensor value{};
    };

    // Serializable optimizer bound to a parameter list. Concrete classes wrap a torch::optim optimizer.
    class Base : public Common::Json::Configurable {
    public:
        ~Base() override = default;

        // (Re)creates the backend optimizer on `parameters`; previous state is discarded.
        void bind(std::vector<torch::Tensor> parameters)
        {
            parameters_ = std::move(parameters);
            instance_ = make(parameters_);
            if (!instance_) {
                throw PreconditionError("Optimizer " + class_name() + " could not be created for the given parameters.");
            }
        }

        [[nodiscard]] bool bound() const noexcept { return instance_ != nullptr; }
        [[nodiscard]] const std::vector<torch::Tensor>& parameters() const noexcept { return parameters_; }

        void zero_grad() { instance().zero_grad(); }

        void step() { instance().step(); }

        // Creates every state slot up front so that saved values can be assigned before the first step.
        virtual void ensure_state_initialized() = 0;

        // Current state tensors in a stable order; empty until the state exists.
        [[nodiscard]] virtual std::vector<StateTensor> weights() const = 0;

        // Assigns values in the order of weights(). Nothing is written when a count or shape differs.
        virtual void set_weights(const std::vector<torch::Tensor>& values)
        {
            const auto current = weights();
            validate_state(current, values);
            torch::NoGradGuard no_grad{};
            for (std::size_t index = 0; index < values.size(); ++index) {
                auto target = current[index].value;
                target.copy_(values[index].to(target.device(), target.scalar_type()));
            }
        }

        // Wrappers around a caller-built backend optimizer cannot be saved.
        [[nodiscard]] virtual bool is_external() const noexcept { return false; }

        // Unbound copy with the same hyperparameters.
        [[nodiscard]] virtual std::shared_ptr<Base> fresh() const = 0;

    protected:
        [[nodiscard]] virtual std::unique_ptr<torch::optim::Optimizer> make(const std::vector<torch::Tensor>& parameters) const = 0;

        [[nodiscard]] torch::optim::Optimizer& instance() const
        {
            if (!instance_) {
                throw PreconditionError("Optimizer " + class_name() + " is not bound to any parameters; compile the model first.");
            }
            return *instance_;
        }

        void validate_state(const std::vector<StateTensor>& current, const std::vector<torch::Tensor>& values) const
        {
            if (current.size() != values.size()) {
                throw CardinalityError("Optimizer " + class_name() + " holds " + std::to_string(current.size())
                                       + " state tensors but " + std::to_string(values.size()) + " were provided.");
            }
            for (std::size_t index = 0; index < values.size(); ++index) {
                if (current[index].value.sizes() != values[index].sizes()) {
                    throw ShapeError("Optimizer state '" + current[index].name + "' has shape "
                                     + format_shape(shape_of(current[index].value)) + " but the provided value has shape "
                                     + format_shape(shape_of(values[index])) + ".");
                }
            }
        }

    private:
        std::vector<torch::Tensor> parameters_{};
        std::unique_ptr<torch::optim::Optimizer> instance_{};
    };

    using OptimizerPtr = std::shared_ptr<Base>;
}

#endif // LATTICE_OPTIMIZER_BASE_HPP
