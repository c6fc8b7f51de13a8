#ifndef LATTICE_OPTIMIZER_EXTERNAL_HPP
#define LATTICE_OPTIMIZER_EXTERNAL_HPP

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../base.hpp"

namespace Lattice::Optimizer::Details {

    using BackendFactory = std::function<std::unique_ptr<torch::optim::Optimizer>(const std::vector<torch::Tensor>&)>;

    // Delegates to a backend optimizer built by the caller. Its state is opaque and is never saved.
    class External : public Base {
    public:
        External(std::string name, BackendFactory factory) : name_(std::move(name)), factory_(std::move(factory)) {
            if (!factory_) {
                throw TypeError("External optimizer '" + name_ + "' needs a backend factory.");
            }
        }

        [[nodiscard]] std::string class_name() const override { return "External"; }

        [[nodiscard]] PropertyTree get_config() const override {
            PropertyTree config;
            config.put("name", name_);
            return config;
        }

        void ensure_state_initialized() override {}

        [[nodiscard]] std::vector<StateTensor> weights() const override { return {}; }

        [[nodiscard]] bool is_external() const noexcept override { return true; }

        [[nodiscard]] std::shared_ptr<Base> fresh() const override { return std::make_shared<External>(name_, factory_); }

    protected:
        [[nodiscard]] std::unique_ptr<torch::optim::Optimizer> make(const std::vector<torch::Tensor>& parameters) const override {
            return factory_(parameters);
        }

    private:
        std::string name_{};
        BackendFactory factory_{};
    };

} // namespace Lattice::Optimizer::Details

#endif // LATTICE_OPTIMIZER_EXTERNAL_HPP
