#ifndef LATTICE_GRAPH_TENSOR_HPP
#define LATTICE_GRAPH_TENSOR_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"
#include "arena.hpp"

namespace Lattice {
    inline constexpr std::int64_t kUnknownDim = -1;

    // Dimension sizes with the batch axis first; kUnknownDim marks a free dimension.
    using Shape = std::vector<std::int64_t>;

    inline std::string format_shape(const Shape& shape)
    {
        std::ostringstream stream;
        stream << '(';
        for (std::size_t index = 0; index < shape.size(); ++index) {
            if (index > 0) {
                stream << ", ";
            }
            if (shape[index] == kUnknownDim) {
                stream << "None";
            } else {
                stream << shape[index];
            }
        }
        if (shape.size() == 1) {
            stream << ',';
        }
        stream << ')';
        return stream.str();
    }

    inline Shape shape_of(const torch::Tensor& tensor)
    {
        const auto sizes = tensor.sizes();
        return Shape(sizes.begin(), sizes.end());
    }

    // True when `concrete` fits `declared`, free dimensions matching anything.
    inline bool shape_compatible(const Shape& declared, const Shape& concrete) noexcept
    {
        if (declared.size() != concrete.size()) {
            return false;
        }
        for (std::size_t index = 0; index < declared.size(); ++index) {
            if (declared[index] != kUnknownDim && concrete[index] != kUnknownDim && declared[index] != concrete[index]) {
                return false;
            }
        }
        return true;
    }

    inline std::string dtype_to_string(torch::ScalarType dtype)
    {
        switch (dtype) {
            case torch::kFloat16: return "float16";
            case torch::kFloat32: return "float32";
            case torch::kFloat64: return "float64";
            case torch::kInt32: return "int32";
            case torch::kInt64: return "int64";
            case torch::kBool: return "bool";
            default: break;
        }
        throw TypeError(std::string("Unsupported dtype '") + c10::toString(dtype) + "'.");
    }

    inline torch::ScalarType dtype_from_string(const std::string& name)
    {
        if (name == "float16") return torch::kFloat16;
        if (name == "float32") return torch::kFloat32;
        if (name == "float64") return torch::kFloat64;
        if (name == "int32") return torch::kInt32;
        if (name == "int64") return torch::kInt64;
        if (name == "bool") return torch::kBool;
        throw ConfigError("Unknown dtype '" + name + "'.");
    }

    namespace Details {
        struct TensorRecord {
            TensorId id{0};
            Shape shape{};
            torch::ScalarType dtype{torch::kFloat32};
            bool sparse{false};
            std::string name{};
            torch::Tensor constant{};
        };
    }

    // Symbolic tensor handle. Copies share the same identity; the origin of a graph tensor
    // is looked up in the arena by id. A handle returned by a layer call keeps the producing
    // layer alive; the copies stored in the producer's own nodes do not.
    class Tensor {
    public:
        Tensor() = default;

        static Tensor create(Shape shape, torch::ScalarType dtype, std::string name, bool sparse = false,
                             torch::Tensor constant = {})
        {
            auto record = std::make_shared<Details::TensorRecord>();
            record->id = Graph::Arena::global().next_tensor_id();
            record->shape = std::move(shape);
            record->dtype = dtype;
            record->sparse = sparse;
            record->name = std::move(name);
            record->constant = std::move(constant);
            Tensor tensor;
            tensor.record_ = std::move(record);
            return tensor;
        }

        [[nodiscard]] bool valid() const noexcept { return record_ != nullptr; }

        [[nodiscard]] TensorId id() const { return record().id; }
        [[nodiscard]] const Shape& shape() const { return record().shape; }
        [[nodiscard]] torch::ScalarType dtype() const { return record().dtype; }
        [[nodiscard]] bool sparse() const { return record().sparse; }
        [[nodiscard]] const std::string& name() const { return record().name; }
        [[nodiscard]] bool has_constant() const { return record().constant.defined(); }
        [[nodiscard]] const torch::Tensor& constant() const { return record().constant; }

        // A graph tensor was produced by a layer call (or an input layer).
        [[nodiscard]] std::optional<Graph::History> history() const
        {
            if (!valid()) {
                return std::nullopt;
            }
            return Graph::Arena::global().history(record_->id);
        }

        [[nodiscard]] bool is_graph_tensor() const { return history().has_value(); }

        [[nodiscard]] const std::shared_ptr<const Layer::Base>& owner() const noexcept { return owner_; }

        [[nodiscard]] Tensor owned_by(std::shared_ptr<const Layer::Base> layer) const
        {
            Tensor tensor = *this;
            tensor.owner_ = std::move(layer);
            return tensor;
        }

        [[nodiscard]] Tensor unowned() const
        {
            Tensor tensor = *this;
            tensor.owner_.reset();
            return tensor;
        }

        friend bool operator==(const Tensor& lhs, const Tensor& rhs) noexcept { return lhs.record_ == rhs.record_; }
        friend bool operator!=(const Tensor& lhs, const Tensor& rhs) noexcept { return !(lhs == rhs); }

    private:
        [[nodiscard]] const Details::TensorRecord& record() const
        {
            if (!record_) {
                throw TypeError("Use of an empty tensor handle.");
            }
            return *record_;
        }

        std::shared_ptr<const Details::TensorRecord> record_{};
        std::shared_ptr<const Layer::Base> owner_{};
    };

    using Mask = std::optional<Tensor>;

    // Either a symbolic handle or a raw backend value to be wrapped by an input layer.
    using InputValue = std::variant<Tensor, torch::Tensor>;

    // A tensor handle with no origin, to be wrapped by an input layer before use.
    inline Tensor placeholder(Shape batch_shape, torch::ScalarType dtype = torch::kFloat32, std::string name = {})
    {
        if (name.empty()) {
            name = "placeholder_" + std::to_string(Graph::Arena::global().next_uid("placeholder"));
        }
        return Tensor::create(std::move(batch_shape), dtype, std::move(name));
    }
}

#endif // LATTICE_GRAPH_TENSOR_HPP
