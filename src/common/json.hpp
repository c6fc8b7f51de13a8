#ifndef LATTICE_COMMON_JSON_HPP
#define LATTICE_COMMON_JSON_HPP

#include <any>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "config.hpp"
#include "error.hpp"

namespace Lattice::Common::Json {
    // Anything that can export itself as {class_name, config}.
    class Configurable {
    public:
        virtual ~Configurable() = default;
        [[nodiscard]] virtual std::string class_name() const = 0;
        [[nodiscard]] virtual PropertyTree get_config() const = 0;
    };

    // A function referenced by its registered name.
    struct NamedCallable {
        std::string name{};
    };

    // A class referenced by its registered name.
    struct TypeTag {
        std::string name{};
    };

    struct Null {};

    class Value;
    using Array = std::vector<Value>;
    using Object = std::vector<std::pair<std::string, Value>>;

    class Value {
    public:
        using Storage = std::variant<Null, bool, std::int64_t, double, std::string, torch::Tensor,
                                     std::shared_ptr<const Configurable>, NamedCallable, TypeTag, PropertyTree,
                                     Array, Object, std::any>;

        Value() = default;
        Value(Null) {}
        Value(bool value) : storage_(value) {}
        Value(int value) : storage_(static_cast<std::int64_t>(value)) {}
        Value(std::int64_t value) : storage_(value) {}
        Value(double value) : storage_(value) {}
        Value(const char* value) : storage_(std::string(value)) {}
        Value(std::string value) : storage_(std::move(value)) {}
        Value(torch::Tensor value) : storage_(std::move(value)) {}
        Value(std::shared_ptr<const Configurable> value) : storage_(std::move(value)) {}
        Value(NamedCallable value) : storage_(std::move(value)) {}
        Value(TypeTag value) : storage_(std::move(value)) {}
        Value(PropertyTree value) : storage_(std::move(value)) {}
        Value(Array value) : storage_(std::move(value)) {}
        Value(Object value) : storage_(std::move(value)) {}

        // Arbitrary payloads are accepted here and rejected at encode time.
        static Value opaque(std::any payload)
        {
            Value value;
            value.storage_ = std::move(payload);
            return value;
        }

        [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    private:
        Storage storage_{};
    };

    namespace Details {
        inline PropertyTree encode_tensor(const torch::Tensor& tensor)
        {
            PropertyTree tree;
            if (!tensor.defined()) {
                return tree;
            }
            const auto values = tensor.detach().to(torch::kCPU);
            if (values.dim() == 0) {
                if (values.is_floating_point()) {
                    tree.put_value(values.item<double>());
                } else if (values.scalar_type() == torch::kBool) {
                    tree.put_value(values.item<bool>());
                } else {
                    tree.put_value(values.item<std::int64_t>());
                }
                return tree;
            }
            for (std::int64_t index = 0; index < values.size(0); ++index) {
                Config::push_back(tree, encode_tensor(values[index]));
            }
            return tree;
        }
    }

    inline PropertyTree encode(const Value& value);

    inline PropertyTree encode_configurable(const Configurable& configurable)
    {
        PropertyTree tree;
        tree.put("class_name", configurable.class_name());
        tree.add_child("config", configurable.get_config());
        return tree;
    }

    // JSON tree for `value`. Raises SerializationError on payloads with no JSON form.
    inline PropertyTree encode(const Value& value)
    {
        return std::visit(
            [](const auto& concrete) -> PropertyTree {
                using T = std::decay_t<decltype(concrete)>;
                PropertyTree tree;
                if constexpr (std::is_same_v<T, Null>) {
                    return tree;
                } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int64_t>
                                     || std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
                    tree.put_value(concrete);
                    return tree;
                } else if constexpr (std::is_same_v<T, torch::Tensor>) {
                    return Details::encode_tensor(concrete);
                } else if constexpr (std::is_same_v<T, std::shared_ptr<const Configurable>>) {
                    if (!concrete) {
                        return tree;
                    }
                    return encode_configurable(*concrete);
                } else if constexpr (std::is_same_v<T, NamedCallable> || std::is_same_v<T, TypeTag>) {
                    tree.put_value(concrete.name);
                    return tree;
                } else if constexpr (std::is_same_v<T, PropertyTree>) {
                    return concrete;
                } else if constexpr (std::is_same_v<T, Array>) {
                    for (const auto& element : concrete) {
                        Config::push_back(tree, encode(element));
                    }
                    return tree;
                } else if constexpr (std::is_same_v<T, Object>) {
                    for (const auto& [key, element] : concrete) {
                        tree.push_back({key, encode(element)});
                    }
                    return tree;
                } else {
                    const std::string type_name = concrete.has_value() ? concrete.type().name() : "empty";
                    throw SerializationError("Not JSON Serializable: value of type " + type_name);
                }
            },
            value.storage());
    }

    inline std::string dumps(const Value& value)
    {
        return Config::to_json(encode(value));
    }
}

#endif // LATTICE_COMMON_JSON_HPP
