#ifndef LATTICE_GRAPH_ARENA_HPP
#define LATTICE_GRAPH_ARENA_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Lattice {
    using TensorId = std::uint64_t;
    using LayerId = std::uint64_t;

    namespace Layer {
        class Base;
    }
}

namespace Lattice::Graph {
    // Origin of a graph tensor: output `tensor_index` of node `node_index` of `layer`.
    struct History {
        LayerId layer{0};
        std::size_t node_index{0};
        std::size_t tensor_index{0};
    };

    // Process-wide handle table. Layers and tensors receive stable integer handles at
    // creation; tensor origins live here instead of on the tensors themselves. Layers are
    // referenced weakly: they are owned by the models and tensor handles that use them.
    class Arena {
    public:
        static Arena& global()
        {
            static Arena instance{};
            return instance;
        }

        Arena(const Arena&) = delete;
        Arena& operator=(const Arena&) = delete;

        [[nodiscard]] TensorId next_tensor_id() noexcept { return next_tensor_.fetch_add(1); }
        [[nodiscard]] LayerId next_layer_id() noexcept { return next_layer_.fetch_add(1); }

        // 1-based counter per prefix, used for default names such as "dense_3".
        [[nodiscard]] std::size_t next_uid(const std::string& prefix)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return ++uids_[prefix];
        }

        void reset_uids()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            uids_.clear();
        }

        void record_history(TensorId tensor, History history)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            history_[tensor] = history;
        }

        void forget_history(TensorId tensor)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            history_.erase(tensor);
        }

        [[nodiscard]] std::optional<History> history(TensorId tensor) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = history_.find(tensor);
            if (it == history_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        void register_layer(LayerId id, const std::shared_ptr<Layer::Base>& layer)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            layers_[id] = layer;
        }

        // Called by a layer on destruction.
        void release_layer(LayerId id)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            layers_.erase(id);
        }

        // Null once the layer has been destroyed.
        [[nodiscard]] std::shared_ptr<Layer::Base> layer(LayerId id) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = layers_.find(id);
            if (it == layers_.end()) {
                return nullptr;
            }
            return it->second.lock();
        }

        [[nodiscard]] std::size_t live_layers() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return layers_.size();
        }

        // Drops every history entry, layer registration and name counter; existing handles become plain values.
        void clear()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            history_.clear();
            layers_.clear();
            uids_.clear();
        }

    private:
        Arena() = default;

        mutable std::mutex mutex_{};
        std::atomic<TensorId> next_tensor_{1};
        std::atomic<LayerId> next_layer_{1};
        std::unordered_map<std::string, std::size_t> uids_{};
        std::unordered_map<TensorId, History> history_{};
        std::unordered_map<LayerId, std::weak_ptr<Layer::Base>> layers_{};
    };
}

namespace Lattice {
    inline void clear_session() { Graph::Arena::global().clear(); }
}

#endif // LATTICE_GRAPH_ARENA_HPP
