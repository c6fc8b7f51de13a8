#ifndef LATTICE_MODEL_GENERATOR_HPP
#define LATTICE_MODEL_GENERATOR_HPP

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"

namespace Lattice {
    // One batch drawn from a generator. `y` stays empty for prediction.
    struct Batch {
        std::vector<torch::Tensor> x{};
        std::vector<torch::Tensor> y{};
        std::optional<torch::Tensor> sample_weight{};
    };

    // Called repeatedly for the next batch; never called concurrently.
    using BatchGenerator = std::function<Batch()>;

    struct GeneratorOptions {
        std::size_t steps{1};             // batches per epoch (or in total for evaluate/predict)
        std::size_t epochs{1};            // fit only
        std::size_t max_queue_size{10};
        std::size_t workers{1};           // 0 draws on the calling thread
        bool use_multiprocessing{false};
        int verbose{0};
        std::ostream* stream{&std::cout};
    };

    // Bounded producer/consumer queue fed by `workers` threads. The first exception thrown by
    // the generator stops the producers and is rethrown by the next get().
    class GeneratorQueue {
    public:
        GeneratorQueue(BatchGenerator generator, std::size_t max_queue_size = 10, std::size_t workers = 1,
                       bool use_multiprocessing = false)
            : generator_(std::move(generator)),
              max_queue_size_(std::max<std::size_t>(max_queue_size, 1)),
              workers_count_(workers)
        {
            if (!generator_) {
                throw TypeError("GeneratorQueue needs a callable generator.");
            }
            if (use_multiprocessing) {
                throw UnsupportedError("Worker processes are not available; use threads (use_multiprocessing = false).");
            }
        }

        GeneratorQueue(const GeneratorQueue&) = delete;
        GeneratorQueue& operator=(const GeneratorQueue&) = delete;

        ~GeneratorQueue() { stop(); }

        void start()
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!workers_.empty()) return;
            stop_ = false;
            workers_.reserve(workers_count_);
            for (std::size_t i = 0; i < workers_count_; ++i) {
                workers_.emplace_back([this] { worker_loop(); });
            }
        }

        void stop()
        {
            {
                std::lock_guard<std::mutex> lk(mu_);
                stop_ = true;
            }
            space_cv_.notify_all();
            ready_cv_.notify_all();
            for (auto& t : workers_) {
                if (t.joinable()) t.join();
            }
            workers_.clear();
            std::lock_guard<std::mutex> lk(mu_);
            queue_.clear();
        }

        [[nodiscard]] bool running() const
        {
            std::lock_guard<std::mutex> lk(mu_);
            return !workers_.empty() && !stop_;
        }

        // Next batch, blocking until one is ready.
        Batch get()
        {
            if (workers_count_ == 0) {
                std::lock_guard<std::mutex> guard(generator_mu_);
                return generator_();
            }

            std::unique_lock<std::mutex> lk(mu_);
            if (workers_.empty()) {
                throw PreconditionError("GeneratorQueue::get called before start().");
            }
            ready_cv_.wait(lk, [this] { return !queue_.empty() || first_exc_ || stop_; });
            if (first_exc_) {
                auto ex = first_exc_;
                first_exc_ = nullptr;
                lk.unlock();
                std::rethrow_exception(ex);
            }
            if (queue_.empty()) {
                throw PreconditionError("GeneratorQueue was stopped while waiting for a batch.");
            }
            auto batch = std::move(queue_.front());
            queue_.pop_front();
            lk.unlock();
            space_cv_.notify_one();
            return batch;
        }

    private:
        void worker_loop() noexcept
        {
            for (;;) {
                {
                    std::unique_lock<std::mutex> lk(mu_);
                    space_cv_.wait(lk, [this] { return stop_ || queue_.size() < max_queue_size_; });
                    if (stop_) return;
                }
                try {
                    Batch batch;
                    {
                        std::lock_guard<std::mutex> guard(generator_mu_);
                        batch = generator_();
                    }
                    {
                        std::lock_guard<std::mutex> lk(mu_);
                        if (stop_) return;
                        queue_.push_back(std::move(batch));
                    }
                    ready_cv_.notify_one();
                } catch (...) {
                    capture_exception(std::current_exception());
                    return;
                }
            }
        }

        void capture_exception(std::exception_ptr eptr)
        {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (!first_exc_) first_exc_ = std::move(eptr);
                stop_ = true;
            }
            ready_cv_.notify_all();
            space_cv_.notify_all();
        }

        BatchGenerator generator_;
        std::size_t max_queue_size_{10};
        std::size_t workers_count_{1};

        mutable std::mutex mu_;
        std::mutex generator_mu_;
        std::condition_variable ready_cv_;
        std::condition_variable space_cv_;
        std::deque<Batch> queue_;
        std::vector<std::thread> workers_;
        bool stop_{true};
        std::exception_ptr first_exc_{nullptr};
    };
}

#endif // LATTICE_MODEL_GENERATOR_HPP
