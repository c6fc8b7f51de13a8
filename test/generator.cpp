#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "check.hpp"

using namespace Lattice;
using Check::expect;
using Check::expect_throws;

namespace {
    BatchGenerator counting_generator(std::shared_ptr<std::int64_t> counter) {
        return [counter]() {
            Batch batch{};
            const auto value = static_cast<double>((*counter)++);
            batch.x = {torch::full({2, 3}, value)};
            batch.y = {torch::full({2, 1}, value)};
            return batch;
        };
    }

    std::shared_ptr<Sequential> make_model() {
        auto model = std::make_shared<Sequential>("streamed");
        model->add(Layer::Dense({.units = 1}, Activation::Identity, {.name = "linear", .input_shape = Shape{3}}));
        return model;
    }
}

void a_single_worker_delivers_batches_in_generation_order() {
    auto counter = std::make_shared<std::int64_t>(0);
    GeneratorQueue queue(counting_generator(counter), 2, 1);
    queue.start();
    for (int expected = 0; expected < 6; ++expected) {
        const auto batch = queue.get();
        expect(batch.x.front()[0][0].item<double>() == static_cast<double>(expected));
    }
    queue.stop();
    expect(!queue.running());
}

void zero_workers_draw_on_the_calling_thread() {
    auto counter = std::make_shared<std::int64_t>(10);
    GeneratorQueue queue(counting_generator(counter), 4, 0);
    expect(queue.get().x.front()[0][0].item<double>() == 10.0);
    expect(queue.get().x.front()[0][0].item<double>() == 11.0);
}

void a_generator_failure_reaches_the_consumer() {
    auto calls = std::make_shared<std::atomic<int>>(0);
    GeneratorQueue queue([calls]() -> Batch {
        if (++*calls > 2) {
            throw std::runtime_error("source exhausted");
        }
        return Batch{{torch::zeros({1, 3})}, {torch::zeros({1, 1})}, std::nullopt};
    }, 1, 1);
    queue.start();
    queue.get();
    queue.get();
    expect_throws<std::runtime_error>([&] { (void)(queue.get()); });
}

void queue_construction_checks_its_arguments() {
    expect_throws<TypeError>([&] { (void)GeneratorQueue(BatchGenerator{}); });
    expect_throws<UnsupportedError>([&] { (void)GeneratorQueue([]() { return Batch{}; }, 10, 1, true); });

    GeneratorQueue idle([]() { return Batch{}; }, 1, 1);
    expect_throws<PreconditionError>([&] { (void)(idle.get()); });
}

void fit_evaluate_and_predict_run_from_generators() {
    const auto model = make_model();
    model->compile({.optimizer = Optimizer::SGD({.learning_rate = 0.01}), .loss = "mse"});

    auto counter = std::make_shared<std::int64_t>(0);
    GeneratorOptions options{};
    options.steps = 3;
    options.epochs = 2;
    options.workers = 2;
    const auto history = model->fit_generator(counting_generator(counter), options);
    expect((history.epoch == std::vector<std::size_t>{0, 1}));
    expect(history.history.at("loss").size() == 2);
    expect(*counter >= 6);

    GeneratorOptions single{};
    single.steps = 2;
    const auto scores = model->evaluate_generator(counting_generator(std::make_shared<std::int64_t>(0)), single);
    expect(scores.size() == 1);

    const auto predictions = model->predict_generator(counting_generator(std::make_shared<std::int64_t>(0)), single);
    expect((predictions.front().sizes() == torch::IntArrayRef{4, 1}));
}

void generator_training_requires_compilation() {
    const auto model = make_model();
    GeneratorOptions options{};
    expect_throws<PreconditionError>([&] { (void)(model->fit_generator(counting_generator(std::make_shared<std::int64_t>(0)), options)); });
}

int main() {
    return Check::run({
        {"a single worker delivers batches in generation order", a_single_worker_delivers_batches_in_generation_order},
        {"zero workers draw on the calling thread", zero_workers_draw_on_the_calling_thread},
        {"a generator failure reaches the consumer", a_generator_failure_reaches_the_consumer},
        {"queue construction checks its arguments", queue_construction_checks_its_arguments},
        {"fit, evaluate and predict run from generators", fit_evaluate_and_predict_run_from_generators},
        {"generator training requires compilation", generator_training_requires_compilation},
    });
}
