#ifndef NABLA_ADAGRAD_HPP
#define NABLA_ADAGRAD_HPP

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Nabla::Optimizer::Details {

    struct AdagradOptions {
        double learning_rate{1e-2};
        double lr_decay{0.0};
        double weight_decay{0.0};
        double initial_accumulator_value{0.0};
        double eps{1e-10};
    };

    struct AdagradDescriptor {
        AdagradOptions options{};
    };

    inline torch::optim::AdagradOptions to_torch_options(const AdagradOptions& options) {
        if (options.learning_rate < 0.0)
            throw std::invalid_argument("Adagrad learning rate must be non-negative.");
        if (options.initial_accumulator_value < 0.0)
            throw std::invalid_argument("Adagrad initial accumulator value must be non-negative.");

        torch::optim::AdagradOptions torch_options(options.learning_rate);
        torch_options = torch_options.lr_decay(options.lr_decay);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.initial_accumulator_value(options.initial_accumulator_value);
        torch_options = torch_options.eps(options.eps);
        return torch_options;
    }

    // torch::optim::Adagrad only creates accumulators in its constructor, so
    // parameters added later must have their "sum" seeded here before any step().
    class Adagrad : public torch::optim::Adagrad {
    public:
        explicit Adagrad(const torch::optim::AdagradOptions& options)
            : torch::optim::Adagrad(std::vector<torch::optim::OptimizerParamGroup>{}, options),
              initial_accumulator_value_(options.initial_accumulator_value()) {}

        void add_slot(std::vector<at::Tensor> params) {
            {
                torch::NoGradGuard no_grad{};
                auto& state_map = this->state();
                for (const auto& param : params) {
                    if (!param.defined()) continue;
                    auto* key = param.unsafeGetTensorImpl();
                    if (state_map.find(key) != state_map.end()) continue;

                    auto state = std::make_unique<torch::optim::AdagradParamState>();
                    state->step(0);
                    state->sum(torch::full_like(param, initial_accumulator_value_));
                    state_map.insert({key, std::move(state)});
                }
            }
            this->add_param_group(torch::optim::OptimizerParamGroup(std::move(params)));
        }

    private:
        double initial_accumulator_value_{0.0};
    };

}

#endif // NABLA_ADAGRAD_HPP
