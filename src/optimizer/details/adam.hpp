#ifndef NABLA_ADAM_HPP
#define NABLA_ADAM_HPP
// Adam / AdamW wrappers. Parameters join one layer at a time through add_slot,
// which also creates the moment estimates for the new parameters.

#include <memory>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Nabla::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{0.0};
        bool amsgrad{false};
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    namespace detail {
        inline void validate_adam(double learning_rate, double beta1, double beta2, double eps) {
            if (learning_rate < 0.0)
                throw std::invalid_argument("Adam learning rate must be non-negative.");
            if (beta1 < 0.0 || beta1 >= 1.0 || beta2 < 0.0 || beta2 >= 1.0)
                throw std::invalid_argument("Adam betas must be in the range [0, 1).");
            if (eps < 0.0)
                throw std::invalid_argument("Adam epsilon must be non-negative.");
        }

        template <class ParamState>
        void seed_moments(torch::optim::Optimizer& optimizer, const std::vector<at::Tensor>& params, bool amsgrad) {
            torch::NoGradGuard no_grad{};
            auto& state_map = optimizer.state();
            for (const auto& param : params) {
                if (!param.defined()) continue;
                auto* key = param.unsafeGetTensorImpl();
                if (state_map.find(key) != state_map.end()) continue;

                auto state = std::make_unique<ParamState>();
                state->step(0);
                state->exp_avg(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                state->exp_avg_sq(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                if (amsgrad) {
                    state->max_exp_avg_sq(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                }
                state_map.insert({key, std::move(state)});
            }
        }
    }

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        detail::validate_adam(options.learning_rate, options.beta1, options.beta2, options.eps);
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    struct AdamWOptions {
        double learning_rate{1e-3};
        double beta1{0.9};
        double beta2{0.999};
        double eps{1e-8};
        double weight_decay{1e-2};
        bool amsgrad{false};
    };

    struct AdamWDescriptor {
        AdamWOptions options{};
    };

    inline torch::optim::AdamWOptions to_torch_options(const AdamWOptions& options) {
        detail::validate_adam(options.learning_rate, options.beta1, options.beta2, options.eps);
        torch::optim::AdamWOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

    class Adam : public torch::optim::Adam {
    public:
        explicit Adam(const torch::optim::AdamOptions& options)
            : torch::optim::Adam(std::vector<torch::optim::OptimizerParamGroup>{}, options),
              amsgrad_(options.amsgrad()) {}

        void add_slot(std::vector<at::Tensor> params) {
            detail::seed_moments<torch::optim::AdamParamState>(*this, params, amsgrad_);
            this->add_param_group(torch::optim::OptimizerParamGroup(std::move(params)));
        }

    private:
        bool amsgrad_{false};
    };

    class AdamW : public torch::optim::AdamW {
    public:
        explicit AdamW(const torch::optim::AdamWOptions& options)
            : torch::optim::AdamW(std::vector<torch::optim::OptimizerParamGroup>{}, options),
              amsgrad_(options.amsgrad()) {}

        void add_slot(std::vector<at::Tensor> params) {
            detail::seed_moments<torch::optim::AdamWParamState>(*this, params, amsgrad_);
            this->add_param_group(torch::optim::OptimizerParamGroup(std::move(params)));
        }

    private:
        bool amsgrad_{false};
    };

}

#endif // NABLA_ADAM_HPP
