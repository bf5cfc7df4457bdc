#ifndef NABLA_RMSPROP_HPP
#define NABLA_RMSPROP_HPP

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Nabla::Optimizer::Details {

    struct RMSpropOptions {
        double learning_rate{1e-2};
        double alpha{0.99};
        double eps{1e-8};
        double weight_decay{0.0};
        double momentum{0.0};
        bool centered{false};
    };

    struct RMSpropDescriptor {
        RMSpropOptions options{};
    };

    inline torch::optim::RMSpropOptions to_torch_options(const RMSpropOptions& options) {
        if (options.learning_rate < 0.0)
            throw std::invalid_argument("RMSprop learning rate must be non-negative.");
        if (options.alpha < 0.0)
            throw std::invalid_argument("RMSprop alpha must be non-negative.");
        if (options.momentum < 0.0)
            throw std::invalid_argument("RMSprop momentum must be non-negative.");

        torch::optim::RMSpropOptions torch_options(options.learning_rate);
        torch_options = torch_options.alpha(options.alpha);
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.momentum(options.momentum);
        torch_options = torch_options.centered(options.centered);
        return torch_options;
    }

    class RMSProp : public torch::optim::RMSprop {
    public:
        explicit RMSProp(const torch::optim::RMSpropOptions& options)
            : torch::optim::RMSprop(std::vector<torch::optim::OptimizerParamGroup>{}, options),
              momentum_(options.momentum() != 0.0),
              centered_(options.centered()) {}

        // square_avg always; momentum_buffer and grad_avg only when configured.
        void add_slot(std::vector<at::Tensor> params) {
            {
                torch::NoGradGuard no_grad{};
                auto& state_map = this->state();
                for (const auto& param : params) {
                    if (!param.defined()) continue;
                    auto* key = param.unsafeGetTensorImpl();
                    if (state_map.find(key) != state_map.end()) continue;

                    auto state = std::make_unique<torch::optim::RMSpropParamState>();
                    state->square_avg(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                    if (momentum_) {
                        state->momentum_buffer(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                    }
                    if (centered_) {
                        state->grad_avg(torch::zeros_like(param, torch::MemoryFormat::Preserve));
                    }
                    state_map.insert({key, std::move(state)});
                }
            }
            this->add_param_group(torch::optim::OptimizerParamGroup(std::move(params)));
        }

    private:
        bool momentum_{false};
        bool centered_{false};
    };

}

#endif // NABLA_RMSPROP_HPP
