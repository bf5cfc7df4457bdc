#ifndef NABLA_SGD_HPP
#define NABLA_SGD_HPP

#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Nabla::Optimizer::Details {

    struct SGDOptions {
        double learning_rate{1e-2};
        double momentum{0.0};
        double dampening{0.0};
        double weight_decay{0.0};
        bool nesterov{false};
    };

    struct SGDDescriptor {
        SGDOptions options{};
    };

    inline torch::optim::SGDOptions to_torch_options(const SGDOptions& options) {
        if (options.learning_rate < 0.0)
            throw std::invalid_argument("SGD learning rate must be non-negative.");
        if (options.momentum < 0.0)
            throw std::invalid_argument("SGD momentum must be non-negative.");
        if (options.nesterov && (options.momentum <= 0.0 || options.dampening != 0.0))
            throw std::invalid_argument("SGD nesterov requires a positive momentum and zero dampening.");

        torch::optim::SGDOptions torch_options(options.learning_rate);
        torch_options = torch_options.momentum(options.momentum);
        torch_options = torch_options.dampening(options.dampening);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.nesterov(options.nesterov);
        return torch_options;
    }

    // Starts without parameters; every layer joins later as its own param group.
    class SGD : public torch::optim::SGD {
    public:
        explicit SGD(const torch::optim::SGDOptions& options)
            : torch::optim::SGD(std::vector<torch::optim::OptimizerParamGroup>{}, options) {}

        // Momentum buffers are created by step() from the first gradient.
        void add_slot(std::vector<at::Tensor> params) {
            this->add_param_group(torch::optim::OptimizerParamGroup(std::move(params)));
        }
    };

} // namespace Nabla::Optimizer::Details

#endif //NABLA_SGD_HPP
