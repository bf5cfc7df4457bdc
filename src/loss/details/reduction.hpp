#ifndef NABLA_LOSS_REDUCTION_HPP
#define NABLA_LOSS_REDUCTION_HPP

#include <cstdint>
#include <type_traits>

#include <torch/torch.h>

namespace Nabla::Loss::Details {

    enum class Reduction { Mean, Sum };

    // Use: to_torch_reduction<torch::nn::functional::MSELossFuncOptions>(Reduction::Mean)
    template <typename Options>
    inline typename Options::reduction_t to_torch_reduction(Reduction r) {
        using RT = typename Options::reduction_t;
        static_assert(!std::is_void_v<RT>, "Options must define nested type 'reduction_t'");

        switch (r) {
            case Reduction::Sum:  return RT{torch::kSum};
            case Reduction::Mean:
            default:              return RT{torch::kMean};
        }
    }

    // Divisor applied to an elementwise gradient so it matches the reduced loss.
    inline double reduction_scale(Reduction reduction, std::int64_t count) {
        if (reduction == Reduction::Sum || count <= 0) {
            return 1.0;
        }
        return static_cast<double>(count);
    }

}

#endif // NABLA_LOSS_REDUCTION_HPP
