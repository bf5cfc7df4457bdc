#ifndef NABLA_CONV_HPP
#define NABLA_CONV_HPP
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../activation/activation.hpp"
#include "../../common/error.hpp"
#include "../../common/shape.hpp"
#include "../../initialization/apply.hpp"
#include "../../initialization/initialization.hpp"
#include "context.hpp"

namespace Nabla::Layer::Details {

    struct Conv2dOptions {
        std::int64_t in_channels{};  // 0: inferred from the predecessor
        std::int64_t out_channels{};
        std::vector<std::int64_t> kernel_size{3, 3};
        std::vector<std::int64_t> stride{1, 1};
        std::vector<std::int64_t> padding{0, 0};
        std::vector<std::int64_t> dilation{1, 1};
        std::int64_t groups{1};
        bool bias{true};
    };

    struct Conv2dDescriptor {
        Conv2dOptions options{};
        ::Nabla::Activation::Descriptor activation{::Nabla::Activation::Identity};
        ::Nabla::Initialization::Descriptor initialization{::Nabla::Initialization::Default};
    };

    namespace detail {
        inline void require_pair(const std::vector<std::int64_t>& values, const char* field, std::int64_t minimum)
        {
            if (values.size() != 2 || values[0] < minimum || values[1] < minimum) {
                throw std::invalid_argument(std::string("Conv2d ") + field + " must hold two values >= "
                                            + std::to_string(minimum) + ".");
            }
        }
    }

    // Samples are [channels, height, width]; weights keep torch's
    // [out_channels, in_channels / groups, kh, kw] layout.
    class Conv2dImpl {
    public:
        static constexpr std::string_view kind{"Conv2d"};

        explicit Conv2dImpl(Conv2dOptions options,
                            ::Nabla::Initialization::Descriptor initialization = ::Nabla::Initialization::Default)
            : options_(std::move(options)), initialization_(initialization)
        {
            if (options_.out_channels <= 0 || options_.in_channels < 0) {
                throw std::invalid_argument("Conv2d layers require positive channel counts.");
            }
            detail::require_pair(options_.kernel_size, "kernel_size", 1);
            detail::require_pair(options_.stride, "stride", 1);
            detail::require_pair(options_.padding, "padding", 0);
            detail::require_pair(options_.dilation, "dilation", 1);
            if (options_.groups <= 0 || options_.out_channels % options_.groups != 0) {
                throw std::invalid_argument("Conv2d groups must be positive and divide out_channels.");
            }
        }

        [[nodiscard]] Shape infer(const Shape& input_shape) const
        {
            if (input_shape.size() != 3) {
                throw ::Nabla::ShapeError("Conv2d expects [channels, height, width] samples, got "
                                          + format_shape(input_shape) + ".");
            }
            const auto channels = input_shape[0];
            if (options_.in_channels > 0 && options_.in_channels != channels) {
                throw ::Nabla::ShapeError("Conv2d declared " + std::to_string(options_.in_channels)
                                          + " input channels but received " + format_shape(input_shape) + ".");
            }
            if (channels % options_.groups != 0) {
                throw ::Nabla::ShapeError("Conv2d groups must divide the " + std::to_string(channels) + " input channels.");
            }

            Shape output{options_.out_channels, 0, 0};
            for (std::size_t axis = 0; axis < 2; ++axis) {
                const auto span = options_.dilation[axis] * (options_.kernel_size[axis] - 1) + 1;
                const auto padded = input_shape[axis + 1] + 2 * options_.padding[axis];
                if (padded < span) {
                    throw ::Nabla::ShapeError("Conv2d kernel does not fit samples of shape " + format_shape(input_shape) + ".");
                }
                output[axis + 1] = (padded - span) / options_.stride[axis] + 1;
            }
            return output;
        }

        [[nodiscard]] bool has_parameters() const noexcept { return true; }

        void allocate(LayerState& state) const
        {
            const auto per_group = state.input_shape.front() / options_.groups;
            const auto fan_in = per_group * options_.kernel_size[0] * options_.kernel_size[1];
            const auto options = torch::TensorOptions().dtype(torch::kFloat32);
            state.weights = torch::empty({options_.out_channels, per_group, options_.kernel_size[0], options_.kernel_size[1]},
                                         options);
            state.bias = options_.bias ? torch::empty({options_.out_channels}, options) : torch::Tensor{};
            ::Nabla::Initialization::Details::apply(initialization_, state.weights, state.bias, fan_in, torch::kFanIn);
        }

        [[nodiscard]] torch::Tensor transform(const LayerState& state,
                                              ForwardContext&,
                                              const torch::Tensor& inputs,
                                              bool) const
        {
            auto x = inputs.to(state.weights.scalar_type());
            return torch::conv2d(x, state.weights, state.bias,
                                 options_.stride, options_.padding, options_.dilation, options_.groups);
        }

        [[nodiscard]] ParameterGradients parameter_gradients(const LayerState& state,
                                                             const ForwardContext& context,
                                                             const torch::Tensor& delta) const
        {
            ParameterGradients gradients{};
            gradients.weights = std::get<1>(backward(state, context, delta, {false, true, false}));
            if (state.bias.defined()) {
                gradients.bias = delta.sum({0, 2, 3});
            }
            return gradients;
        }

        [[nodiscard]] torch::Tensor d_inputs(const LayerState& state,
                                             const ForwardContext& context,
                                             const torch::Tensor& delta) const
        {
            return std::get<0>(backward(state, context, delta, {true, false, false}));
        }

        [[nodiscard]] Conv2dDescriptor descriptor(const LayerState& state) const
        {
            Conv2dDescriptor descriptor{.options = options_,
                                        .activation = state.activation,
                                        .initialization = initialization_};
            if (state.initialized) {
                descriptor.options.in_channels = state.input_shape.front();
            }
            return descriptor;
        }

        [[nodiscard]] const Conv2dOptions& options() const noexcept { return options_; }

    private:
        [[nodiscard]] std::tuple<torch::Tensor, torch::Tensor, torch::Tensor> backward(const LayerState& state,
                                                                                       const ForwardContext& context,
                                                                                       const torch::Tensor& delta,
                                                                                       std::array<bool, 3> mask) const
        {
            const std::vector<std::int64_t> output_padding{0, 0};
            return at::convolution_backward(delta,
                                            context.inputs.to(delta.scalar_type()),
                                            state.weights,
                                            c10::nullopt,
                                            options_.stride,
                                            options_.padding,
                                            options_.dilation,
                                            /*transposed=*/false,
                                            output_padding,
                                            options_.groups,
                                            mask);
        }

        Conv2dOptions options_{};
        ::Nabla::Initialization::Descriptor initialization_{};
    };

}

#endif //NABLA_CONV_HPP
