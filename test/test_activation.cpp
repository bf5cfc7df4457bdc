#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Nabla.h"

namespace Act = Nabla::Activation;

TEST(Activation, ReLUGradientIsElementwiseStep) {
    const auto z = torch::tensor({-2.0f, -0.5f, 0.5f, 3.0f});
    const auto gradient = Act::Details::gradient(Act::Type::ReLU, z);
    EXPECT_TRUE(torch::equal(gradient, torch::tensor({0.0f, 0.0f, 1.0f, 1.0f})));
    EXPECT_TRUE(torch::equal(Act::Details::apply(Act::Type::ReLU, z), torch::tensor({0.0f, 0.0f, 0.5f, 3.0f})));
}

TEST(Activation, LeakyReLUKeepsNegativeSlope) {
    const auto z = torch::tensor({-1.0f, 2.0f});
    const auto gradient = Act::Details::gradient(Act::Type::LeakyReLU, z);
    EXPECT_NEAR(gradient[0].item<float>(), 0.01f, 1e-7);
    EXPECT_NEAR(gradient[1].item<float>(), 1.0f, 1e-7);
}

TEST(Activation, SigmoidAndTanhGradientsMatchClosedForm) {
    const auto z = torch::linspace(-3.0, 3.0, 13);
    const auto s = torch::sigmoid(z);
    EXPECT_TRUE(torch::allclose(Act::Details::gradient(Act::Type::Sigmoid, z), s * (1 - s), 1e-5, 1e-6));
    const auto t = torch::tanh(z);
    EXPECT_TRUE(torch::allclose(Act::Details::gradient(Act::Type::Tanh, z), 1 - t * t, 1e-5, 1e-6));
}

TEST(Activation, IdentityPassesThrough) {
    const auto z = torch::randn({4, 3});
    EXPECT_TRUE(torch::equal(Act::Details::apply(Act::Type::Identity, z), z));
    const auto d_out = torch::randn({4, 3});
    const auto delta = Act::Details::contract(d_out, Act::Details::gradient(Act::Type::Identity, z));
    EXPECT_TRUE(torch::allclose(delta, d_out));
}

TEST(Activation, DiagonalContractionIsElementwiseProduct) {
    const auto d_out = torch::randn({5, 4});
    const auto gradient = torch::rand({5, 4});
    EXPECT_TRUE(torch::allclose(Act::Details::contract(d_out, gradient), d_out * gradient));
}

TEST(Activation, ExplicitDiagonalJacobianMatchesElementwiseGradient) {
    torch::manual_seed(5);
    const auto z = torch::randn({5, 4});
    const auto d_out = torch::randn({5, 4});
    for (const auto type : {Act::Type::ReLU, Act::Type::Sigmoid, Act::Type::Tanh}) {
        const auto gradient = Act::Details::gradient(type, z);
        const auto jacobian = torch::diag_embed(gradient);
        ASSERT_EQ(jacobian.sizes(), (std::vector<int64_t>{5, 4, 4}));

        const auto elementwise = Act::Details::contract(d_out, gradient);
        const auto batched = Act::Details::contract(d_out, jacobian);
        for (int64_t row = 0; row < d_out.size(0); ++row) {
            EXPECT_TRUE(torch::allclose(batched[row], elementwise[row], 1e-5, 1e-6)) << "row " << row;
        }
    }
}

TEST(Activation, SoftmaxJacobianContractionMatchesClosedForm) {
    torch::manual_seed(7);
    const auto z = torch::randn({6, 4});
    const auto d_out = torch::randn({6, 4});
    const auto s = Act::Details::apply(Act::Type::Softmax, z);

    const auto jacobian = Act::Details::gradient(Act::Type::Softmax, z);
    ASSERT_EQ(jacobian.sizes(), (std::vector<int64_t>{6, 4, 4}));

    const auto delta = Act::Details::contract(d_out, jacobian);
    const auto expected = s * (d_out - (d_out * s).sum(-1, /*keepdim=*/true));
    EXPECT_TRUE(torch::allclose(delta, expected, 1e-5, 1e-6));
}

TEST(Activation, SoftmaxRowsSumToOne) {
    const auto s = Act::Details::apply(Act::Type::Softmax, torch::randn({3, 5}));
    EXPECT_TRUE(torch::allclose(s.sum(-1), torch::ones({3})));
}

TEST(Activation, ContractRejectsIncompatibleGradient) {
    const auto d_out = torch::randn({3, 4});
    EXPECT_THROW(Act::Details::contract(d_out, torch::randn({3, 5})), Nabla::ShapeError);
    EXPECT_THROW(Act::Details::contract(d_out, torch::randn({3, 4, 5})), Nabla::ShapeError);
    EXPECT_THROW(Act::Details::contract(d_out, torch::randn({2, 4, 4})), Nabla::ShapeError);
}
