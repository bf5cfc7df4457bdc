#include <gtest/gtest.h>
#include <cmath>
#include <torch/torch.h>

#include "../include/Nabla.h"

namespace {
    // dL/d(prediction) as recorded by autograd on the reference loss expression.
    template <class Descriptor>
    torch::Tensor reference_gradient(const Descriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        auto leaf = prediction.clone().set_requires_grad(true);
        auto loss = Nabla::Loss::Details::compute(descriptor, leaf, target);
        loss.backward();
        return leaf.grad();
    }

    double loss_value(const Nabla::Loss::Descriptor& descriptor, const torch::Tensor& prediction, const torch::Tensor& target) {
        return Nabla::Loss::Details::compute(descriptor, prediction, target);
    }
}

TEST(Loss, MeanSquaredErrorValue) {
    const auto prediction = torch::tensor({{1.0f, 2.0f}, {3.0f, 4.0f}});
    const auto target = torch::zeros({2, 2});
    EXPECT_NEAR(loss_value(Nabla::Loss::MSE(), prediction, target), 7.5, 1e-6);
    EXPECT_NEAR(loss_value(Nabla::Loss::MSE({.reduction = Nabla::Loss::Reduction::Sum}), prediction, target),
                30.0, 1e-6);
}

TEST(Loss, MeanAbsoluteErrorValue) {
    const auto prediction = torch::tensor({{1.0f, -2.0f}, {3.0f, -4.0f}});
    EXPECT_NEAR(loss_value(Nabla::Loss::MAE(), prediction, torch::zeros({2, 2})), 2.5, 1e-6);
}

TEST(Loss, BinaryCrossEntropyValueAndGradient) {
    const auto prediction = torch::tensor({{0.8f}, {0.2f}});
    const auto target = torch::tensor({{1.0f}, {0.0f}});
    EXPECT_NEAR(loss_value(Nabla::Loss::BinaryCrossEntropy(), prediction, target), -std::log(0.8), 1e-5);
    const auto gradient = Nabla::Loss::Details::gradient(Nabla::Loss::BinaryCrossEntropy(), prediction, target);
    EXPECT_TRUE(torch::allclose(gradient, torch::tensor({{-0.625f}, {0.625f}}), 1e-4, 1e-6));
}

TEST(Loss, HandDerivedGradientsMatchAutograd) {
    torch::manual_seed(9);
    const auto prediction = torch::rand({4, 3}) * 0.8 + 0.1;
    const auto target = torch::rand({4, 3}).round();
    const auto probabilities = torch::softmax(torch::randn({4, 3}), 1);
    const auto one_hot = torch::eye(3).index_select(0, torch::tensor({0, 2, 1, 2}, torch::kLong));

    using namespace Nabla::Loss;
    EXPECT_TRUE(torch::allclose(Details::gradient(MSE(), prediction, target), reference_gradient(MSE(), prediction, target), 1e-4, 1e-6));
    EXPECT_TRUE(torch::allclose(Details::gradient(MAE(), prediction, target), reference_gradient(MAE(), prediction, target), 1e-4, 1e-6));
    EXPECT_TRUE(torch::allclose(Details::gradient(BinaryCrossEntropy(), prediction, target),
                                reference_gradient(BinaryCrossEntropy(), prediction, target), 1e-4, 1e-6));
    EXPECT_TRUE(torch::allclose(Details::gradient(CategoricalCrossEntropy(), probabilities, one_hot),
                                reference_gradient(CategoricalCrossEntropy(), probabilities, one_hot), 1e-4, 1e-6));
}

TEST(Loss, MismatchedOperandsThrowShapeError) {
    const Nabla::Loss::Descriptor loss = Nabla::Loss::MSE();
    EXPECT_THROW((void)Nabla::Loss::Details::compute(loss, torch::zeros({4, 1}), torch::zeros({4})), Nabla::ShapeError);
    EXPECT_THROW((void)Nabla::Loss::Details::gradient(loss, torch::zeros({4, 2}), torch::zeros({4, 3})), Nabla::ShapeError);
    EXPECT_EQ(Nabla::Loss::Details::to_string(loss), "MSE");
}

TEST(Metric, AccuracyUsesArgmaxForMultiColumnOutputs) {
    const auto prediction = torch::tensor({{0.9f, 0.1f}, {0.2f, 0.8f}, {0.6f, 0.4f}});
    const auto target = torch::tensor({{1.0f, 0.0f}, {1.0f, 0.0f}, {0.0f, 1.0f}});
    EXPECT_NEAR(Nabla::Metric::compute(Nabla::Metric::Accuracy, prediction, target), 1.0 / 3.0, 1e-9);
}

TEST(Metric, AccuracyThresholdsSingleColumnOutputs) {
    const auto prediction = torch::tensor({{0.7f}, {0.3f}, {0.55f}, {0.1f}});
    const auto target = torch::tensor({{1.0f}, {1.0f}, {1.0f}, {0.0f}});
    EXPECT_NEAR(Nabla::Metric::compute(Nabla::Metric::Accuracy, prediction, target), 0.75, 1e-9);
}

TEST(Metric, RegressionMetrics) {
    const auto prediction = torch::tensor({{1.0f}, {3.0f}});
    const auto target = torch::tensor({{0.0f}, {1.0f}});
    EXPECT_NEAR(Nabla::Metric::compute(Nabla::Metric::MeanSquaredError, prediction, target), 2.5, 1e-6);
    EXPECT_NEAR(Nabla::Metric::compute(Nabla::Metric::MeanAbsoluteError, prediction, target), 1.5, 1e-6);
}

TEST(Metric, NamesResolveBothWays) {
    EXPECT_EQ(Nabla::Metric::name(Nabla::Metric::Kind::Accuracy), "accuracy");
    EXPECT_EQ(Nabla::Metric::from_name("mse").kind, Nabla::Metric::Kind::MeanSquaredError);
    EXPECT_EQ(Nabla::Metric::from_name("mae").kind, Nabla::Metric::Kind::MeanAbsoluteError);
    EXPECT_THROW((void)Nabla::Metric::from_name("f1"), Nabla::ConfigurationError);
}

TEST(Metric, MismatchedOperandsThrowShapeError) {
    EXPECT_THROW((void)Nabla::Metric::compute(Nabla::Metric::Accuracy, torch::zeros({4, 2}), torch::zeros({4, 3})),
                 Nabla::ShapeError);
}
