#include <gtest/gtest.h>
#include <torch/torch.h>

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include "../include/Nabla.h"

namespace {
    Nabla::Model make_regressor(std::int64_t inputs = 3, std::int64_t outputs = 1) {
        Nabla::Model model("regressor");
        model.add(Nabla::Layer::Input({.shape = {inputs}}));
        model.add(Nabla::Layer::FC({.out_features = 4}, Nabla::Activation::Tanh));
        model.add(Nabla::Layer::FC({.out_features = outputs}));
        return model;
    }

    Nabla::FitOptions quiet(std::ostream& sink, std::size_t epochs = 1, std::int64_t batch_size = 4) {
        return Nabla::FitOptions{.epochs = epochs, .batch_size = batch_size, .verbose = 0, .stream = &sink};
    }
}

TEST(Model, FirstLayerMustBeInput) {
    Nabla::Model model;
    EXPECT_THROW(model.add(Nabla::Layer::FC({.out_features = 2})), Nabla::ConfigurationError);
    model.add(Nabla::Layer::Input({.shape = {2}}));
    EXPECT_THROW(model.add(Nabla::Layer::Input()), Nabla::ConfigurationError);
    EXPECT_EQ(model.size(), 1u);
}

TEST(Model, LayersInitializeEagerlyFromDeclaredInput) {
    auto model = make_regressor(5, 2);
    ASSERT_EQ(model.size(), 3u);
    for (const auto& layer : model.layers()) {
        EXPECT_TRUE(layer.initialized());
    }
    EXPECT_EQ(model.layer(1).input_shape(), (Nabla::Shape{5}));
    EXPECT_EQ(model.output_shape(), (Nabla::Shape{2}));
    EXPECT_EQ(model.layer(0).name(), "input_0");
    EXPECT_EQ(model.layer(2).name(), "fc_2");
}

TEST(Model, ShapesAreFinalizedLazilyByFit) {
    torch::manual_seed(1);
    Nabla::Model model;
    model.add(Nabla::Layer::Input());
    model.add(Nabla::Layer::Flatten());
    model.add(Nabla::Layer::FC({.out_features = 2}), "head");
    EXPECT_FALSE(model.layer(2).initialized());

    model.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE());
    std::ostringstream sink;
    model.fit(torch::randn({8, 2, 3}), torch::randn({8, 2}), quiet(sink));

    EXPECT_TRUE(model.layer(2).initialized());
    EXPECT_EQ(model.layer(0).output_shape(), (Nabla::Shape{2, 3}));
    EXPECT_EQ(model.layer(2).input_shape(), (Nabla::Shape{6}));
    EXPECT_EQ(model.layer(2).name(), "head");
}

TEST(Model, FitAndEvaluateRequireCompile) {
    auto model = make_regressor();
    std::ostringstream sink;
    const auto x = torch::randn({8, 3});
    const auto y = torch::randn({8, 1});
    EXPECT_FALSE(model.is_compiled());
    EXPECT_THROW(model.fit(x, y, quiet(sink)), Nabla::ConfigurationError);
    EXPECT_THROW((void)model.evaluate(x, y), Nabla::ConfigurationError);
}

TEST(Model, FitRejectsConflictingOptions) {
    auto model = make_regressor();
    model.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE());
    std::ostringstream sink;
    const auto x = torch::randn({8, 3});
    const auto y = torch::randn({8, 1});

    auto options = quiet(sink);
    options.verbose = 3;
    EXPECT_THROW(model.fit(x, y, options), Nabla::ConfigurationError);

    options = quiet(sink);
    options.verbose = 2;
    options.validation_split = 1.0;
    EXPECT_THROW(model.fit(x, y, options), Nabla::ConfigurationError);

    options.validation_split = 0.25;
    options.validation_data = std::make_pair(x, y);
    EXPECT_THROW(model.fit(x, y, options), Nabla::ConfigurationError);

    options = quiet(sink);
    options.validation_data = std::make_pair(x, y);
    EXPECT_THROW(model.fit(x, y, options), Nabla::ConfigurationError);

    EXPECT_THROW(model.fit(x, y, quiet(sink, 1, 16)), std::invalid_argument);
    EXPECT_THROW(model.fit(x, torch::randn({7, 1}), quiet(sink)), std::invalid_argument);
}

TEST(Model, GetGradientsComputesWithoutUpdating) {
    torch::manual_seed(2);
    Nabla::Model model;
    model.add(Nabla::Layer::Input({.shape = {3}}));
    model.add(Nabla::Layer::FC({.out_features = 2}));
    model.compile(Nabla::Optimizer::SGD({.learning_rate = 0.5}), Nabla::Loss::MSE());

    const auto x = torch::randn({5, 3});
    const auto y = torch::randn({5, 2});
    const auto weights = model.layer(1).weights().clone();

    auto trace = model.forward(x, true);
    const auto predictions = trace.output;
    ASSERT_EQ(trace.contexts.size(), 2u);
    const auto gradients = model.get_gradients(std::move(trace), y);

    ASSERT_EQ(gradients.inputs.size(), 2u);
    const auto d_out = 2.0 * (predictions - y) / 10.0;
    EXPECT_TRUE(torch::allclose(gradients.inputs[1], d_out, 1e-5, 1e-6));
    EXPECT_TRUE(torch::allclose(gradients.inputs[0], torch::matmul(d_out, weights.t()), 1e-5, 1e-6));
    EXPECT_TRUE(torch::allclose(gradients.parameters[1].weights, torch::matmul(x.t(), d_out), 1e-5, 1e-6));
    EXPECT_TRUE(gradients.parameters[0].empty());
    EXPECT_TRUE(torch::equal(model.layer(1).weights(), weights));

    model.apply_gradients(gradients);
    EXPECT_TRUE(torch::allclose(model.layer(1).weights(), weights - 0.5 * gradients.parameters[1].weights, 1e-5, 1e-6));
}

TEST(Model, OneEpochOnConstantBatchUpdatesEveryLayer) {
    Nabla::Model model;
    model.add(Nabla::Layer::Input({.shape = {4}}));
    model.add(Nabla::Layer::FC({.out_features = 3}, Nabla::Activation::ReLU));
    model.add(Nabla::Layer::FC({.out_features = 1}, Nabla::Activation::Sigmoid));
    {
        torch::NoGradGuard no_grad;
        model.layer(1).state().weights.fill_(0.1);
        model.layer(1).state().bias.zero_();
        model.layer(2).state().weights.fill_(0.5);
        model.layer(2).state().bias.zero_();
    }
    model.compile(Nabla::Optimizer::SGD({.learning_rate = 0.1}), Nabla::Loss::MSE());
    const auto hidden_before = model.layer(1).weights().clone();
    const auto output_before = model.layer(2).weights().clone();

    std::ostringstream sink;
    const auto history = model.fit(torch::ones({4, 4}), torch::zeros({4, 1}), quiet(sink, 1, 4));

    EXPECT_FALSE(torch::equal(model.layer(1).weights(), hidden_before));
    EXPECT_FALSE(torch::equal(model.layer(2).weights(), output_before));
    ASSERT_EQ(history.at("loss").size(), 1u);
    EXPECT_TRUE(std::isfinite(history.at("loss")[0]));
    EXPECT_GE(history.at("loss")[0], 0.0);
}

TEST(Model, ConvolutionalChainInfersShapesAndTrains) {
    torch::manual_seed(17);
    const auto x = torch::randn({16, 1, 6, 6});
    const auto y = x.mean({1, 2, 3}).unsqueeze(1);

    Nabla::Model model("conv");
    model.add(Nabla::Layer::Input({.shape = {1, 6, 6}}));
    model.add(Nabla::Layer::Conv2d({.out_channels = 3, .kernel_size = {3, 3}}, Nabla::Activation::ReLU,
                                   Nabla::Initialization::HeUniform));
    model.add(Nabla::Layer::Flatten());
    model.add(Nabla::Layer::FC({.out_features = 1}));
    EXPECT_EQ(model.layer(1).output_shape(), (Nabla::Shape{3, 4, 4}));
    EXPECT_EQ(model.layer(2).output_shape(), (Nabla::Shape{48}));
    model.compile(Nabla::Optimizer::Adam({.learning_rate = 0.01}), Nabla::Loss::MSE());

    const auto kernels = model.layer(1).weights().clone();
    std::ostringstream sink;
    const auto history = model.fit(x, y, quiet(sink, 20, 4));
    EXPECT_FALSE(torch::equal(model.layer(1).weights(), kernels));
    EXPECT_LT(history.at("loss").back(), history.at("loss").front());
    EXPECT_EQ(model.predict(x).sizes(), (std::vector<int64_t>{16, 1}));
}

TEST(Model, TrainingReducesRegressionLoss) {
    torch::manual_seed(0);
    const auto x = torch::randn({64, 2});
    const auto y = (x.select(1, 0) - 2.0 * x.select(1, 1) + 0.5).unsqueeze(1);

    Nabla::Model model("regressor");
    model.add(Nabla::Layer::Input({.shape = {2}}));
    model.add(Nabla::Layer::FC({.out_features = 8}, Nabla::Activation::Tanh, Nabla::Initialization::XavierUniform));
    model.add(Nabla::Layer::FC({.out_features = 1}));
    model.compile(Nabla::Optimizer::SGD({.learning_rate = 0.05}), Nabla::Loss::MSE(), {Nabla::Metric::MeanAbsoluteError});

    std::ostringstream sink;
    const auto history = model.fit(x, y, quiet(sink, 60, 8));
    const auto& loss = history.at("loss");
    ASSERT_EQ(loss.size(), 60u);
    EXPECT_LT(loss.back(), 0.5 * loss.front());
    EXPECT_EQ(history.at("mae").size(), 60u);
    ASSERT_TRUE(history.contains("val_loss"));
    EXPECT_TRUE(history.at("val_loss").empty());
    ASSERT_TRUE(history.contains("val_mae"));
    EXPECT_TRUE(history.at("val_mae").empty());
    EXPECT_LT(model.evaluate(x, y, 8), loss.front() / 8.0);
}

TEST(Model, SoftmaxClassifierLearnsSeparableBlobs) {
    torch::manual_seed(4);
    const auto half = 32;
    const auto positive = torch::randn({half, 2}) * 0.5 + 2.0;
    const auto negative = torch::randn({half, 2}) * 0.5 - 2.0;
    const auto x = torch::cat({positive, negative});
    const auto labels = torch::cat({torch::zeros({half}, torch::kLong), torch::ones({half}, torch::kLong)});
    const auto y = torch::eye(2).index_select(0, labels);

    Nabla::Model model("classifier");
    model.add(Nabla::Layer::Input({.shape = {2}}));
    model.add(Nabla::Layer::FC({.out_features = 8}, Nabla::Activation::ReLU, Nabla::Initialization::HeUniform));
    model.add(Nabla::Layer::FC({.out_features = 2}, Nabla::Activation::Softmax));
    model.compile(Nabla::Optimizer::Adam({.learning_rate = 0.05}), Nabla::Loss::CategoricalCrossEntropy(),
                  std::vector<std::string>{"accuracy"});

    std::ostringstream sink;
    const auto history = model.fit(x, y, quiet(sink, 30, 8));
    EXPECT_GT(history.at("accuracy").back(), 0.9);
    EXPECT_GT(model.compute_metric(Nabla::Metric::Accuracy, model.predict(x), y), 0.9);
}

TEST(Model, ValidationSeriesAndEpochLog) {
    torch::manual_seed(6);
    auto model = make_regressor();
    model.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE(), std::vector<std::string>{"mae"});
    const auto x = torch::randn({16, 3});
    const auto y = torch::randn({16, 1});

    std::ostringstream log;
    Nabla::FitOptions options{.epochs = 2, .batch_size = 4, .verbose = 2,
                              .validation_data = std::make_pair(torch::randn({6, 3}), torch::randn({6, 1})),
                              .stream = &log};
    const auto history = model.fit(x, y, options);

    for (const auto* key : {"loss", "mae", "val_loss", "val_mae"}) {
        ASSERT_TRUE(history.contains(key)) << key;
        EXPECT_EQ(history.at(key).size(), 2u) << key;
    }
    EXPECT_EQ(history.size(), 4u);

    const auto text = log.str();
    EXPECT_NE(text.find("Epoch [1/2]"), std::string::npos);
    EXPECT_NE(text.find("Epoch [2/2]"), std::string::npos);
    EXPECT_NE(text.find("Validation"), std::string::npos);
    EXPECT_EQ(text.find("Batch ["), std::string::npos);
}

TEST(Model, ValidationSplitHoldsOutTrailingFraction) {
    torch::manual_seed(8);
    auto model = make_regressor();
    model.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE());
    std::ostringstream log;
    Nabla::FitOptions options{.epochs = 3, .batch_size = 5, .verbose = 1, .validation_split = 0.25, .stream = &log};
    const auto history = model.fit(torch::randn({20, 3}), torch::randn({20, 1}), options);

    EXPECT_EQ(history.at("val_loss").size(), 3u);
    // 15 training samples in batches of 5.
    EXPECT_NE(log.str().find("Batch [3/3]"), std::string::npos);
    EXPECT_EQ(log.str().find("Batch [4/"), std::string::npos);
}

TEST(Model, InitialEpochSkipsEarlierEpochs) {
    auto model = make_regressor();
    model.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE());
    std::ostringstream log;
    Nabla::FitOptions options{.epochs = 3, .batch_size = 4, .verbose = 2, .initial_epoch = 1, .stream = &log};
    const auto history = model.fit(torch::randn({8, 3}), torch::randn({8, 1}), options);
    EXPECT_EQ(history.at("loss").size(), 2u);
    EXPECT_EQ(log.str().find("Epoch [1/3]"), std::string::npos);
    EXPECT_NE(log.str().find("Epoch [3/3]"), std::string::npos);
}

TEST(Model, PredictIncludesTrailingPartialBatch) {
    torch::manual_seed(10);
    auto model = make_regressor(3, 2);
    const auto x = torch::randn({7, 3});
    const auto predictions = model.predict(x, 3);
    ASSERT_EQ(predictions.sizes(), (std::vector<int64_t>{7, 2}));
    EXPECT_TRUE(torch::allclose(predictions, model.forward(x).output, 1e-5, 1e-6));

    const auto empty = model.predict(torch::empty({0, 3}));
    EXPECT_EQ(empty.sizes(), (std::vector<int64_t>{0, 2}));
}

TEST(Model, EvaluateDividesFullBatchLossesBySampleCount) {
    torch::manual_seed(12);
    auto model = make_regressor();
    model.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE());
    const auto x = torch::randn({10, 3});
    const auto y = torch::randn({10, 1});

    const auto first = model.compute_loss(model.predict(x.narrow(0, 0, 4)), y.narrow(0, 0, 4));
    const auto second = model.compute_loss(model.predict(x.narrow(0, 4, 4)), y.narrow(0, 4, 4));
    EXPECT_NEAR(model.evaluate(x, y, 4), (first + second) / 10.0, 1e-6);
    EXPECT_THROW((void)model.evaluate(torch::empty({0, 3}), torch::empty({0, 1})), std::invalid_argument);
}

TEST(Model, ComputeMetricAcceptsInputsOrPredictions) {
    torch::manual_seed(14);
    auto model = make_regressor(4, 3);
    const auto x = torch::randn({9, 4});
    const auto y = torch::randn({9, 3});
    const auto from_inputs = model.compute_metric(Nabla::Metric::MeanSquaredError, x, y);
    const auto from_predictions = model.compute_metric(Nabla::Metric::MeanSquaredError, model.predict(x), y);
    EXPECT_NEAR(from_inputs, from_predictions, 1e-6);
}

TEST(Model, CompileResolvesMetricNames) {
    auto model = make_regressor();
    model.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE(), std::vector<std::string>{"mae", "mae", "mse"});
    EXPECT_EQ(model.metrics().size(), 2u);
    EXPECT_THROW(model.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE(), std::vector<std::string>{"precision"}),
                 Nabla::ConfigurationError);

    Nabla::Model empty;
    EXPECT_THROW(empty.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE()), Nabla::ConfigurationError);
}

TEST(Model, SummaryListsLayersAndParameterCount) {
    auto model = make_regressor(3, 1);
    const auto text = model.summary();
    EXPECT_EQ(text.rfind("regressor", 0), 0u);
    EXPECT_NE(text.find("Layers:"), std::string::npos);
    EXPECT_NE(text.find("input_0"), std::string::npos);
    EXPECT_NE(text.find("fc_1"), std::string::npos);
    // 3*4 + 4 + 4*1 + 1
    EXPECT_NE(text.find("Total params: 21"), std::string::npos);
}

TEST(Model, ProgressModeDrawsABar) {
    auto model = make_regressor();
    model.compile(Nabla::Optimizer::SGD(), Nabla::Loss::MSE());
    std::ostringstream sink;
    model.fit(torch::randn({8, 3}), torch::randn({8, 1}), quiet(sink, 2));
    EXPECT_NE(sink.str().find("Training"), std::string::npos);
    EXPECT_EQ(sink.str().find("Epoch ["), std::string::npos);
}
