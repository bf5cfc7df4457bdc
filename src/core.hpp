#ifndef NABLA_CORE_HPP
#define NABLA_CORE_HPP
/*
 * Core orchestrator of the framework.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Own the ordered chain of registered layers and finalize their shapes,
 *    either eagerly on add() or lazily from the first batch seen by fit().
 *  - Bind the optimizer, loss and metrics selected through compile().
 *  - Run the forward sweep, the backward sweep (get_gradients) and the
 *    update sweep (apply_gradients) as three separate steps.
 *  - Drive the batched training loop and report through the stream carried
 *    by FitOptions.
 *  - Persist the chain as architecture.json plus a parameter archive.
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "common/error.hpp"
#include "common/save_load.hpp"
#include "common/shape.hpp"
#include "data/batch_generator.hpp"
#include "layer/layer.hpp"
#include "loss/apply.hpp"
#include "loss/loss.hpp"
#include "metric/apply.hpp"
#include "metric/metric.hpp"
#include "optimizer/optimizer.hpp"
#include "training/history.hpp"
#include "utils/progressbar.hpp"
#include "utils/terminal.hpp"

namespace Nabla {
    namespace Core {
        template <std::size_t Epochs, std::int64_t BatchSize, bool Shuffle>
        struct TrainingConfig {
            static_assert(Epochs > 0, "TrainingConfig requires at least one epoch.");
            static_assert(BatchSize > 0, "TrainingConfig requires a positive batch size.");

            static constexpr std::size_t epochs = Epochs;
            static constexpr std::int64_t batch_size = BatchSize;
            static constexpr bool shuffle = Shuffle;
        };

        using DefaultTrainingConfig = TrainingConfig<1, 32, true>;
        inline constexpr auto kDefaultTrainingConfig = DefaultTrainingConfig{};
    }

    struct FitOptions {
        std::size_t epochs{Core::kDefaultTrainingConfig.epochs};
        std::int64_t batch_size{Core::kDefaultTrainingConfig.batch_size};
        int verbose{1}; // 0: progress bar over epochs, 1: every batch and epoch, 2: epochs only
        std::optional<std::pair<torch::Tensor, torch::Tensor>> validation_data{};
        double validation_split{0.0};
        bool shuffle{Core::kDefaultTrainingConfig.shuffle};
        std::size_t initial_epoch{0};
        std::ostream* stream{&std::cout};
    };

    // Output of a forward sweep plus one context per layer, consumed by get_gradients.
    struct ForwardTrace {
        torch::Tensor output;
        std::vector<Layer::ForwardContext> contexts;
    };

    struct Gradients {
        std::vector<torch::Tensor> inputs;
        std::vector<Layer::ParameterGradients> parameters;
    };

    class Model {
    public:
        explicit Model(std::string name = "Sequential") : name_(std::move(name)) {}

        void add(Layer::Descriptor descriptor, std::string name = {})
        {
            const bool is_input = std::holds_alternative<Layer::InputDescriptor>(descriptor);
            if (layers_.empty() && !is_input) {
                throw ConfigurationError("The first layer of a model must be an Input layer.");
            }
            if (!layers_.empty() && is_input) {
                throw ConfigurationError("An Input layer can only be the first layer of a model.");
            }
            if (name.empty()) {
                name = Layer::Details::default_name(descriptor, layers_.size());
            }

            auto layer = Layer::Details::build_registered_layer(descriptor, std::move(name));
            if (!layers_.empty() && layers_.back().initialized() && !layer.initialized()) {
                layer.initialize(layers_.back().output_shape());
            }
            if (optimizer_ && layer.initialized()) {
                optimizer_.add_slot(layer.state());
            }
            layers_.push_back(std::move(layer));
        }

        // Recompiling replaces every optimizer slot, so per-parameter state starts over.
        void compile(const Optimizer::Descriptor& optimizer,
                     const Loss::Descriptor& loss,
                     const std::vector<Metric::Descriptor>& metrics = {})
        {
            if (layers_.empty()) {
                throw ConfigurationError("Model::compile requires at least one layer.");
            }
            auto binding = Optimizer::Details::build_binding(optimizer);
            for (auto& layer : layers_) {
                if (layer.initialized()) {
                    binding.add_slot(layer.state());
                }
            }

            optimizer_ = std::move(binding);
            loss_ = loss;
            metrics_.clear();
            for (const auto& metric : metrics) {
                const bool duplicate = std::any_of(metrics_.begin(), metrics_.end(), [&](const Metric::Descriptor& bound) {
                    return bound.kind == metric.kind;
                });
                if (!duplicate) {
                    metrics_.push_back(metric);
                }
            }
            compiled_ = true;
        }

        void compile(const Optimizer::Descriptor& optimizer,
                     const Loss::Descriptor& loss,
                     const std::vector<std::string>& metric_names)
        {
            std::vector<Metric::Descriptor> metrics;
            metrics.reserve(metric_names.size());
            for (const auto& metric_name : metric_names) {
                metrics.push_back(Metric::from_name(metric_name));
            }
            compile(optimizer, loss, metrics);
        }

        [[nodiscard]] ForwardTrace forward(const torch::Tensor& inputs, bool training = false) const
        {
            require_layers("forward");
            ForwardTrace trace{};
            trace.contexts.reserve(layers_.size());
            torch::Tensor activations = inputs;
            for (const auto& layer : layers_) {
                auto step = layer.forward(activations, training);
                activations = std::move(step.output);
                trace.contexts.push_back(std::move(step.context));
            }
            trace.output = std::move(activations);
            return trace;
        }

        // Backward sweep only. Parameters are left untouched until apply_gradients.
        [[nodiscard]] Gradients get_gradients(ForwardTrace trace, const torch::Tensor& targets)
        {
            const auto& loss = require_loss("get_gradients");
            if (trace.contexts.size() != layers_.size()) {
                throw StateError("Forward trace holds " + std::to_string(trace.contexts.size())
                                 + " contexts for a model of " + std::to_string(layers_.size()) + " layers.");
            }

            const auto count = layers_.size();
            Gradients gradients{};
            gradients.inputs.resize(count);
            gradients.parameters.resize(count);
            gradients.inputs[count - 1] = Loss::Details::gradient(loss, trace.output, targets);
            for (std::size_t index = count - 1; index >= 1; --index) {
                auto step = layers_[index].backward(std::move(trace.contexts[index]), gradients.inputs[index]);
                gradients.inputs[index - 1] = std::move(step.d_inputs);
                gradients.parameters[index] = std::move(step.parameters);
            }
            return gradients;
        }

        void apply_gradients(const Gradients& gradients)
        {
            if (!optimizer_) {
                throw ConfigurationError("Model::apply_gradients requires compile() to bind an optimizer.");
            }
            if (gradients.parameters.size() != layers_.size()) {
                throw std::invalid_argument("Gradients hold " + std::to_string(gradients.parameters.size())
                                            + " entries for a model of " + std::to_string(layers_.size()) + " layers.");
            }
            if (!trainable_) {
                return;
            }
            for (std::size_t index = 0; index < layers_.size(); ++index) {
                layers_[index].update(optimizer_, gradients.parameters[index]);
            }
        }

        Training::History fit(const torch::Tensor& inputs, const torch::Tensor& targets, const FitOptions& options = {})
        {
            if (!compiled_) {
                throw ConfigurationError("Model::fit requires compile() to be called first.");
            }
            if (options.verbose < 0 || options.verbose > 2) {
                throw ConfigurationError("verbose must be 0, 1 or 2, got " + std::to_string(options.verbose) + ".");
            }
            if (!(options.validation_split >= 0.0 && options.validation_split < 1.0)) {
                throw ConfigurationError("validation_split must lie in [0, 1).");
            }
            const bool split_requested = options.validation_split > 0.0;
            if (options.validation_data && split_requested) {
                throw ConfigurationError("validation_data and validation_split cannot be combined.");
            }
            if ((options.validation_data || split_requested) && options.verbose == 0) {
                throw ConfigurationError("Validation is only reported with verbose 1 or 2.");
            }
            if (options.stream == nullptr) {
                throw std::invalid_argument("FitOptions::stream must not be null.");
            }
            if (options.batch_size <= 0) {
                throw std::invalid_argument("Batch size must be positive, got " + std::to_string(options.batch_size) + ".");
            }
            require_dataset(inputs, targets, "Model::fit");

            auto train_inputs = inputs;
            auto train_targets = targets;
            auto validation = options.validation_data;
            if (split_requested) {
                const auto total = inputs.size(0);
                const auto holdout = static_cast<std::int64_t>(
                    std::ceil(static_cast<double>(total) * options.validation_split));
                if (holdout >= total) {
                    throw ConfigurationError("validation_split leaves no training samples out of "
                                             + std::to_string(total) + ".");
                }
                const auto order = torch::randperm(total, torch::TensorOptions().dtype(torch::kLong));
                const auto train_index = order.narrow(0, 0, total - holdout);
                const auto holdout_index = order.narrow(0, total - holdout, holdout);
                train_inputs = inputs.index_select(0, train_index);
                train_targets = targets.index_select(0, train_index);
                validation = std::make_pair(inputs.index_select(0, holdout_index), targets.index_select(0, holdout_index));
            }
            if (validation) {
                require_dataset(validation->first, validation->second, "Validation data");
            }
            if (train_inputs.size(0) < options.batch_size) {
                throw std::invalid_argument("Model::fit needs at least one full batch: "
                                            + std::to_string(train_inputs.size(0)) + " samples for a batch size of "
                                            + std::to_string(options.batch_size) + ".");
            }

            finalize_shapes(sample_shape(train_inputs));

            // Every series exists from the start; the val_ ones stay empty without validation.
            Training::History history;
            history.add_series("loss");
            history.add_series("val_loss");
            for (const auto& metric : metrics_) {
                history.add_series(std::string(Metric::name(metric)));
                history.add_series("val_" + std::string(Metric::name(metric)));
            }

            auto& stream = *options.stream;
            std::optional<Utils::ProgressBar> progress;
            if (options.verbose == 0 && options.epochs > options.initial_epoch) {
                progress.emplace(static_cast<std::int64_t>(options.epochs - options.initial_epoch), "Training", stream);
            }

            for (auto epoch = options.initial_epoch; epoch < options.epochs; ++epoch) {
                const auto started = std::chrono::steady_clock::now();
                Data::BatchGenerator batches(train_inputs, train_targets, options.batch_size, options.shuffle);

                double loss_sum = 0.0;
                std::vector<double> metric_sums(metrics_.size(), 0.0);
                std::int64_t batch_index = 0;
                for (auto batch : batches) {
                    auto trace = forward(batch.inputs, /*training=*/true);
                    const auto predictions = trace.output;
                    const auto gradients = get_gradients(std::move(trace), batch.targets);
                    apply_gradients(gradients);

                    const double batch_loss = Loss::Details::compute(*loss_, predictions, batch.targets);
                    const auto batch_metrics = compute_metrics(predictions, batch.targets);
                    loss_sum += batch_loss;
                    for (std::size_t m = 0; m < batch_metrics.size(); ++m) {
                        metric_sums[m] += batch_metrics[m];
                    }

                    ++batch_index;
                    if (options.verbose == 1) {
                        log_batch(stream, batch_index, batches.size(), batch_loss, batch_metrics);
                    }
                }

                const auto batch_count = static_cast<double>(batches.size());
                const double epoch_loss = loss_sum / batch_count;
                history.append("loss", epoch_loss);
                std::vector<double> epoch_metrics;
                epoch_metrics.reserve(metrics_.size());
                for (std::size_t m = 0; m < metrics_.size(); ++m) {
                    epoch_metrics.push_back(metric_sums[m] / batch_count);
                    history.append(std::string(Metric::name(metrics_[m])), epoch_metrics.back());
                }

                std::optional<double> validation_loss;
                std::vector<double> validation_metrics;
                if (validation) {
                    const auto predictions = forward(validation->first, /*training=*/false).output;
                    validation_loss = Loss::Details::compute(*loss_, predictions, validation->second);
                    validation_metrics = compute_metrics(predictions, validation->second);
                    history.append("val_loss", *validation_loss);
                    for (std::size_t m = 0; m < metrics_.size(); ++m) {
                        history.append("val_" + std::string(Metric::name(metrics_[m])), validation_metrics[m]);
                    }
                }

                const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
                if (options.verbose > 0) {
                    log_epoch(stream, epoch + 1, options.epochs, epoch_loss, epoch_metrics,
                              validation_loss, validation_metrics, elapsed.count());
                } else if (progress) {
                    std::ostringstream suffix;
                    suffix << " loss: " << std::fixed << std::setprecision(6) << epoch_loss;
                    progress->update(static_cast<std::int64_t>(epoch - options.initial_epoch + 1), suffix.str());
                }
            }
            return history;
        }

        // Runs every sample through the chain, the trailing partial batch included.
        [[nodiscard]] torch::Tensor predict(const torch::Tensor& inputs,
                                            std::int64_t batch_size = Core::kDefaultTrainingConfig.batch_size) const
        {
            require_layers("predict");
            if (batch_size <= 0) {
                throw std::invalid_argument("Batch size must be positive, got " + std::to_string(batch_size) + ".");
            }
            if (!inputs.defined() || inputs.dim() == 0) {
                throw std::invalid_argument("Model::predict requires a defined tensor with a leading sample dimension.");
            }

            const auto total = inputs.size(0);
            if (total == 0) {
                Shape sizes{0};
                const auto& produced = output_shape();
                sizes.insert(sizes.end(), produced.begin(), produced.end());
                return torch::empty(sizes, torch::TensorOptions().dtype(torch::kFloat32));
            }

            std::vector<torch::Tensor> outputs;
            outputs.reserve(static_cast<std::size_t>((total + batch_size - 1) / batch_size));
            for (std::int64_t offset = 0; offset < total; offset += batch_size) {
                const auto length = std::min(batch_size, total - offset);
                outputs.push_back(forward(inputs.narrow(0, offset, length), /*training=*/false).output);
            }
            return torch::cat(outputs, 0);
        }

        // Sum of full-batch losses divided by the number of samples.
        [[nodiscard]] double evaluate(const torch::Tensor& inputs,
                                      const torch::Tensor& targets,
                                      std::int64_t batch_size = Core::kDefaultTrainingConfig.batch_size) const
        {
            const auto& loss = require_loss("evaluate");
            require_layers("evaluate");
            Data::BatchGenerator batches(inputs, targets, batch_size, /*shuffle=*/false);
            if (inputs.size(0) == 0) {
                throw std::invalid_argument("Model::evaluate requires at least one sample.");
            }

            double total = 0.0;
            for (auto batch : batches) {
                total += Loss::Details::compute(loss, forward(batch.inputs, /*training=*/false).output, batch.targets);
            }
            return total / static_cast<double>(inputs.size(0));
        }

        [[nodiscard]] double compute_loss(const torch::Tensor& predictions, const torch::Tensor& targets) const
        {
            return Loss::Details::compute(require_loss("compute_loss"), predictions, targets);
        }

        // values are taken as predictions when their sample shape is the model's
        // output shape, otherwise they are run through predict() first.
        [[nodiscard]] double compute_metric(const Metric::Descriptor& metric,
                                            const torch::Tensor& values,
                                            const torch::Tensor& targets) const
        {
            if (!values.defined()) {
                throw std::invalid_argument("Model::compute_metric received an undefined tensor.");
            }
            const bool are_predictions = !layers_.empty() && layers_.back().initialized()
                                         && sample_shape(values) == layers_.back().output_shape();
            return Metric::compute(metric, are_predictions ? values : predict(values), targets);
        }

        [[nodiscard]] std::string summary() const
        {
            using Utils::Terminal::Repeat;
            using Utils::Terminal::Symbols::kBoxHorizontal;

            const auto rule = Repeat(kBoxHorizontal, 64);
            std::ostringstream stream;
            stream << name_ << '\n' << rule << '\n' << "Layers:" << '\n';
            std::int64_t total = 0;
            for (const auto& layer : layers_) {
                stream << rule << '\n' << layer.summary() << '\n';
                total += layer.count_params();
            }
            stream << rule << '\n' << "Total params: " << total << '\n';
            return stream.str();
        }

        void save(const std::filesystem::path& directory) const
        {
            namespace fs = std::filesystem;
            if (directory.empty()) {
                throw std::invalid_argument("Model::save requires a non-empty directory path.");
            }

            std::error_code error_code;
            fs::create_directories(directory, error_code);
            if (error_code) {
                throw std::runtime_error("Failed to create directory '" + directory.string() + "': " + error_code.message());
            }

            const auto architecture_path = directory / "architecture.json";
            const auto parameters_path = directory / "parameters.pt";

            std::vector<Common::SaveLoad::NamedLayerDescriptor> descriptors;
            descriptors.reserve(layers_.size());
            for (const auto& layer : layers_) {
                descriptors.push_back({layer.descriptor(), layer.name(), layer.trainable()});
            }

            Common::SaveLoad::PropertyTree architecture;
            architecture.put("name", name_);
            architecture.add_child("layers", Common::SaveLoad::serialize_layer_list(descriptors));

            try {
                Common::SaveLoad::write_json_file(architecture_path, architecture);
            } catch (const std::exception& error) {
                throw std::runtime_error(
                    std::string("Failed to write architecture description to '")
                    + architecture_path.string() + "': " + error.what());
            }

            torch::serialize::OutputArchive archive;
            for (std::size_t index = 0; index < layers_.size(); ++index) {
                const auto& layer = layers_[index];
                if (layer.weights().defined()) {
                    archive.write(parameter_key(index, "weights"), layer.weights());
                }
                if (layer.bias().defined()) {
                    archive.write(parameter_key(index, "bias"), layer.bias());
                }
            }
            try {
                archive.save_to(parameters_path.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error(std::string("Failed to write parameter archive '")
                                         + parameters_path.string() + "': " + error.what());
            }
        }

        // The restored model is uncompiled; call compile() before fit().
        void load(const std::filesystem::path& directory)
        {
            namespace fs = std::filesystem;
            if (directory.empty()) {
                throw std::invalid_argument("Model::load requires a non-empty directory path.");
            }

            const auto architecture_path = directory / "architecture.json";
            const auto parameters_path = directory / "parameters.pt";

            if (!fs::exists(architecture_path)) {
                throw std::runtime_error(std::string("Architecture file not found at '")
                                         + architecture_path.string() + "'.");
            }
            if (!fs::exists(parameters_path)) {
                throw std::runtime_error(std::string("Parameter archive not found at '")
                                         + parameters_path.string() + "'.");
            }

            Common::SaveLoad::PropertyTree architecture;
            try {
                architecture = Common::SaveLoad::read_json_file(architecture_path);
            } catch (const std::exception& error) {
                throw std::runtime_error(std::string("Failed to read architecture description from '")
                                         + architecture_path.string() + "': " + error.what());
            }

            auto layers_node = architecture.get_child_optional("layers");
            if (!layers_node) {
                throw std::runtime_error(std::string("Architecture description '") + architecture_path.string()
                                         + "' is missing the 'layers' entry.");
            }
            auto descriptors = Common::SaveLoad::deserialize_layer_list(*layers_node, "layer");

            Model restored(architecture.get<std::string>("name", std::string{"Sequential"}));
            try {
                for (auto& descriptor : descriptors) {
                    restored.add(std::move(descriptor.descriptor), std::move(descriptor.name));
                    restored.layers_.back().set_trainable(descriptor.trainable);
                }
            } catch (const std::logic_error& error) {
                throw std::runtime_error(std::string("Invalid architecture in '") + architecture_path.string()
                                         + "': " + error.what());
            }

            torch::serialize::InputArchive archive;
            try {
                archive.load_from(parameters_path.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error(std::string("Failed to open parameter archive '")
                                         + parameters_path.string() + "': " + error.what());
            }

            torch::NoGradGuard no_grad{};
            for (std::size_t index = 0; index < restored.layers_.size(); ++index) {
                auto& state = restored.layers_[index].state();
                restore_parameter(archive, parameter_key(index, "weights"), state.weights);
                restore_parameter(archive, parameter_key(index, "bias"), state.bias);
            }

            *this = std::move(restored);
        }

        [[nodiscard]] const std::vector<Layer::RegisteredLayer>& layers() const noexcept { return layers_; }
        [[nodiscard]] const Layer::RegisteredLayer& layer(std::size_t index) const { return layers_.at(index); }
        [[nodiscard]] Layer::RegisteredLayer& layer(std::size_t index) { return layers_.at(index); }
        [[nodiscard]] std::size_t size() const noexcept { return layers_.size(); }
        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] bool is_compiled() const noexcept { return compiled_; }
        [[nodiscard]] const std::vector<Metric::Descriptor>& metrics() const noexcept { return metrics_; }

        [[nodiscard]] Shape output_shape() const
        {
            if (layers_.empty() || !layers_.back().initialized()) {
                return {};
            }
            return layers_.back().output_shape();
        }

        [[nodiscard]] bool trainable() const noexcept { return trainable_; }
        void set_trainable(bool trainable) noexcept { trainable_ = trainable; }

    private:
        // Initializes every pending layer from its predecessor, then registers any missing optimizer slot.
        void finalize_shapes(const Shape& sample)
        {
            require_layers("finalize_shapes");
            if (!layers_.front().initialized()) {
                layers_.front().initialize(sample);
            }
            for (std::size_t index = 1; index < layers_.size(); ++index) {
                if (!layers_[index].initialized()) {
                    layers_[index].initialize(layers_[index - 1].output_shape());
                }
            }
            if (optimizer_) {
                for (auto& layer : layers_) {
                    optimizer_.add_slot(layer.state());
                }
            }
        }

        [[nodiscard]] std::vector<double> compute_metrics(const torch::Tensor& predictions, const torch::Tensor& targets) const
        {
            std::vector<double> values;
            values.reserve(metrics_.size());
            for (const auto& metric : metrics_) {
                values.push_back(Metric::compute(metric, predictions, targets));
            }
            return values;
        }

        void require_layers(const char* operation) const
        {
            if (layers_.empty()) {
                throw ConfigurationError(std::string("Model::") + operation + " requires at least one layer.");
            }
        }

        [[nodiscard]] const Loss::Descriptor& require_loss(const char* operation) const
        {
            if (!loss_) {
                throw ConfigurationError(std::string("Model::") + operation + " requires compile() to bind a loss.");
            }
            return *loss_;
        }

        static void require_dataset(const torch::Tensor& inputs, const torch::Tensor& targets, const std::string& context)
        {
            if (!inputs.defined() || !targets.defined() || inputs.dim() == 0 || targets.dim() == 0) {
                throw std::invalid_argument(context + " requires defined inputs and targets with a leading dimension.");
            }
            if (inputs.size(0) != targets.size(0)) {
                throw std::invalid_argument(context + ": inputs and targets disagree on sample count ("
                                            + std::to_string(inputs.size(0)) + " vs "
                                            + std::to_string(targets.size(0)) + ").");
            }
        }

        [[nodiscard]] static std::string parameter_key(std::size_t index, const char* parameter)
        {
            return "layer_" + std::to_string(index) + "." + parameter;
        }

        static void restore_parameter(torch::serialize::InputArchive& archive, const std::string& key, torch::Tensor& target)
        {
            if (!target.defined()) {
                return;
            }
            torch::Tensor stored;
            try {
                archive.read(key, stored);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Checkpoint is missing parameter '" + key + "': " + error.what());
            }
            if (!stored.defined()) {
                throw std::runtime_error("Checkpoint parameter '" + key + "' is undefined.");
            }
            if (stored.sizes() != target.sizes()) {
                throw std::runtime_error("Parameter '" + key + "' shape mismatch: expected "
                                         + c10::str(target.sizes()) + " but found "
                                         + c10::str(stored.sizes()) + ".");
            }
            target.copy_(stored.to(target.scalar_type()));
        }

        void log_batch(std::ostream& stream,
                       std::int64_t batch_index,
                       std::int64_t total_batches,
                       double loss,
                       const std::vector<double>& metric_values) const
        {
            std::ostringstream line;
            line << "  Batch [" << batch_index << "/" << total_batches << "] loss: "
                 << std::fixed << std::setprecision(6) << loss;
            for (std::size_t m = 0; m < metrics_.size(); ++m) {
                line << " " << Metric::name(metrics_[m]) << ": " << std::fixed << std::setprecision(6) << metric_values[m];
            }
            stream << line.str() << '\n';
        }

        void log_epoch(std::ostream& stream,
                       std::size_t epoch_index,
                       std::size_t total_epochs,
                       double train_loss,
                       const std::vector<double>& train_metrics,
                       const std::optional<double>& validation_loss,
                       const std::vector<double>& validation_metrics,
                       double duration_seconds) const
        {
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightYellow;

            std::ostringstream line;
            line << "Epoch [" << epoch_index << "/" << total_epochs << "] | ";
            line << ApplyColor("Train", kBrightYellow) << " loss: "
                 << std::fixed << std::setprecision(6) << train_loss;
            for (std::size_t m = 0; m < metrics_.size(); ++m) {
                line << " " << Metric::name(metrics_[m]) << ": " << std::fixed << std::setprecision(6) << train_metrics[m];
            }

            if (validation_loss) {
                line << " | " << ApplyColor("Validation", kBrightBlue) << " loss: "
                     << std::fixed << std::setprecision(6) << *validation_loss;
                for (std::size_t m = 0; m < metrics_.size(); ++m) {
                    line << " " << Metric::name(metrics_[m]) << ": "
                         << std::fixed << std::setprecision(6) << validation_metrics[m];
                }
            }

            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << duration_seconds << "sec";
            line << " | "
                 << ApplyColor("duration: " + duration_stream.str(), kBrightBlack);

            stream << line.str() << '\n';
        }

        std::string name_{};
        std::vector<Layer::RegisteredLayer> layers_{};
        Optimizer::Details::Binding optimizer_{};
        std::optional<Loss::Descriptor> loss_{};
        std::vector<Metric::Descriptor> metrics_{};
        bool compiled_{false};
        bool trainable_{true};
    };
}

#endif // NABLA_CORE_HPP
