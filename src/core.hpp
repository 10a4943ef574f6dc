#ifndef GRADUS_CORE_HPP
#define GRADUS_CORE_HPP
/*
 * Core orchestrator of the library.
 * ---------------------------------------------------------------------------
 *  - Collects layer, loss and optimizer descriptors and routes them to the
 *    factories under layer/, loss/ and optimizer/.
 *  - Runs the supervised loop: forward -> loss -> backward -> step -> zero_grad,
 *    one call per mini-batch, with per-epoch telemetry.
 *  - Exposes evaluation, probability prediction and checkpoint save/load.
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <torch/torch.h>

#include "activation/activation.hpp"
#include "activation/apply.hpp"
#include "common/save_load.hpp"
#include "data/loader/loader.hpp"
#include "evaluation/evaluation.hpp"
#include "initialization/initialization.hpp"
#include "layer/layer.hpp"
#include "loss/loss.hpp"
#include "metric/metric.hpp"
#include "optimizer/optimizer.hpp"
#include "utils/mode_guard.hpp"
#include "utils/progressbar.hpp"
#include "utils/terminal.hpp"

namespace Gradus {
    template <class... Ts>
    struct Overloaded : Ts... {
        using Ts::operator()...;
    };

    template <class... Ts>
    Overloaded(Ts...) -> Overloaded<Ts...>;

    namespace Core {
        struct DefaultTrainingConfig {
            static constexpr std::size_t epochs = 5;
            static constexpr std::size_t batch_size = 64;
            static constexpr bool shuffle = true;
        };
        inline constexpr auto kDefaultTrainingConfig = DefaultTrainingConfig{};
    }

    struct TrainOptions {
        std::size_t epoch{Core::kDefaultTrainingConfig.epochs};
        std::size_t batch_size{Core::kDefaultTrainingConfig.batch_size};
        bool shuffle{Core::kDefaultTrainingConfig.shuffle};
        bool monitor{true};
        bool progress{false};
        std::optional<std::vector<torch::Tensor>> test{}; // {inputs, targets}
        std::ostream* stream{&std::cout};
        std::optional<std::uint64_t> seed{};
    };

    class Model : public torch::nn::Module {
        using LossDescriptor = Loss::Descriptor;

    public:
        struct TrainingTelemetry {
            struct EpochSnapshot {
                std::size_t epoch_index{};
                double train_loss{};
                std::optional<double> test_loss{};
                std::optional<double> test_accuracy{};
                std::optional<double> delta{};
                double learning_rate{};
                std::chrono::system_clock::time_point timestamp{};
                double duration_seconds{};
            };

            [[nodiscard]] const std::vector<EpochSnapshot>& epochs() const noexcept { return epochs_; }
            void clear() noexcept { epochs_.clear(); }

        private:
            friend class Model;
            void append_epoch(EpochSnapshot snapshot) { epochs_.push_back(std::move(snapshot)); }

            std::vector<EpochSnapshot> epochs_{};
        };

        explicit Model(std::string_view name = {}) : name_(name) {}

        [[nodiscard]] const TrainingTelemetry& training_telemetry() const noexcept { return telemetry_; }
        void clear_training_telemetry() noexcept { telemetry_.clear(); }

        void train(bool on = true) override { torch::nn::Module::train(on); }
        void eval() { torch::nn::Module::train(false); }

        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] std::string model_name() const { return name_.empty() ? std::string("model") : name_; }

        using ModuleDescriptor = Common::SaveLoad::ModuleDescriptor;
        using NamedModuleDescriptor = Common::SaveLoad::NamedModuleDescriptor;

        void add(ModuleDescriptor descriptor, std::string name = {}) {
            if (optimizer_) {
                throw std::logic_error("Cannot add layers after the optimizer has been configured.");
            }
            // The layer name is settled before anything is registered on the module.
            const auto index = module_index_;
            auto layer_name = name;
            if (layer_name.empty()) {
                layer_name = std::visit([](const auto& concrete_descriptor) { return Layer::Details::kind_of(concrete_descriptor); },
                                        descriptor)
                             + "_" + std::to_string(index);
            }
            if (name_index_.find(layer_name) != name_index_.end()) {
                throw std::invalid_argument("Layer name '" + layer_name + "' is already registered.");
            }

            auto registered = std::visit(
                [&](const auto& concrete_descriptor) {
                    return Layer::Details::build_registered_layer(*this, concrete_descriptor, index);
                },
                descriptor);
            ++module_index_;

            registered.name = std::move(layer_name);
            if (registered.module && device_ != torch::Device(torch::kCPU)) {
                registered.module->to(device_);
            }

            name_index_[registered.name] = layers_.size();
            layers_.push_back(std::move(registered));
            module_descriptors_.emplace_back(std::move(descriptor), std::move(name));
        }

        [[nodiscard]] std::size_t layer_count() const noexcept { return layers_.size(); }

        [[nodiscard]] const Layer::Details::RegisteredLayer& layer(std::size_t index) const {
            if (index >= layers_.size()) {
                throw std::out_of_range("Layer index " + std::to_string(index) + " out of range ("
                                        + std::to_string(layers_.size()) + " layers).");
            }
            return layers_[index];
        }

        [[nodiscard]] std::optional<std::size_t> find(const std::string& name) const {
            const auto it = name_index_.find(name);
            if (it == name_index_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        [[nodiscard]] const std::vector<NamedModuleDescriptor>& descriptors() const noexcept { return module_descriptors_; }

        [[nodiscard]] Activation::Type output_activation() const noexcept {
            return layers_.empty() ? Activation::Type::Identity : layers_.back().activation;
        }

        [[nodiscard]] std::int64_t parameter_count() const {
            std::int64_t total = 0;
            for (const auto& parameter : this->parameters(/*recurse=*/true)) {
                if (parameter.requires_grad()) {
                    total += parameter.numel();
                }
            }
            return total;
        }

        void summary(std::ostream& stream = std::cout) const {
            using namespace Utils::Terminal;
            const auto color = Colors::kBrightBlue;

            std::vector<std::string> names{"Layer"};
            std::vector<std::string> modules{"Module"};
            std::vector<std::string> activations{"Activation"};
            std::vector<std::string> params{"Parameters"};
            for (const auto& entry : layers_) {
                names.push_back(entry.name);
                std::ostringstream repr;
                if (entry.module) {
                    entry.module->pretty_print(repr);
                }
                modules.push_back(repr.str());
                activations.emplace_back(Activation::Details::to_string(entry.activation));
                params.push_back(std::to_string(entry.parameter_count()));
            }

            auto widest = [](const std::vector<std::string>& column) {
                std::size_t width = 0;
                for (const auto& cell : column) {
                    width = std::max(width, cell.size());
                }
                return width;
            };
            const std::vector<std::size_t> widths{widest(names), widest(modules), widest(activations), widest(params)};
            std::vector<std::size_t> spacings;
            for (auto width : widths) {
                spacings.push_back(width + 2);
            }

            auto print_row = [&](std::size_t row) {
                std::ostringstream line;
                line << Symbols::kBoxVertical << ' ' << std::left << std::setw(static_cast<int>(widths[0])) << names[row];
                line << ' ' << Symbols::kBoxVertical << ' ' << std::setw(static_cast<int>(widths[1])) << modules[row];
                line << ' ' << Symbols::kBoxVertical << ' ' << std::setw(static_cast<int>(widths[2])) << activations[row];
                line << ' ' << Symbols::kBoxVertical << ' ' << std::right << std::setw(static_cast<int>(widths[3])) << params[row];
                line << ' ' << Symbols::kBoxVertical;
                stream << line.str() << '\n';
            };

            stream << HTop(spacings, color, FrameStyle::Box) << '\n';
            print_row(0);
            stream << HMid(spacings, color) << '\n';
            for (std::size_t row = 1; row < names.size(); ++row) {
                print_row(row);
            }
            stream << HBottom(spacings, color) << '\n';
            stream << "Trainable parameters: " << parameter_count() << '\n';
        }

        Model& to_device(bool use_cuda = true)
        {
            if (use_cuda && torch::cuda::is_available()) {
                device_ = torch::Device(torch::kCUDA, /*index=*/0);
            } else {
                device_ = torch::Device(torch::kCPU);
            }
            this->to(device_);
            return *this;
        }

        [[nodiscard]] const torch::Device& device() const noexcept { return device_; }

        [[nodiscard]] torch::Tensor forward(torch::Tensor input)
        {
            if (layers_.empty()) {
                throw std::logic_error("Cannot run forward on a model without layers.");
            }
            if (input.device() != device_) {
                input = input.to(device_);
            }
            for (const auto& entry : layers_) {
                input = entry.forward(std::move(input));
                input = Activation::Details::apply(entry.activation, std::move(input));
            }
            return input;
        }

        template <class Descriptor>
        void set_loss(Descriptor descriptor) {
            using Decayed = std::decay_t<Descriptor>;
            constexpr bool kSupported = std::disjunction_v<
                std::is_same<Decayed, Loss::Details::CrossEntropyDescriptor>,
                std::is_same<Decayed, Loss::Details::NegativeLogLikelihoodDescriptor>,
                std::is_same<Decayed, Loss::Details::MSEDescriptor>,
                std::is_same<Decayed, Loss::Descriptor>>;
            static_assert(kSupported, "Unsupported loss descriptor type provided to Model::set_loss.");

            if constexpr (std::is_same_v<Decayed, Loss::Descriptor>) {
                loss_descriptor_ = std::move(descriptor);
            } else {
                loss_descriptor_ = LossDescriptor{std::in_place_type<Decayed>, std::move(descriptor)};
            }
        }

        [[nodiscard]] bool has_loss() const noexcept { return loss_descriptor_.has_value(); }

        void set_optimizer(Optimizer::Descriptor descriptor) {
            if (layers_.empty()) {
                throw std::logic_error("Cannot create optimizer before any layer has been registered.");
            }
            auto parameters = this->parameters(/*recurse=*/true);
            optimizer_ = std::visit(
                [&](const auto& concrete_descriptor) {
                    return Optimizer::Details::build_optimizer(std::move(parameters), concrete_descriptor);
                },
                descriptor);
        }

        [[nodiscard]] bool has_optimizer() const noexcept { return static_cast<bool>(optimizer_); }

        [[nodiscard]] double learning_rate() const {
            if (!optimizer_ || optimizer_->param_groups().empty()) {
                throw std::logic_error("Learning rate requested before an optimizer was configured.");
            }
            return optimizer_->param_groups().front().options().get_lr();
        }

        void zero_grad(bool set_to_none = false) {
            if (optimizer_) {
                optimizer_->zero_grad(set_to_none);
            } else {
                torch::nn::Module::zero_grad(set_to_none);
            }
        }

        void step() {
            if (!optimizer_) {
                throw std::logic_error("Optimizer has not been configured.");
            }
            optimizer_->step();
        }

        [[nodiscard]] torch::Tensor compute_loss(const torch::Tensor& prediction,
                                                 const torch::Tensor& target,
                                                 const std::optional<torch::Tensor>& weight = std::nullopt) const {
            if (!loss_descriptor_.has_value()) {
                throw std::logic_error("Loss function has not been configured.");
            }
            auto staged_target = target.device() == prediction.device() ? target : target.to(prediction.device());
            return std::visit(
                [&](const auto& descriptor) {
                    return Loss::Details::compute(descriptor, prediction, staged_target, weight);
                }, *loss_descriptor_);
        }

        // One optimisation step; gradients are cleared before returning.
        torch::Tensor train_step(const torch::Tensor& inputs, const torch::Tensor& targets) {
            ensure_trainable();
            auto prediction = forward(inputs);
            auto loss = compute_loss(prediction, targets);
            loss.backward();
            step();
            zero_grad();
            return loss.detach();
        }

        void train(Data::Loader& loader, const TrainOptions& options = {}) {
            ensure_trainable();
            if (options.epoch == 0) {
                return;
            }
            if (options.test) {
                validate_test_split(*options.test);
            }
            if (options.seed) {
                torch::manual_seed(*options.seed);
            }

            std::optional<double> previous_loss{};
            std::optional<double> best_loss{};
            const auto batches = loader.size();

            for (std::size_t epoch = 0; epoch < options.epoch; ++epoch) {
                const auto epoch_start = std::chrono::steady_clock::now();
                if (epoch > 0 && loader.options().shuffle) {
                    loader.reshuffle();
                }

                this->train();
                std::optional<Utils::ProgressBar> bar{};
                if (options.progress && options.stream != nullptr && batches > 0) {
                    bar.emplace(static_cast<std::int64_t>(batches),
                                "Epoch " + std::to_string(epoch + 1) + "/" + std::to_string(options.epoch),
                                options.stream);
                }

                double running_loss = 0.0;
                std::size_t seen = 0;
                for (const auto& batch : loader) {
                    const auto loss = train_step(batch.inputs, batch.targets);
                    running_loss += loss.item<double>();
                    ++seen;
                    if (bar) {
                        bar->update(static_cast<std::int64_t>(seen), running_loss / static_cast<double>(seen));
                    }
                }

                TrainingTelemetry::EpochSnapshot snapshot{};
                snapshot.epoch_index = epoch + 1;
                snapshot.train_loss = seen > 0 ? running_loss / static_cast<double>(seen) : 0.0;
                snapshot.learning_rate = learning_rate();

                if (options.test) {
                    const auto [test_loss, test_accuracy] = measure((*options.test)[0], (*options.test)[1],
                                                                    std::max<std::size_t>(options.batch_size, 1));
                    snapshot.test_loss = test_loss;
                    snapshot.test_accuracy = test_accuracy;
                }

                const double monitored = snapshot.test_loss.value_or(snapshot.train_loss);
                if (previous_loss) {
                    snapshot.delta = monitored - *previous_loss;
                }
                const bool improved = !best_loss || monitored < *best_loss;
                if (improved) {
                    best_loss = monitored;
                }
                previous_loss = monitored;

                snapshot.timestamp = std::chrono::system_clock::now();
                snapshot.duration_seconds =
                    std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_start).count();

                if (options.monitor && options.stream != nullptr) {
                    log_epoch(*options.stream, snapshot, options.epoch, improved);
                }
                telemetry_.append_epoch(std::move(snapshot));
            }
        }

        void train(torch::Tensor inputs, torch::Tensor targets, const TrainOptions& options = {}) {
            ensure_trainable();
            if (!inputs.defined() || !targets.defined()) {
                throw std::invalid_argument("Training inputs and targets must be defined.");
            }
            if (inputs.dim() == 0 || targets.dim() == 0) {
                throw std::invalid_argument("Training tensors must have a leading sample dimension.");
            }
            if (inputs.size(0) != targets.size(0)) {
                throw std::invalid_argument("Training inputs and targets must have the same number of samples.");
            }
            if (options.batch_size == 0) {
                throw std::invalid_argument("Training batch size must be positive.");
            }
            if (options.epoch == 0) {
                return;
            }

            Data::Loader loader(std::move(inputs), std::move(targets),
                                Data::LoaderOptions{.batch_size = options.batch_size,
                                                    .shuffle = options.shuffle,
                                                    .drop_last = false,
                                                    .seed = options.seed});
            train(loader, options);
        }

        // Class probabilities for a batch; the model's own output activation is honoured.
        [[nodiscard]] torch::Tensor predict_proba(const torch::Tensor& inputs) {
            torch::NoGradGuard guard;
            torch::Tensor output;
            {
                Utils::EvalModeGuard mode(*this);
                output = forward(inputs);
            }

            switch (output_activation()) {
                case Activation::Type::Softmax:
                    return output;
                case Activation::Type::LogSoftmax:
                    return output.exp();
                default:
                    return torch::softmax(output, /*dim=*/output.dim() > 1 ? 1 : 0);
            }
        }

        auto evaluate(torch::Tensor evaluation_inputs,
                      torch::Tensor evaluation_targets,
                      Evaluation::ClassificationDescriptor descriptor,
                      std::vector<Metric::Classification::Descriptor> metrics,
                      Evaluation::Options options = {}) -> Evaluation::ClassificationReport {
            return Evaluation::Evaluate(
                *this,
                std::move(evaluation_inputs),
                std::move(evaluation_targets),
                descriptor,
                std::move(metrics),
                options);
        }

        // Writes directory/<name>/{architecture.json, parameters.binary}; returns the directory written.
        std::filesystem::path save(const std::filesystem::path& directory, bool overwrite = false, std::ostream* stream = &std::cout) const {
            namespace fs = std::filesystem;
            if (directory.empty()) {
                throw std::invalid_argument("Model::save requires a non-empty directory path.");
            }
            if (layers_.empty()) {
                throw std::logic_error("Cannot save a model without layers.");
            }

            auto target_dir = directory / model_name();
            if (fs::exists(target_dir) && !overwrite) {
                int counter = 1;
                while (true) {
                    auto candidate = directory / (model_name() + "_" + std::to_string(counter));
                    if (!fs::exists(candidate)) {
                        target_dir = candidate;
                        break;
                    }
                    ++counter;
                }
            }
            if (stream != nullptr) {
                *stream << "[Gradus] Saving model as: " << target_dir.string() << std::endl;
            }

            std::error_code error_code;
            fs::create_directories(target_dir, error_code);
            if (error_code) {
                throw std::runtime_error("Failed to create checkpoint directory '" + target_dir.string() + "': " + error_code.message());
            }

            const auto architecture_path = target_dir / "architecture.json";
            const auto parameters_path = target_dir / "parameters.binary";

            Common::SaveLoad::PropertyTree architecture;
            architecture.put("name", model_name());
            architecture.add_child("modules", Common::SaveLoad::serialize_module_list(module_descriptors_));

            try {
                Common::SaveLoad::write_json_file(architecture_path, architecture);
            } catch (const std::exception& error) {
                throw std::runtime_error(
                    std::string("Failed to write architecture description to '")
                    + architecture_path.string() + "': " + error.what());
            }

            try {
                torch::serialize::OutputArchive archive;
                torch::nn::Module::save(archive);
                archive.save_to(parameters_path.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to write parameters to '" + parameters_path.string() + "': " + error.what());
            }
            return target_dir;
        }

        // Rebuilds the layers from a checkpoint directory. Any configured optimizer is dropped.
        void load(const std::filesystem::path& directory)
        {
            namespace fs = std::filesystem;
            if (directory.empty()) {
                throw std::invalid_argument("Model::load requires a non-empty directory path.");
            }

            const auto architecture_path = directory / "architecture.json";
            const auto parameters_path = directory / "parameters.binary";

            if (!fs::exists(architecture_path)) {
                throw std::runtime_error(std::string("Architecture file not found at '")
                                         + architecture_path.string() + "'.");
            }
            if (!fs::exists(parameters_path)) {
                throw std::runtime_error(std::string("Parameter archive not found at '")
                                         + parameters_path.string() + "'.");
            }

            const auto architecture = Common::SaveLoad::read_json_file(architecture_path);
            auto modules_node = architecture.get_child_optional("modules");
            if (!modules_node) {
                throw std::runtime_error(std::string("Architecture description '") + architecture_path.string()
                                         + "' is missing the 'modules' entry.");
            }
            auto descriptors = Common::SaveLoad::deserialize_module_list(*modules_node, "module");

            // Layers and parameters are staged on a scratch model; this one is untouched until both check out.
            Model staged;
            for (const auto& descriptor : descriptors) {
                try {
                    staged.add(descriptor.descriptor, descriptor.name);
                } catch (const std::invalid_argument& error) {
                    throw std::runtime_error("Architecture description '" + architecture_path.string()
                                             + "' holds an invalid layer: " + error.what());
                }
            }

            torch::serialize::InputArchive archive;
            try {
                archive.load_from(parameters_path.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error(std::string("Failed to open parameter archive '")
                                         + parameters_path.string() + "': " + error.what());
            }

            for (const auto& item : staged.named_parameters(/*recurse=*/true)) {
                torch::Tensor stored;
                try {
                    archive.read(item.key(), stored);
                } catch (const c10::Error& error) {
                    throw std::runtime_error("Checkpoint is missing parameter '" + item.key() + "': " + error.what());
                }
                if (!stored.defined()) {
                    throw std::runtime_error("Checkpoint parameter '" + item.key() + "' is undefined.");
                }
                if (stored.sizes() != item.value().sizes()) {
                    throw std::runtime_error("Parameter '" + item.key() + "' shape mismatch: expected "
                                             + format_tensor_shape(item.value()) + " but found "
                                             + format_tensor_shape(stored) + ".");
                }
                torch::NoGradGuard guard;
                item.value().copy_(stored);
            }

            reset_runtime_state();
            if (auto name_value = architecture.get_optional<std::string>("name")) {
                name_ = std::move(*name_value);
            }
            for (auto& descriptor : descriptors) {
                add(std::move(descriptor.descriptor), std::move(descriptor.name));
            }

            const auto loaded = staged.named_parameters(/*recurse=*/true);
            torch::NoGradGuard guard;
            for (const auto& item : this->named_parameters(/*recurse=*/true)) {
                item.value().copy_(loaded[item.key()].to(item.value().device()));
            }
        }

    private:
        void ensure_trainable() const {
            if (!optimizer_) {
                throw std::logic_error("Optimizer has not been configured.");
            }
            if (!loss_descriptor_) {
                throw std::logic_error("Loss function has not been configured.");
            }
        }

        static void validate_test_split(const std::vector<torch::Tensor>& split) {
            if (split.size() != 2 || !split[0].defined() || !split[1].defined()) {
                throw std::invalid_argument("Test split must hold exactly {inputs, targets}.");
            }
            if (split[0].dim() == 0 || split[0].size(0) != split[1].size(0) || split[0].size(0) == 0) {
                throw std::invalid_argument("Test inputs and targets must be non-empty with matching sample counts.");
            }
        }

        // Mean loss and top-1 accuracy over a held-out split, in eval mode.
        std::pair<double, double> measure(const torch::Tensor& inputs, const torch::Tensor& targets, std::size_t batch_size) {
            torch::NoGradGuard guard;
            Utils::EvalModeGuard mode(*this);

            const auto total = inputs.size(0);
            const auto step_size = static_cast<std::int64_t>(batch_size);
            double loss_sum = 0.0;
            std::int64_t correct = 0;
            for (std::int64_t offset = 0; offset < total; offset += step_size) {
                const auto current = std::min<std::int64_t>(step_size, total - offset);
                auto batch_targets = targets.narrow(0, offset, current).to(device_);
                auto prediction = forward(inputs.narrow(0, offset, current));
                loss_sum += compute_loss(prediction, batch_targets).item<double>() * static_cast<double>(current);
                if (prediction.dim() == 2 && batch_targets.dim() == 1) {
                    correct += prediction.argmax(1).eq(batch_targets).sum().item<std::int64_t>();
                }
            }

            return {loss_sum / static_cast<double>(total), static_cast<double>(correct) / static_cast<double>(total)};
        }

        static void log_epoch(std::ostream& stream,
                              const TrainingTelemetry::EpochSnapshot& snapshot,
                              std::size_t total_epochs,
                              bool improved)
        {
            using Utils::Terminal::ApplyColor;
            using Utils::Terminal::Colors::kBrightBlack;
            using Utils::Terminal::Colors::kBrightBlue;
            using Utils::Terminal::Colors::kBrightGreen;
            using Utils::Terminal::Colors::kBrightYellow;
            using Utils::Terminal::Colors::kReset;

            std::ostringstream line;
            line << "Epoch [" << snapshot.epoch_index << "/" << total_epochs << "] | ";
            line << ApplyColor("Train", kBrightYellow) << " loss: "
                 << std::fixed << std::setprecision(6) << snapshot.train_loss << " | ";
            line << ApplyColor("Test", kBrightBlue) << " loss: ";
            if (snapshot.test_loss) {
                line << std::fixed << std::setprecision(6) << *snapshot.test_loss;
            } else {
                line << "N/A";
            }
            if (snapshot.test_accuracy) {
                line << " | acc: " << std::fixed << std::setprecision(2) << (*snapshot.test_accuracy * 100.0) << '%';
            }

            line << " | \xCE\x94Loss: ";
            if (snapshot.delta) {
                std::ostringstream delta_stream;
                delta_stream << std::showpos << std::fixed << std::setprecision(6) << *snapshot.delta;
                line << delta_stream.str();
            } else {
                line << "N/A";
            }

            const std::string nabla_symbol{Utils::Terminal::Symbols::kNabla};
            const std::string grey{kBrightBlack};
            const std::string green{kBrightGreen};
            const std::string reset{kReset};
            if (improved)
                line << grey << " (" << green << nabla_symbol << grey << ")" << reset;
            else
                line << grey << " (" << nabla_symbol << ")" << reset;

            std::ostringstream lr_stream;
            lr_stream << std::defaultfloat << std::setprecision(4) << snapshot.learning_rate;
            std::ostringstream duration_stream;
            duration_stream << std::fixed << std::setprecision(2) << snapshot.duration_seconds << "sec";
            line << " | lr: " << lr_stream.str() << " | "
                 << ApplyColor("duration: " + duration_stream.str(), kBrightBlack);

            stream << line.str() << '\n';
        }

        void reset_runtime_state() {
            std::vector<std::string> children;
            for (const auto& child : this->named_children()) {
                children.push_back(child.key());
            }
            for (const auto& key : children) {
                this->unregister_module(key);
            }
            layers_.clear();
            module_descriptors_.clear();
            name_index_.clear();
            optimizer_.reset();
            module_index_ = 0;
            telemetry_.clear();
        }

        static std::string format_tensor_shape(const torch::Tensor& tensor) {
            std::ostringstream stream;
            stream << '(';
            const auto sizes = tensor.sizes();
            for (std::size_t index = 0; index < sizes.size(); ++index) {
                if (index > 0) {
                    stream << ", ";
                }
                stream << sizes[index];
            }
            stream << ')';
            return stream.str();
        }

        std::vector<Layer::Details::RegisteredLayer> layers_{};
        std::vector<NamedModuleDescriptor> module_descriptors_{};
        std::unordered_map<std::string, std::size_t> name_index_{};
        std::optional<LossDescriptor> loss_descriptor_{};
        std::unique_ptr<torch::optim::Optimizer> optimizer_{};
        TrainingTelemetry telemetry_{};
        std::size_t module_index_{0};
        std::string name_{};
        torch::Device device_{torch::kCPU};
    };
}

#endif //GRADUS_CORE_HPP
