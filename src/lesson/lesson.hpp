#ifndef GRADUS_LESSON_HPP
#define GRADUS_LESSON_HPP
/*
 * The MNIST walkthrough, one function per section. Every section prints its
 * heading and a short explanation to the lesson stream and returns what it
 * produced so that later sections (and tests) can build on it.
 */

#include <algorithm>
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
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../autograd/inspect.hpp"
#include "../config/config.hpp"
#include "../core.hpp"
#include "../data/data.hpp"
#include "../display/display.hpp"
#include "../initialization/apply.hpp"
#include "../initialization/initialization.hpp"
#include "../network.hpp"
#include "../utils/terminal.hpp"

namespace Gradus::Lesson {
    struct Context {
        Config::LessonConfig config{};
        std::ostream* stream{&std::cout};
    };

    namespace Details {
        inline void heading(const Context& context, int number, std::string_view title, std::string_view text) {
            if (context.stream == nullptr) {
                return;
            }
            using namespace Utils::Terminal;
            std::ostringstream line;
            line << "[Gradus] " << number << ". " << title;
            auto& out = *context.stream;
            out << '\n';
            if (context.config.color) {
                out << Styles::kBold << ApplyColor(line.str(), Colors::kBrightCyan) << Colors::kReset << '\n';
                out << ApplyColor(text, Colors::kBrightBlack) << '\n';
            } else {
                out << line.str() << '\n' << text << '\n';
            }
        }

        inline std::string shape_of(const torch::Tensor& tensor) {
            std::ostringstream out;
            out << '[';
            for (std::int64_t i = 0; i < tensor.dim(); ++i) {
                out << tensor.size(i) << (i + 1 < tensor.dim() ? ", " : "");
            }
            out << ']';
            return out.str();
        }

        inline Optimizer::Descriptor optimizer_from(const Config::LessonConfig& config) {
            if (config.optimizer == "adam") {
                return Optimizer::Descriptor{Optimizer::Adam({.learning_rate = config.learning_rate})};
            }
            return Optimizer::Descriptor{Optimizer::SGD({.learning_rate = config.learning_rate, .momentum = config.momentum})};
        }

        // Weight tensor of the first fully connected layer.
        inline torch::Tensor first_linear_weight(const Model& model) {
            for (std::size_t i = 0; i < model.layer_count(); ++i) {
                const auto& entry = model.layer(i);
                if (entry.kind != "fc" || !entry.module) {
                    continue;
                }
                auto parameters = entry.module->named_parameters(/*recurse=*/false);
                if (const auto* weight = parameters.find("weight")) {
                    return *weight;
                }
            }
            throw std::logic_error("Model has no fully connected layer.");
        }
    }

    // 1
    struct DataSection {
        torch::Tensor train_inputs;
        torch::Tensor train_targets;
        torch::Tensor test_inputs;
        torch::Tensor test_targets;
        std::shared_ptr<Data::Loader> loader;
        Data::Batch sample;
    };

    inline DataSection LoadData(const Context& context) {
        const auto& config = context.config;
        Details::heading(context, 1, "Load the data",
                         "Each MNIST image is a 28x28 greyscale digit. Pixels are scaled to [0, 1] and then normalised\n"
                         "with mean " + std::to_string(config.normalize_mean) + " and std " + std::to_string(config.normalize_std)
                         + ", so the network sees values in [-1, 1]. The loader serves shuffled batches of "
                         + std::to_string(config.batch_size) + ".");

        auto [train_x, train_y, test_x, test_y] =
            Data::Load::MNIST(config.dataset_root, config.train_fraction, config.test_fraction, /*normalise=*/true);

        DataSection section{};
        section.train_inputs = Data::Manipulation::Normalize(train_x, config.normalize_mean, config.normalize_std);
        section.train_targets = train_y;
        section.test_inputs = Data::Manipulation::Normalize(test_x, config.normalize_mean, config.normalize_std);
        section.test_targets = test_y;
        section.loader = std::make_shared<Data::Loader>(
            section.train_inputs, section.train_targets,
            Data::LoaderOptions{.batch_size = config.batch_size, .shuffle = true, .drop_last = false, .seed = config.seed});
        section.sample = section.loader->next();

        Data::Check::Size(section.train_inputs, "Train images", context.stream);
        Data::Check::Size(section.test_inputs, "Test images", context.stream);
        Data::Check::Size(section.sample.inputs, "One batch of images", context.stream);
        Data::Check::Size(section.sample.targets, "One batch of labels", context.stream);
        if (context.stream != nullptr) {
            *context.stream << "Batches per epoch: " << section.loader->size() << '\n';
        }
        return section;
    }

    // 2
    struct NetworkSection {
        std::shared_ptr<Model> model;
    };

    inline NetworkSection BuildNetwork(const Context& context,
                                       Activation::Descriptor output = Activation::Identity,
                                       std::string name = "mnist_mlp") {
        const auto& config = context.config;
        std::ostringstream hidden;
        for (auto size : config.hidden) {
            hidden << size << " -> ";
        }
        Details::heading(context, 2, "Build the network",
                         "A feed-forward network: flatten the image into 784 inputs, then 784 -> " + hidden.str()
                         + "10.\nHidden layers use ReLU; the last layer emits one score per digit. The first layer's weights\n"
                         "can also be set by hand: small normal values and a zero bias.");

        NetworkSection section{};
        section.model = std::make_shared<Model>(name);
        Network::MNIST(*section.model, Network::MNISTOptions{.hidden = config.hidden,
                                                             .activation = Activation::ReLU,
                                                             .output = output});
        section.model->to_device(config.use_cuda);
        if (context.stream != nullptr) {
            section.model->summary(*context.stream);
        }
        return section;
    }

    struct InitialisationSection {
        std::string layer;
        double weight_std{0.0};
        double bias_sum{0.0};
    };

    // Part of section 2: the first fully connected layer is re-drawn by hand.
    inline InitialisationSection InitialiseByHand(const Context& context, Model& model) {
        for (std::size_t i = 0; i < model.layer_count(); ++i) {
            const auto& entry = model.layer(i);
            if (entry.kind != "fc") {
                continue;
            }
            Initialization::Details::reinitialize(entry.module, Initialization::SmallNormal);

            const auto parameters = entry.module->named_parameters(/*recurse=*/false);
            InitialisationSection section{};
            section.layer = entry.name;
            section.weight_std = parameters["weight"].std().item<double>();
            section.bias_sum = parameters.contains("bias") ? parameters["bias"].abs().sum().item<double>() : 0.0;
            if (context.stream != nullptr) {
                *context.stream << "Re-initialised '" << section.layer << "' by hand: weights ~ N(0, "
                                << Initialization::Details::kSmallNormalStd << "), bias = 0 (measured std "
                                << std::fixed << std::setprecision(4) << section.weight_std << std::defaultfloat << ")\n";
            }
            return section;
        }
        throw std::logic_error("Model has no fully connected layer.");
    }

    // 3
    struct LossSection {
        torch::Tensor output;
        torch::Tensor loss;
    };

    inline LossSection LossOnBatch(const Context& context, Model& model, const Data::Batch& batch) {
        Details::heading(context, 3, "Loss on one batch",
                         "Cross-entropy compares the raw scores (logits) with the true labels. An untrained network\n"
                         "guesses uniformly, so the loss starts close to ln(10) = 2.30.");
        model.set_loss(Loss::CrossEntropy());
        LossSection section{};
        section.output = model.forward(batch.inputs);
        section.loss = model.compute_loss(section.output, batch.targets);
        if (context.stream != nullptr) {
            *context.stream << "Logits shape: " << Details::shape_of(section.output) << '\n'
                            << "Cross-entropy loss: " << std::fixed << std::setprecision(4)
                            << section.loss.item<double>() << std::defaultfloat << '\n';
        }
        return section;
    }

    // 4
    inline LossSection LogSoftmaxLoss(const Context& context, Model& model, const Data::Batch& batch) {
        Details::heading(context, 4, "LogSoftmax output with negative log-likelihood",
                         "With a LogSoftmax output the network returns log-probabilities. Negative log-likelihood on\n"
                         "those is the same quantity as cross-entropy on logits, and exp() recovers probabilities.");
        if (model.output_activation() != Activation::Type::LogSoftmax) {
            throw std::invalid_argument("LogSoftmaxLoss expects a model whose output activation is LogSoftmax.");
        }
        model.set_loss(Loss::NegativeLogLikelihood());
        LossSection section{};
        section.output = model.forward(batch.inputs);
        section.loss = model.compute_loss(section.output, batch.targets);
        if (context.stream != nullptr) {
            const auto row_sum = section.output.detach().exp().sum(1).mean().item<double>();
            *context.stream << "NLL loss: " << std::fixed << std::setprecision(4) << section.loss.item<double>() << '\n'
                            << "Mean of sum(exp(output)) per row: " << row_sum << std::defaultfloat << '\n';
        }
        return section;
    }

    // 5
    inline Autograd::Demonstration AutogradDemo(const Context& context) {
        Details::heading(context, 5, "Autograd",
                         "Tensors created with requires_grad record the operations applied to them. Calling backward()\n"
                         "on a scalar walks that graph and fills .grad. Here y = x^2 and z = mean(y), so dz/dx = x/2.");
        auto demo = Autograd::Demonstrate(torch::randn({2, 2}));
        if (context.stream != nullptr) {
            auto& out = *context.stream;
            out << "x =\n" << demo.x.detach() << '\n'
                << "y = x^2 =\n" << demo.y.detach() << '\n'
                << "y.grad_fn: " << demo.grad_fn_name << '\n'
                << "z = mean(y) = " << demo.z.item<double>() << '\n'
                << "x.grad =\n" << demo.grad << '\n'
                << "x / 2 =\n" << demo.expected << '\n'
                << "Gradient matches analytic result: " << (demo.matches ? "yes" : "no") << '\n';
        }
        return demo;
    }

    // 6
    struct BackwardSection {
        bool grad_defined_before{false};
        torch::Tensor first_layer_grad;
        std::vector<Autograd::GradientRow> rows;
        double loss{0.0};
    };

    inline BackwardSection BackwardPass(const Context& context, Model& model, const Data::Batch& batch) {
        Details::heading(context, 6, "Backward pass",
                         "The loss depends on every weight. loss.backward() computes d(loss)/d(weight) for all of them;\n"
                         "before the call the first layer has no gradient, afterwards it has one of the same shape.");
        model.zero_grad(/*set_to_none=*/true);
        const auto weight = Details::first_linear_weight(model);

        BackwardSection section{};
        section.grad_defined_before = weight.grad().defined();
        auto output = model.forward(batch.inputs);
        auto loss = model.compute_loss(output, batch.targets);
        loss.backward();
        section.loss = loss.item<double>();
        section.first_layer_grad = weight.grad().detach().clone();
        section.rows = Autograd::Gradients(model);

        if (context.stream != nullptr) {
            *context.stream << "Before backward: first layer gradient "
                            << (section.grad_defined_before ? "defined" : "None") << '\n'
                            << "After backward: first layer gradient " << Details::shape_of(section.first_layer_grad) << '\n';
            Autograd::Print(section.rows, context.stream);
        }
        model.zero_grad();
        return section;
    }

    // 7
    struct StepSection {
        torch::Tensor before;
        torch::Tensor after;
        torch::Tensor gradient;
        Autograd::Change change{};
        double loss{0.0};
    };

    inline StepSection SingleStep(const Context& context, Model& model, const Data::Batch& batch) {
        Details::heading(context, 7, "One optimisation step",
                         "The optimizer moves every weight a small step against its gradient:\n"
                         "w <- w - learning_rate * grad. Gradients accumulate, so they are cleared after each step.");
        if (!model.has_optimizer()) {
            model.set_optimizer(Optimizer::SGD({.learning_rate = 0.01}));
        }
        const auto weight = Details::first_linear_weight(model);

        StepSection section{};
        section.before = Autograd::Snapshot(weight);
        model.zero_grad();
        auto output = model.forward(batch.inputs);
        auto loss = model.compute_loss(output, batch.targets);
        loss.backward();
        section.loss = loss.item<double>();
        section.gradient = weight.grad().detach().to(torch::kCPU).clone();
        model.step();
        model.zero_grad();
        section.after = Autograd::Snapshot(weight);
        section.change = Autograd::Compare(section.before, section.after);

        if (context.stream != nullptr) {
            auto& out = *context.stream;
            out << "Initial weights (first row, first 5):\n" << section.before[0].narrow(0, 0, 5) << '\n'
                << "Gradient (first row, first 5):\n" << section.gradient[0].narrow(0, 0, 5) << '\n'
                << "Updated weights (first row, first 5):\n" << section.after[0].narrow(0, 0, 5) << '\n'
                << "Largest change: " << std::scientific << std::setprecision(3) << section.change.max_abs_change
                << std::defaultfloat << " (learning rate " << model.learning_rate() << ")\n";
        }
        return section;
    }

    // 8
    struct TrainingSection {
        std::shared_ptr<Model> model;
        std::vector<double> epoch_losses;
    };

    inline TrainingSection TrainNetwork(const Context& context, const DataSection& data) {
        const auto& config = context.config;
        Details::heading(context, 8, "Train the network",
                         "One epoch is a full pass over the training set: for every batch run forward, loss, backward,\n"
                         "step and zero_grad. The running loss should fall epoch after epoch.");

        const bool use_nll = config.loss == "nll";
        Context quiet = context;
        quiet.stream = nullptr;
        TrainingSection section{};
        section.model = BuildNetwork(quiet, use_nll ? Activation::LogSoftmax : Activation::Identity, "mnist_classifier").model;
        if (use_nll) {
            section.model->set_loss(Loss::NegativeLogLikelihood());
        } else {
            section.model->set_loss(Loss::CrossEntropy());
        }
        section.model->set_optimizer(Details::optimizer_from(config));

        TrainOptions options{};
        options.epoch = config.epochs;
        options.batch_size = config.batch_size;
        options.monitor = true;
        options.progress = context.stream != nullptr;
        options.test = std::vector<torch::Tensor>{data.test_inputs, data.test_targets};
        options.stream = context.stream;
        options.seed = config.seed;
        section.model->train(*data.loader, options);

        for (const auto& epoch : section.model->training_telemetry().epochs()) {
            section.epoch_losses.push_back(epoch.train_loss);
            if (context.stream != nullptr) {
                *context.stream << "Training loss: " << epoch.train_loss << '\n';
            }
        }
        return section;
    }

    // 9
    struct ClassifySection {
        std::int64_t predicted{-1};
        std::int64_t label{-1};
        torch::Tensor probabilities;
        std::optional<std::filesystem::path> panel{};
    };

    inline ClassifySection Classify(const Context& context, Model& model, const DataSection& data, std::int64_t index = 0) {
        const auto& config = context.config;
        Details::heading(context, 9, "Classify a digit",
                         "Pass one test image through the trained network and turn its output into class probabilities.");
        if (index < 0 || index >= data.test_inputs.size(0)) {
            throw std::out_of_range("Test image index " + std::to_string(index) + " out of range.");
        }

        const auto image = data.test_inputs[index];
        ClassifySection section{};
        section.probabilities = model.predict_proba(image.unsqueeze(0))[0].to(torch::kCPU);
        section.predicted = section.probabilities.argmax().item<std::int64_t>();
        section.label = data.test_targets[index].item<std::int64_t>();

        const auto display_image = Data::Manipulation::Denormalize(image, config.normalize_mean, config.normalize_std);
        Display::ViewClassify(display_image, section.probabilities,
                              Display::Options{.color = config.color, .stream = context.stream});
        if (!config.panel_path.empty()) {
            section.panel = Display::SavePanel(config.panel_path, display_image, section.probabilities);
        }
        if (context.stream != nullptr) {
            *context.stream << "Predicted " << section.predicted << ", label " << section.label << '\n';
            if (section.panel) {
                *context.stream << "[Gradus] Panel written to " << section.panel->string() << '\n';
            }
        }
        return section;
    }

    // 10
    struct EvaluationSection {
        Evaluation::ClassificationReport report;
        std::optional<std::filesystem::path> checkpoint{};
    };

    inline EvaluationSection EvaluateNetwork(const Context& context, Model& model, const DataSection& data) {
        const auto& config = context.config;
        Details::heading(context, 10, "Evaluate on held-out data",
                         "Accuracy on images the network never trained on tells whether it learned digits or memorised.");
        EvaluationSection section{};
        Evaluation::Options options{};
        options.batch_size = std::max<std::size_t>(config.batch_size, 256);
        options.stream = context.stream;
        options.print_summary = true;
        options.print_per_class = true;
        options.frame_style = Utils::Terminal::FrameStyle::Box;
        section.report = model.evaluate(data.test_inputs, data.test_targets, Evaluation::Classification,
                                        {Metric::Classification::Accuracy,
                                         Metric::Classification::Precision,
                                         Metric::Classification::Recall,
                                         Metric::Classification::F1,
                                         Metric::Classification::Top1Error},
                                        options);
        if (!config.checkpoint_dir.empty()) {
            section.checkpoint = model.save(config.checkpoint_dir, /*overwrite=*/false, context.stream);
        }
        return section;
    }

    struct RunSummary {
        std::vector<double> epoch_losses;
        double test_accuracy{0.0};
        std::int64_t predicted{-1};
        std::int64_t label{-1};
    };

    inline RunSummary Run(const Config::LessonConfig& config, std::ostream* stream = &std::cout) {
        Config::Validate(config);
        if (config.seed) {
            torch::manual_seed(*config.seed);
        }
        const Context context{config, stream};
        Config::Print(config, stream);

        auto data = LoadData(context);

        auto logits_network = BuildNetwork(context, Activation::Identity, "mnist_logits");
        (void)InitialiseByHand(context, *logits_network.model);
        (void)LossOnBatch(context, *logits_network.model, data.sample);

        Context quiet = context;
        quiet.stream = nullptr;
        auto log_network = BuildNetwork(quiet, Activation::LogSoftmax, "mnist_log_softmax");
        (void)LogSoftmaxLoss(context, *log_network.model, data.sample);

        (void)AutogradDemo(context);
        (void)BackwardPass(context, *log_network.model, data.sample);
        (void)SingleStep(context, *log_network.model, data.sample);

        auto training = TrainNetwork(context, data);
        auto classified = Classify(context, *training.model, data);
        auto evaluation = EvaluateNetwork(context, *training.model, data);

        RunSummary summary{};
        summary.epoch_losses = std::move(training.epoch_losses);
        summary.test_accuracy = evaluation.report.overall_accuracy;
        summary.predicted = classified.predicted;
        summary.label = classified.label;
        if (stream != nullptr) {
            *stream << "\n[Gradus] Lesson complete. Test accuracy "
                    << std::fixed << std::setprecision(2) << summary.test_accuracy * 100.0 << "%" << std::defaultfloat << '\n';
        }
        return summary;
    }
}

#endif // GRADUS_LESSON_HPP
