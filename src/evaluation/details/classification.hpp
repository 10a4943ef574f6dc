#ifndef GRADUS_CLASSIFICATION_HPP
#define GRADUS_CLASSIFICATION_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../metric/metric.hpp"
#include "../../utils/mode_guard.hpp"
#include "../../utils/terminal.hpp"

namespace Gradus::Evaluation::Details::Classification {
    struct Descriptor { };

    struct Options {
        std::size_t batch_size{256};
        bool print_summary{true};
        bool print_per_class{true};
        bool print_confusion{false};
        std::ostream* stream{&std::cout};
        Utils::Terminal::FrameStyle frame_style{Utils::Terminal::FrameStyle::Box};
    };

    struct Report {
        struct SummaryRow {
            Metric::Classification::Kind metric{};
            double macro{0.0};
            double weighted{0.0};
        };

        std::vector<Metric::Classification::Kind> order{};
        std::vector<SummaryRow> summary{};
        std::vector<std::int64_t> labels{};
        std::vector<std::size_t> support{};
        std::vector<std::vector<double>> per_class{};
        // confusion[true][predicted]
        std::vector<std::vector<std::size_t>> confusion{};
        std::size_t total_samples{0};
        std::size_t correct{0};
        double overall_accuracy{std::numeric_limits<double>::quiet_NaN()};
    };

    namespace detail {
        inline double safe_div(double num, double den) {
            constexpr double kEps = 1e-12;
            return (std::abs(den) < kEps) ? 0.0 : (num / den);
        }

        inline std::string_view metric_name(Metric::Classification::Kind kind) {
            using MetricKind = Metric::Classification::Kind;
            switch (kind) {
                case MetricKind::Accuracy: return "Accuracy";
                case MetricKind::Precision: return "Precision";
                case MetricKind::Recall: return "Recall";
                case MetricKind::F1: return "F1 score";
                case MetricKind::Top1Error: return "Top-1 error";
            }
            return "Metric";
        }

        inline std::string format_double(double value) {
            if (!std::isfinite(value)) {
                return "nan";
            }
            std::ostringstream out;
            out << std::fixed << std::setprecision(6) << value;
            return out.str();
        }

        // Drops duplicates, keeps request order.
        inline std::vector<Metric::Classification::Kind> normalise_requests(const std::vector<Metric::Classification::Descriptor>& descriptors) {
            std::vector<Metric::Classification::Kind> order;
            order.reserve(descriptors.size());
            for (const auto& descriptor : descriptors) {
                if (std::find(order.begin(), order.end(), descriptor.kind) == order.end()) {
                    order.push_back(descriptor.kind);
                }
            }
            return order;
        }

        inline torch::Tensor flatten_targets(torch::Tensor targets) {
            targets = targets.to(torch::kCPU);
            if (targets.dim() == 2 && targets.size(1) > 1) {
                targets = targets.argmax(1);
            }
            return targets.reshape({-1}).to(torch::kLong);
        }

        inline void accumulate(std::vector<std::vector<std::size_t>>& confusion,
                               const torch::Tensor& predicted,
                               const torch::Tensor& targets) {
            const auto num_classes = static_cast<std::int64_t>(confusion.size());
            auto pred = predicted.to(torch::kCPU).to(torch::kLong).contiguous();
            auto truth = targets.to(torch::kCPU).to(torch::kLong).contiguous();
            auto pred_acc = pred.accessor<std::int64_t, 1>();
            auto truth_acc = truth.accessor<std::int64_t, 1>();
            for (std::int64_t i = 0; i < truth.size(0); ++i) {
                const auto t = truth_acc[i];
                const auto p = pred_acc[i];
                if (t < 0 || t >= num_classes || p < 0 || p >= num_classes) {
                    throw std::out_of_range("Evaluation label " + std::to_string(t) + " or prediction " + std::to_string(p)
                                            + " outside [0, " + std::to_string(num_classes) + ").");
                }
                ++confusion[static_cast<std::size_t>(t)][static_cast<std::size_t>(p)];
            }
        }

        inline void finalise(Report& report) {
            using MetricKind = Metric::Classification::Kind;
            const auto num_classes = report.confusion.size();

            report.labels.resize(num_classes);
            report.support.assign(num_classes, 0);
            std::vector<std::size_t> predicted(num_classes, 0);
            std::vector<std::size_t> tp(num_classes, 0);
            report.correct = 0;

            for (std::size_t t = 0; t < num_classes; ++t) {
                report.labels[t] = static_cast<std::int64_t>(t);
                for (std::size_t p = 0; p < num_classes; ++p) {
                    const auto count = report.confusion[t][p];
                    report.support[t] += count;
                    predicted[p] += count;
                }
                tp[t] = report.confusion[t][t];
                report.correct += tp[t];
            }

            report.overall_accuracy = safe_div(static_cast<double>(report.correct), static_cast<double>(report.total_samples));

            report.per_class.assign(report.order.size(), std::vector<double>(num_classes, 0.0));
            report.summary.clear();

            for (std::size_t m = 0; m < report.order.size(); ++m) {
                const auto kind = report.order[m];
                auto& values = report.per_class[m];
                for (std::size_t c = 0; c < num_classes; ++c) {
                    const double precision = safe_div(static_cast<double>(tp[c]), static_cast<double>(predicted[c]));
                    const double recall = safe_div(static_cast<double>(tp[c]), static_cast<double>(report.support[c]));
                    switch (kind) {
                        case MetricKind::Accuracy: values[c] = recall; break;
                        case MetricKind::Precision: values[c] = precision; break;
                        case MetricKind::Recall: values[c] = recall; break;
                        case MetricKind::F1: values[c] = safe_div(2.0 * precision * recall, precision + recall); break;
                        case MetricKind::Top1Error: values[c] = report.support[c] > 0 ? 1.0 - recall : 0.0; break;
                    }
                }

                double macro = 0.0;
                double weighted = 0.0;
                std::size_t present = 0;
                for (std::size_t c = 0; c < num_classes; ++c) {
                    if (report.support[c] == 0) {
                        continue;
                    }
                    ++present;
                    macro += values[c];
                    weighted += values[c] * static_cast<double>(report.support[c]);
                }
                macro = safe_div(macro, static_cast<double>(present));
                weighted = safe_div(weighted, static_cast<double>(report.total_samples));

                // Accuracy and Top-1 error are global rates, not averages of per-class rates.
                if (kind == MetricKind::Accuracy) {
                    macro = weighted = report.overall_accuracy;
                } else if (kind == MetricKind::Top1Error) {
                    macro = weighted = 1.0 - report.overall_accuracy;
                }

                report.summary.push_back(Report::SummaryRow{kind, macro, weighted});
            }
        }
    }

    inline void Print(const Report& report, const Options& options);

    // Scores precomputed logits (or probabilities) against integer labels.
    [[nodiscard]] inline auto FromLogits(const torch::Tensor& logits,
                                         const torch::Tensor& targets,
                                         const std::vector<Metric::Classification::Descriptor>& descriptors,
                                         const Options& options = Options{}) -> Report {
        auto order = detail::normalise_requests(descriptors);
        if (order.empty()) {
            throw std::invalid_argument("At least one classification metric must be requested for evaluation.");
        }
        if (!logits.defined() || !targets.defined() || logits.dim() != 2) {
            throw std::invalid_argument("Evaluation expects [N, C] logits and defined targets.");
        }
        auto labels = detail::flatten_targets(targets);
        if (logits.size(0) != labels.size(0)) {
            throw std::invalid_argument("Evaluation inputs and targets must have the same number of samples.");
        }
        if (logits.size(0) == 0) {
            throw std::invalid_argument("Evaluation requires at least one sample.");
        }

        Report report{};
        report.order = std::move(order);
        report.total_samples = static_cast<std::size_t>(logits.size(0));
        const auto num_classes = static_cast<std::size_t>(logits.size(1));
        report.confusion.assign(num_classes, std::vector<std::size_t>(num_classes, 0));
        detail::accumulate(report.confusion, logits.argmax(1), labels);
        detail::finalise(report);

        if (options.stream && (options.print_summary || options.print_per_class || options.print_confusion)) {
            Print(report, options);
        }
        return report;
    }

    template <class Model>
    [[nodiscard]] auto Evaluate(Model& model,
                                torch::Tensor inputs,
                                torch::Tensor targets,
                                const std::vector<Metric::Classification::Descriptor>& descriptors,
                                const Options& options) -> Report
    {
        auto metric_order = detail::normalise_requests(descriptors);
        if (metric_order.empty()) {
            throw std::invalid_argument("At least one classification metric must be requested for evaluation.");
        }
        if (!inputs.defined() || !targets.defined()) {
            throw std::invalid_argument("Evaluation inputs and targets must be defined.");
        }
        if (inputs.dim() == 0 || inputs.size(0) == 0) {
            throw std::invalid_argument("Evaluation requires at least one sample.");
        }
        auto labels = detail::flatten_targets(targets);
        if (inputs.size(0) != labels.size(0)) {
            throw std::invalid_argument("Evaluation inputs and targets must have the same number of samples.");
        }

        Report report{};
        report.order = std::move(metric_order);
        report.total_samples = static_cast<std::size_t>(inputs.size(0));

        const auto total = inputs.size(0);
        const auto batch_size = options.batch_size > 0 ? static_cast<std::int64_t>(options.batch_size) : total;

        torch::NoGradGuard guard;
        Utils::EvalModeGuard mode(model);
        const auto device = model.device();

        for (std::int64_t offset = 0; offset < total; offset += batch_size) {
            const auto current = std::min<std::int64_t>(batch_size, total - offset);
            auto batch_inputs = inputs.narrow(0, offset, current).to(device);
            auto logits = model.forward(batch_inputs);
            if (logits.dim() != 2) {
                logits = logits.reshape({current, -1});
            }
            if (report.confusion.empty()) {
                const auto num_classes = static_cast<std::size_t>(logits.size(1));
                report.confusion.assign(num_classes, std::vector<std::size_t>(num_classes, 0));
            }
            detail::accumulate(report.confusion, logits.argmax(1), labels.narrow(0, offset, current));
        }

        detail::finalise(report);

        if (options.stream && (options.print_summary || options.print_per_class || options.print_confusion)) {
            Print(report, options);
        }

        return report;
    }

    inline void Print(const Report& report, const Options& options) {
        if (!options.stream) {
            return;
        }

        auto& stream = *options.stream;
        const auto& metrics = report.order;

        using namespace Utils::Terminal;
        const auto color = Colors::kBrightBlue;

        auto make_spacing = [](std::size_t width) { return width + 2; };

        if (options.print_summary && !report.summary.empty()) {
            std::size_t metric_width = std::string("Evaluation: Classification").size();
            std::size_t macro_width = std::string("Macro").size();
            std::size_t weighted_width = std::string("Weighted (support)").size();

            std::vector<std::string> names;
            std::vector<std::string> macros;
            std::vector<std::string> weighteds;
            for (const auto& row : report.summary) {
                names.emplace_back(detail::metric_name(row.metric));
                macros.push_back(detail::format_double(row.macro));
                weighteds.push_back(detail::format_double(row.weighted));
                metric_width = std::max(metric_width, names.back().size());
                macro_width = std::max(macro_width, macros.back().size());
                weighted_width = std::max(weighted_width, weighteds.back().size());
            }

            const std::vector<std::size_t> spacings{
                make_spacing(metric_width), make_spacing(macro_width), make_spacing(weighted_width)
            };

            auto print_row = [&](std::string_view c1, std::string_view c2, std::string_view c3) {
                std::ostringstream row;
                row << std::setfill(' ');
                row << Symbols::kBoxVertical << ' ';
                row << std::left << std::setw(static_cast<int>(metric_width)) << c1;
                row << std::right;
                row << ' ' << Symbols::kBoxVertical << ' ';
                row << std::setw(static_cast<int>(macro_width)) << c2;
                row << ' ' << Symbols::kBoxVertical << ' ';
                row << std::setw(static_cast<int>(weighted_width)) << c3;
                row << ' ' << Symbols::kBoxVertical;
                stream << row.str() << '\n';
            };

            stream << '\n' << HTop(spacings, color, options.frame_style) << '\n';
            print_row("Evaluation: Classification", "", "");
            stream << HMid(spacings, color) << '\n';
            print_row("Metric", "Macro", "Weighted (support)");
            stream << HMid(spacings, color) << '\n';
            for (std::size_t i = 0; i < names.size(); ++i) {
                print_row(names[i], macros[i], weighteds[i]);
            }
            stream << HBottom(spacings, color, options.frame_style) << '\n';

            if (std::isfinite(report.overall_accuracy)) {
                stream << "\nOverall accuracy (micro): " << detail::format_double(report.overall_accuracy)
                       << " (" << report.correct << '/' << report.total_samples << ")\n";
            }
        }

        const auto num_classes = report.labels.size();

        if (options.print_per_class && !report.per_class.empty() && num_classes > 0) {
            std::size_t metric_width = std::string("Support").size();
            for (auto kind : metrics) {
                metric_width = std::max(metric_width, detail::metric_name(kind).size());
            }

            std::vector<std::string> headers;
            std::vector<std::string> supports;
            std::vector<std::size_t> widths(num_classes, 0);
            for (std::size_t i = 0; i < num_classes; ++i) {
                headers.push_back("Label " + std::to_string(report.labels[i]));
                supports.push_back(std::to_string(report.support[i]));
                widths[i] = std::max(headers.back().size(), supports.back().size());
                for (const auto& values : report.per_class) {
                    widths[i] = std::max(widths[i], detail::format_double(values[i]).size());
                }
            }

            std::vector<std::size_t> spacings{make_spacing(metric_width)};
            for (auto width : widths) {
                spacings.push_back(make_spacing(width));
            }

            auto print_row = [&](std::string_view name, const std::vector<std::string>& values) {
                std::ostringstream row;
                row << std::setfill(' ');
                row << Symbols::kBoxVertical << ' ';
                row << std::left << std::setw(static_cast<int>(metric_width)) << name;
                row << std::right;
                for (std::size_t i = 0; i < num_classes; ++i) {
                    row << ' ' << Symbols::kBoxVertical << ' ';
                    row << std::setw(static_cast<int>(widths[i])) << values[i];
                }
                row << ' ' << Symbols::kBoxVertical;
                stream << row.str() << '\n';
            };

            stream << '\n' << HTop(spacings, color, options.frame_style) << '\n';
            print_row("Per-class", std::vector<std::string>(num_classes));
            stream << HMid(spacings, color) << '\n';
            print_row("Metric", headers);
            stream << HMid(spacings, color) << '\n';
            print_row("Support", supports);
            for (std::size_t m = 0; m < metrics.size() && m < report.per_class.size(); ++m) {
                std::vector<std::string> values;
                for (std::size_t c = 0; c < num_classes; ++c) {
                    values.push_back(detail::format_double(report.per_class[m][c]));
                }
                stream << HMid(spacings, color) << '\n';
                print_row(detail::metric_name(metrics[m]), values);
            }
            stream << HBottom(spacings, color, options.frame_style) << '\n';
        }

        if (options.print_confusion && !report.confusion.empty()) {
            std::size_t width = std::string("true\\pred").size();
            for (const auto& row : report.confusion) {
                for (auto value : row) {
                    width = std::max(width, std::to_string(value).size());
                }
            }
            std::vector<std::size_t> spacings(num_classes + 1, make_spacing(width));

            auto print_row = [&](std::string_view head, const std::vector<std::string>& cells) {
                std::ostringstream row;
                row << Symbols::kBoxVertical << ' ' << std::left << std::setw(static_cast<int>(width)) << head << std::right;
                for (const auto& cell : cells) {
                    row << ' ' << Symbols::kBoxVertical << ' ' << std::setw(static_cast<int>(width)) << cell;
                }
                row << ' ' << Symbols::kBoxVertical;
                stream << row.str() << '\n';
            };

            std::vector<std::string> header;
            for (auto label : report.labels) {
                header.push_back(std::to_string(label));
            }
            stream << '\n' << HTop(spacings, color, options.frame_style) << '\n';
            print_row("true\\pred", header);
            stream << HMid(spacings, color) << '\n';
            for (std::size_t t = 0; t < num_classes; ++t) {
                std::vector<std::string> cells;
                for (auto value : report.confusion[t]) {
                    cells.push_back(std::to_string(value));
                }
                print_row(std::to_string(report.labels[t]), cells);
            }
            stream << HBottom(spacings, color, options.frame_style) << '\n';
        }
    }
}

#endif //GRADUS_CLASSIFICATION_HPP
