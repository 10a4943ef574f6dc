#ifndef GRADUS_AUTOGRAD_INSPECT_HPP
#define GRADUS_AUTOGRAD_INSPECT_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <torch/torch.h>

#include "../utils/terminal.hpp"

namespace Gradus::Autograd {
    struct Demonstration {
        torch::Tensor x;
        torch::Tensor y;
        torch::Tensor z;
        torch::Tensor grad;
        torch::Tensor expected;
        bool matches{false};
        std::string grad_fn_name{};
    };

    /*
     * y = x^2, z = mean(y), then z.backward().
     * dz/dx = 2x / numel(x), so for a 2x2 input the gradient is x / 2.
     */
    [[nodiscard]] inline Demonstration Demonstrate(const torch::Tensor& input) {
        if (!input.defined() || input.numel() == 0) {
            throw std::invalid_argument("Autograd demonstration requires a non-empty tensor.");
        }
        if (!input.is_floating_point()) {
            throw std::invalid_argument("Autograd demonstration requires a floating point tensor.");
        }

        Demonstration result{};
        result.x = input.detach().clone().requires_grad_(true);
        result.y = result.x.pow(2);
        result.z = result.y.mean();
        if (const auto& node = result.y.grad_fn()) {
            result.grad_fn_name = node->name();
        }
        result.z.backward();

        result.grad = result.x.grad().detach().clone();
        result.expected = (2.0 * result.x.detach()) / static_cast<double>(result.x.numel());
        result.matches = torch::allclose(result.grad, result.expected);
        return result;
    }

    struct GradientRow {
        std::string name{};
        std::vector<std::int64_t> shape{};
        bool grad_defined{false};
        double grad_norm{0.0};
        double grad_mean{0.0};
    };

    template <class Module>
    [[nodiscard]] std::vector<GradientRow> Gradients(const Module& module) {
        std::vector<GradientRow> rows;
        for (const auto& item : module.named_parameters(/*recurse=*/true)) {
            GradientRow row{};
            row.name = item.key();
            row.shape.assign(item.value().sizes().begin(), item.value().sizes().end());
            const auto& grad = item.value().grad();
            row.grad_defined = grad.defined();
            if (row.grad_defined) {
                auto values = grad.detach().to(torch::kCPU, torch::kFloat64);
                row.grad_norm = values.norm().item<double>();
                row.grad_mean = values.mean().item<double>();
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

    inline void Print(const std::vector<GradientRow>& rows, std::ostream* stream = &std::cout,
                      Utils::Terminal::FrameStyle frame_style = Utils::Terminal::FrameStyle::Box) {
        if (stream == nullptr) {
            return;
        }
        using namespace Utils::Terminal;
        const auto color = Colors::kBrightBlue;

        auto shape_string = [](const std::vector<std::int64_t>& shape) {
            std::ostringstream out;
            out << '[';
            for (std::size_t i = 0; i < shape.size(); ++i) {
                out << shape[i];
                if (i + 1 < shape.size()) out << ", ";
            }
            out << ']';
            return out.str();
        };
        auto number = [](double value) {
            std::ostringstream out;
            out << std::scientific << std::setprecision(4) << value;
            return out.str();
        };

        std::vector<std::vector<std::string>> table{{"Parameter", "Shape", "Grad norm", "Grad mean"}};
        for (const auto& row : rows) {
            table.push_back({row.name, shape_string(row.shape),
                             row.grad_defined ? number(row.grad_norm) : "None",
                             row.grad_defined ? number(row.grad_mean) : "None"});
        }

        std::vector<std::size_t> widths(4, 0);
        for (const auto& line : table) {
            for (std::size_t c = 0; c < 4; ++c) {
                widths[c] = std::max(widths[c], line[c].size());
            }
        }
        std::vector<std::size_t> spacings;
        for (auto width : widths) {
            spacings.push_back(width + 2);
        }

        auto print_row = [&](const std::vector<std::string>& cells) {
            std::ostringstream line;
            line << Symbols::kBoxVertical << ' ' << std::left << std::setw(static_cast<int>(widths[0])) << cells[0] << std::right;
            for (std::size_t c = 1; c < 4; ++c) {
                line << ' ' << Symbols::kBoxVertical << ' ' << std::setw(static_cast<int>(widths[c])) << cells[c];
            }
            line << ' ' << Symbols::kBoxVertical;
            *stream << line.str() << '\n';
        };

        *stream << HTop(spacings, color, frame_style) << '\n';
        print_row(table.front());
        *stream << HMid(spacings, color) << '\n';
        for (std::size_t r = 1; r < table.size(); ++r) {
            print_row(table[r]);
        }
        *stream << HBottom(spacings, color, frame_style) << '\n';
    }

    struct Change {
        double max_abs_change{0.0};
        double mean_abs_change{0.0};
        bool changed{false};
    };

    // Detached copy of a parameter, taken before an optimizer step.
    [[nodiscard]] inline torch::Tensor Snapshot(const torch::Tensor& parameter) {
        if (!parameter.defined()) {
            throw std::invalid_argument("Cannot snapshot an undefined parameter.");
        }
        return parameter.detach().to(torch::kCPU).clone();
    }

    [[nodiscard]] inline Change Compare(const torch::Tensor& before, const torch::Tensor& after) {
        if (!before.defined() || !after.defined()) {
            throw std::invalid_argument("Compare expects two defined tensors.");
        }
        if (before.sizes() != after.sizes()) {
            throw std::invalid_argument("Compare expects tensors of identical shape.");
        }
        auto difference = (after.detach().to(torch::kCPU, torch::kFloat64) - before.detach().to(torch::kCPU, torch::kFloat64)).abs();
        Change change{};
        if (difference.numel() > 0) {
            change.max_abs_change = difference.max().item<double>();
            change.mean_abs_change = difference.mean().item<double>();
        }
        change.changed = change.max_abs_change > 0.0;
        return change;
    }
}

#endif // GRADUS_AUTOGRAD_INSPECT_HPP
