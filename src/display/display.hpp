#ifndef GRADUS_DISPLAY_HPP
#define GRADUS_DISPLAY_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <torch/torch.h>

#include "../data/load/types.hpp"
#include "../utils/terminal.hpp"

namespace Gradus::Display {
    struct Options {
        bool color{true};
        std::size_t bar_width{30};
        std::ostream* stream{&std::cout};
    };

    struct PanelOptions {
        int image_size{280};
        int bar_area_width{320};
        int bar_max_length{200};
    };

    namespace Details {
        inline constexpr std::string_view kAsciiRamp = " .:-=+*#%@";

        // Accepts [28, 28], [1, 28, 28], [1, 1, 28, 28] or [784]; returns [28, 28] float64 in [0, 1].
        inline torch::Tensor to_unit_image(const torch::Tensor& image) {
            if (!image.defined() || image.numel() != Data::Type::MNIST::kPixels) {
                throw std::invalid_argument("Display expects a single 28x28 image ([28,28], [1,28,28] or [784]).");
            }
            auto pixels = image.detach().to(torch::kCPU, torch::kFloat64).reshape({Data::Type::MNIST::kRows, Data::Type::MNIST::kCols});
            const auto low = pixels.min().item<double>();
            const auto high = pixels.max().item<double>();
            if (high - low <= 1e-12) {
                return torch::zeros_like(pixels);
            }
            return (pixels - low) / (high - low);
        }

        inline std::vector<double> to_probabilities(const torch::Tensor& probabilities) {
            if (!probabilities.defined() || probabilities.numel() != Data::Type::MNIST::kClasses) {
                throw std::invalid_argument("Expected " + std::to_string(Data::Type::MNIST::kClasses)
                                            + " class probabilities.");
            }
            auto values = probabilities.detach().to(torch::kCPU, torch::kFloat64).reshape({-1}).contiguous();
            return {values.data_ptr<double>(), values.data_ptr<double>() + values.numel()};
        }

        inline std::vector<std::string> render_rows(const torch::Tensor& unit, bool color) {
            using namespace Utils::Terminal;
            std::vector<std::string> rows;
            auto accessor = unit.accessor<double, 2>();
            for (std::int64_t r = 0; r < unit.size(0); ++r) {
                std::string line;
                for (std::int64_t c = 0; c < unit.size(1); ++c) {
                    const double value = accessor[r][c];
                    if (color) {
                        line.append(Bg256(GreyIndex(value))).append("  ");
                    } else {
                        const auto index = static_cast<std::size_t>(value * static_cast<double>(kAsciiRamp.size() - 1) + 0.5);
                        line.append(2, kAsciiRamp[std::min(index, kAsciiRamp.size() - 1)]);
                    }
                }
                if (color) {
                    line.append(Colors::kReset);
                }
                rows.push_back(std::move(line));
            }
            return rows;
        }
    }

    // Terminal rendering of one digit, two characters per pixel.
    inline std::string Render(const torch::Tensor& image, const Options& options = {}) {
        const auto rows = Details::render_rows(Details::to_unit_image(image), options.color);
        std::ostringstream out;
        for (const auto& row : rows) {
            out << row << '\n';
        }
        if (options.stream != nullptr) {
            *options.stream << out.str() << std::flush;
        }
        return out.str();
    }

    // Digit on the left, one bar per class on the right; the argmax is marked.
    inline std::string ViewClassify(const torch::Tensor& image, const torch::Tensor& probabilities, const Options& options = {}) {
        using namespace Utils::Terminal;
        const auto probs = Details::to_probabilities(probabilities);
        const auto rows = Details::render_rows(Details::to_unit_image(image), options.color);
        const auto best = static_cast<std::size_t>(std::distance(probs.begin(), std::max_element(probs.begin(), probs.end())));

        const auto first_bar_row = (rows.size() - probs.size()) / 2;
        std::ostringstream out;
        for (std::size_t r = 0; r < rows.size(); ++r) {
            out << rows[r];
            if (r >= first_bar_row && r < first_bar_row + probs.size()) {
                const auto cls = r - first_bar_row;
                const auto value = std::clamp(probs[cls], 0.0, 1.0);
                const auto filled = static_cast<std::size_t>(value * static_cast<double>(options.bar_width) + 0.5);
                std::ostringstream bar;
                bar << "   " << cls << ' ' << Symbols::kBoxVertical
                    << Repeat(Symbols::kFullBlock, filled) << std::string(options.bar_width - std::min(filled, options.bar_width), ' ')
                    << Symbols::kBoxVertical << ' ' << std::fixed << std::setprecision(4) << value;
                if (cls == best) {
                    bar << ' ' << Symbols::kArrowLeft;
                }
                out << (options.color && cls == best ? ApplyColor(bar.str(), Colors::kBrightGreen) : bar.str());
            }
            out << '\n';
        }
        if (options.stream != nullptr) {
            *options.stream << out.str() << std::flush;
        }
        return out.str();
    }

    // PNG panel: upscaled digit on the left, probability bars on the right.
    inline std::filesystem::path SavePanel(const std::filesystem::path& path,
                                           const torch::Tensor& image,
                                           const torch::Tensor& probabilities,
                                           const PanelOptions& options = {}) {
        const auto probs = Details::to_probabilities(probabilities);
        const auto unit = (Details::to_unit_image(image) * 255.0).round().to(torch::kUInt8).contiguous();

        try {
            cv::Mat digit(static_cast<int>(unit.size(0)), static_cast<int>(unit.size(1)), CV_8UC1, unit.data_ptr<std::uint8_t>());
            cv::Mat scaled;
            cv::resize(digit, scaled, cv::Size(options.image_size, options.image_size), 0, 0, cv::INTER_NEAREST);
            cv::Mat scaled_bgr;
            cv::cvtColor(scaled, scaled_bgr, cv::COLOR_GRAY2BGR);

            cv::Mat panel(options.image_size, options.image_size + options.bar_area_width, CV_8UC3, cv::Scalar(255, 255, 255));
            scaled_bgr.copyTo(panel(cv::Rect(0, 0, options.image_size, options.image_size)));

            const auto best = static_cast<std::size_t>(std::distance(probs.begin(), std::max_element(probs.begin(), probs.end())));
            const int row_height = options.image_size / static_cast<int>(probs.size());
            const int origin_x = options.image_size + 30;
            for (std::size_t cls = 0; cls < probs.size(); ++cls) {
                const int top = static_cast<int>(cls) * row_height + 4;
                const int length = static_cast<int>(std::clamp(probs[cls], 0.0, 1.0) * options.bar_max_length);
                const auto colour = cls == best ? cv::Scalar(60, 160, 60) : cv::Scalar(200, 140, 60);

                cv::putText(panel, std::to_string(cls), cv::Point(options.image_size + 10, top + row_height - 10),
                            cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 0), 1, cv::LINE_AA);
                if (length > 0) {
                    cv::rectangle(panel, cv::Rect(origin_x, top, length, row_height - 8), colour, cv::FILLED);
                }
                std::ostringstream label;
                label << std::fixed << std::setprecision(3) << probs[cls];
                cv::putText(panel, label.str(), cv::Point(origin_x + options.bar_max_length + 8, top + row_height - 10),
                            cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar(40, 40, 40), 1, cv::LINE_AA);
            }

            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            if (!cv::imwrite(path.string(), panel)) {
                throw std::runtime_error("Failed to encode panel image to '" + path.string() + "'.");
            }
        } catch (const cv::Exception& error) {
            throw std::runtime_error("OpenCV failed to write panel '" + path.string() + "': " + error.what());
        }
        return path;
    }
}

#endif // GRADUS_DISPLAY_HPP
