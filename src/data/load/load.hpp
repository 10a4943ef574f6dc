#ifndef GRADUS_LOAD_HPP
#define GRADUS_LOAD_HPP
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "types.hpp"

namespace Gradus::Data::Load {
    namespace Details {
        template <class Tensor>
        Tensor apply_fraction(Tensor tensor, std::size_t count) {
            if (tensor.dim() == 0) {
                return tensor;
            }
            if (tensor.size(0) <= static_cast<int64_t>(count)) {
                return tensor;
            }
            return tensor.narrow(0, 0, static_cast<int64_t>(count)).clone();
        }

        inline std::size_t fraction_count(float fraction, std::size_t total) {
            const auto clamped = std::clamp(fraction, 0.0f, 1.0f);
            return std::clamp<std::size_t>(
                static_cast<std::size_t>(std::round(clamped * static_cast<float>(total))), 0, total);
        }

        inline std::filesystem::path resolve_mnist_root(const std::string& root) {
            const std::array<std::filesystem::path, 3> candidates = {
                std::filesystem::path(root),
                std::filesystem::path(root) / "MNIST",
                std::filesystem::path(root) / "MNIST" / "raw"
            };

            for (const auto& candidate : candidates) {
                if (!std::filesystem::exists(candidate)) {
                    continue;
                }

                const bool has_all_files = std::all_of(
                    Type::MNIST::kRequiredFiles.begin(), Type::MNIST::kRequiredFiles.end(),
                    [&](const char* file) { return std::filesystem::exists(candidate / file); });

                if (has_all_files) {
                    return candidate;
                }
            }

            throw std::runtime_error("Unable to locate MNIST dataset in the provided root: " + root);
        }

        inline std::uint32_t read_big_endian_u32(std::ifstream& file, const std::filesystem::path& file_path, const char* context) {
            std::array<std::uint8_t, 4> buffer{};
            if (!file.read(reinterpret_cast<char*>(buffer.data()), 4)) {
                throw std::runtime_error("Failed to read " + std::string(context) + " from " + file_path.string());
            }

            return (static_cast<std::uint32_t>(buffer[0]) << 24U) |
                   (static_cast<std::uint32_t>(buffer[1]) << 16U) |
                   (static_cast<std::uint32_t>(buffer[2]) << 8U) |
                   static_cast<std::uint32_t>(buffer[3]);
        }

        inline void write_big_endian_u32(std::ofstream& file, std::uint32_t value) {
            const std::array<char, 4> buffer{
                static_cast<char>((value >> 24U) & 0xFFU),
                static_cast<char>((value >> 16U) & 0xFFU),
                static_cast<char>((value >> 8U) & 0xFFU),
                static_cast<char>(value & 0xFFU)
            };
            file.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        }

        // The header's count is checked against the bytes actually on disk before anything is allocated.
        inline void require_payload(const std::filesystem::path& file_path, std::uintmax_t header_bytes,
                                    std::uintmax_t payload_bytes, const char* what) {
            std::error_code error_code;
            const auto file_bytes = std::filesystem::file_size(file_path, error_code);
            if (error_code) {
                throw std::runtime_error("Failed to stat MNIST " + std::string(what) + " file " + file_path.string()
                                         + ": " + error_code.message());
            }
            if (file_bytes < header_bytes || file_bytes - header_bytes < payload_bytes) {
                throw std::runtime_error("MNIST " + std::string(what) + " file truncated: " + file_path.string());
            }
        }

        // Returns [N, 1, 28, 28] uint8.
        inline torch::Tensor read_idx_images(const std::filesystem::path& file_path) {
            std::ifstream file(file_path, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Failed to open MNIST image file: " + file_path.string());
            }

            const auto magic = read_big_endian_u32(file, file_path, "magic number");
            if (magic != Type::IDX::kImageMagic) {
                throw std::runtime_error("Unexpected MNIST image file magic number in " + file_path.string());
            }

            const auto count = static_cast<int64_t>(read_big_endian_u32(file, file_path, "image count"));
            const auto rows = static_cast<int64_t>(read_big_endian_u32(file, file_path, "rows"));
            const auto cols = static_cast<int64_t>(read_big_endian_u32(file, file_path, "columns"));

            if (rows != Type::MNIST::kRows || cols != Type::MNIST::kCols) {
                throw std::runtime_error("MNIST image dimensions must be 28x28 in file: " + file_path.string());
            }

            const auto expected_size = static_cast<std::size_t>(count * rows * cols);
            require_payload(file_path, 16, expected_size, "image");
            std::vector<std::uint8_t> buffer(expected_size);
            file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            if (static_cast<std::size_t>(file.gcount()) != expected_size) {
                throw std::runtime_error("MNIST image file truncated: " + file_path.string());
            }

            auto tensor = torch::empty({count, 1, rows, cols}, torch::kUInt8);
            if (expected_size > 0) {
                std::memcpy(tensor.data_ptr<std::uint8_t>(), buffer.data(), buffer.size());
            }
            return tensor;
        }

        // Returns [N] int64.
        inline torch::Tensor read_idx_labels(const std::filesystem::path& file_path) {
            std::ifstream file(file_path, std::ios::binary);
            if (!file) {
                throw std::runtime_error("Failed to open MNIST label file: " + file_path.string());
            }

            const auto magic = read_big_endian_u32(file, file_path, "magic number");
            if (magic != Type::IDX::kLabelMagic) {
                throw std::runtime_error("Unexpected MNIST label file magic number in " + file_path.string());
            }

            const auto count = static_cast<int64_t>(read_big_endian_u32(file, file_path, "label count"));
            require_payload(file_path, 8, static_cast<std::uintmax_t>(count), "label");

            std::vector<std::uint8_t> buffer(static_cast<std::size_t>(count));
            file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            if (static_cast<std::size_t>(file.gcount()) != buffer.size()) {
                throw std::runtime_error("MNIST label file truncated: " + file_path.string());
            }

            auto tensor = torch::empty({count}, torch::kInt64);
            auto accessor = tensor.accessor<int64_t, 1>();
            for (int64_t index = 0; index < count; ++index) {
                accessor[index] = static_cast<int64_t>(buffer[static_cast<std::size_t>(index)]);
            }
            return tensor;
        }

        // Accepts [N, 28, 28] or [N, 1, 28, 28]; values are clamped into [0, 255].
        inline void write_idx_images(const std::filesystem::path& file_path, const torch::Tensor& images) {
            if (!images.defined() || (images.dim() != 3 && images.dim() != 4)) {
                throw std::invalid_argument("write_idx_images expects a [N, 28, 28] or [N, 1, 28, 28] tensor.");
            }
            auto bytes = images.reshape({images.size(0), -1}).to(torch::kCPU);
            if (bytes.size(1) != Type::MNIST::kPixels) {
                throw std::invalid_argument("write_idx_images expects 28x28 images.");
            }
            bytes = bytes.clamp(0, 255).to(torch::kUInt8).contiguous();

            std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw std::runtime_error("Failed to open MNIST image file for writing: " + file_path.string());
            }
            write_big_endian_u32(file, Type::IDX::kImageMagic);
            write_big_endian_u32(file, static_cast<std::uint32_t>(bytes.size(0)));
            write_big_endian_u32(file, static_cast<std::uint32_t>(Type::MNIST::kRows));
            write_big_endian_u32(file, static_cast<std::uint32_t>(Type::MNIST::kCols));
            file.write(reinterpret_cast<const char*>(bytes.data_ptr<std::uint8_t>()),
                       static_cast<std::streamsize>(bytes.numel()));
            if (!file) {
                throw std::runtime_error("Failed to write MNIST image payload to: " + file_path.string());
            }
        }

        inline void write_idx_labels(const std::filesystem::path& file_path, const torch::Tensor& labels) {
            if (!labels.defined() || labels.dim() != 1) {
                throw std::invalid_argument("write_idx_labels expects a one-dimensional label tensor.");
            }
            auto bytes = labels.to(torch::kCPU).clamp(0, 255).to(torch::kUInt8).contiguous();

            std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw std::runtime_error("Failed to open MNIST label file for writing: " + file_path.string());
            }
            write_big_endian_u32(file, Type::IDX::kLabelMagic);
            write_big_endian_u32(file, static_cast<std::uint32_t>(bytes.size(0)));
            file.write(reinterpret_cast<const char*>(bytes.data_ptr<std::uint8_t>()),
                       static_cast<std::streamsize>(bytes.numel()));
            if (!file) {
                throw std::runtime_error("Failed to write MNIST label payload to: " + file_path.string());
            }
        }
    }

    /*
     * Reads the four MNIST IDX files found under `root`, `root/MNIST` or `root/MNIST/raw`.
     * Returns (train_images, train_labels, test_images, test_labels); images are [N, 1, 28, 28]
     * float32, scaled into [0, 1] when `normalise` is set, labels are [N] int64.
     * Fractions keep the leading share of each split.
     */
    [[nodiscard]] inline std::tuple<torch::Tensor, torch::Tensor, torch::Tensor, torch::Tensor>
    MNIST(const std::string& root, float train_fraction = 1.0f, float test_fraction = 1.0f, bool normalise = true) {
        const auto dataset_root = Details::resolve_mnist_root(root);

        auto train_inputs = Details::read_idx_images(dataset_root / Type::MNIST::kTrainImages);
        auto train_targets = Details::read_idx_labels(dataset_root / Type::MNIST::kTrainLabels);
        auto test_inputs = Details::read_idx_images(dataset_root / Type::MNIST::kTestImages);
        auto test_targets = Details::read_idx_labels(dataset_root / Type::MNIST::kTestLabels);

        if (train_inputs.size(0) != train_targets.size(0)) {
            throw std::runtime_error("MNIST training images and labels count mismatch");
        }
        if (test_inputs.size(0) != test_targets.size(0)) {
            throw std::runtime_error("MNIST test images and labels count mismatch");
        }

        const auto effective_train = Details::fraction_count(train_fraction, static_cast<std::size_t>(train_inputs.size(0)));
        const auto effective_test = Details::fraction_count(test_fraction, static_cast<std::size_t>(test_inputs.size(0)));

        train_inputs = Details::apply_fraction(std::move(train_inputs), effective_train);
        train_targets = Details::apply_fraction(std::move(train_targets), effective_train);
        test_inputs = Details::apply_fraction(std::move(test_inputs), effective_test);
        test_targets = Details::apply_fraction(std::move(test_targets), effective_test);

        train_inputs = train_inputs.to(torch::kFloat32);
        test_inputs = test_inputs.to(torch::kFloat32);
        if (normalise) {
            train_inputs = train_inputs / 255.0f;
            test_inputs = test_inputs / 255.0f;
        }

        return {train_inputs, train_targets, test_inputs, test_targets};
    }
}

#endif //GRADUS_LOAD_HPP
