#include "fixtures.hpp"

#include <atomic>
#include <chrono>
#include <system_error>

#include "../src/data/load/load.hpp"

namespace Gradus::Testing {
    TempDirectory::TempDirectory(const std::string& prefix) {
        static std::atomic<std::uint64_t> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path()
              / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(path_);
    }

    TempDirectory::~TempDirectory() {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
    }

    Digits MakeDigits(std::int64_t per_class, std::uint64_t seed) {
        torch::manual_seed(seed);
        const auto total = per_class * 10;
        auto images = torch::randint(0, 40, {total, 28, 28}, torch::TensorOptions().dtype(torch::kLong));
        auto labels = torch::arange(total, torch::TensorOptions().dtype(torch::kLong)) % 10;
        for (std::int64_t i = 0; i < total; ++i) {
            const auto label = labels[i].item<std::int64_t>();
            images[i].narrow(0, 2 * label + 4, 2).fill_(255);
        }
        return {images.to(torch::kUInt8), labels};
    }

    void WriteMNIST(const std::filesystem::path& directory, const Digits& train, const Digits& test) {
        std::filesystem::create_directories(directory);
        using Gradus::Data::Type::MNIST;
        Gradus::Data::Load::Details::write_idx_images(directory / MNIST::kTrainImages, train.images);
        Gradus::Data::Load::Details::write_idx_labels(directory / MNIST::kTrainLabels, train.labels);
        Gradus::Data::Load::Details::write_idx_images(directory / MNIST::kTestImages, test.images);
        Gradus::Data::Load::Details::write_idx_labels(directory / MNIST::kTestLabels, test.labels);
    }

    std::pair<torch::Tensor, torch::Tensor> AsFloat(const Digits& digits) {
        auto inputs = digits.images.to(torch::kFloat32).div(255.0).unsqueeze(1);
        return {inputs, digits.labels.clone()};
    }
}
