#ifndef GRADUS_TEST_FIXTURES_HPP
#define GRADUS_TEST_FIXTURES_HPP

#include <cstdint>
#include <filesystem>
#include <string>

#include <torch/torch.h>

namespace Gradus::Testing {
    // Unique directory under the system temp path, removed on destruction.
    class TempDirectory {
    public:
        explicit TempDirectory(const std::string& prefix = "gradus");
        ~TempDirectory();

        TempDirectory(const TempDirectory&) = delete;
        TempDirectory& operator=(const TempDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    struct Digits {
        torch::Tensor images; // [N, 28, 28] uint8
        torch::Tensor labels; // [N] int64
    };

    // Class c lights rows [2c + 4, 2c + 6) on a noisy background, so every class is linearly separable.
    Digits MakeDigits(std::int64_t per_class, std::uint64_t seed);

    // Writes the four IDX files the MNIST loader expects into `directory`.
    void WriteMNIST(const std::filesystem::path& directory, const Digits& train, const Digits& test);

    // Float inputs in [0, 1] shaped [N, 1, 28, 28] together with their labels.
    std::pair<torch::Tensor, torch::Tensor> AsFloat(const Digits& digits);
}

#endif // GRADUS_TEST_FIXTURES_HPP
