#include <gtest/gtest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../src/data/data.hpp"
#include "fixtures.hpp"

namespace {
    using Gradus::Testing::Digits;
    using Gradus::Testing::MakeDigits;
    using Gradus::Testing::TempDirectory;
    using Gradus::Testing::WriteMNIST;

    // Big-endian IDX header words with no payload behind them.
    void WriteHeader(const std::filesystem::path& path, std::initializer_list<std::uint32_t> words) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        for (const auto word : words) {
            const char bytes[4] = {static_cast<char>((word >> 24U) & 0xFFU), static_cast<char>((word >> 16U) & 0xFFU),
                                   static_cast<char>((word >> 8U) & 0xFFU), static_cast<char>(word & 0xFFU)};
            file.write(bytes, 4);
        }
    }
}

TEST(MNISTLoad, ReadsWrittenIdxFiles) {
    TempDirectory directory("gradus_mnist");
    const auto train = MakeDigits(20, 1);
    const auto test = MakeDigits(5, 2);
    WriteMNIST(directory.path(), train, test);

    auto [train_x, train_y, test_x, test_y] = Gradus::Data::Load::MNIST(directory.path().string());

    EXPECT_EQ(train_x.sizes().vec(), (std::vector<int64_t>{200, 1, 28, 28}));
    EXPECT_EQ(test_x.sizes().vec(), (std::vector<int64_t>{50, 1, 28, 28}));
    EXPECT_EQ(train_x.scalar_type(), torch::kFloat32);
    EXPECT_EQ(train_y.scalar_type(), torch::kLong);
    EXPECT_LE(train_x.max().item<float>(), 1.0f);
    EXPECT_GE(train_x.min().item<float>(), 0.0f);
    EXPECT_TRUE(torch::equal(train_y, train.labels));
    EXPECT_TRUE(torch::equal(test_y, test.labels));

    const auto restored = (train_x.squeeze(1) * 255.0f).round().to(torch::kUInt8);
    EXPECT_TRUE(torch::equal(restored, train.images));
}

TEST(MNISTLoad, KeepsRawBytesWithoutNormalisation) {
    TempDirectory directory("gradus_mnist");
    const auto train = MakeDigits(2, 3);
    WriteMNIST(directory.path(), train, train);

    auto [train_x, train_y, test_x, test_y] = Gradus::Data::Load::MNIST(directory.path().string(), 1.0f, 1.0f, false);
    EXPECT_FLOAT_EQ(train_x.max().item<float>(), 255.0f);
}

TEST(MNISTLoad, AppliesFractions) {
    TempDirectory directory("gradus_mnist");
    WriteMNIST(directory.path(), MakeDigits(10, 4), MakeDigits(10, 5));

    auto [train_x, train_y, test_x, test_y] = Gradus::Data::Load::MNIST(directory.path().string(), 0.5f, 0.1f);
    EXPECT_EQ(train_x.size(0), 50);
    EXPECT_EQ(train_y.size(0), 50);
    EXPECT_EQ(test_x.size(0), 10);
}

TEST(MNISTLoad, FindsRawSubdirectory) {
    TempDirectory directory("gradus_mnist");
    WriteMNIST(directory.path() / "MNIST" / "raw", MakeDigits(1, 6), MakeDigits(1, 7));

    auto [train_x, train_y, test_x, test_y] = Gradus::Data::Load::MNIST(directory.path().string());
    EXPECT_EQ(train_x.size(0), 10);
}

TEST(MNISTLoad, MissingFilesThrow) {
    TempDirectory directory("gradus_mnist");
    EXPECT_THROW((void)Gradus::Data::Load::MNIST(directory.path().string()), std::runtime_error);
}

TEST(MNISTLoad, RejectsWrongMagicNumber) {
    TempDirectory directory("gradus_mnist");
    const auto digits = MakeDigits(1, 8);
    WriteMNIST(directory.path(), digits, digits);

    using Gradus::Data::Type::MNIST;
    // A label file where an image file is expected.
    Gradus::Data::Load::Details::write_idx_labels(directory.path() / MNIST::kTrainImages, digits.labels);

    EXPECT_THROW((void)Gradus::Data::Load::MNIST(directory.path().string()), std::runtime_error);
    EXPECT_THROW((void)Gradus::Data::Load::Details::read_idx_images(directory.path() / MNIST::kTrainImages),
                 std::runtime_error);
}

TEST(MNISTLoad, RejectsTruncatedPayload) {
    TempDirectory directory("gradus_mnist");
    const auto digits = MakeDigits(1, 9);
    const auto path = directory.path() / "truncated-idx3-ubyte";
    Gradus::Data::Load::Details::write_idx_images(path, digits.images);
    std::filesystem::resize_file(path, std::filesystem::file_size(path) - 100);

    EXPECT_THROW((void)Gradus::Data::Load::Details::read_idx_images(path), std::runtime_error);
}

TEST(MNISTLoad, HeaderCountBeyondFileSizeIsTruncation) {
    TempDirectory directory("gradus_mnist");
    const auto images = directory.path() / "huge-idx3-ubyte";
    const auto labels = directory.path() / "huge-idx1-ubyte";
    WriteHeader(images, {2051u, 0xFFFFFFFFu, 28u, 28u});
    WriteHeader(labels, {2049u, 0xFFFFFFFFu});

    try {
        (void)Gradus::Data::Load::Details::read_idx_images(images);
        FAIL() << "expected a truncation error";
    } catch (const std::runtime_error& error) {
        EXPECT_NE(std::string(error.what()).find(images.string()), std::string::npos);
    }
    EXPECT_THROW((void)Gradus::Data::Load::Details::read_idx_labels(labels), std::runtime_error);
}

TEST(MNISTLoad, RejectsWrongGeometry) {
    TempDirectory directory("gradus_mnist");
    const auto path = directory.path() / "small-idx3-ubyte";
    WriteHeader(path, {2051u, 0u, 14u, 14u});

    EXPECT_THROW((void)Gradus::Data::Load::Details::read_idx_images(path), std::runtime_error);
}

TEST(MNISTLoad, RejectsImageLabelCountMismatch) {
    TempDirectory directory("gradus_mnist");
    const auto digits = MakeDigits(2, 11);
    WriteMNIST(directory.path(), digits, digits);

    using Gradus::Data::Type::MNIST;
    Gradus::Data::Load::Details::write_idx_labels(directory.path() / MNIST::kTrainLabels, digits.labels.narrow(0, 0, 5));

    EXPECT_THROW((void)Gradus::Data::Load::MNIST(directory.path().string()), std::runtime_error);
}

TEST(Manipulation, FractionKeepsLeadingShare) {
    const auto x = torch::arange(10, torch::kFloat32).unsqueeze(1);
    const auto y = torch::arange(10, torch::kLong);

    auto [fx, fy] = Gradus::Data::Manipulation::Fraction(x, y, 0.3f);
    EXPECT_EQ(fx.size(0), 3);
    EXPECT_TRUE(torch::equal(fy, torch::tensor({0, 1, 2}, torch::kLong)));

    auto [all_x, all_y] = Gradus::Data::Manipulation::Fraction(x, y, 2.0f);
    EXPECT_EQ(all_y.size(0), 10);
    EXPECT_THROW((void)Gradus::Data::Manipulation::Fraction(x, y.narrow(0, 0, 4), 0.5f), std::invalid_argument);
}

TEST(Manipulation, NormalizeMapsUnitRangeToSymmetric) {
    const auto x = torch::tensor({0.0f, 0.5f, 1.0f});
    const auto normalised = Gradus::Data::Manipulation::Normalize(x, 0.5, 0.5);
    EXPECT_TRUE(torch::allclose(normalised, torch::tensor({-1.0f, 0.0f, 1.0f})));
    EXPECT_TRUE(torch::allclose(Gradus::Data::Manipulation::Denormalize(normalised, 0.5, 0.5), x));
    EXPECT_THROW((void)Gradus::Data::Manipulation::Normalize(x, 0.5, 0.0), std::invalid_argument);
    EXPECT_THROW((void)Gradus::Data::Manipulation::Normalize(x, 0.5, -1.0), std::invalid_argument);
}

TEST(Manipulation, ShuffleKeepsPairs) {
    const auto x = torch::arange(32, torch::kFloat32).unsqueeze(1);
    const auto y = torch::arange(32, torch::kLong);
    auto [sx, sy] = Gradus::Data::Manipulation::Shuffle(x, y, 7);

    EXPECT_TRUE(torch::equal(sx.squeeze(1).to(torch::kLong), sy));
    EXPECT_TRUE(torch::equal(std::get<0>(sy.sort()), y));
    EXPECT_THROW((void)Gradus::Data::Manipulation::Shuffle(x, y.narrow(0, 0, 3)), std::invalid_argument);
}

TEST(Check, DistributionCountsEachClass) {
    const auto digits = MakeDigits(3, 10);
    const auto counts = Gradus::Data::Check::Distribution(digits.labels, 10);
    ASSERT_EQ(counts.size(), 10u);
    for (const auto count : counts) {
        EXPECT_EQ(count, 3);
    }
    EXPECT_THROW((void)Gradus::Data::Check::Distribution(torch::tensor({0, 11}, torch::kLong), 10), std::out_of_range);
}

TEST(Check, SizePrintsShape) {
    std::ostringstream out;
    const auto sizes = Gradus::Data::Check::Size(torch::zeros({64, 1, 28, 28}), "Batch", &out);
    EXPECT_EQ(sizes, (std::vector<int64_t>{64, 1, 28, 28}));
    EXPECT_EQ(out.str(), "Batch: (64, 1, 28, 28)\n");
}
