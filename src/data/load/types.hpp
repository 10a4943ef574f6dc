#ifndef GRADUS_DATA_TYPES_HPP
#define GRADUS_DATA_TYPES_HPP
#include <array>
#include <cstdint>

namespace Gradus::Data::Type {
    // IDX container used by the MNIST distribution (big-endian header, raw uint8 payload).
    struct IDX {
        static constexpr std::uint32_t kImageMagic = 2051;
        static constexpr std::uint32_t kLabelMagic = 2049;
    };

    struct MNIST {
        static constexpr std::int64_t kRows = 28;
        static constexpr std::int64_t kCols = 28;
        static constexpr std::int64_t kPixels = kRows * kCols;
        static constexpr std::int64_t kClasses = 10;

        static constexpr const char* kTrainImages = "train-images-idx3-ubyte";
        static constexpr const char* kTrainLabels = "train-labels-idx1-ubyte";
        static constexpr const char* kTestImages = "t10k-images-idx3-ubyte";
        static constexpr const char* kTestLabels = "t10k-labels-idx1-ubyte";

        static constexpr std::array<const char*, 4> kRequiredFiles{kTrainImages, kTrainLabels, kTestImages, kTestLabels};
    };
}

#endif // GRADUS_DATA_TYPES_HPP
