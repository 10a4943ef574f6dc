#ifndef GRADUS_METRIC_HPP
#define GRADUS_METRIC_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "evaluation/details"
namespace Gradus::Metric::Classification {
    enum class Kind {
        Accuracy,
        Precision,
        Recall,
        F1,
        Top1Error,
    };

    struct Descriptor {
        Kind kind;
    };

    [[nodiscard]] constexpr auto Make(Kind kind) noexcept -> Descriptor { return Descriptor{kind}; }

    inline constexpr Descriptor Accuracy{Kind::Accuracy};
    inline constexpr Descriptor Precision{Kind::Precision};
    inline constexpr Descriptor Recall{Kind::Recall};
    inline constexpr Descriptor F1{Kind::F1};
    inline constexpr Descriptor Top1Error{Kind::Top1Error};
}

#endif //GRADUS_METRIC_HPP
