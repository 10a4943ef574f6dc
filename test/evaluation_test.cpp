#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

#include <torch/torch.h>

#include "../src/evaluation/evaluation.hpp"

namespace {
    namespace Metric = Gradus::Metric::Classification;

    Gradus::Evaluation::Options Quiet() {
        Gradus::Evaluation::Options options{};
        options.stream = nullptr;
        return options;
    }

    // Three classes; predictions are 0, 0, 1, 1, 2, 0 against labels 0, 0, 1, 2, 2, 2.
    std::pair<torch::Tensor, torch::Tensor> HandBuilt() {
        const auto predicted = torch::tensor({0, 0, 1, 1, 2, 0}, torch::kLong);
        auto logits = torch::one_hot(predicted, 3).to(torch::kFloat32) * 5.0f;
        auto labels = torch::tensor({0, 0, 1, 2, 2, 2}, torch::kLong);
        return {logits, labels};
    }
}

TEST(Evaluation, ConfusionMatrixFromLogits) {
    auto [logits, labels] = HandBuilt();
    const auto report = Gradus::Evaluation::Evaluate(logits, labels, Gradus::Evaluation::Classification,
                                                     {Metric::Accuracy}, Quiet());

    ASSERT_EQ(report.confusion.size(), 3u);
    EXPECT_EQ(report.confusion[0], (std::vector<std::size_t>{2, 0, 0}));
    EXPECT_EQ(report.confusion[1], (std::vector<std::size_t>{0, 1, 0}));
    EXPECT_EQ(report.confusion[2], (std::vector<std::size_t>{1, 1, 1}));
    EXPECT_EQ(report.support, (std::vector<std::size_t>{2, 1, 3}));
    EXPECT_EQ(report.total_samples, 6u);
    EXPECT_EQ(report.correct, 4u);
    EXPECT_DOUBLE_EQ(report.overall_accuracy, 4.0 / 6.0);
}

TEST(Evaluation, PerClassAndSummaryMetrics) {
    auto [logits, labels] = HandBuilt();
    const auto report = Gradus::Evaluation::Evaluate(
        logits, labels, Gradus::Evaluation::Classification,
        {Metric::Accuracy, Metric::Precision, Metric::Recall, Metric::F1, Metric::Top1Error}, Quiet());

    ASSERT_EQ(report.order.size(), 5u);
    ASSERT_EQ(report.summary.size(), 5u);

    // Precision: class 0 -> 2/3, class 1 -> 1/2, class 2 -> 1/1.
    EXPECT_NEAR(report.per_class[1][0], 2.0 / 3.0, 1e-12);
    EXPECT_NEAR(report.per_class[1][1], 0.5, 1e-12);
    EXPECT_NEAR(report.per_class[1][2], 1.0, 1e-12);
    // Recall: 1, 1, 1/3.
    EXPECT_NEAR(report.per_class[2][2], 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(report.summary[2].macro, (1.0 + 1.0 + 1.0 / 3.0) / 3.0, 1e-12);
    EXPECT_NEAR(report.summary[2].weighted, 4.0 / 6.0, 1e-12);
    // F1 of class 0: 2 * (2/3 * 1) / (2/3 + 1) = 0.8.
    EXPECT_NEAR(report.per_class[3][0], 0.8, 1e-12);

    EXPECT_NEAR(report.summary[0].macro, 4.0 / 6.0, 1e-12);
    EXPECT_NEAR(report.summary[4].macro, 2.0 / 6.0, 1e-12);
}

TEST(Evaluation, DuplicateMetricsAreDropped) {
    auto [logits, labels] = HandBuilt();
    const auto report = Gradus::Evaluation::Evaluate(logits, labels, Gradus::Evaluation::Classification,
                                                     {Metric::Recall, Metric::Accuracy, Metric::Recall}, Quiet());
    ASSERT_EQ(report.order.size(), 2u);
    EXPECT_EQ(report.order[0], Metric::Kind::Recall);
}

TEST(Evaluation, PrintsTables) {
    auto [logits, labels] = HandBuilt();
    std::ostringstream out;
    Gradus::Evaluation::Options options{};
    options.stream = &out;
    options.print_confusion = true;
    (void)Gradus::Evaluation::Evaluate(logits, labels, Gradus::Evaluation::Classification, {Metric::Accuracy}, options);
    EXPECT_NE(out.str().find("Accuracy"), std::string::npos);
}

TEST(Evaluation, RejectsBadInput) {
    auto [logits, labels] = HandBuilt();
    EXPECT_THROW((void)Gradus::Evaluation::Evaluate(logits, labels.narrow(0, 0, 5), Gradus::Evaluation::Classification,
                                                    {Metric::Accuracy}, Quiet()),
                 std::invalid_argument);
    EXPECT_THROW((void)Gradus::Evaluation::Evaluate(logits, labels, Gradus::Evaluation::Classification, {}, Quiet()),
                 std::invalid_argument);
    EXPECT_THROW((void)Gradus::Evaluation::Evaluate(logits, torch::tensor({0, 0, 1, 2, 2, 7}, torch::kLong),
                                                    Gradus::Evaluation::Classification, {Metric::Accuracy}, Quiet()),
                 std::out_of_range);
}
