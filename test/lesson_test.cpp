#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <torch/torch.h>

#include "../src/lesson/lesson.hpp"
#include "fixtures.hpp"

namespace {
    class LessonTest : public ::testing::Test {
    protected:
        void SetUp() override {
            Gradus::Testing::WriteMNIST(directory_.path() / "MNIST" / "raw",
                                        Gradus::Testing::MakeDigits(20, 40),
                                        Gradus::Testing::MakeDigits(5, 41));
            config_.dataset_root = directory_.path().string();
            config_.hidden = {32, 16};
            config_.epochs = 3;
            config_.batch_size = 20;
            config_.optimizer = "adam";
            config_.learning_rate = 1e-2;
            config_.seed = 1;
            config_.color = false;
            config_.panel_path = (directory_.path() / "classify.png").string();
            config_.checkpoint_dir = (directory_.path() / "checkpoints").string();
        }

        Gradus::Lesson::Context Context(std::ostream* stream) const { return {config_, stream}; }

        Gradus::Testing::TempDirectory directory_{"gradus_lesson"};
        Gradus::Config::LessonConfig config_{};
    };
}

TEST_F(LessonTest, LoadDataNormalisesAndBatches) {
    const auto data = Gradus::Lesson::LoadData(Context(nullptr));
    EXPECT_EQ(data.train_inputs.size(0), 200);
    EXPECT_EQ(data.test_inputs.size(0), 50);
    EXPECT_GE(data.train_inputs.min().item<float>(), -1.0f);
    EXPECT_LE(data.train_inputs.max().item<float>(), 1.0f);
    EXPECT_LT(data.train_inputs.min().item<float>(), 0.0f);
    EXPECT_EQ(data.sample.inputs.sizes().vec(), (std::vector<int64_t>{20, 1, 28, 28}));
    EXPECT_EQ(data.loader->size(), 10u);
}

TEST_F(LessonTest, LossSectionsAgree) {
    const auto data = Gradus::Lesson::LoadData(Context(nullptr));
    std::ostringstream out;
    auto logits = Gradus::Lesson::BuildNetwork(Context(&out), Gradus::Activation::Identity);
    const auto ce = Gradus::Lesson::LossOnBatch(Context(&out), *logits.model, data.sample);
    EXPECT_NEAR(ce.loss.item<double>(), std::log(10.0), 0.5);
    EXPECT_NE(out.str().find("Cross-entropy loss"), std::string::npos);

    auto log_probs = Gradus::Lesson::BuildNetwork(Context(nullptr), Gradus::Activation::LogSoftmax);
    const auto nll = Gradus::Lesson::LogSoftmaxLoss(Context(nullptr), *log_probs.model, data.sample);
    EXPECT_TRUE(torch::allclose(nll.output.exp().sum(1), torch::ones({20}), 1e-5, 1e-5));
    EXPECT_THROW((void)Gradus::Lesson::LogSoftmaxLoss(Context(nullptr), *logits.model, data.sample), std::invalid_argument);
}

TEST_F(LessonTest, FirstLayerInitialisedByHand) {
    torch::manual_seed(12);
    auto network = Gradus::Lesson::BuildNetwork(Context(nullptr), Gradus::Activation::Identity);
    std::ostringstream out;
    const auto section = Gradus::Lesson::InitialiseByHand(Context(&out), *network.model);

    EXPECT_EQ(section.layer, "hidden_1");
    EXPECT_EQ(section.bias_sum, 0.0);
    EXPECT_NEAR(section.weight_std, 0.01, 2e-3);
    EXPECT_NE(out.str().find("Re-initialised 'hidden_1'"), std::string::npos);

    Gradus::Model flat_only("flat");
    flat_only.add(Gradus::Layer::Flatten());
    EXPECT_THROW((void)Gradus::Lesson::InitialiseByHand(Context(nullptr), flat_only), std::logic_error);
}

TEST_F(LessonTest, BackwardAndStepSections) {
    const auto data = Gradus::Lesson::LoadData(Context(nullptr));
    auto network = Gradus::Lesson::BuildNetwork(Context(nullptr), Gradus::Activation::LogSoftmax);
    network.model->set_loss(Gradus::Loss::NegativeLogLikelihood());

    const auto backward = Gradus::Lesson::BackwardPass(Context(nullptr), *network.model, data.sample);
    EXPECT_FALSE(backward.grad_defined_before);
    EXPECT_EQ(backward.first_layer_grad.sizes().vec(), (std::vector<int64_t>{32, 784}));
    EXPECT_FALSE(backward.rows.empty());

    const auto step = Gradus::Lesson::SingleStep(Context(nullptr), *network.model, data.sample);
    EXPECT_TRUE(step.change.changed);
    EXPECT_TRUE(torch::allclose(step.after, step.before - 0.01 * step.gradient, 1e-6, 1e-6));
}

TEST_F(LessonTest, RunCompletesEveryChapter) {
    std::ostringstream out;
    const auto summary = Gradus::Lesson::Run(config_, &out);

    ASSERT_EQ(summary.epoch_losses.size(), 3u);
    EXPECT_LT(summary.epoch_losses.back(), summary.epoch_losses.front());
    EXPECT_GE(summary.test_accuracy, 0.0);
    EXPECT_LE(summary.test_accuracy, 1.0);
    EXPECT_GE(summary.predicted, 0);
    EXPECT_LT(summary.predicted, 10);
    EXPECT_EQ(summary.label, 0);

    EXPECT_TRUE(std::filesystem::exists(config_.panel_path));
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(config_.checkpoint_dir) / "mnist_classifier" / "architecture.json"));
    const auto text = out.str();
    EXPECT_NE(text.find("10. Evaluate on held-out data"), std::string::npos);
    EXPECT_NE(text.find("Training loss: "), std::string::npos);
}

TEST_F(LessonTest, MissingDatasetFails) {
    config_.dataset_root = (directory_.path() / "nowhere").string();
    std::ostringstream out;
    EXPECT_THROW((void)Gradus::Lesson::Run(config_, &out), std::runtime_error);
}
