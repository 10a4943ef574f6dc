#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../src/network.hpp"
#include "fixtures.hpp"

namespace {
    std::shared_ptr<Gradus::Model> Trained() {
        torch::manual_seed(4);
        auto model = std::make_shared<Gradus::Model>("checkpointed");
        Gradus::Network::MNIST(*model, {.hidden = {24, 12}, .activation = Gradus::Activation::ReLU,
                                        .output = Gradus::Activation::LogSoftmax, .dropout = 0.1});
        model->set_loss(Gradus::Loss::NegativeLogLikelihood());
        model->set_optimizer(Gradus::Optimizer::SGD({.learning_rate = 0.05, .momentum = 0.9}));
        auto [x, y] = Gradus::Testing::AsFloat(Gradus::Testing::MakeDigits(2, 30));
        (void)model->train_step(x, y);
        return model;
    }
}

TEST(Checkpoint, SaveThenLoadReproducesOutputs) {
    Gradus::Testing::TempDirectory directory("gradus_ckpt");
    auto original = Trained();
    std::ostringstream log;
    const auto written = original->save(directory.path(), false, &log);

    EXPECT_EQ(written.string(), (directory.path() / "checkpointed").string());
    EXPECT_TRUE(std::filesystem::exists(written / "architecture.json"));
    EXPECT_TRUE(std::filesystem::exists(written / "parameters.binary"));
    EXPECT_NE(log.str().find("Saving model as"), std::string::npos);

    Gradus::Model restored;
    restored.load(written);
    EXPECT_EQ(restored.name(), "checkpointed");
    ASSERT_EQ(restored.layer_count(), original->layer_count());
    EXPECT_EQ(restored.output_activation(), Gradus::Activation::Type::LogSoftmax);
    EXPECT_TRUE(restored.find("dropout_2").has_value());
    EXPECT_FALSE(restored.has_optimizer());

    original->eval();
    restored.eval();
    const auto input = torch::rand({6, 1, 28, 28});
    torch::NoGradGuard guard;
    EXPECT_TRUE(torch::allclose(original->forward(input), restored.forward(input)));
}

TEST(Checkpoint, ExistingDirectoryGetsSuffix) {
    Gradus::Testing::TempDirectory directory("gradus_ckpt");
    auto model = Trained();
    const auto first = model->save(directory.path(), false, nullptr);
    const auto second = model->save(directory.path(), false, nullptr);
    const auto third = model->save(directory.path(), false, nullptr);
    EXPECT_EQ(first.filename().string(), "checkpointed");
    EXPECT_EQ(second.filename().string(), "checkpointed_1");
    EXPECT_EQ(third.filename().string(), "checkpointed_2");

    const auto overwritten = model->save(directory.path(), true, nullptr);
    EXPECT_EQ(overwritten.string(), first.string());
}

TEST(Checkpoint, LoadedModelCanBeRetrained) {
    Gradus::Testing::TempDirectory directory("gradus_ckpt");
    const auto written = Trained()->save(directory.path(), false, nullptr);

    Gradus::Model restored;
    restored.load(written);
    restored.set_loss(Gradus::Loss::NegativeLogLikelihood());
    restored.set_optimizer(Gradus::Optimizer::SGD());
    auto [x, y] = Gradus::Testing::AsFloat(Gradus::Testing::MakeDigits(1, 31));
    EXPECT_NO_THROW((void)restored.train_step(x, y));
}

TEST(Checkpoint, MissingFilesThrow) {
    Gradus::Testing::TempDirectory directory("gradus_ckpt");
    Gradus::Model model;
    EXPECT_THROW(model.load(directory.path()), std::runtime_error);

    const auto written = Trained()->save(directory.path(), false, nullptr);
    std::filesystem::remove(written / "parameters.binary");
    EXPECT_THROW(model.load(written), std::runtime_error);
}

TEST(Checkpoint, MalformedArchitectureThrows) {
    Gradus::Testing::TempDirectory directory("gradus_ckpt");
    const auto written = Trained()->save(directory.path(), false, nullptr);
    {
        std::ofstream file(written / "architecture.json", std::ios::trunc);
        file << "{ \"name\": \"broken\", \"modules\": [ { \"kind\": \"layer\", \"descriptor\": { \"type\": \"conv9d\" } } ] }";
    }
    Gradus::Model model;
    EXPECT_THROW(model.load(written), std::runtime_error);

    {
        std::ofstream file(written / "architecture.json", std::ios::trunc);
        file << "{ not json";
    }
    EXPECT_THROW(model.load(written), std::runtime_error);
}

TEST(Checkpoint, SaveRequiresLayers) {
    Gradus::Testing::TempDirectory directory("gradus_ckpt");
    Gradus::Model empty("empty");
    EXPECT_THROW((void)empty.save(directory.path(), false, nullptr), std::logic_error);
    EXPECT_THROW((void)Trained()->save(std::filesystem::path{}, false, nullptr), std::invalid_argument);
}

namespace {
    void WriteArchitecture(const std::filesystem::path& directory, Gradus::Layer::Descriptor layer) {
        using namespace Gradus::Common::SaveLoad;
        PropertyTree architecture;
        architecture.put("name", "rewritten");
        architecture.add_child("modules", serialize_module_list({NamedModuleDescriptor{std::move(layer)}}));
        write_json_file(directory / "architecture.json", architecture);
    }
}

TEST(Checkpoint, InvalidLayerLeavesModelUntouched) {
    Gradus::Testing::TempDirectory directory("gradus_ckpt");
    const auto written = Trained()->save(directory.path(), false, nullptr);

    auto target = Trained();
    const auto layers = target->layer_count();
    const auto parameters = target->parameter_count();

    WriteArchitecture(written, Gradus::Layer::FC({-1, 10, true}));
    EXPECT_THROW(target->load(written), std::runtime_error);

    WriteArchitecture(written, Gradus::Layer::Dropout({.probability = 1.0}));
    EXPECT_THROW(target->load(written), std::runtime_error);

    EXPECT_EQ(target->name(), "checkpointed");
    EXPECT_EQ(target->layer_count(), layers);
    EXPECT_EQ(target->parameter_count(), parameters);
    EXPECT_TRUE(target->has_optimizer());
}

TEST(Checkpoint, ParameterShapeMismatchLeavesModelUntouched) {
    Gradus::Testing::TempDirectory directory("gradus_ckpt");
    const auto written = Trained()->save(directory.path(), false, nullptr);

    // Same layer names, wider first hidden layer than the stored weights.
    Gradus::Model wider("checkpointed");
    Gradus::Network::MNIST(wider, {.hidden = {32, 12}, .activation = Gradus::Activation::ReLU,
                                   .output = Gradus::Activation::LogSoftmax, .dropout = 0.1});
    const auto other = wider.save(directory.path() / "wider", false, nullptr);
    std::filesystem::copy_file(other / "architecture.json", written / "architecture.json",
                               std::filesystem::copy_options::overwrite_existing);

    auto target = Trained();
    target->eval();
    const auto input = torch::rand({3, 1, 28, 28});
    torch::Tensor before;
    {
        torch::NoGradGuard guard;
        before = target->forward(input);
    }

    try {
        target->load(written);
        FAIL() << "expected a shape mismatch";
    } catch (const std::runtime_error& error) {
        EXPECT_NE(std::string(error.what()).find("shape mismatch"), std::string::npos);
    }

    EXPECT_TRUE(target->has_optimizer());
    torch::NoGradGuard guard;
    EXPECT_TRUE(torch::equal(target->forward(input), before));
}

TEST(Checkpoint, MissingParameterThrows) {
    Gradus::Testing::TempDirectory directory("gradus_ckpt");
    const auto written = Trained()->save(directory.path(), false, nullptr);
    WriteArchitecture(written, Gradus::Layer::FC({784, 10, true}));

    // A lone FC registers as fc_0; the stored network keeps its first linear layer at fc_1.
    Gradus::Model model;
    EXPECT_THROW(model.load(written), std::runtime_error);
    EXPECT_EQ(model.layer_count(), 0u);
}
