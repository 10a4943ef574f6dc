#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "../src/config/config.hpp"
#include "fixtures.hpp"

namespace {
    std::filesystem::path WriteJson(const std::filesystem::path& directory, const std::string& body) {
        const auto path = directory / "lesson.json";
        std::ofstream file(path, std::ios::trunc);
        file << body;
        return path;
    }
}

TEST(Config, DefaultsAreValid) {
    const Gradus::Config::LessonConfig config{};
    EXPECT_NO_THROW(Gradus::Config::Validate(config));
    EXPECT_EQ(config.hidden, (std::vector<std::int64_t>{128, 64}));
    EXPECT_EQ(config.epochs, 5u);
    EXPECT_EQ(config.batch_size, 64u);
    EXPECT_EQ(config.loss, "nll");
    EXPECT_FALSE(config.seed.has_value());
}

TEST(Config, LoadsJsonFile) {
    Gradus::Testing::TempDirectory directory("gradus_config");
    const auto path = WriteJson(directory.path(), R"({
        "dataset_root": "/tmp/mnist",
        "hidden": [256, 128, 64],
        "epochs": 3,
        "learning_rate": 0.01,
        "optimizer": "adam",
        "loss": "cross_entropy",
        "seed": 17,
        "color": false
    })");

    const auto config = Gradus::Config::Load(path);
    EXPECT_EQ(config.dataset_root, "/tmp/mnist");
    EXPECT_EQ(config.hidden, (std::vector<std::int64_t>{256, 128, 64}));
    EXPECT_EQ(config.epochs, 3u);
    EXPECT_DOUBLE_EQ(config.learning_rate, 0.01);
    EXPECT_EQ(config.optimizer, "adam");
    EXPECT_EQ(config.loss, "cross_entropy");
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 17u);
    EXPECT_FALSE(config.color);
    EXPECT_EQ(config.batch_size, 64u);
}

TEST(Config, RejectsUnknownKeysAndBadJson) {
    Gradus::Testing::TempDirectory directory("gradus_config");
    EXPECT_THROW((void)Gradus::Config::Load(WriteJson(directory.path(), R"({"epoch": 3})")), std::invalid_argument);
    EXPECT_THROW((void)Gradus::Config::Load(WriteJson(directory.path(), "{ broken")), std::runtime_error);
    EXPECT_THROW((void)Gradus::Config::Load(directory.path() / "absent.json"), std::runtime_error);
}

TEST(Config, OverridesFromCommandLine) {
    Gradus::Config::LessonConfig config{};
    Gradus::Config::ApplyOverrides(config, {"epochs=2", "hidden=32, 16", "batch_size=128", "use_cuda=false",
                                            "panel_path=out/panel.png"});
    EXPECT_EQ(config.epochs, 2u);
    EXPECT_EQ(config.hidden, (std::vector<std::int64_t>{32, 16}));
    EXPECT_EQ(config.batch_size, 128u);
    EXPECT_EQ(config.panel_path, "out/panel.png");
}

TEST(Config, OverrideKeysMayContainDots) {
    Gradus::Config::LessonConfig config{};
    // Dots in the value must not be treated as a path.
    Gradus::Config::ApplyOverrides(config, {"dataset_root=./data.v2"});
    EXPECT_EQ(config.dataset_root, "./data.v2");
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"data.root=x"}), std::invalid_argument);
}

TEST(Config, RejectsInvalidValues) {
    Gradus::Config::LessonConfig config{};
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"epochs"}), std::invalid_argument);
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"=3"}), std::invalid_argument);
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"epochs=-1"}), std::invalid_argument);
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"epochs=many"}), std::invalid_argument);
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"optimizer=rmsprop"}), std::invalid_argument);
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"loss=hinge"}), std::invalid_argument);
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"hidden=12,x"}), std::invalid_argument);
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"hidden=12,0"}), std::invalid_argument);
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"train_fraction=1.5"}), std::invalid_argument);
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"normalize_std=0"}), std::invalid_argument);
}

TEST(Config, SeedMustBeNonNegative) {
    Gradus::Config::LessonConfig config{};
    EXPECT_THROW(Gradus::Config::ApplyOverrides(config, {"seed=-1"}), std::invalid_argument);
    EXPECT_FALSE(config.seed.has_value());

    Gradus::Config::ApplyOverrides(config, {"seed=0"});
    ASSERT_TRUE(config.seed.has_value());
    EXPECT_EQ(*config.seed, 0u);
}

TEST(Config, PrintListsFields) {
    Gradus::Config::LessonConfig config{};
    config.seed = 5;
    std::ostringstream out;
    Gradus::Config::Print(config, &out);
    EXPECT_NE(out.str().find("hidden         128,64"), std::string::npos);
    EXPECT_NE(out.str().find("seed           5"), std::string::npos);
}
