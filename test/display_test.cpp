#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <opencv2/imgcodecs.hpp>
#include <torch/torch.h>

#include "../src/display/display.hpp"
#include "fixtures.hpp"

namespace {
    std::size_t CountLines(const std::string& text) {
        return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    }
}

TEST(Display, RenderProducesOneLinePerRow) {
    const auto image = torch::rand({1, 28, 28});
    const auto text = Gradus::Display::Render(image, {.color = false, .stream = nullptr});
    EXPECT_EQ(CountLines(text), 28u);
    // Two ASCII characters per pixel.
    EXPECT_EQ(text.find('\n'), 56u);
}

TEST(Display, BlankImageRendersAsSpaces) {
    const auto text = Gradus::Display::Render(torch::zeros({28, 28}), {.color = false, .stream = nullptr});
    EXPECT_EQ(text.find_first_not_of(" \n"), std::string::npos);
}

TEST(Display, ViewClassifyMarksMostLikelyClass) {
    auto probabilities = torch::full({10}, 0.01f);
    probabilities[7] = 0.91f;
    std::ostringstream out;
    const auto text = Gradus::Display::ViewClassify(torch::rand({784}), probabilities,
                                                    {.color = false, .bar_width = 20, .stream = &out});
    EXPECT_EQ(text, out.str());
    EXPECT_EQ(CountLines(text), 28u);

    std::istringstream lines(text);
    std::string line;
    std::size_t marked = 0;
    while (std::getline(lines, line)) {
        if (line.find(Gradus::Utils::Terminal::Symbols::kArrowLeft) != std::string::npos) {
            ++marked;
            EXPECT_NE(line.find("   7 "), std::string::npos);
        }
    }
    EXPECT_EQ(marked, 1u);
}

TEST(Display, RejectsWrongShapes) {
    EXPECT_THROW((void)Gradus::Display::Render(torch::rand({27, 28}), {.stream = nullptr}), std::invalid_argument);
    EXPECT_THROW((void)Gradus::Display::ViewClassify(torch::rand({28, 28}), torch::rand({9}), {.stream = nullptr}),
                 std::invalid_argument);
}

TEST(Display, SavePanelWritesImage) {
    Gradus::Testing::TempDirectory directory("gradus_display");
    const auto path = directory.path() / "nested" / "panel.png";
    const auto probabilities = torch::softmax(torch::randn({10}), 0);
    const auto written = Gradus::Display::SavePanel(path, torch::rand({1, 1, 28, 28}), probabilities);

    ASSERT_TRUE(std::filesystem::exists(written));
    const auto panel = cv::imread(written.string());
    ASSERT_FALSE(panel.empty());
    EXPECT_EQ(panel.rows, 280);
    EXPECT_EQ(panel.cols, 600);
}
