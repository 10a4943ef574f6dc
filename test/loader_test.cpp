#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include <torch/torch.h>

#include "../src/data/loader/loader.hpp"

namespace {
    std::pair<torch::Tensor, torch::Tensor> Indexed(std::int64_t count) {
        auto targets = torch::arange(count, torch::kLong);
        auto inputs = targets.to(torch::kFloat32).unsqueeze(1).repeat({1, 3});
        return {inputs, targets};
    }

    torch::Tensor Visited(const Gradus::Data::Loader& loader) {
        std::vector<torch::Tensor> parts;
        for (const auto& batch : loader) {
            parts.push_back(batch.targets);
        }
        return torch::cat(parts);
    }
}

TEST(Loader, CountsPartialLastBatch) {
    auto [x, y] = Indexed(10);
    Gradus::Data::Loader loader(x, y, {.batch_size = 4, .shuffle = false});

    EXPECT_EQ(loader.size(), 3u);
    EXPECT_EQ(loader.batch(0).inputs.size(0), 4);
    EXPECT_EQ(loader.batch(2).inputs.size(0), 2);
    EXPECT_EQ(loader.batch(2).index, 2u);
    EXPECT_THROW((void)loader.batch(3), std::out_of_range);
}

TEST(Loader, DropLastSkipsPartialBatch) {
    auto [x, y] = Indexed(10);
    Gradus::Data::Loader loader(x, y, {.batch_size = 4, .shuffle = false, .drop_last = true});
    EXPECT_EQ(loader.size(), 2u);

    Gradus::Data::Loader tiny(x.narrow(0, 0, 3), y.narrow(0, 0, 3), {.batch_size = 4, .shuffle = false, .drop_last = true});
    EXPECT_TRUE(tiny.empty());
    EXPECT_THROW((void)tiny.next(), std::logic_error);
}

TEST(Loader, SequentialOrderWithoutShuffle) {
    auto [x, y] = Indexed(9);
    Gradus::Data::Loader loader(x, y, {.batch_size = 2, .shuffle = false});
    EXPECT_TRUE(torch::equal(Visited(loader), y));
}

TEST(Loader, ShuffledPassVisitsEverySampleOnce) {
    auto [x, y] = Indexed(37);
    Gradus::Data::Loader loader(x, y, {.batch_size = 8, .shuffle = true, .seed = 3});

    for (int pass = 0; pass < 3; ++pass) {
        const auto visited = Visited(loader);
        ASSERT_EQ(visited.size(0), 37);
        EXPECT_TRUE(torch::equal(std::get<0>(visited.sort()), y));
        loader.reshuffle();
    }
}

TEST(Loader, BatchesKeepInputTargetPairs) {
    auto [x, y] = Indexed(20);
    Gradus::Data::Loader loader(x, y, {.batch_size = 6, .shuffle = true, .seed = 11});
    for (const auto& batch : loader) {
        EXPECT_TRUE(torch::equal(batch.inputs.select(1, 0).to(torch::kLong), batch.targets));
    }
}

TEST(Loader, SameSeedSameOrder) {
    auto [x, y] = Indexed(50);
    Gradus::Data::Loader first(x, y, {.batch_size = 10, .shuffle = true, .seed = 42});
    Gradus::Data::Loader second(x, y, {.batch_size = 10, .shuffle = true, .seed = 42});
    EXPECT_TRUE(torch::equal(Visited(first), Visited(second)));
}

TEST(Loader, RejectsInvalidInput) {
    auto [x, y] = Indexed(10);
    EXPECT_THROW(Gradus::Data::Loader(x, y.narrow(0, 0, 9)), std::invalid_argument);
    EXPECT_THROW(Gradus::Data::Loader(x, y, {.batch_size = 0}), std::invalid_argument);
    EXPECT_THROW(Gradus::Data::Loader(torch::Tensor{}, y), std::invalid_argument);
}
