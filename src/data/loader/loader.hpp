#ifndef GRADUS_DATA_LOADER_HPP
#define GRADUS_DATA_LOADER_HPP
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <numeric>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

namespace Gradus::Data {
    struct LoaderOptions {
        std::size_t batch_size{64};
        bool shuffle{true};
        bool drop_last{false};
        std::optional<std::uint64_t> seed{};
    };

    struct Batch {
        torch::Tensor inputs;
        torch::Tensor targets;
        std::size_t index{};
    };

    /*
     * Mini-batch view over an (inputs, targets) pair. Batches are slices along dim 0; when shuffling,
     * a permutation is drawn at construction and again on every reshuffle() call.
     */
    class Loader {
    public:
        class Iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Batch;
            using difference_type = std::ptrdiff_t;
            using pointer = const Batch*;
            using reference = Batch;

            Iterator(const Loader* loader, std::size_t position) : loader_(loader), position_(position) {}

            Batch operator*() const { return loader_->batch(position_); }
            Iterator& operator++() { ++position_; return *this; }
            Iterator operator++(int) { auto copy = *this; ++position_; return copy; }

            friend bool operator==(const Iterator& lhs, const Iterator& rhs) {
                return lhs.loader_ == rhs.loader_ && lhs.position_ == rhs.position_;
            }
            friend bool operator!=(const Iterator& lhs, const Iterator& rhs) { return !(lhs == rhs); }

        private:
            const Loader* loader_;
            std::size_t position_;
        };

        Loader(torch::Tensor inputs, torch::Tensor targets, LoaderOptions options = {})
            : inputs_(std::move(inputs)), targets_(std::move(targets)), options_(options) {
            if (!inputs_.defined() || !targets_.defined()) {
                throw std::invalid_argument("Loader expects defined input and target tensors.");
            }
            if (inputs_.dim() == 0 || targets_.dim() == 0) {
                throw std::invalid_argument("Loader expects tensors with a leading sample dimension.");
            }
            if (inputs_.size(0) != targets_.size(0)) {
                throw std::invalid_argument("Loader received " + std::to_string(inputs_.size(0)) + " inputs but "
                                            + std::to_string(targets_.size(0)) + " targets.");
            }
            if (options_.batch_size == 0) {
                throw std::invalid_argument("Loader batch size must be positive.");
            }
            if (options_.seed.has_value()) {
                engine_.seed(*options_.seed);
            } else {
                engine_.seed(std::random_device{}());
            }
            if (options_.shuffle) {
                reshuffle();
            }
        }

        [[nodiscard]] std::size_t sample_count() const { return static_cast<std::size_t>(inputs_.size(0)); }

        // Number of batches in one pass.
        [[nodiscard]] std::size_t size() const {
            const auto samples = sample_count();
            if (options_.drop_last) {
                return samples / options_.batch_size;
            }
            return (samples + options_.batch_size - 1) / options_.batch_size;
        }

        [[nodiscard]] bool empty() const { return size() == 0; }
        [[nodiscard]] const LoaderOptions& options() const noexcept { return options_; }
        [[nodiscard]] const torch::Tensor& inputs() const noexcept { return inputs_; }
        [[nodiscard]] const torch::Tensor& targets() const noexcept { return targets_; }

        void reshuffle() {
            const auto samples = sample_count();
            std::vector<int64_t> order(samples);
            std::iota(order.begin(), order.end(), int64_t{0});
            std::shuffle(order.begin(), order.end(), engine_);
            permutation_ = torch::tensor(order, torch::TensorOptions().dtype(torch::kLong));
        }

        [[nodiscard]] Batch batch(std::size_t index) const {
            if (index >= size()) {
                throw std::out_of_range("Loader batch index " + std::to_string(index) + " out of range ("
                                        + std::to_string(size()) + " batches).");
            }
            const auto offset = static_cast<int64_t>(index * options_.batch_size);
            const auto count = std::min<int64_t>(static_cast<int64_t>(options_.batch_size),
                                                 static_cast<int64_t>(sample_count()) - offset);

            if (permutation_.defined()) {
                auto indices = permutation_.narrow(0, offset, count);
                return {inputs_.index_select(0, indices.to(inputs_.device())),
                        targets_.index_select(0, indices.to(targets_.device())),
                        index};
            }
            return {inputs_.narrow(0, offset, count), targets_.narrow(0, offset, count), index};
        }

        // First batch of a fresh pass.
        [[nodiscard]] Batch next() {
            if (empty()) {
                throw std::logic_error("Loader holds no complete batch.");
            }
            if (options_.shuffle) {
                reshuffle();
            }
            return batch(0);
        }

        [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
        [[nodiscard]] Iterator end() const { return Iterator(this, size()); }

    private:
        torch::Tensor inputs_;
        torch::Tensor targets_;
        LoaderOptions options_;
        torch::Tensor permutation_{};
        std::mt19937_64 engine_{};
    };
}

#endif // GRADUS_DATA_LOADER_HPP
