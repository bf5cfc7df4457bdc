#ifndef NABLA_DATA_BATCH_GENERATOR_HPP
#define NABLA_DATA_BATCH_GENERATOR_HPP

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

namespace Nabla::Data {

    struct Batch {
        torch::Tensor inputs;
        torch::Tensor targets;
    };

    // Full batches of (inputs, targets) in row order, or in the order of one
    // random permutation shared by both tensors. The trailing partial batch is
    // never produced. Batches are sliced on demand.
    class BatchGenerator {
    public:
        class Iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = Batch;
            using difference_type = std::ptrdiff_t;
            using pointer = const Batch*;
            using reference = Batch;

            Iterator() = default;
            Iterator(const BatchGenerator* owner, std::int64_t index) : owner_(owner), index_(index) {}

            [[nodiscard]] Batch operator*() const { return owner_->batch(index_); }

            Iterator& operator++() { ++index_; return *this; }
            Iterator operator++(int) { auto copy = *this; ++index_; return copy; }

            [[nodiscard]] bool operator==(const Iterator& other) const noexcept { return index_ == other.index_; }
            [[nodiscard]] bool operator!=(const Iterator& other) const noexcept { return index_ != other.index_; }

        private:
            const BatchGenerator* owner_{nullptr};
            std::int64_t index_{0};
        };

        BatchGenerator(torch::Tensor inputs, torch::Tensor targets, std::int64_t batch_size, bool shuffle = true)
            : inputs_(std::move(inputs)), targets_(std::move(targets)), batch_size_(batch_size)
        {
            if (batch_size_ <= 0) {
                throw std::invalid_argument("Batch size must be positive, got " + std::to_string(batch_size_) + ".");
            }
            if (!inputs_.defined() || !targets_.defined() || inputs_.dim() == 0 || targets_.dim() == 0) {
                throw std::invalid_argument("BatchGenerator requires defined inputs and targets with a leading dimension.");
            }
            if (inputs_.size(0) != targets_.size(0)) {
                throw std::invalid_argument("Inputs and targets disagree on sample count: "
                                            + std::to_string(inputs_.size(0)) + " vs "
                                            + std::to_string(targets_.size(0)) + ".");
            }

            const auto total = inputs_.size(0);
            batches_ = total / batch_size_;
            if (shuffle && total > 0) {
                order_ = torch::randperm(total, torch::TensorOptions().dtype(torch::kLong).device(inputs_.device()));
            }
        }

        [[nodiscard]] std::int64_t size() const noexcept { return batches_; }
        [[nodiscard]] std::int64_t batch_size() const noexcept { return batch_size_; }
        [[nodiscard]] bool shuffled() const noexcept { return order_.defined(); }

        [[nodiscard]] Iterator begin() const { return Iterator(this, 0); }
        [[nodiscard]] Iterator end() const { return Iterator(this, batches_); }

        [[nodiscard]] Batch batch(std::int64_t index) const
        {
            if (index < 0 || index >= batches_) {
                throw std::out_of_range("Batch index " + std::to_string(index) + " is out of range.");
            }
            const auto offset = index * batch_size_;
            if (!order_.defined()) {
                return Batch{inputs_.narrow(0, offset, batch_size_), targets_.narrow(0, offset, batch_size_)};
            }
            auto batch_indices = order_.narrow(0, offset, batch_size_);
            return Batch{inputs_.index_select(0, batch_indices),
                         targets_.index_select(0, batch_indices.to(targets_.device()))};
        }

    private:
        torch::Tensor inputs_;
        torch::Tensor targets_;
        torch::Tensor order_{};
        std::int64_t batch_size_{0};
        std::int64_t batches_{0};
    };
}

#endif // NABLA_DATA_BATCH_GENERATOR_HPP
