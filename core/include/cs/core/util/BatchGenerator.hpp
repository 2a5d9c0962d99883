#pragma once

#include "cs/core/types/Errors.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cs {

// --------------------------------------------------------------------------
// BatchGenerator<T>: caller-owned cursor over a fixed list of rows
//
// Hands out consecutive pages of at most batch_size rows. The generator owns
// its rows and its cursor, so two consumers never share an iteration state
// unless they share the generator object itself. reset() rewinds the cursor.
// --------------------------------------------------------------------------
template <typename T>
class BatchGenerator {
public:
    BatchGenerator() = default;

    BatchGenerator(std::vector<T> rows, size_t batch_size)
        : rows_(std::move(rows)), batch_size_(batch_size)
    {
        if (batch_size_ == 0) {
            throw InvalidRange("batch_size must be positive");
        }
    }

    [[nodiscard]] size_t total() const noexcept { return rows_.size(); }
    [[nodiscard]] size_t batch_size() const noexcept { return batch_size_; }

    // ceil(total / batch_size)
    [[nodiscard]] size_t total_pages() const noexcept
    {
        return (rows_.size() + batch_size_ - 1) / batch_size_;
    }

    [[nodiscard]] size_t pages_pulled() const noexcept
    {
        return (cursor_ + batch_size_ - 1) / batch_size_;
    }

    [[nodiscard]] bool has_next() const noexcept { return cursor_ < rows_.size(); }

    std::vector<T> next()
    {
        if (!has_next()) {
            throw std::out_of_range("Batch generator exhausted after " +
                                    std::to_string(total_pages()) + " pages");
        }
        const size_t end = std::min(cursor_ + batch_size_, rows_.size());
        std::vector<T> page(rows_.begin() + static_cast<std::ptrdiff_t>(cursor_),
                            rows_.begin() + static_cast<std::ptrdiff_t>(end));
        cursor_ = end;
        return page;
    }

    void reset() noexcept { cursor_ = 0; }

    [[nodiscard]] const std::vector<T>& rows() const noexcept { return rows_; }

private:
    std::vector<T> rows_;
    size_t batch_size_ = 1;
    size_t cursor_ = 0;
};

}  // namespace cs
