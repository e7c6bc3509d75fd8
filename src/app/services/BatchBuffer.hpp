#pragma once
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

// Ordered pending rows for one writer. Callers flush when Add() reports the
// threshold, and before moving to another plugin.
template<typename Row>
class BatchBuffer {
public:
    explicit BatchBuffer(const size_t threshold) : threshold_(threshold == 0 ? 1 : threshold) {
        rows_.reserve(threshold_);
    }

    // Returns true once the buffer holds threshold rows.
    auto Add(Row row) -> bool {
        rows_.push_back(std::move(row));
        return rows_.size() >= threshold_;
    }

    [[nodiscard]] auto Empty() const -> bool { return rows_.empty(); }
    [[nodiscard]] auto Size() const -> size_t { return rows_.size(); }
    [[nodiscard]] auto Threshold() const -> size_t { return threshold_; }
    [[nodiscard]] auto Rows() const -> std::span<const Row> { return rows_; }

    auto Clear() -> void { rows_.clear(); }

private:
    size_t threshold_;
    std::vector<Row> rows_;
};
