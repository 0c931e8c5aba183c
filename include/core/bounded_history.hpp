#pragma once

#include <algorithm>
#include <cstddef>
#include <deque>
#include <iterator>
#include <utility>
#include <vector>

namespace perf_analyzer::core {

// Append-only ring with a fixed capacity; pushing into a full ring evicts the oldest entry.
template <typename T>
class BoundedHistory {
 public:
  explicit BoundedHistory(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  void push(T value) {
    if (items_.size() == capacity_) {
      items_.pop_front();
    }
    items_.push_back(std::move(value));
  }

  // Removes every entry matching pred; survivors keep insertion order.
  template <typename Pred>
  std::size_t prune_if(Pred pred) {
    const auto first = std::remove_if(items_.begin(), items_.end(), pred);
    const auto removed = static_cast<std::size_t>(std::distance(first, items_.end()));
    items_.erase(first, items_.end());
    return removed;
  }

  template <typename Pred>
  [[nodiscard]] std::vector<T> copy_if(Pred pred) const {
    std::vector<T> out;
    for (const auto& item : items_) {
      if (pred(item)) {
        out.push_back(item);
      }
    }
    return out;
  }

  [[nodiscard]] std::vector<T> snapshot() const { return std::vector<T>(items_.begin(), items_.end()); }

  [[nodiscard]] const T* back() const noexcept { return items_.empty() ? nullptr : &items_.back(); }

  [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

 private:
  std::size_t capacity_;
  std::deque<T> items_;
};

}  // namespace perf_analyzer::core
