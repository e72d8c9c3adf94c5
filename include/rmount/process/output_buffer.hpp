#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace rmount::process {

/// Fixed-capacity ring of the most recent bytes a child wrote. Older output
/// is overwritten once the capacity is reached.
class OutputBuffer {
public:
  explicit OutputBuffer(std::size_t capacity);

  void append(std::string_view data);
  [[nodiscard]] std::string contents() const;
  [[nodiscard]] std::vector<std::string> tail_lines(std::size_t count) const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t total_bytes() const;

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::string ring_;
  std::size_t head_ = 0;
  std::size_t size_ = 0;
  std::size_t total_ = 0;
};

} // namespace rmount::process
