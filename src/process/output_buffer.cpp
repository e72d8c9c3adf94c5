#include "rmount/process/output_buffer.hpp"

#include <algorithm>
#include <sstream>

namespace rmount::process {

OutputBuffer::OutputBuffer(const std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)), ring_(capacity_, '\0') {}

void OutputBuffer::append(std::string_view data) {
  std::lock_guard<std::mutex> lock(mutex_);
  total_ += data.size();
  if (data.size() >= capacity_) {
    data.remove_prefix(data.size() - capacity_);
    ring_.assign(data.begin(), data.end());
    head_ = 0;
    size_ = capacity_;
    return;
  }

  for (const char ch : data) {
    const std::size_t tail = (head_ + size_) % capacity_;
    ring_[tail] = ch;
    if (size_ < capacity_) {
      ++size_;
    } else {
      head_ = (head_ + 1) % capacity_;
    }
  }
}

std::string OutputBuffer::contents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string out;
  out.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    out.push_back(ring_[(head_ + i) % capacity_]);
  }
  return out;
}

std::vector<std::string> OutputBuffer::tail_lines(const std::size_t count) const {
  std::vector<std::string> lines;
  std::stringstream stream(contents());
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  if (lines.size() > count) {
    lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(count));
  }
  return lines;
}

std::size_t OutputBuffer::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return size_;
}

std::size_t OutputBuffer::total_bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_;
}

} // namespace rmount::process
