#include "recitation_buffer.hpp"

void RecitationBuffer::append(const TextUnit& unit) {
  std::lock_guard<std::mutex> lk(mutex_);
  if (!data_.empty()) data_ += unit.lead;
  data_ += unit.text;
  units_++;
}

std::string RecitationBuffer::snapshot() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return data_;
}

void RecitationBuffer::reset() {
  std::lock_guard<std::mutex> lk(mutex_);
  data_.clear();
  units_ = 0;
}

size_t RecitationBuffer::size() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return data_.size();
}

size_t RecitationBuffer::units() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return units_;
}
