#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <utility>

/*
    RingBuffer is a fixed-capacity history with oldest-eviction. Capacity is a template parameter so the storage
    lives inline in the owner (a Track, a crossing state, a zone's rolling window) and never grows.

    Indexing is oldest-first: at(0) is the oldest sample still held, back() is the newest.
*/

namespace fta {

template <typename T, std::size_t N>
class RingBuffer {
  static_assert(N > 0, "RingBuffer capacity must be > 0");

public:
  RingBuffer() = default;

  // Push a new sample, evicting the oldest when full
  void push(T value) {
    buf_[(head_ + size_) % N] = std::move(value);
    if (size_ < N) {
      ++size_;
    } else {
      head_ = (head_ + 1) % N;
    }
  }

  const T& at(std::size_t i) const {
    if (i >= size_) throw std::out_of_range("RingBuffer::at index out of range");
    return buf_[(head_ + i) % N];
  }

  const T& back() const { return at(size_ - 1); }

  // Second newest sample, used for "previous vs current" checks
  const T& previous() const { return at(size_ - 2); }

  void clear() {
    head_ = 0;
    size_ = 0;
  }

  std::size_t size() const { return size_; }
  bool empty() const { return size_ == 0; }
  bool full() const { return size_ == N; }
  static constexpr std::size_t capacity() { return N; }

  template <typename Fn>
  void for_each(Fn&& fn) const {
    for (std::size_t i = 0; i < size_; ++i) fn(buf_[(head_ + i) % N]);
  }

private:
  std::array<T, N> buf_{};
  std::size_t head_{0};
  std::size_t size_{0};
};

} // namespace fta
