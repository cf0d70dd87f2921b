#ifndef SRC_CHUG_CORE_TIMESTAMP_WINDOW_H_
#define SRC_CHUG_CORE_TIMESTAMP_WINDOW_H_

#include <iterator>
#include <vector>

#include "chug/base/timer.h"
#include "chug/base/types.h"

namespace chug::core {

/// Fixed capacity FIFO of monotonic timestamps backed by a ring buffer.
/// Once full, every insert evicts the oldest timestamp. Iteration is always oldest to newest.
/// A window with zero capacity accepts inserts but never holds anything.
class TimestampWindow {
 public:
  class ConstIterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = MonoTime;
    using difference_type = isize;
    using pointer = const MonoTime*;
    using reference = const MonoTime&;

    ConstIterator() = default;

    auto operator*() const -> reference { return (*mWindow)[mOffset]; }
    auto operator->() const -> pointer { return &(*mWindow)[mOffset]; }

    auto operator==(const ConstIterator& rhs) const -> bool {
      return mWindow == rhs.mWindow && mOffset == rhs.mOffset;
    }
    auto operator!=(const ConstIterator& rhs) const -> bool { return !(*this == rhs); }

    auto operator++() -> ConstIterator& {
      ++mOffset;
      return *this;
    }

    auto operator++(int) -> ConstIterator {
      auto previous = *this;
      ++mOffset;
      return previous;
    }

   private:
    const TimestampWindow* mWindow = nullptr;
    usize mOffset = 0;

    friend class TimestampWindow;

    ConstIterator(const TimestampWindow* window, const usize offset) : mWindow(window), mOffset(offset) {}
  };

  explicit TimestampWindow(usize capacity);

  void Insert(MonoTime timestamp);

  [[nodiscard]] auto Length() const noexcept -> usize { return mLength; }
  [[nodiscard]] auto Capacity() const noexcept -> usize { return mSlots.size(); }
  [[nodiscard]] auto IsEmpty() const noexcept -> bool { return mLength == 0; }
  [[nodiscard]] auto IsFull() const noexcept -> bool { return mLength == mSlots.size(); }

  /// `offset` 0 is the oldest timestamp held, `Length() - 1` the newest. Requires offset < Length()
  [[nodiscard]] auto operator[](usize offset) const -> const MonoTime&;
  /// Requires !IsEmpty()
  [[nodiscard]] auto Oldest() const -> const MonoTime&;
  /// Requires !IsEmpty()
  [[nodiscard]] auto Newest() const -> const MonoTime&;

  [[nodiscard]] auto begin() const -> ConstIterator { return {this, 0}; }
  [[nodiscard]] auto end() const -> ConstIterator { return {this, mLength}; }

 private:
  // Sized once on construction, never grows
  std::vector<MonoTime> mSlots;
  usize mHead = 0;
  usize mLength = 0;
};

}  // namespace chug::core

#endif  // SRC_CHUG_CORE_TIMESTAMP_WINDOW_H_
