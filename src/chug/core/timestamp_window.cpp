#include "chug/core/timestamp_window.h"

#include "chug/base/assert.h"

namespace chug::core {

TimestampWindow::TimestampWindow(const usize capacity) : mSlots(capacity) {}

void TimestampWindow::Insert(const MonoTime timestamp) {
  // NOLINTNEXTLINE(readability-braces-around-statements)
  if (mSlots.empty()) return;

  if (IsFull()) {
    // Overwrite the oldest slot in place and move head to the next oldest
    mSlots[mHead] = timestamp;
    mHead = (mHead + 1) % mSlots.size();
    return;
  }

  mSlots[(mHead + mLength) % mSlots.size()] = timestamp;
  mLength++;
  CHUG_ASSERT(mLength <= mSlots.size())
}

auto TimestampWindow::operator[](const usize offset) const -> const MonoTime& {
  CHUG_ASSERT(offset < mLength)
  return mSlots[(mHead + offset) % mSlots.size()];
}

auto TimestampWindow::Oldest() const -> const MonoTime& { return (*this)[0]; }

auto TimestampWindow::Newest() const -> const MonoTime& { return (*this)[mLength - 1]; }

}  // namespace chug::core
