#pragma once
#include "../clock.hpp"
#include <cstdint>
#include <mutex>

// Reads return a fixed time. tickAfter(n) moves it forward by one
// millisecond on the (n+1)th read from now.
class FakeClock : public snowid::ClockSource {
public:
  explicit FakeClock(std::uint64_t now) : mNow(now) {}

  auto now() -> std::uint64_t override
  {
    auto lk = std::scoped_lock(mMt);
    mReads++;
    if (mTickAt != 0 && mReads > mTickAt) {
      mNow++;
      mTickAt = 0;
    }
    return mNow;
  }

  auto set(std::uint64_t now) -> void
  {
    auto lk = std::scoped_lock(mMt);
    mNow = now;
  }

  auto tickAfter(std::uint64_t reads) -> void
  {
    auto lk = std::scoped_lock(mMt);
    mTickAt = mReads + reads;
  }

  auto reads() -> std::uint64_t
  {
    auto lk = std::scoped_lock(mMt);
    return mReads;
  }

private:
  std::mutex mMt;
  std::uint64_t mNow;
  std::uint64_t mReads = 0;
  std::uint64_t mTickAt = 0;
};
