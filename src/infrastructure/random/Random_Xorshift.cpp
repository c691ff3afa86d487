#include "infrastructure/random/Random_Xorshift.hpp"

#include <unistd.h>

#include <chrono>

namespace burrow::host::infrastructure::random
{

namespace
{
uint32_t clock_seed()
{
  const auto ticks = static_cast<uint64_t>(
      std::chrono::steady_clock::now().time_since_epoch().count());
  const auto pid = static_cast<uint64_t>(::getpid());
  return static_cast<uint32_t>(ticks ^ (ticks >> 32) ^ (pid * 0x9E3779B9u));
}
}  // namespace

Random_Xorshift::Random_Xorshift() : Random_Xorshift(clock_seed()) {}

Random_Xorshift::Random_Xorshift(uint32_t seed) : state_(seed) {}

uint32_t Random_Xorshift::next()
{
  // state must be non-zero
  if (state_ == 0) state_ = 0xA5A5A5A5u;
  state_ ^= state_ << 13;
  state_ ^= state_ >> 17;
  state_ ^= state_ << 5;
  return state_;
}

std::size_t Random_Xorshift::uniform(std::size_t n)
{
  if (n <= 1) return 0;
  // rejection sampling keeps the result unbiased
  const uint64_t range = 0x100000000ull;
  if (n >= range) return static_cast<std::size_t>(next());
  const uint64_t limit = range - (range % n);
  uint64_t r;
  do
  {
    r = next();
  } while (r >= limit);
  return static_cast<std::size_t>(r % n);
}

}  // namespace burrow::host::infrastructure::random
