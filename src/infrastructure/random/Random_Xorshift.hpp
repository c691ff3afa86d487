#pragma once

#include <cstddef>
#include <cstdint>

#include "application/ports/IRandomSource.hpp"

namespace burrow::host::infrastructure::random
{

// xorshift32; plenty for spreading load across resolvers.
class Random_Xorshift final : public burrow::host::application::ports::IRandomSource
{
 public:
  // Seeded from the clock and the pid, so separate processes diverge.
  Random_Xorshift();
  explicit Random_Xorshift(uint32_t seed);

  std::size_t uniform(std::size_t n) override;

  uint32_t next();

 private:
  uint32_t state_;
};

}  // namespace burrow::host::infrastructure::random
