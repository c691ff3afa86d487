#pragma once

#include <cstddef>

namespace burrow::host::application::ports
{

struct IRandomSource
{
  virtual ~IRandomSource() = default;

  // Uniform index in [0, n). n is never 0.
  virtual std::size_t uniform(std::size_t n) = 0;
};

}  // namespace burrow::host::application::ports
