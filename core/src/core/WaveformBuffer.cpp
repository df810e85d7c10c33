#include "core/WaveformBuffer.h"

#include <cmath>
#include <limits>

namespace morphsynth {

int SampleCountFor(const double sampleRate, const double durationSeconds) noexcept
{
  const double product = std::floor(sampleRate * durationSeconds);
  if (!std::isfinite(product) || product <= 0.0) {
    return 0;
  }
  if (product >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(product);
}

}  // namespace morphsynth
