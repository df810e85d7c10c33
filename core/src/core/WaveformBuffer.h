#pragma once

#include <string>
#include <vector>

namespace morphsynth {

// Mono block of samples tagged with the rate it was rendered at.
// Pipeline stages never modify their input buffer; each one returns a
// new buffer of the same length.
struct WaveformBuffer {
  double sampleRate{44100.0};
  std::vector<float> samples;

  [[nodiscard]] int size() const noexcept
  {
    return static_cast<int>(samples.size());
  }

  [[nodiscard]] bool empty() const noexcept { return samples.empty(); }
};

// Number of samples covering `durationSeconds` at `sampleRate`,
// rounded down. Negative or non-finite products yield 0.
[[nodiscard]] int SampleCountFor(double sampleRate, double durationSeconds) noexcept;

enum class RenderErrorCode {
  kNone = 0,
  kInvalidParameter,
  kVoiceBusy,
  kOutputRejected,
};

// Failure description filled in by the rendering stages. Callers pass
// a pointer when they want the details; a null pointer is accepted
// everywhere.
struct RenderError {
  RenderErrorCode code{RenderErrorCode::kNone};
  std::string message;
};

}  // namespace morphsynth
