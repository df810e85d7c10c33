#pragma once

#include "core/WaveformBuffer.h"

namespace morphsynth {

// Second-order IIR coefficients normalised so that a0 == 1.
struct BiquadCoefficients {
  double b0{1.0};
  double b1{0.0};
  double b2{0.0};
  double a1{0.0};
  double a2{0.0};
};

// Bounds applied to cutoff / nyquist so the design stays strictly
// inside (0, 1).
inline constexpr double kMinNormalisedCutoff = 1.0e-4;
inline constexpr double kMaxNormalisedCutoff = 0.9999;

[[nodiscard]] double NormaliseCutoff(double cutoffHz, double sampleRate) noexcept;

// Bilinear-transform Butterworth low-pass (Q = 1/sqrt(2)) designed from
// the normalised cutoff only.
[[nodiscard]] BiquadCoefficients DesignLowPass(double cutoffHz, double sampleRate);

// Runs the direct-form I difference equation over `input` starting from
// silence:
//   y[n] = b0 x[n] + b1 x[n-1] + b2 x[n-2] - a1 y[n-1] - a2 y[n-2]
[[nodiscard]] WaveformBuffer ApplyBiquad(const WaveformBuffer& input,
                                         const BiquadCoefficients& coefficients);

// Low-pass stage of the render pipeline. `resonance` is accepted so
// callers can pass the full filter configuration, but the coefficient
// design ignores it: the response is always Butterworth.
[[nodiscard]] WaveformBuffer ApplyResonantLowPass(const WaveformBuffer& input,
                                                  double cutoffHz,
                                                  double resonance);

}  // namespace morphsynth
