#pragma once

#include <array>

#include "core/WaveformBuffer.h"

namespace morphsynth {

inline constexpr int kNumOscillators = 4;

// Basis waveforms blended by the morphing stage. The enumerator value
// doubles as the oscillator slot index in the bank, the weight vector
// and the detune vector.
enum class OscillatorWaveform {
  kSine = 0,
  kSawtooth,
  kTriangle,
  kPulse,
};

using OscillatorBuffers = std::array<WaveformBuffer, kNumOscillators>;
using OscillatorWeights = std::array<double, kNumOscillators>;
using OscillatorDetune = std::array<double, kNumOscillators>;

// Evaluates a single waveform at time `t` (seconds) for frequency `f`.
// The shapes are computed directly from f*t, without phase
// accumulation or band-limiting:
//   sine      sin(2*pi*f*t)
//   sawtooth  2*(f*t - floor(f*t + 0.5))         in [-1, 1)
//   triangle  2*|sawtooth| - 1
//   pulse     +1 when frac(f*t) < 0.5, else -1   (50% duty)
[[nodiscard]] double EvaluateWaveform(OscillatorWaveform waveform,
                                      double frequencyHz,
                                      double timeSeconds) noexcept;

// Renders the four basis waveforms for `durationSeconds`. Each slot
// plays `baseFrequencyHz + detuneHz[slot]`; the offset is a plain Hz
// shift, not a pitch ratio. A zero (or negative) duration yields four
// empty buffers.
[[nodiscard]] OscillatorBuffers GenerateOscillatorBank(
    double baseFrequencyHz,
    const OscillatorDetune& detuneHz,
    double sampleRate,
    double durationSeconds);

// Blends the oscillator buffers into `out` using `weights` normalised
// by their sum. Returns false with RenderErrorCode::kInvalidParameter
// when the weights sum to zero, when any weight is negative or not
// finite, or when the buffers disagree on length or sample rate. `out`
// is left untouched on failure.
bool MorphWaveforms(const OscillatorBuffers& oscillators,
                    const OscillatorWeights& weights,
                    WaveformBuffer& out,
                    RenderError* error = nullptr);

}  // namespace morphsynth
