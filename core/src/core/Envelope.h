#pragma once

#include <vector>

#include "core/WaveformBuffer.h"

namespace morphsynth {

// ADSR configuration. Attack, decay and release are stage lengths in
// seconds; sustain is a level in [0,1].
struct EnvelopeSettings {
  double attack{0.1};
  double decay{0.1};
  double sustain{0.8};
  double release{0.1};
};

// Stage boundaries, in samples, for a note of a given length.
struct EnvelopeLayout {
  int attackSamples{0};
  int decaySamples{0};
  int sustainSamples{0};
  int releaseSamples{0};
};

[[nodiscard]] EnvelopeLayout ComputeEnvelopeLayout(int totalSamples,
                                                   const EnvelopeSettings& settings,
                                                   double sampleRate) noexcept;

// Builds the per-sample gain curve for a note of `totalSamples`.
//
// Segments are written in order attack, decay, sustain, release. The
// release ramp always occupies the last `releaseSamples` entries and is
// written last, so when attack + decay + release is longer than the
// note it overwrites the earlier segments. A release longer than the
// note keeps its tail aligned with the end of the array, so the final
// sample is 0 whenever the release spans two or more samples. Ramps
// include both endpoints.
[[nodiscard]] std::vector<float> BuildEnvelope(int totalSamples,
                                               const EnvelopeSettings& settings,
                                               double sampleRate);

// Multiplies `input` by the envelope built for its length and rate.
[[nodiscard]] WaveformBuffer ApplyEnvelope(const WaveformBuffer& input,
                                           const EnvelopeSettings& settings);

}  // namespace morphsynth
