#include "core/Oscillators.h"

#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

namespace morphsynth {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

double sawtooth(const double cycles) noexcept
{
  return 2.0 * (cycles - std::floor(cycles + 0.5));
}

void setError(RenderError* error, std::string message)
{
  if (error != nullptr) {
    error->code = RenderErrorCode::kInvalidParameter;
    error->message = std::move(message);
  }
}

}  // namespace

double EvaluateWaveform(const OscillatorWaveform waveform,
                        const double frequencyHz,
                        const double timeSeconds) noexcept
{
  const double cycles = frequencyHz * timeSeconds;

  switch (waveform) {
  case OscillatorWaveform::kSine:
    return std::sin(kTwoPi * cycles);
  case OscillatorWaveform::kSawtooth:
    return sawtooth(cycles);
  case OscillatorWaveform::kTriangle:
    return 2.0 * std::abs(sawtooth(cycles)) - 1.0;
  case OscillatorWaveform::kPulse:
    // Floored modulo so negative frequencies keep the same duty.
    return (cycles - std::floor(cycles)) < 0.5 ? 1.0 : -1.0;
  }

  return 0.0;
}

OscillatorBuffers GenerateOscillatorBank(const double baseFrequencyHz,
                                         const OscillatorDetune& detuneHz,
                                         const double sampleRate,
                                         const double durationSeconds)
{
  const int numSamples = SampleCountFor(sampleRate, durationSeconds);

  OscillatorBuffers bank;
  for (int slot = 0; slot < kNumOscillators; ++slot) {
    const auto slotIdx = static_cast<std::size_t>(slot);
    const auto waveform = static_cast<OscillatorWaveform>(slot);
    const double frequency = baseFrequencyHz + detuneHz[slotIdx];

    WaveformBuffer& buffer = bank[slotIdx];
    buffer.sampleRate = sampleRate;
    buffer.samples.resize(static_cast<std::size_t>(numSamples));

    for (int i = 0; i < numSamples; ++i) {
      const double t = static_cast<double>(i) / sampleRate;
      buffer.samples[static_cast<std::size_t>(i)] =
          static_cast<float>(EvaluateWaveform(waveform, frequency, t));
    }
  }

  return bank;
}

bool MorphWaveforms(const OscillatorBuffers& oscillators,
                    const OscillatorWeights& weights,
                    WaveformBuffer& out,
                    RenderError* const error)
{
  double sum = 0.0;
  for (const double weight : weights) {
    if (!std::isfinite(weight) || weight < 0.0) {
      setError(error, "oscillator weights must be finite and non-negative");
      return false;
    }
    sum += weight;
  }

  if (!(sum > 0.0) || !std::isfinite(sum)) {
    setError(error, "oscillator weights sum to zero");
    return false;
  }

  const WaveformBuffer& first = oscillators.front();
  for (const auto& buffer : oscillators) {
    if (buffer.size() != first.size() ||
        buffer.sampleRate != first.sampleRate) {
      setError(error, "oscillator buffers differ in length or sample rate");
      return false;
    }
  }

  OscillatorWeights normalised{};
  for (std::size_t slot = 0; slot < weights.size(); ++slot) {
    normalised[slot] = weights[slot] / sum;
  }

  WaveformBuffer morphed;
  morphed.sampleRate = first.sampleRate;
  morphed.samples.resize(first.samples.size());

  for (std::size_t i = 0; i < morphed.samples.size(); ++i) {
    double acc = 0.0;
    for (std::size_t slot = 0; slot < oscillators.size(); ++slot) {
      acc += normalised[slot] *
             static_cast<double>(oscillators[slot].samples[i]);
    }
    morphed.samples[i] = static_cast<float>(acc);
  }

  out = std::move(morphed);
  return true;
}

}  // namespace morphsynth
