#include "core/ResonantFilter.h"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include <juce_dsp/juce_dsp.h>

namespace morphsynth {

double NormaliseCutoff(const double cutoffHz, const double sampleRate) noexcept
{
  const double nyquist = 0.5 * sampleRate;
  double normalised = (nyquist > 0.0) ? cutoffHz / nyquist : 0.0;
  if (!std::isfinite(normalised)) {
    normalised = kMaxNormalisedCutoff;
  }
  return std::clamp(normalised, kMinNormalisedCutoff, kMaxNormalisedCutoff);
}

BiquadCoefficients DesignLowPass(const double cutoffHz, const double sampleRate)
{
  const double normalised = NormaliseCutoff(cutoffHz, sampleRate);
  const double designRate = sampleRate > 0.0 ? sampleRate : 2.0;
  const double designFrequency = normalised * 0.5 * designRate;

  // JUCE stores second-order coefficients as {b0, b1, b2, a1, a2},
  // already divided by a0. The two-argument overload uses
  // Q = 1/sqrt(2), i.e. a Butterworth response.
  const auto designed =
      juce::dsp::IIR::Coefficients<double>::makeLowPass(designRate,
                                                        designFrequency);
  const auto& raw = designed->coefficients;

  BiquadCoefficients coefficients;
  coefficients.b0 = raw[0];
  coefficients.b1 = raw[1];
  coefficients.b2 = raw[2];
  coefficients.a1 = raw[3];
  coefficients.a2 = raw[4];
  return coefficients;
}

WaveformBuffer ApplyBiquad(const WaveformBuffer& input,
                           const BiquadCoefficients& c)
{
  WaveformBuffer output;
  output.sampleRate = input.sampleRate;
  output.samples.resize(input.samples.size());

  double x1 = 0.0;
  double x2 = 0.0;
  double y1 = 0.0;
  double y2 = 0.0;

  for (std::size_t n = 0; n < input.samples.size(); ++n) {
    const double x0 = static_cast<double>(input.samples[n]);
    const double y0 =
        c.b0 * x0 + c.b1 * x1 + c.b2 * x2 - c.a1 * y1 - c.a2 * y2;

    output.samples[n] = static_cast<float>(y0);

    x2 = x1;
    x1 = x0;
    y2 = y1;
    y1 = y0;
  }

  return output;
}

WaveformBuffer ApplyResonantLowPass(const WaveformBuffer& input,
                                    const double cutoffHz,
                                    const double resonance)
{
  // TODO: map resonance onto the design Q once the response change is
  // acceptable for existing patches; it is inert for now.
  juce::ignoreUnused(resonance);

  return ApplyBiquad(input, DesignLowPass(cutoffHz, input.sampleRate));
}

}  // namespace morphsynth
