#include "core/Envelope.h"

#include <algorithm>
#include <cstddef>

namespace morphsynth {

namespace {

// Writes an endpoint-inclusive linear ramp of `length` samples whose
// first sample lands at `begin`. Only indices inside [0, env.size())
// are written, so a ramp may start before the array or end after it.
void writeRamp(std::vector<float>& env,
               const int begin,
               const int length,
               const double start,
               const double end)
{
  if (length <= 0) {
    return;
  }

  const int total = static_cast<int>(env.size());
  const int first = std::max(begin, 0);
  const int last = std::min(begin + length, total);
  const double denom = static_cast<double>(std::max(length - 1, 1));

  for (int k = first; k < last; ++k) {
    const double pos = (length > 1)
                           ? static_cast<double>(k - begin) / denom
                           : 0.0;
    env[static_cast<std::size_t>(k)] =
        static_cast<float>(start + (end - start) * pos);
  }
}

int stageSamples(const double seconds, const double sampleRate) noexcept
{
  return SampleCountFor(sampleRate, seconds);
}

}  // namespace

EnvelopeLayout ComputeEnvelopeLayout(const int totalSamples,
                                     const EnvelopeSettings& settings,
                                     const double sampleRate) noexcept
{
  EnvelopeLayout layout;
  layout.attackSamples = stageSamples(settings.attack, sampleRate);
  layout.decaySamples = stageSamples(settings.decay, sampleRate);
  layout.releaseSamples = stageSamples(settings.release, sampleRate);

  const long long remaining = static_cast<long long>(totalSamples) -
                              layout.attackSamples - layout.decaySamples -
                              layout.releaseSamples;
  layout.sustainSamples = static_cast<int>(std::max(0LL, remaining));
  return layout;
}

std::vector<float> BuildEnvelope(const int totalSamples,
                                 const EnvelopeSettings& settings,
                                 const double sampleRate)
{
  std::vector<float> env(static_cast<std::size_t>(std::max(totalSamples, 0)),
                         0.0F);
  if (env.empty()) {
    return env;
  }

  const EnvelopeLayout layout =
      ComputeEnvelopeLayout(totalSamples, settings, sampleRate);
  const double sustain = settings.sustain;

  const int decayBegin = layout.attackSamples;
  const int sustainBegin = decayBegin + layout.decaySamples;

  writeRamp(env, 0, layout.attackSamples, 0.0, 1.0);
  writeRamp(env, decayBegin, layout.decaySamples, 1.0, sustain);

  const int sustainEnd =
      std::min(sustainBegin + layout.sustainSamples, totalSamples);
  for (int k = sustainBegin; k < sustainEnd; ++k) {
    env[static_cast<std::size_t>(k)] = static_cast<float>(sustain);
  }

  // Release last: it owns the tail of the note whatever the other
  // stages wrote there.
  writeRamp(env, totalSamples - layout.releaseSamples,
            layout.releaseSamples, sustain, 0.0);

  return env;
}

WaveformBuffer ApplyEnvelope(const WaveformBuffer& input,
                             const EnvelopeSettings& settings)
{
  const std::vector<float> env =
      BuildEnvelope(input.size(), settings, input.sampleRate);

  WaveformBuffer shaped;
  shaped.sampleRate = input.sampleRate;
  shaped.samples.resize(input.samples.size());
  for (std::size_t i = 0; i < shaped.samples.size(); ++i) {
    shaped.samples[i] = input.samples[i] * env[i];
  }
  return shaped;
}

}  // namespace morphsynth
