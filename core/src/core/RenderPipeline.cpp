#include "core/RenderPipeline.h"

#include <string>

#include "core/Envelope.h"
#include "core/NoteFrequency.h"
#include "core/Oscillators.h"
#include "core/ResonantFilter.h"

namespace morphsynth {

bool RenderNote(const int note,
                const SynthParameters& params,
                const double sampleRate,
                const double durationSeconds,
                WaveformBuffer& out,
                RenderError* const error)
{
  const double frequency = NoteToFrequency(note);

  const OscillatorBuffers bank = GenerateOscillatorBank(
      frequency, params.detuneHz, sampleRate, durationSeconds);

  WaveformBuffer morphed;
  if (!MorphWaveforms(bank, params.weights, morphed, error)) {
    return false;
  }

  const WaveformBuffer shaped = ApplyEnvelope(morphed, params.envelope);

  out = ApplyResonantLowPass(shaped, params.filterCutoffHz,
                             params.filterResonance);
  return true;
}

const char* VoiceStateName(const VoiceState state) noexcept
{
  switch (state) {
  case VoiceState::kIdle:
    return "idle";
  case VoiceState::kRendering:
    return "rendering";
  case VoiceState::kPlaying:
    return "playing";
  case VoiceState::kDone:
    return "done";
  }
  return "unknown";
}

Voice::Voice(OutputSink& sink, const double sampleRate) noexcept
    : sink_(sink), sampleRate_(sampleRate)
{
}

Voice::~Voice()
{
  // The sink holds a callback pointing at this voice until playback
  // ends.
  waitUntilFinished();
}

bool Voice::noteOn(const int note,
                   const SynthParameters snapshot,
                   RenderError* const error)
{
  const VoiceState current = state();
  if (current == VoiceState::kRendering || current == VoiceState::kPlaying) {
    if (error != nullptr) {
      error->code = RenderErrorCode::kVoiceBusy;
      error->message = "voice is still " +
                       std::string(VoiceStateName(current));
    }
    return false;
  }

  state_.store(VoiceState::kRendering, std::memory_order_release);

  WaveformBuffer rendered;
  if (!RenderNote(note, snapshot, sampleRate_, kNoteDurationSeconds,
                  rendered, error)) {
    state_.store(VoiceState::kIdle, std::memory_order_release);
    return false;
  }

  std::uint64_t generation = 0;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    generation = ++generation_;
    state_.store(VoiceState::kPlaying, std::memory_order_release);
  }

  const bool accepted = sink_.submit(
      rendered, [this, generation] { onPlaybackFinished(generation); });

  if (!accepted) {
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      if (generation_ == generation) {
        state_.store(VoiceState::kIdle, std::memory_order_release);
      }
    }
    finished_.notify_all();

    if (error != nullptr) {
      error->code = RenderErrorCode::kOutputRejected;
      error->message = "output sink rejected the rendered note";
    }
    return false;
  }

  ++notesSubmitted_;
  return true;
}

void Voice::waitUntilFinished()
{
  std::unique_lock<std::mutex> lock(mutex_);
  finished_.wait(lock, [this] {
    return state_.load(std::memory_order_acquire) != VoiceState::kPlaying;
  });
}

bool Voice::waitUntilFinished(const std::chrono::milliseconds timeout)
{
  std::unique_lock<std::mutex> lock(mutex_);
  return finished_.wait_for(lock, timeout, [this] {
    return state_.load(std::memory_order_acquire) != VoiceState::kPlaying;
  });
}

void Voice::abandonPlayback()
{
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load(std::memory_order_acquire) != VoiceState::kPlaying) {
      return;
    }
    ++generation_;
    state_.store(VoiceState::kIdle, std::memory_order_release);
  }
  finished_.notify_all();
}

void Voice::onPlaybackFinished(const std::uint64_t generation)
{
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (generation != generation_ ||
        state_.load(std::memory_order_acquire) != VoiceState::kPlaying) {
      return;
    }
    state_.store(VoiceState::kDone, std::memory_order_release);
  }
  finished_.notify_all();
}

}  // namespace morphsynth
