#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

#include "core/SynthIo.h"
#include "core/SynthParameters.h"
#include "core/WaveformBuffer.h"

namespace morphsynth {

// Every note is rendered for a fixed length; velocity and the time the
// key is held do not change it.
inline constexpr double kNoteDurationSeconds = 1.0;

// Renders one note from a parameter snapshot:
// oscillator bank -> morph -> envelope -> low-pass.
// On failure `out` is left untouched and `error` (when non-null)
// describes the rejected parameter.
bool RenderNote(int note,
                const SynthParameters& params,
                double sampleRate,
                double durationSeconds,
                WaveformBuffer& out,
                RenderError* error = nullptr);

enum class VoiceState {
  kIdle = 0,
  kRendering,
  kPlaying,
  kDone,
};

[[nodiscard]] const char* VoiceStateName(VoiceState state) noexcept;

// Single monophonic voice driving the render/playback cycle:
//
//   Idle -> Rendering -> Playing -> Done
//
// noteOn() renders with the snapshot it is given and hands the result
// to the sink. The sink's completion callback moves the voice from
// Playing to Done; waitUntilFinished() blocks the caller on that
// signal. A failed render (or a sink that refuses the buffer) returns
// the voice to Idle without submitting anything.
class Voice {
 public:
  Voice(OutputSink& sink, double sampleRate) noexcept;

  Voice(const Voice&) = delete;
  Voice& operator=(const Voice&) = delete;

  ~Voice();

  // Accepted in Idle or Done. Returns true when a buffer was
  // submitted to the sink.
  bool noteOn(int note, SynthParameters snapshot, RenderError* error = nullptr);

  // Blocks until the note submitted by the last successful noteOn()
  // has finished playing. Returns immediately when nothing is
  // playing.
  void waitUntilFinished();

  // As above, giving up after `timeout`. Returns false when the note
  // is still playing at that point.
  bool waitUntilFinished(std::chrono::milliseconds timeout);

  // Detaches the voice from a note whose completion never arrived and
  // returns it to Idle. A completion that turns up later is ignored.
  void abandonPlayback();

  [[nodiscard]] VoiceState state() const noexcept
  {
    return state_.load(std::memory_order_acquire);
  }

  // Number of buffers accepted by the sink so far.
  [[nodiscard]] std::uint64_t notesSubmitted() const noexcept
  {
    return notesSubmitted_;
  }

 private:
  void onPlaybackFinished(std::uint64_t generation);

  OutputSink& sink_;
  const double sampleRate_;

  std::atomic<VoiceState> state_{VoiceState::kIdle};

  std::mutex mutex_;
  std::condition_variable finished_;
  // Incremented per submission so a late callback from an earlier
  // note cannot complete a newer one.
  std::uint64_t generation_{0};
  std::uint64_t notesSubmitted_{0};
};

}  // namespace morphsynth
