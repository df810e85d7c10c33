#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "core/MidiTypes.h"
#include "core/RenderPipeline.h"
#include "core/SynthIo.h"
#include "core/SynthParameters.h"

namespace morphsynth {

struct ControlLoopSettings {
  double sampleRate{44100.0};

  // Sleep applied when a poll returns no events.
  std::chrono::milliseconds idleSleep{1};

  // Longest wait for the sink to report the end of a note. A note
  // lasts one second, so this only trips when the output is stuck.
  std::chrono::milliseconds playbackTimeout{3000};
};

// Cooperative single-threaded loop owning the parameter record and the
// voice. Each cycle drains up to kMaxEventsPerPoll events from the
// source and handles them strictly in arrival order:
//   - ControlChange mutates the parameters through ControllerMap.
//   - NoteOn renders a note from a copy of the current parameters and
//     blocks until the sink reports the end of playback, or until
//     playbackTimeout passes, after which the note is abandoned.
//   - NoteOff (or NoteOn with velocity 0) is acknowledged only.
// Because playback is awaited inside the cycle, no controller message
// is applied while a note is playing.
class ControlLoop {
 public:
  static constexpr int kMaxEventsPerPoll = 10;

  ControlLoop(MessageSource& source,
              OutputSink& sink,
              ControlLoopSettings settings = {});

  ControlLoop(const ControlLoop&) = delete;
  ControlLoop& operator=(const ControlLoop&) = delete;

  // Runs one poll cycle. Returns the number of raw events consumed.
  int pollOnce();

  // Polls until `stopRequested` becomes true.
  void run(const std::atomic<bool>& stopRequested);

  void handleMessage(const ControlMessage& message);

  [[nodiscard]] const SynthParameters& parameters() const noexcept
  {
    return parameters_;
  }

  [[nodiscard]] const Voice& voice() const noexcept { return voice_; }

  [[nodiscard]] std::uint64_t renderFailures() const noexcept
  {
    return renderFailures_;
  }

  [[nodiscard]] std::uint64_t ignoredControllers() const noexcept
  {
    return ignoredControllers_;
  }

  // Notes abandoned because the sink never reported completion.
  [[nodiscard]] std::uint64_t playbackTimeouts() const noexcept
  {
    return playbackTimeouts_;
  }

 private:
  void handleNoteOn(const NoteOn& event);
  void handleNoteOff(const NoteOff& event);
  void handleControlChange(const ControlChange& event);

  MessageSource& source_;
  const ControlLoopSettings settings_;

  SynthParameters parameters_{};
  const ControllerMap controllerMap_{};
  Voice voice_;

  std::uint64_t renderFailures_{0};
  std::uint64_t ignoredControllers_{0};
  std::uint64_t playbackTimeouts_{0};
};

}  // namespace morphsynth
