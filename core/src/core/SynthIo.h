#pragma once

#include <functional>
#include <vector>

#include "core/MidiTypes.h"
#include "core/WaveformBuffer.h"

namespace morphsynth {

// Source of raw controller events. Implementations may be fed from
// another thread but poll() is only called from the control loop.
class MessageSource {
 public:
  virtual ~MessageSource() = default;

  // Removes and returns up to `maxEvents` queued events in arrival
  // order. Never blocks; returns an empty vector when idle.
  virtual std::vector<RawMidiEvent> poll(int maxEvents) = 0;
};

// Destination for rendered notes.
class OutputSink {
 public:
  using CompletionCallback = std::function<void()>;

  virtual ~OutputSink() = default;

  // Starts playback of `buffer` at `buffer.sampleRate`. Returns false
  // when the sink cannot accept the buffer; in that case `onFinished`
  // is never invoked. On success `onFinished` is invoked exactly once,
  // from any thread, after the last sample has been consumed (or the
  // sink was stopped).
  virtual bool submit(const WaveformBuffer& buffer,
                      CompletionCallback onFinished) = 0;
};

}  // namespace morphsynth
