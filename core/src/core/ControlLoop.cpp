#include "core/ControlLoop.h"

#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

#include <juce_core/juce_core.h>

namespace morphsynth {

ControlLoop::ControlLoop(MessageSource& source,
                         OutputSink& sink,
                         ControlLoopSettings settings)
    : source_(source),
      settings_(std::move(settings)),
      voice_(sink, settings_.sampleRate)
{
}

int ControlLoop::pollOnce()
{
  const auto events = source_.poll(kMaxEventsPerPoll);

  for (const auto& raw : events) {
    const auto message = DecodeMidiEvent(raw);
    if (!message.has_value()) {
      continue;
    }
    handleMessage(*message);
  }

  return static_cast<int>(events.size());
}

void ControlLoop::run(const std::atomic<bool>& stopRequested)
{
  juce::Logger::writeToLog("[morphsynth] Control loop running at " +
                           juce::String(settings_.sampleRate, 0) + " Hz");

  while (!stopRequested.load(std::memory_order_relaxed)) {
    if (pollOnce() == 0) {
      std::this_thread::sleep_for(settings_.idleSleep);
    }
  }

  juce::Logger::writeToLog("[morphsynth] Control loop stopped");
}

void ControlLoop::handleMessage(const ControlMessage& message)
{
  std::visit(
      [this](const auto& event) {
        using Event = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<Event, NoteOn>) {
          handleNoteOn(event);
        } else if constexpr (std::is_same_v<Event, NoteOff>) {
          handleNoteOff(event);
        } else {
          handleControlChange(event);
        }
      },
      message.payload);
}

void ControlLoop::handleNoteOn(const NoteOn& event)
{
  if (event.velocity <= 0) {
    handleNoteOff(NoteOff{event.note});
    return;
  }

  RenderError error;
  if (!voice_.noteOn(event.note, parameters_, &error)) {
    ++renderFailures_;
    juce::Logger::writeToLog(
        "[morphsynth] Note " + juce::String(event.note) +
        " not rendered: " + juce::String(error.message));
    return;
  }

  if (!voice_.waitUntilFinished(settings_.playbackTimeout)) {
    ++playbackTimeouts_;
    voice_.abandonPlayback();
    juce::Logger::writeToLog(
        "[morphsynth] Note " + juce::String(event.note) +
        " never finished playing; output abandoned after " +
        juce::String(static_cast<juce::int64>(
            settings_.playbackTimeout.count())) +
        " ms");
  }
}

void ControlLoop::handleNoteOff(const NoteOff& event)
{
  // Notes always play their full fixed length; there is nothing to
  // release early.
  juce::ignoreUnused(event);
}

void ControlLoop::handleControlChange(const ControlChange& event)
{
  if (!controllerMap_.apply(event.controller, event.value,
                            settings_.sampleRate, parameters_)) {
    ++ignoredControllers_;
  }
}

}  // namespace morphsynth
