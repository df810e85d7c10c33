#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <juce_audio_devices/juce_audio_devices.h>

#include "core/SynthIo.h"

// MIDI input device feeding the control loop.
//
// JUCE delivers messages on its own MIDI thread; they are converted to
// RawMidiEvent and queued here until the control loop polls them. The
// queue is bounded: when it is full the oldest event is dropped.
class MidiInputSource : public morphsynth::MessageSource,
                        private juce::MidiInputCallback {
public:
    static constexpr std::size_t kMaxQueuedEvents = 4096;

    MidiInputSource();
    ~MidiInputSource() override;

    MidiInputSource(const MidiInputSource&) = delete;
    MidiInputSource& operator=(const MidiInputSource&) = delete;

    // Opens the input at `deviceIndex` in juce::MidiInput's device list
    // and starts delivery. On failure, returns false and writes a short
    // description into `error_message` when it is non-null.
    bool open(int deviceIndex, std::string* error_message = nullptr);

    // Stops delivery and releases the device. Safe to call repeatedly.
    void close();

    [[nodiscard]] bool isOpen() const noexcept { return input_ != nullptr; }

    [[nodiscard]] std::string deviceName() const;

    [[nodiscard]] std::uint64_t droppedEvents() const;

    // morphsynth::MessageSource
    std::vector<morphsynth::RawMidiEvent> poll(int maxEvents) override;

    // Queues an event as if it had arrived from the device.
    void push(const morphsynth::RawMidiEvent& event);

private:
    void handleIncomingMidiMessage(juce::MidiInput* source,
                                   const juce::MidiMessage& message) override;

    std::unique_ptr<juce::MidiInput> input_;

    mutable std::mutex queueMutex_;
    std::deque<morphsynth::RawMidiEvent> queue_;
    std::uint64_t droppedEvents_{0};
};
