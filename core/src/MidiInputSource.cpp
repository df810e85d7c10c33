#include "MidiInputSource.h"

#include <algorithm>

MidiInputSource::MidiInputSource() = default;

MidiInputSource::~MidiInputSource()
{
    close();
}

bool MidiInputSource::open(const int deviceIndex,
                           std::string* const error_message)
{
    if (error_message != nullptr) {
        *error_message = {};
    }

    close();

    const auto devices = juce::MidiInput::getAvailableDevices();
    if (devices.isEmpty()) {
        if (error_message != nullptr) {
            *error_message = "No MIDI input devices available";
        }
        return false;
    }

    if (deviceIndex < 0 || deviceIndex >= devices.size()) {
        if (error_message != nullptr) {
            *error_message = "MIDI device index " +
                             std::to_string(deviceIndex) +
                             " out of range (0-" +
                             std::to_string(devices.size() - 1) + ")";
        }
        return false;
    }

    const auto& info = devices.getReference(deviceIndex);
    input_ = juce::MidiInput::openDevice(info.identifier, this);
    if (input_ == nullptr) {
        if (error_message != nullptr) {
            *error_message = "Cannot open MIDI device '" +
                             info.name.toStdString() + "'";
        }
        return false;
    }

    input_->start();
    juce::Logger::writeToLog("[morphsynth] Listening on MIDI input '" +
                             info.name + "'");
    return true;
}

void MidiInputSource::close()
{
    if (input_ == nullptr) {
        return;
    }

    input_->stop();
    juce::Logger::writeToLog("[morphsynth] Closed MIDI input '" +
                             input_->getName() + "'");
    input_.reset();
}

std::string MidiInputSource::deviceName() const
{
    return input_ != nullptr ? input_->getName().toStdString()
                             : std::string{};
}

std::uint64_t MidiInputSource::droppedEvents() const
{
    const std::lock_guard<std::mutex> lock(queueMutex_);
    return droppedEvents_;
}

std::vector<morphsynth::RawMidiEvent> MidiInputSource::poll(
    const int maxEvents)
{
    std::vector<morphsynth::RawMidiEvent> events;
    if (maxEvents <= 0) {
        return events;
    }

    const std::lock_guard<std::mutex> lock(queueMutex_);
    const auto count = std::min(queue_.size(),
                                static_cast<std::size_t>(maxEvents));
    events.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        events.push_back(queue_.front());
        queue_.pop_front();
    }
    return events;
}

void MidiInputSource::push(const morphsynth::RawMidiEvent& event)
{
    bool dropped = false;
    std::uint64_t totalDropped = 0;
    {
        const std::lock_guard<std::mutex> lock(queueMutex_);
        if (queue_.size() >= kMaxQueuedEvents) {
            queue_.pop_front();
            totalDropped = ++droppedEvents_;
            dropped = true;
        }
        queue_.push_back(event);
    }

    // Only log the first drop and then every 1000th to avoid flooding.
    if (dropped && (totalDropped == 1 || totalDropped % 1000 == 0)) {
        juce::Logger::writeToLog(
            "[morphsynth] MIDI queue full; dropped " +
            juce::String(static_cast<juce::int64>(totalDropped)) +
            " event(s)");
    }
}

void MidiInputSource::handleIncomingMidiMessage(
    juce::MidiInput* source,
    const juce::MidiMessage& message)
{
    juce::ignoreUnused(source);

    // Sysex and other long messages carry nothing the synth reacts to.
    const int size = message.getRawDataSize();
    if (size <= 0 || size > 3) {
        return;
    }

    const auto* data = message.getRawData();
    morphsynth::RawMidiEvent event;
    event.status = data[0];
    event.data1 = size > 1 ? data[1] : 0;
    event.data2 = size > 2 ? data[2] : 0;
    event.data3 = 0;
    event.timestampMs = message.getTimeStamp() * 1000.0;
    push(event);
}
