#pragma once

#include <atomic>
#include <string>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_audio_devices/juce_audio_devices.h>

#include "NotePlayer.h"
#include "core/SynthIo.h"

// Audio-device output for rendered notes.
//
// Responsibilities:
//   - Own a JUCE AudioDeviceManager with stereo (or wider) output.
//   - Play one mono note at a time on every output channel.
//   - Signal the submitter once the last sample has left the callback.
//
// The control loop submits a note and then waits, so at most one note
// is pending at any time. A second submit() while a note is still
// playing is rejected, and so is any submit() while the device is
// stopped. Completion callbacks run on a dedicated playback thread,
// never on the audio thread.
class AudioEngine : public juce::AudioIODeviceCallback,
                    public morphsynth::OutputSink,
                    private juce::Thread {
public:
    AudioEngine();
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    // Opens the output device. `deviceType` selects a JUCE backend by
    // name (for example "ALSA" or "JACK"); an empty string keeps the
    // system default. The preferred sample rate is requested from the
    // device but not guaranteed; notes rendered at another rate are
    // resampled on playback.
    //
    // On failure, returns false and writes a short description into
    // `error_message` when it is non-null.
    bool initialise(double preferredSampleRate,
                    const std::string& deviceType,
                    std::string* error_message = nullptr);

    // Detaches the callback, finishes any pending note and closes the
    // device. Safe to call more than once; only the first call has an
    // effect.
    void shutdown();

    [[nodiscard]] double deviceSampleRate() const noexcept
    {
        return deviceSampleRate_.load(std::memory_order_relaxed);
    }

    // morphsynth::OutputSink
    bool submit(const morphsynth::WaveformBuffer& buffer,
                CompletionCallback onFinished) override;

    // juce::AudioIODeviceCallback
    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
    void audioDeviceIOCallbackWithContext(
        const float* const* inputChannelData,
        int numInputChannels,
        float* const* outputChannelData,
        int numOutputChannels,
        int numSamples,
        const juce::AudioIODeviceCallbackContext& context) override;

private:
    // juce::Thread: releases finished notes and runs their callbacks.
    void run() override;

    juce::AudioDeviceManager deviceManager_;

    std::atomic<double> deviceSampleRate_{44100.0};

    NotePlayer player_;

    bool initialised_{false};
    bool isShutdown_{false};
};
