#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_core/juce_core.h>

#include "core/SynthIo.h"
#include "core/WaveformBuffer.h"

// Converts `buffer` to `deviceSampleRate` with a Lagrange interpolator.
// Buffers already at the device rate are returned unchanged. The result
// holds floor(size * deviceRate / bufferRate) samples.
[[nodiscard]] std::vector<float> ResampleForDevice(
    const morphsynth::WaveformBuffer& buffer, double deviceSampleRate);

// Single-slot note playback shared between a submitting thread and the
// real-time audio callback.
//
//   - start() parks a note in the slot (submitting thread).
//   - render() copies it out block by block, clamped to [-1, 1], and
//     marks the slot finished after the last sample (audio thread).
//   - collectFinished() releases a finished slot and runs its
//     completion callback (any non-real-time thread).
//
// render() never frees memory or runs a callback; it only flips a
// flag and bumps an atomic counter that waitForCompletion() sleeps on.
// A slot is also finished when the device stops, so a waiter is never
// left behind a device that will not drain it.
class NotePlayer {
public:
    using CompletionCallback = morphsynth::OutputSink::CompletionCallback;

    NotePlayer() = default;
    ~NotePlayer();

    NotePlayer(const NotePlayer&) = delete;
    NotePlayer& operator=(const NotePlayer&) = delete;

    // Marks the device as running or stopped. Stopping finishes any
    // pending note. Notes are only accepted while the device runs.
    void setDeviceRunning(bool running);

    [[nodiscard]] bool isDeviceRunning() const;

    // Accepts `samples` for playback. Returns false when the device is
    // stopped or a note still occupies the slot; `onFinished` is then
    // dropped without being called. An empty note completes at once.
    bool start(std::vector<float> samples, CompletionCallback onFinished);

    // Audio-thread entry point. Writes the next `numSamples` of the
    // pending note to every channel and silence everywhere else.
    void render(float* const* outputChannelData,
                int numOutputChannels,
                int numSamples) noexcept;

    // Releases a finished note and runs its callback on the calling
    // thread. Returns true when a callback was run.
    bool collectFinished();

    // Number of notes finished by render() or by a device stop so far.
    [[nodiscard]] std::uint32_t completionCount() const noexcept
    {
        return completions_.load(std::memory_order_acquire);
    }

    // Blocks while completionCount() == `seen`.
    void waitForCompletion(std::uint32_t seen) const noexcept;

    // Wakes every waitForCompletion() caller without finishing a note.
    void wakeWaiters() noexcept;

    [[nodiscard]] bool hasPendingNote() const;

private:
    struct Playback {
        std::vector<float> samples;
        int position{0};
        bool finished{false};
        CompletionCallback onFinished;
    };

    void signalCompletion() noexcept;

    // Guards `playback_` and `deviceRunning_`. render() only try-locks
    // so it never blocks behind start().
    mutable juce::SpinLock lock_;
    std::unique_ptr<Playback> playback_;
    bool deviceRunning_{false};

    std::atomic<std::uint32_t> completions_{0};
};
