#include "NotePlayer.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

namespace {

// Extra silent input samples handed to the interpolator so it never
// reads past the end of a note.
constexpr int kResamplerPadding = 8;

}  // namespace

std::vector<float> ResampleForDevice(const morphsynth::WaveformBuffer& buffer,
                                     const double deviceSampleRate)
{
    if (buffer.empty() || buffer.sampleRate <= 0.0 ||
        deviceSampleRate <= 0.0 ||
        std::abs(buffer.sampleRate - deviceSampleRate) < 1.0e-3) {
        return buffer.samples;
    }

    const double speedRatio = buffer.sampleRate / deviceSampleRate;
    const int numOutput = static_cast<int>(std::floor(
        static_cast<double>(buffer.size()) * deviceSampleRate /
        buffer.sampleRate));

    std::vector<float> output(static_cast<std::size_t>(std::max(numOutput, 0)),
                              0.0F);
    if (output.empty()) {
        return output;
    }

    std::vector<float> padded(buffer.samples);
    padded.resize(padded.size() + kResamplerPadding, 0.0F);

    juce::LagrangeInterpolator interpolator;
    (void)interpolator.process(speedRatio, padded.data(), output.data(),
                               numOutput);
    return output;
}

NotePlayer::~NotePlayer()
{
    // A note left in the slot still owes its completion callback.
    setDeviceRunning(false);
    collectFinished();
}

void NotePlayer::setDeviceRunning(const bool running)
{
    bool finishedPending = false;
    {
        const juce::SpinLock::ScopedLockType lock(lock_);
        deviceRunning_ = running;
        if (!running && playback_ != nullptr && !playback_->finished) {
            playback_->finished = true;
            finishedPending = true;
        }
    }
    if (finishedPending) {
        signalCompletion();
    }
}

bool NotePlayer::isDeviceRunning() const
{
    const juce::SpinLock::ScopedLockType lock(lock_);
    return deviceRunning_;
}

bool NotePlayer::hasPendingNote() const
{
    const juce::SpinLock::ScopedLockType lock(lock_);
    return playback_ != nullptr;
}

bool NotePlayer::start(std::vector<float> samples,
                       CompletionCallback onFinished)
{
    // A note finished since the last collect still occupies the slot.
    collectFinished();

    auto playback = std::make_unique<Playback>();
    playback->samples = std::move(samples);

    {
        const juce::SpinLock::ScopedLockType lock(lock_);
        if (!deviceRunning_ || playback_ != nullptr) {
            return false;
        }
        if (!playback->samples.empty()) {
            playback->onFinished = std::move(onFinished);
            playback_ = std::move(playback);
            return true;
        }
    }

    // Nothing to play: complete straight away.
    if (onFinished) {
        onFinished();
    }
    return true;
}

void NotePlayer::render(float* const* outputChannelData,
                        const int numOutputChannels,
                        const int numSamples) noexcept
{
    for (int channel = 0; channel < numOutputChannels; ++channel) {
        if (auto* out = outputChannelData[channel]) {
            std::fill(out, out + numSamples, 0.0F);
        }
    }

    bool justFinished = false;
    {
        const juce::SpinLock::ScopedTryLockType lock(lock_);
        if (!lock.isLocked() || playback_ == nullptr || playback_->finished) {
            return;
        }

        auto& playback = *playback_;
        const int total = static_cast<int>(playback.samples.size());
        const int count = std::min(total - playback.position, numSamples);
        const float* src = playback.samples.data() + playback.position;

        for (int channel = 0; channel < numOutputChannels; ++channel) {
            if (auto* out = outputChannelData[channel]) {
                for (int i = 0; i < count; ++i) {
                    out[i] = juce::jlimit(-1.0F, 1.0F, src[i]);
                }
            }
        }

        playback.position += count;
        if (playback.position >= total) {
            playback.finished = true;
            justFinished = true;
        }
    }

    if (justFinished) {
        signalCompletion();
    }
}

bool NotePlayer::collectFinished()
{
    std::unique_ptr<Playback> done;
    {
        const juce::SpinLock::ScopedLockType lock(lock_);
        if (playback_ == nullptr || !playback_->finished) {
            return false;
        }
        done = std::move(playback_);
    }

    if (done->onFinished) {
        done->onFinished();
    }
    return true;
}

void NotePlayer::waitForCompletion(const std::uint32_t seen) const noexcept
{
    completions_.wait(seen, std::memory_order_acquire);
}

void NotePlayer::wakeWaiters() noexcept
{
    signalCompletion();
}

void NotePlayer::signalCompletion() noexcept
{
    completions_.fetch_add(1, std::memory_order_acq_rel);
    completions_.notify_all();
}
