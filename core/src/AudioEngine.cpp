#include "AudioEngine.h"

#include <cmath>
#include <utility>

namespace {

constexpr int kPlaybackThreadStopTimeoutMs = 2000;

}  // namespace

AudioEngine::AudioEngine() : juce::Thread("morphsynth-playback") {}

AudioEngine::~AudioEngine()
{
    shutdown();
}

bool AudioEngine::initialise(const double preferredSampleRate,
                             const std::string& deviceType,
                             std::string* const error_message)
{
    if (error_message != nullptr) {
        *error_message = {};
    }

    auto fail = [error_message](const juce::String& text) {
        juce::Logger::writeToLog("[morphsynth] Failed to initialise audio: " +
                                 text);
        if (error_message != nullptr) {
            *error_message = text.toStdString();
        }
        return false;
    };

    if (isShutdown_) {
        return fail("engine already shut down");
    }

    juce::AudioDeviceManager::AudioDeviceSetup preferred;
    preferred.sampleRate = preferredSampleRate;

    juce::String audioError = deviceManager_.initialise(
        /*numInputChannels*/ 0, /*numOutputChannels*/ 2,
        /*savedState*/ nullptr, /*selectDefaultDeviceOnFailure*/ true,
        /*preferredDefaultDeviceName*/ {}, &preferred);
    if (audioError.isNotEmpty()) {
        return fail(audioError);
    }

    if (!deviceType.empty()) {
        const juce::String requestedType(deviceType);
        bool typeAvailable = false;
        for (auto* type : deviceManager_.getAvailableDeviceTypes()) {
            if (type != nullptr &&
                type->getTypeName().equalsIgnoreCase(requestedType)) {
                deviceManager_.setCurrentAudioDeviceType(type->getTypeName(),
                                                         true);
                typeAvailable = true;
                break;
            }
        }
        if (!typeAvailable) {
            return fail("audio device type '" + requestedType +
                        "' is not available");
        }

        auto setup = deviceManager_.getAudioDeviceSetup();
        setup.sampleRate = preferredSampleRate;
        audioError = deviceManager_.setAudioDeviceSetup(setup, true);
        if (audioError.isNotEmpty()) {
            return fail(audioError);
        }
    }

    auto* device = deviceManager_.getCurrentAudioDevice();
    if (device == nullptr) {
        return fail("no audio device open");
    }
    if (device->getActiveOutputChannels().countNumberOfSetBits() == 0) {
        return fail("no channels");
    }

    deviceSampleRate_.store(device->getCurrentSampleRate(),
                            std::memory_order_relaxed);
    if (!startThread()) {
        return fail("could not start playback thread");
    }
    deviceManager_.addAudioCallback(this);
    initialised_ = true;

    juce::Logger::writeToLog(
        "[morphsynth] Audio output '" + device->getName() + "' (" +
        device->getTypeName() + ") at " +
        juce::String(device->getCurrentSampleRate(), 0) + " Hz");

    if (std::abs(device->getCurrentSampleRate() - preferredSampleRate) > 1.0e-3) {
        juce::Logger::writeToLog(
            "[morphsynth] Device rate differs from render rate " +
            juce::String(preferredSampleRate, 0) +
            " Hz; notes will be resampled");
    }

    return true;
}

void AudioEngine::shutdown()
{
    if (isShutdown_) {
        return;
    }

    isShutdown_ = true;

    // Detach first so the audio thread no longer touches the player.
    deviceManager_.removeAudioCallback(this);
    player_.setDeviceRunning(false);

    signalThreadShouldExit();
    player_.wakeWaiters();
    if (!stopThread(kPlaybackThreadStopTimeoutMs)) {
        juce::Logger::writeToLog(
            "[morphsynth] Playback thread did not stop in time");
    }

    // Anything finished after the thread left still owes its callback.
    player_.collectFinished();

    if (initialised_) {
        deviceManager_.closeAudioDevice();
        juce::Logger::writeToLog("[morphsynth] Audio output closed");
    }
}

bool AudioEngine::submit(const morphsynth::WaveformBuffer& buffer,
                         CompletionCallback onFinished)
{
    if (!initialised_ || isShutdown_) {
        return false;
    }

    if (player_.start(ResampleForDevice(buffer, deviceSampleRate()),
                      std::move(onFinished))) {
        return true;
    }

    juce::Logger::writeToLog(
        player_.isDeviceRunning()
            ? "[morphsynth] Output busy; rejecting overlapping note"
            : "[morphsynth] Audio device stopped; rejecting note");
    return false;
}

void AudioEngine::run()
{
    while (!threadShouldExit()) {
        const auto seen = player_.completionCount();
        player_.collectFinished();
        if (threadShouldExit()) {
            break;
        }
        player_.waitForCompletion(seen);
    }
}

void AudioEngine::audioDeviceAboutToStart(juce::AudioIODevice* device)
{
    const double sr =
        (device != nullptr) ? device->getCurrentSampleRate() : 44100.0;
    deviceSampleRate_.store(sr > 0.0 ? sr : 44100.0,
                            std::memory_order_relaxed);
    player_.setDeviceRunning(true);
}

void AudioEngine::audioDeviceStopped()
{
    // A stopped device will not drain the pending note; the player
    // finishes it so the playback thread releases the waiting loop.
    player_.setDeviceRunning(false);
}

void AudioEngine::audioDeviceIOCallbackWithContext(
    const float* const* inputChannelData,
    const int numInputChannels,
    float* const* outputChannelData,
    const int numOutputChannels,
    const int numSamples,
    const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused(inputChannelData, numInputChannels, context);
    player_.render(outputChannelData, numOutputChannels, numSamples);
}
