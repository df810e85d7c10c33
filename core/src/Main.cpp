#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <argparse/argparse.hpp>
#include <juce_events/juce_events.h>

#include "AudioEngine.h"
#include "MidiInputSource.h"
#include "WavFileSink.h"
#include "core/ControlLoop.h"

namespace {

std::atomic<bool> g_stopRequested{false};

void handleStopSignal(int signalNumber)
{
    juce::ignoreUnused(signalNumber);
    g_stopRequested.store(true);
}

}  // namespace

int main(int argc, char** argv)
{
    argparse::ArgumentParser program("morphsynth", "0.1.0",
                                     argparse::default_arguments::all, true);
    program.add_description(
        "morphsynth: real-time morphing synthesizer driven by a MIDI "
        "controller.");
    program.add_argument("-d", "--midi-device")
        .help("MIDI input device index (default: 0).")
        .scan<'i', int>()
        .default_value(0);
    program.add_argument("-r", "--sample-rate")
        .help("Render sample rate in Hz.")
        .scan<'g', double>()
        .default_value(44100.0);
    program.add_argument("-t", "--audio-device-type")
        .help("Audio backend name, e.g. ALSA or JACK (default: system "
              "default).")
        .default_value(std::string{});
    program.add_argument("-o", "--render-dir")
        .help("Write each note to a WAV file in this directory instead of "
              "playing it.")
        .default_value(std::string{});
    program.add_argument("-p", "--poll-interval-ms")
        .help("Sleep between polls when no MIDI event is pending.")
        .scan<'i', int>()
        .default_value(1);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    const int midiDevice = program.get<int>("--midi-device");
    const double sampleRate = program.get<double>("--sample-rate");
    const auto audioDeviceType = program.get<std::string>("--audio-device-type");
    const auto renderDir = program.get<std::string>("--render-dir");
    const int pollIntervalMs = program.get<int>("--poll-interval-ms");

    if (!(sampleRate > 0.0)) {
        std::cerr << "[morphsynth] Invalid --sample-rate '" << sampleRate
                  << "' (must be > 0)." << std::endl;
        return 1;
    }
    if (pollIntervalMs < 0) {
        std::cerr << "[morphsynth] Invalid --poll-interval-ms '"
                  << pollIntervalMs << "' (must be >= 0)." << std::endl;
        return 1;
    }

    const juce::ScopedJuceInitialiser_GUI juceInitialiser;

    MidiInputSource midiInput;
    {
        std::string error;
        if (!midiInput.open(midiDevice, &error)) {
            std::cerr << "[morphsynth] Failed to open MIDI device "
                      << midiDevice << ": " << error << std::endl;
            return 1;
        }
    }

    std::unique_ptr<AudioEngine> audioEngine;
    std::unique_ptr<WavFileSink> wavSink;
    morphsynth::OutputSink* sink = nullptr;

    if (!renderDir.empty()) {
        wavSink = std::make_unique<WavFileSink>(
            juce::File::getCurrentWorkingDirectory().getChildFile(
                juce::String(renderDir)));
        std::string error;
        if (!wavSink->prepare(&error)) {
            std::cerr << "[morphsynth] " << error << std::endl;
            return 1;
        }
        std::cout << "[morphsynth] Rendering notes to "
                  << wavSink->directory().getFullPathName() << std::endl;
        sink = wavSink.get();
    } else {
        audioEngine = std::make_unique<AudioEngine>();
        std::string error;
        if (!audioEngine->initialise(sampleRate, audioDeviceType, &error)) {
            std::cerr << "[morphsynth] Failed to open audio output: " << error
                      << std::endl;
            return 1;
        }
        sink = audioEngine.get();
    }

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    std::cout << "[morphsynth] Ready on MIDI input '" << midiInput.deviceName()
              << "'. Press Ctrl+C to quit." << std::endl;

    {
        morphsynth::ControlLoopSettings settings;
        settings.sampleRate = sampleRate;
        settings.idleSleep = std::chrono::milliseconds(pollIntervalMs);

        morphsynth::ControlLoop loop(midiInput, *sink, settings);
        loop.run(g_stopRequested);

        // Stop MIDI delivery, then the output, while the loop's voice
        // can still take a late completion callback.
        midiInput.close();
        if (audioEngine != nullptr) {
            audioEngine->shutdown();
        }

        std::cout << "[morphsynth] Notes played: "
                  << loop.voice().notesSubmitted()
                  << ", render failures: " << loop.renderFailures()
                  << ", playback timeouts: " << loop.playbackTimeouts()
                  << std::endl;
    }

    std::cout << "[morphsynth] Bye." << std::endl;
    return 0;
}
