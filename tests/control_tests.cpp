#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <juce_audio_formats/juce_audio_formats.h>

#include "MidiInputSource.h"
#include "NotePlayer.h"
#include "WavFileSink.h"
#include "core/ControlLoop.h"
#include "core/MidiTypes.h"
#include "core/RenderPipeline.h"
#include "core/SynthIo.h"
#include "core/SynthParameters.h"

// Tests for MIDI decoding, controller mapping, the voice state machine
// and the control loop, driven by in-memory sources and sinks.
// They run as a normal binary and are integrated with CTest.

using morphsynth::ControlChange;
using morphsynth::ControlLoop;
using morphsynth::ControllerMap;
using morphsynth::ControllerTarget;
using morphsynth::DecodeMidiEvent;
using morphsynth::MessageSource;
using morphsynth::NoteOff;
using morphsynth::NoteOn;
using morphsynth::OutputSink;
using morphsynth::RawMidiEvent;
using morphsynth::RenderError;
using morphsynth::RenderErrorCode;
using morphsynth::RenderNote;
using morphsynth::SynthParameters;
using morphsynth::Voice;
using morphsynth::VoiceState;
using morphsynth::WaveformBuffer;

namespace {

constexpr double kSampleRate = 44100.0;

RawMidiEvent noteOnEvent(const int note, const int velocity)
{
    return RawMidiEvent{0x90, note, velocity, 0, 0.0};
}

RawMidiEvent noteOffEvent(const int note)
{
    return RawMidiEvent{0x80, note, 0, 0, 0.0};
}

RawMidiEvent controlEvent(const int controller, const int value)
{
    return RawMidiEvent{0xB0, controller, value, 0, 0.0};
}

// Scripted event queue.
class FakeMessageSource : public MessageSource {
public:
    void push(const RawMidiEvent& event) { events_.push_back(event); }

    std::vector<RawMidiEvent> poll(const int maxEvents) override
    {
        ++polls;
        std::vector<RawMidiEvent> batch;
        while (!events_.empty() &&
               static_cast<int>(batch.size()) < maxEvents) {
            batch.push_back(events_.front());
            events_.pop_front();
        }
        return batch;
    }

    [[nodiscard]] std::size_t pending() const { return events_.size(); }

    int polls{0};

private:
    std::deque<RawMidiEvent> events_;
};

// Keeps every submitted buffer and finishes playback immediately.
class RecordingSink : public OutputSink {
public:
    bool submit(const WaveformBuffer& buffer,
                CompletionCallback onFinished) override
    {
        buffers.push_back(buffer);
        if (onFinished) {
            onFinished();
        }
        return true;
    }

    std::vector<WaveformBuffer> buffers;
};

// Accepts buffers but only finishes when the test says so.
class DeferredSink : public OutputSink {
public:
    bool submit(const WaveformBuffer& buffer,
                CompletionCallback onFinished) override
    {
        buffers.push_back(buffer);
        pending = std::move(onFinished);
        return true;
    }

    void finish()
    {
        auto callback = std::move(pending);
        pending = nullptr;
        if (callback) {
            callback();
        }
    }

    std::vector<WaveformBuffer> buffers;
    CompletionCallback pending;
};

class RejectingSink : public OutputSink {
public:
    bool submit(const WaveformBuffer& buffer,
                CompletionCallback onFinished) override
    {
        juce::ignoreUnused(buffer, onFinished);
        ++attempts;
        return false;
    }

    int attempts{0};
};

bool allFinite(const WaveformBuffer& buffer)
{
    for (const float s : buffer.samples) {
        if (!std::isfinite(s)) {
            return false;
        }
    }
    return true;
}

}  // namespace

int main()
{
    // Status decoding ignores the channel nibble.
    {
        const auto on = DecodeMidiEvent(RawMidiEvent{0x93, 60, 100, 0, 12.5});
        assert(on.has_value());
        assert(std::holds_alternative<NoteOn>(on->payload));
        assert(std::get<NoteOn>(on->payload).note == 60);
        assert(std::get<NoteOn>(on->payload).velocity == 100);
        assert(on->timestampMs == 12.5);

        const auto off = DecodeMidiEvent(noteOffEvent(61));
        assert(off.has_value());
        assert(std::holds_alternative<NoteOff>(off->payload));
        assert(std::get<NoteOff>(off->payload).note == 61);

        const auto cc = DecodeMidiEvent(RawMidiEvent{0xBF, 22, 64, 0, 0.0});
        assert(cc.has_value());
        assert(std::holds_alternative<ControlChange>(cc->payload));
        assert(std::get<ControlChange>(cc->payload).controller == 22);
        assert(std::get<ControlChange>(cc->payload).value == 64);
    }

    // NoteOn with velocity 0 is a NoteOff.
    {
        const auto msg = DecodeMidiEvent(noteOnEvent(64, 0));
        assert(msg.has_value());
        assert(std::holds_alternative<NoteOff>(msg->payload));
        assert(std::get<NoteOff>(msg->payload).note == 64);
    }

    // Unhandled statuses decode to nothing; data bytes keep 7 bits.
    {
        assert(!DecodeMidiEvent(RawMidiEvent{0xE0, 0, 64, 0, 0.0}).has_value());
        assert(!DecodeMidiEvent(RawMidiEvent{0xA0, 60, 10, 0, 0.0}).has_value());
        assert(!DecodeMidiEvent(RawMidiEvent{0xF8, 0, 0, 0, 0.0}).has_value());
        assert(!DecodeMidiEvent(RawMidiEvent{0x00, 0, 0, 0, 0.0}).has_value());

        const auto masked = DecodeMidiEvent(RawMidiEvent{0x90, 0xC8, 0x85, 0, 0.0});
        assert(masked.has_value());
        assert(std::get<NoteOn>(masked->payload).note == 0x48);
        assert(std::get<NoteOn>(masked->payload).velocity == 0x05);
    }

    // Controller table.
    {
        const ControllerMap map;
        assert(map.lookup(14).target == ControllerTarget::kEnvelopeAttack);
        assert(map.lookup(17).target == ControllerTarget::kEnvelopeRelease);
        assert(map.lookup(20).target == ControllerTarget::kOscillatorWeight);
        assert(map.lookup(20).slot == 2);
        assert(map.lookup(22).target == ControllerTarget::kFilterCutoff);
        assert(map.lookup(23).target == ControllerTarget::kFilterResonance);
        assert(map.lookup(29).target == ControllerTarget::kOscillatorDetune);
        assert(map.lookup(29).slot == 3);
        assert(map.lookup(24).target == ControllerTarget::kNone);
        assert(map.lookup(13).target == ControllerTarget::kNone);
        assert(map.lookup(-1).target == ControllerTarget::kNone);
        assert(map.lookup(500).target == ControllerTarget::kNone);
    }

    // Controller scaling.
    {
        const ControllerMap map;
        SynthParameters params;

        assert(map.apply(14, 0, kSampleRate, params));
        assert(params.envelope.attack == 0.0);
        assert(map.apply(14, 127, kSampleRate, params));
        assert(params.envelope.attack == 1.0);
        assert(map.apply(16, 127, kSampleRate, params));
        assert(params.envelope.sustain == 1.0);

        assert(map.apply(19, 127, kSampleRate, params));
        assert(params.weights[1] == 1.0);
        assert(params.weights[0] == 0.25);

        assert(map.apply(22, 127, kSampleRate, params));
        assert(params.filterCutoffHz == 22050.0);
        assert(map.apply(22, 0, kSampleRate, params));
        assert(params.filterCutoffHz == morphsynth::kMinFilterCutoffHz);

        assert(map.apply(23, 0, kSampleRate, params));
        assert(params.filterResonance == 0.0);

        assert(map.apply(26, 0, kSampleRate, params));
        assert(params.detuneHz[0] == -1.0);
        assert(map.apply(28, 127, kSampleRate, params));
        assert(params.detuneHz[2] == 1.0);

        // Out-of-range values are clamped before scaling.
        assert(map.apply(15, 300, kSampleRate, params));
        assert(params.envelope.decay == 1.0);

        // Unmapped controllers leave the record alone.
        const SynthParameters before = params;
        assert(!map.apply(7, 100, kSampleRate, params));
        assert(params.filterCutoffHz == before.filterCutoffHz);
        assert(params.weights == before.weights);
    }

    // Voice state machine with a sink that finishes on demand.
    {
        DeferredSink sink;
        Voice voice(sink, kSampleRate);
        assert(voice.state() == VoiceState::kIdle);

        assert(voice.noteOn(69, SynthParameters{}));
        assert(voice.state() == VoiceState::kPlaying);
        assert(sink.buffers.size() == 1U);

        // A second note is refused while the first is playing.
        RenderError busy;
        assert(!voice.noteOn(70, SynthParameters{}, &busy));
        assert(busy.code == RenderErrorCode::kVoiceBusy);
        assert(sink.buffers.size() == 1U);

        sink.finish();
        assert(voice.state() == VoiceState::kDone);
        voice.waitUntilFinished();

        // Done accepts the next note.
        assert(voice.noteOn(70, SynthParameters{}));
        assert(voice.notesSubmitted() == 2U);
        sink.finish();
        assert(voice.state() == VoiceState::kDone);
    }

    // A sink that refuses the buffer sends the voice back to Idle.
    {
        RejectingSink sink;
        Voice voice(sink, kSampleRate);
        RenderError error;
        assert(!voice.noteOn(69, SynthParameters{}, &error));
        assert(error.code == RenderErrorCode::kOutputRejected);
        assert(voice.state() == VoiceState::kIdle);
        assert(sink.attempts == 1);
        assert(voice.notesSubmitted() == 0U);
        voice.waitUntilFinished();
    }

    // A note the sink never completes: the timed wait gives up, the
    // voice is freed, and a late completion cannot touch the next note.
    {
        DeferredSink sink;
        Voice voice(sink, kSampleRate);
        assert(voice.noteOn(69, SynthParameters{}));
        assert(!voice.waitUntilFinished(std::chrono::milliseconds(10)));
        assert(voice.state() == VoiceState::kPlaying);

        voice.abandonPlayback();
        assert(voice.state() == VoiceState::kIdle);
        auto stale = std::move(sink.pending);
        sink.pending = nullptr;

        assert(voice.noteOn(72, SynthParameters{}));
        assert(voice.state() == VoiceState::kPlaying);
        stale();
        assert(voice.state() == VoiceState::kPlaying);

        sink.finish();
        assert(voice.waitUntilFinished(std::chrono::milliseconds(10)));
        assert(voice.state() == VoiceState::kDone);

        // Abandoning a finished note changes nothing.
        voice.abandonPlayback();
        assert(voice.state() == VoiceState::kDone);
    }

    // Invalid parameters never reach the sink.
    {
        RecordingSink sink;
        Voice voice(sink, kSampleRate);
        SynthParameters params;
        params.weights = {0.0, 0.0, 0.0, 0.0};
        RenderError error;
        assert(!voice.noteOn(69, params, &error));
        assert(error.code == RenderErrorCode::kInvalidParameter);
        assert(voice.state() == VoiceState::kIdle);
        assert(sink.buffers.empty());
    }

    // The voice renders from its snapshot, not from later edits.
    {
        DeferredSink sink;
        Voice voice(sink, kSampleRate);

        SynthParameters params;
        params.filterCutoffHz = 500.0;
        assert(voice.noteOn(60, params));
        params.filterCutoffHz = 8000.0;
        params.weights = {0.0, 1.0, 0.0, 0.0};
        sink.finish();

        WaveformBuffer expected;
        SynthParameters atNoteOn;
        atNoteOn.filterCutoffHz = 500.0;
        assert(RenderNote(60, atNoteOn, kSampleRate,
                          morphsynth::kNoteDurationSeconds, expected));
        assert(sink.buffers.size() == 1U);
        assert(sink.buffers[0].samples == expected.samples);
    }

    // One NoteOn plays exactly one second of finite audio.
    {
        FakeMessageSource source;
        RecordingSink sink;
        ControlLoop loop(source, sink);

        source.push(noteOnEvent(69, 100));
        assert(loop.pollOnce() == 1);

        assert(sink.buffers.size() == 1U);
        assert(sink.buffers[0].size() == 44100);
        assert(sink.buffers[0].sampleRate == kSampleRate);
        assert(allFinite(sink.buffers[0]));
        assert(loop.voice().state() == VoiceState::kDone);
        assert(loop.voice().notesSubmitted() == 1U);
        assert(loop.renderFailures() == 0U);
    }

    // NoteOff and NoteOn with velocity 0 produce no audio.
    {
        FakeMessageSource source;
        RecordingSink sink;
        ControlLoop loop(source, sink);

        source.push(noteOffEvent(69));
        source.push(noteOnEvent(69, 0));
        assert(loop.pollOnce() == 2);
        assert(sink.buffers.empty());
        assert(loop.voice().state() == VoiceState::kIdle);
    }

    // At most ten events are handled per poll.
    {
        FakeMessageSource source;
        RecordingSink sink;
        ControlLoop loop(source, sink);

        for (int i = 0; i < 12; ++i) {
            source.push(controlEvent(23, i));
        }
        assert(loop.pollOnce() == ControlLoop::kMaxEventsPerPoll);
        assert(source.pending() == 2U);
        assert(loop.parameters().filterResonance == 9.0 / 127.0);
        assert(loop.pollOnce() == 2);
        assert(loop.parameters().filterResonance == 11.0 / 127.0);
        assert(loop.pollOnce() == 0);
    }

    // Events in one batch are handled in arrival order: the note uses
    // the cutoff set before it, not the one set after it.
    {
        FakeMessageSource source;
        RecordingSink sink;
        ControlLoop loop(source, sink);

        source.push(controlEvent(22, 0));
        source.push(noteOnEvent(69, 100));
        source.push(controlEvent(22, 127));
        assert(loop.pollOnce() == 3);

        SynthParameters atNote;
        atNote.filterCutoffHz = morphsynth::kMinFilterCutoffHz;
        WaveformBuffer expected;
        assert(RenderNote(69, atNote, kSampleRate,
                          morphsynth::kNoteDurationSeconds, expected));
        assert(sink.buffers.size() == 1U);
        assert(sink.buffers[0].samples == expected.samples);
        assert(loop.parameters().filterCutoffHz == 22050.0);
    }

    // Unmapped controllers are counted and otherwise ignored.
    {
        FakeMessageSource source;
        RecordingSink sink;
        ControlLoop loop(source, sink);

        const SynthParameters before = loop.parameters();
        source.push(controlEvent(1, 64));
        source.push(controlEvent(64, 127));
        source.push(RawMidiEvent{0xE0, 0, 64, 0, 0.0});
        assert(loop.pollOnce() == 3);
        assert(loop.ignoredControllers() == 2U);
        assert(loop.parameters().filterCutoffHz == before.filterCutoffHz);
        assert(loop.parameters().envelope.attack == before.envelope.attack);
        assert(sink.buffers.empty());
    }

    // All weights at zero: the note is dropped and the loop carries on.
    {
        FakeMessageSource source;
        RecordingSink sink;
        ControlLoop loop(source, sink);

        for (int cc = 18; cc <= 21; ++cc) {
            source.push(controlEvent(cc, 0));
        }
        source.push(noteOnEvent(69, 100));
        assert(loop.pollOnce() == 5);
        assert(sink.buffers.empty());
        assert(loop.renderFailures() == 1U);
        assert(loop.voice().state() == VoiceState::kIdle);

        // Restoring one weight makes the next note render.
        source.push(controlEvent(18, 127));
        source.push(noteOnEvent(69, 100));
        assert(loop.pollOnce() == 2);
        assert(sink.buffers.size() == 1U);
    }

    // run() returns once stop has been requested.
    {
        FakeMessageSource source;
        RecordingSink sink;
        morphsynth::ControlLoopSettings settings;
        settings.idleSleep = std::chrono::milliseconds(0);
        ControlLoop loop(source, sink, settings);

        const std::atomic<bool> stop{true};
        loop.run(stop);
        assert(source.polls == 0);
    }

    // A stuck output does not stall the loop: each note times out and
    // the events behind it are still handled.
    {
        FakeMessageSource source;
        DeferredSink sink;
        morphsynth::ControlLoopSettings settings;
        settings.playbackTimeout = std::chrono::milliseconds(10);
        ControlLoop loop(source, sink, settings);

        source.push(noteOnEvent(69, 100));
        source.push(controlEvent(74, 0));
        source.push(noteOnEvent(72, 100));
        assert(loop.pollOnce() == 3);

        assert(loop.playbackTimeouts() == 2U);
        assert(loop.renderFailures() == 0U);
        assert(sink.buffers.size() == 2U);
        assert(loop.voice().notesSubmitted() == 2U);
        assert(loop.voice().state() == VoiceState::kIdle);

        // The completion finally arriving is ignored.
        sink.finish();
        assert(loop.voice().state() == VoiceState::kIdle);
    }

    // Device playback slot: clamped output on every channel, completion
    // flagged after the last sample and delivered off the audio thread.
    {
        NotePlayer player;
        int finished = 0;
        const auto onFinished = [&finished] { ++finished; };

        // Nothing is accepted before the device starts.
        assert(!player.start({0.5F}, onFinished));
        assert(!player.hasPendingNote());

        player.setDeviceRunning(true);
        assert(player.start({0.25F, -2.0F, 3.0F, 0.5F, -0.5F}, onFinished));
        assert(player.hasPendingNote());

        // A second note is refused while the first is playing.
        assert(!player.start({0.1F}, onFinished));

        std::vector<float> left(3, 9.0F);
        std::vector<float> right(3, 9.0F);
        float* channels[] = {left.data(), right.data()};
        const std::uint32_t before = player.completionCount();

        player.render(channels, 2, 3);
        assert(left == (std::vector<float>{0.25F, -1.0F, 1.0F}));
        assert(right == left);
        assert(player.completionCount() == before);
        assert(!player.collectFinished());
        assert(finished == 0);

        player.render(channels, 2, 3);
        assert(left == (std::vector<float>{0.5F, -0.5F, 0.0F}));
        assert(right == left);
        assert(player.completionCount() == before + 1U);
        player.waitForCompletion(before);

        // render() only flags the note; the callback waits for collect.
        assert(finished == 0);
        assert(player.hasPendingNote());
        assert(player.collectFinished());
        assert(finished == 1);
        assert(!player.hasPendingNote());
        assert(!player.collectFinished());

        player.render(channels, 2, 3);
        assert(left == (std::vector<float>(3, 0.0F)));

        // An empty note completes at once.
        assert(player.start({}, onFinished));
        assert(finished == 2);

        // Stopping the device finishes a note mid-flight.
        assert(player.start({0.1F, 0.1F, 0.1F, 0.1F}, onFinished));
        player.render(channels, 2, 2);
        player.setDeviceRunning(false);
        assert(player.completionCount() == before + 2U);
        assert(player.collectFinished());
        assert(finished == 3);
        assert(!player.start({0.1F}, onFinished));
        assert(finished == 3);
    }

    // Notes rendered at another rate are stretched to the device rate.
    {
        WaveformBuffer buffer;
        buffer.sampleRate = 44100.0;
        buffer.samples.assign(44100, 0.25F);

        const auto resampled = ResampleForDevice(buffer, 48000.0);
        assert(resampled.size() == 48000U);
        assert(std::abs(resampled[24000] - 0.25F) < 1.0e-4F);

        const auto same = ResampleForDevice(buffer, 44100.0);
        assert(same == buffer.samples);

        assert(ResampleForDevice(WaveformBuffer{}, 48000.0).empty());
    }

    // MIDI input queue: arrival order and oldest-first dropping.
    {
        MidiInputSource input;
        assert(!input.isOpen());
        assert(input.poll(10).empty());

        for (int i = 0; i < 3; ++i) {
            input.push(noteOnEvent(60 + i, 100));
        }
        const auto first = input.poll(2);
        assert(first.size() == 2U);
        assert(first[0].data1 == 60);
        assert(first[1].data1 == 61);
        const auto rest = input.poll(10);
        assert(rest.size() == 1U);
        assert(rest[0].data1 == 62);

        const int total = static_cast<int>(MidiInputSource::kMaxQueuedEvents) + 5;
        for (int i = 0; i < total; ++i) {
            input.push(controlEvent(23, i % 128));
        }
        assert(input.droppedEvents() == 5U);
        const auto oldest = input.poll(1);
        assert(oldest.size() == 1U);
        assert(oldest[0].data2 == 5);

        input.close();
        input.close();
    }

    // WAV renderer: one float mono file per note, finished at once.
    {
        const juce::File dir =
            juce::File::getSpecialLocation(juce::File::tempDirectory)
                .getNonexistentChildFile("morphsynth-tests", "", false);

        WavFileSink sink(dir);
        std::string error;
        assert(sink.prepare(&error));
        assert(dir.isDirectory());

        FakeMessageSource source;
        ControlLoop loop(source, sink);
        source.push(noteOnEvent(69, 100));
        source.push(noteOnEvent(72, 100));
        assert(loop.pollOnce() == 2);

        assert(sink.filesWritten() == 2U);
        assert(loop.voice().state() == VoiceState::kDone);

        const juce::File firstFile = dir.getChildFile("note-1.wav");
        assert(firstFile.existsAsFile());
        assert(dir.getChildFile("note-2.wav").existsAsFile());
        assert(sink.nextFile().getFileName() == "note-3.wav");

        juce::AudioFormatManager formatManager;
        formatManager.registerBasicFormats();
        std::unique_ptr<juce::AudioFormatReader> reader(
            formatManager.createReaderFor(firstFile));
        assert(reader != nullptr);
        assert(reader->numChannels == 1U);
        assert(reader->sampleRate == kSampleRate);
        assert(reader->lengthInSamples == 44100);
        assert(reader->bitsPerSample == 32U);
        assert(reader->usesFloatingPointData);

        reader.reset();
        dir.deleteRecursively();
    }

    return 0;
}
