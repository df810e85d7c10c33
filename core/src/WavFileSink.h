#pragma once

#include <cstdint>
#include <string>

#include <juce_audio_formats/juce_audio_formats.h>

#include "core/SynthIo.h"

// Headless output: every submitted note is written to
// `<directory>/note-<sequence>.wav` as 32-bit float mono and reported
// finished as soon as the file is closed.
class WavFileSink : public morphsynth::OutputSink {
public:
    explicit WavFileSink(juce::File directory);

    // Creates the output directory if needed.
    bool prepare(std::string* error_message = nullptr);

    bool submit(const morphsynth::WaveformBuffer& buffer,
                CompletionCallback onFinished) override;

    [[nodiscard]] const juce::File& directory() const noexcept
    {
        return directory_;
    }

    // File that the next accepted note will be written to.
    [[nodiscard]] juce::File nextFile() const;

    [[nodiscard]] std::uint64_t filesWritten() const noexcept
    {
        return nextSequence_ - 1;
    }

private:
    bool writeFile(const juce::File& file,
                   const morphsynth::WaveformBuffer& buffer,
                   std::string* error_message);

    juce::File directory_;
    juce::WavAudioFormat wavFormat_;
    std::uint64_t nextSequence_{1};
};
