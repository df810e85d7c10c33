#include "WavFileSink.h"

#include <memory>
#include <utility>

namespace {

constexpr int kBitsPerSample = 32;

}  // namespace

WavFileSink::WavFileSink(juce::File directory)
    : directory_(std::move(directory))
{
}

bool WavFileSink::prepare(std::string* const error_message)
{
    if (directory_.isDirectory()) {
        return true;
    }

    const juce::Result result = directory_.createDirectory();
    if (result.failed()) {
        if (error_message != nullptr) {
            *error_message = "Cannot create render directory '" +
                             directory_.getFullPathName().toStdString() +
                             "': " + result.getErrorMessage().toStdString();
        }
        return false;
    }
    return true;
}

juce::File WavFileSink::nextFile() const
{
    return directory_.getChildFile("note-" + juce::String(nextSequence_) +
                                   ".wav");
}

bool WavFileSink::submit(const morphsynth::WaveformBuffer& buffer,
                         CompletionCallback onFinished)
{
    const juce::File file = nextFile();

    std::string error;
    if (!writeFile(file, buffer, &error)) {
        juce::Logger::writeToLog("[morphsynth] WAV write failed: " +
                                 juce::String(error));
        return false;
    }

    ++nextSequence_;
    juce::Logger::writeToLog("[morphsynth] Wrote " + file.getFileName() +
                             " (" + juce::String(buffer.size()) +
                             " samples)");

    if (onFinished) {
        onFinished();
    }
    return true;
}

bool WavFileSink::writeFile(const juce::File& file,
                            const morphsynth::WaveformBuffer& buffer,
                            std::string* const error_message)
{
    if (buffer.sampleRate <= 0.0) {
        if (error_message != nullptr) {
            *error_message = "Invalid sample rate";
        }
        return false;
    }

    // Overwrite leftovers from an earlier session.
    file.deleteFile();

    auto stream = std::make_unique<juce::FileOutputStream>(file);
    if (!stream->openedOk()) {
        if (error_message != nullptr) {
            *error_message = "Cannot open '" +
                             file.getFullPathName().toStdString() + "'";
        }
        return false;
    }

    std::unique_ptr<juce::AudioFormatWriter> writer(wavFormat_.createWriterFor(
        stream.get(), buffer.sampleRate, /*numChannels*/ 1, kBitsPerSample,
        {}, 0));
    if (writer == nullptr) {
        if (error_message != nullptr) {
            *error_message = "Unsupported WAV format";
        }
        return false;
    }
    // The writer owns the stream from here on.
    stream.release();

    const float* channels[] = {buffer.samples.data()};
    if (!buffer.empty() &&
        !writer->writeFromFloatArrays(channels, 1, buffer.size())) {
        if (error_message != nullptr) {
            *error_message = "Write error";
        }
        return false;
    }

    if (!writer->flush()) {
        if (error_message != nullptr) {
            *error_message = "Flush error";
        }
        return false;
    }
    return true;
}
