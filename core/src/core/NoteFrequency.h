#pragma once

namespace morphsynth {

inline constexpr int kReferenceNote = 69;           // A4
inline constexpr double kReferenceFrequencyHz = 440.0;

// Equal-tempered frequency for a MIDI note number:
// 440 * 2^((note - 69) / 12). Not range-checked.
[[nodiscard]] double NoteToFrequency(int note) noexcept;

}  // namespace morphsynth
