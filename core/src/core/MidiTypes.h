#pragma once

#include <cstdint>
#include <optional>
#include <variant>

namespace morphsynth {

// Raw event as delivered by a message source, before decoding. The
// layout mirrors the 4-byte packets produced by common MIDI input
// drivers: status byte, up to three data bytes and a timestamp in
// milliseconds relative to the source's own clock.
struct RawMidiEvent {
  int status{0};
  int data1{0};
  int data2{0};
  int data3{0};
  double timestampMs{0.0};
};

// Status nibbles (channel bits masked off).
inline constexpr int kStatusNoteOff = 0x80;        // 128
inline constexpr int kStatusNoteOn = 0x90;         // 144
inline constexpr int kStatusControlChange = 0xB0;  // 176

struct NoteOn {
  int note{0};      // [0, 127]
  int velocity{0};  // [1, 127]; velocity 0 decodes as NoteOff.
};

struct NoteOff {
  int note{0};
};

struct ControlChange {
  int controller{0};
  int value{0};
};

// Decoded controller message. Immutable once built and consumed
// exactly once by the control loop.
struct ControlMessage {
  std::variant<NoteOn, NoteOff, ControlChange> payload;
  double timestampMs{0.0};
};

// Decodes a raw event. Returns std::nullopt for status bytes that the
// synthesizer does not handle (aftertouch, pitch bend, system
// messages, ...). Data bytes are masked to 7 bits.
[[nodiscard]] std::optional<ControlMessage> DecodeMidiEvent(
    const RawMidiEvent& event) noexcept;

}  // namespace morphsynth
