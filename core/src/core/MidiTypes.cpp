#include "core/MidiTypes.h"

namespace morphsynth {

std::optional<ControlMessage> DecodeMidiEvent(const RawMidiEvent& event) noexcept
{
  const int kind = event.status & 0xF0;
  const int data1 = event.data1 & 0x7F;
  const int data2 = event.data2 & 0x7F;

  ControlMessage message;
  message.timestampMs = event.timestampMs;

  switch (kind) {
  case kStatusNoteOn:
    if (data2 > 0) {
      message.payload = NoteOn{data1, data2};
    } else {
      message.payload = NoteOff{data1};
    }
    return message;
  case kStatusNoteOff:
    message.payload = NoteOff{data1};
    return message;
  case kStatusControlChange:
    message.payload = ControlChange{data1, data2};
    return message;
  default:
    return std::nullopt;
  }
}

}  // namespace morphsynth
