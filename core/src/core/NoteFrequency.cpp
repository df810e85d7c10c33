#include "core/NoteFrequency.h"

#include <cmath>

namespace morphsynth {

double NoteToFrequency(const int note) noexcept
{
  const double semitones = static_cast<double>(note - kReferenceNote);
  return kReferenceFrequencyHz * std::pow(2.0, semitones / 12.0);
}

}  // namespace morphsynth
