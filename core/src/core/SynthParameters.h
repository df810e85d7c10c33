#pragma once

#include <array>

#include "core/Envelope.h"
#include "core/Oscillators.h"

namespace morphsynth {

inline constexpr double kMinFilterCutoffHz = 20.0;

// Live synthesis parameters. One instance is owned by the control loop
// and mutated field by field as controller messages arrive; every
// render receives its own copy so later mutations never reach a note
// that is already rendering or playing.
struct SynthParameters {
  // Raw oscillator weights in slot order (sine, saw, triangle,
  // pulse). Normalised by their sum at render time.
  OscillatorWeights weights{0.25, 0.25, 0.25, 0.25};

  EnvelopeSettings envelope{};

  double filterCutoffHz{1000.0};

  // Stored and controllable but not part of the filter design.
  double filterResonance{0.7};

  // Per-oscillator offset in Hz, in [-1, 1].
  OscillatorDetune detuneHz{0.0, 0.0, 0.0, 0.0};
};

// What a controller number does to the parameter record.
enum class ControllerTarget {
  kNone = 0,
  kEnvelopeAttack,
  kEnvelopeDecay,
  kEnvelopeSustain,
  kEnvelopeRelease,
  kOscillatorWeight,
  kFilterCutoff,
  kFilterResonance,
  kOscillatorDetune,
};

struct ControllerAction {
  ControllerTarget target{ControllerTarget::kNone};
  int slot{0};  // Oscillator slot for weight / detune targets.
};

// Fixed controller assignment:
//   14-17  envelope attack / decay / sustain / release = v/127
//   18-21  oscillator weight 0..3                     = v/127
//   22     filter cutoff  = clamp(v/127 * sr/2, 20, sr/2)
//   23     filter resonance                           = v/127
//   26-29  oscillator detune 0..3 (Hz)                = (v/127 - 0.5) * 2
// Every other controller number maps to ControllerTarget::kNone.
class ControllerMap {
 public:
  static constexpr int kNumControllers = 128;

  ControllerMap();

  // Returns the action bound to `controller`; numbers outside
  // [0, 127] resolve to a kNone action.
  [[nodiscard]] const ControllerAction& lookup(int controller) const noexcept;

  // Applies a ControlChange to `params`. `value` is clamped to
  // [0, 127] before scaling. Returns false (and leaves `params`
  // untouched) when the controller is not mapped.
  bool apply(int controller,
             int value,
             double sampleRate,
             SynthParameters& params) const noexcept;

 private:
  void bind(int controller, ControllerTarget target, int slot = 0) noexcept;

  std::array<ControllerAction, kNumControllers> actions_{};
};

}  // namespace morphsynth
