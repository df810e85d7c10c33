#include "core/SynthParameters.h"

#include <algorithm>
#include <cstddef>

namespace morphsynth {

namespace {

constexpr int kControllerAttack = 14;
constexpr int kControllerWeightBase = 18;
constexpr int kControllerCutoff = 22;
constexpr int kControllerResonance = 23;
constexpr int kControllerDetuneBase = 26;

const ControllerAction kUnmappedAction{};

}  // namespace

ControllerMap::ControllerMap()
{
  bind(kControllerAttack + 0, ControllerTarget::kEnvelopeAttack);
  bind(kControllerAttack + 1, ControllerTarget::kEnvelopeDecay);
  bind(kControllerAttack + 2, ControllerTarget::kEnvelopeSustain);
  bind(kControllerAttack + 3, ControllerTarget::kEnvelopeRelease);

  for (int slot = 0; slot < kNumOscillators; ++slot) {
    bind(kControllerWeightBase + slot, ControllerTarget::kOscillatorWeight,
         slot);
    bind(kControllerDetuneBase + slot, ControllerTarget::kOscillatorDetune,
         slot);
  }

  bind(kControllerCutoff, ControllerTarget::kFilterCutoff);
  bind(kControllerResonance, ControllerTarget::kFilterResonance);
}

void ControllerMap::bind(const int controller,
                         const ControllerTarget target,
                         const int slot) noexcept
{
  auto& action = actions_[static_cast<std::size_t>(controller)];
  action.target = target;
  action.slot = slot;
}

const ControllerAction& ControllerMap::lookup(const int controller) const noexcept
{
  if (controller < 0 || controller >= kNumControllers) {
    return kUnmappedAction;
  }
  return actions_[static_cast<std::size_t>(controller)];
}

bool ControllerMap::apply(const int controller,
                          const int value,
                          const double sampleRate,
                          SynthParameters& params) const noexcept
{
  const ControllerAction& action = lookup(controller);
  if (action.target == ControllerTarget::kNone) {
    return false;
  }

  const double v01 =
      static_cast<double>(std::clamp(value, 0, 127)) / 127.0;
  const auto slot = static_cast<std::size_t>(
      std::clamp(action.slot, 0, kNumOscillators - 1));

  switch (action.target) {
  case ControllerTarget::kEnvelopeAttack:
    params.envelope.attack = v01;
    break;
  case ControllerTarget::kEnvelopeDecay:
    params.envelope.decay = v01;
    break;
  case ControllerTarget::kEnvelopeSustain:
    params.envelope.sustain = v01;
    break;
  case ControllerTarget::kEnvelopeRelease:
    params.envelope.release = v01;
    break;
  case ControllerTarget::kOscillatorWeight:
    params.weights[slot] = v01;
    break;
  case ControllerTarget::kFilterCutoff: {
    const double nyquist = 0.5 * sampleRate;
    params.filterCutoffHz =
        std::clamp(v01 * nyquist, kMinFilterCutoffHz,
                   std::max(nyquist, kMinFilterCutoffHz));
    break;
  }
  case ControllerTarget::kFilterResonance:
    params.filterResonance = v01;
    break;
  case ControllerTarget::kOscillatorDetune:
    params.detuneHz[slot] = (v01 - 0.5) * 2.0;
    break;
  case ControllerTarget::kNone:
    return false;
  }

  return true;
}

}  // namespace morphsynth
