#include "dsp/energy.h"

#include <algorithm>
#include <cmath>

#include "dsp/liquid_primitives.h"

namespace autoscan::dsp {

namespace {
constexpr double kFloorDbfs = -120.0;
constexpr float kAttack = 0.5f;
constexpr float kRelease = 0.1f;
}  // namespace

float computeRms(const float* samples, std::size_t count) {
    if (samples == nullptr || count == 0) {
        return 0.0f;
    }
    const float sum = liquid::sumSquares(samples, count);
    return std::sqrt(std::max(0.0f, sum) / static_cast<float>(count));
}

double rmsToDbfs(float rms) {
    if (!(rms > 0.0f)) {
        return kFloorDbfs;
    }
    return std::max(kFloorDbfs, 20.0 * std::log10(static_cast<double>(rms)));
}

float smoothLevel(float input, LevelSmoother& state) {
    if (!state.initialized) {
        state.value = input;
        state.initialized = true;
        return state.value;
    }
    const float alpha = input > state.value ? kAttack : kRelease;
    state.value += alpha * (input - state.value);
    return state.value;
}

}  // namespace autoscan::dsp
