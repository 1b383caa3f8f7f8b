#ifndef DSP_ENERGY_H
#define DSP_ENERGY_H

#include <cstddef>

namespace autoscan::dsp {

// sqrt(mean(x^2)) over a block of normalized samples. 0 for an empty block.
float computeRms(const float *samples, std::size_t count);
double rmsToDbfs(float rms);

struct LevelSmoother {
  bool initialized = false;
  float value = 0.0f;
};

// Fast-attack, slow-release smoothing for the reported audio level.
float smoothLevel(float input, LevelSmoother &state);

} // namespace autoscan::dsp

#endif
