#ifndef DSP_LIQUID_PRIMITIVES_H
#define DSP_LIQUID_PRIMITIVES_H

#include <cstddef>

#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#pragma clang diagnostic ignored "-Wreturn-type-c-linkage"
extern "C" {
#include "liquid/liquid.h"
}
#pragma clang diagnostic pop

namespace autoscan::dsp::liquid {

// Single-pole DC blocker on real samples (iirfilt_rrrf).
class DCBlocker {
public:
  DCBlocker() = default;
  ~DCBlocker();
  DCBlocker(const DCBlocker &) = delete;
  DCBlocker &operator=(const DCBlocker &) = delete;
  DCBlocker(DCBlocker &&) = delete;
  DCBlocker &operator=(DCBlocker &&) = delete;

  void init(float alpha);
  void reset();
  float execute(float input) const;
  void executeBlock(float *samples, std::size_t count) const;
  bool ready() const { return m_object != nullptr; }

private:
  iirfilt_rrrf m_object = nullptr;
  float m_alpha = 0.0f;
};

float sumSquares(const float *samples, std::size_t count);

} // namespace autoscan::dsp::liquid

#endif
