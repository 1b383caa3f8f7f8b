#include "dsp/liquid_primitives.h"

#include <stdexcept>

namespace autoscan::dsp::liquid {

DCBlocker::~DCBlocker() {
    if (m_object != nullptr) {
        iirfilt_rrrf_destroy(m_object);
    }
}

void DCBlocker::init(float alpha) {
    if (alpha <= 0.0f) {
        throw std::runtime_error("dc blocker alpha must be positive");
    }
    if (m_object != nullptr) {
        iirfilt_rrrf_destroy(m_object);
    }
    m_alpha = alpha;
    m_object = iirfilt_rrrf_create_dc_blocker(m_alpha);
    if (m_object == nullptr) {
        throw std::runtime_error("failed to create liquid iirfilt_rrrf dc blocker");
    }
}

void DCBlocker::reset() {
    if (m_object != nullptr) {
        iirfilt_rrrf_reset(m_object);
    }
}

float DCBlocker::execute(float input) const {
    if (m_object == nullptr) {
        return input;
    }
    float out = 0.0f;
    iirfilt_rrrf_execute(m_object, input, &out);
    return out;
}

void DCBlocker::executeBlock(float* samples, std::size_t count) const {
    if (m_object == nullptr || samples == nullptr) {
        return;
    }
    for (std::size_t i = 0; i < count; i++) {
        float out = 0.0f;
        iirfilt_rrrf_execute(m_object, samples[i], &out);
        samples[i] = out;
    }
}

float sumSquares(const float* samples, std::size_t count) {
    if (samples == nullptr || count == 0) {
        return 0.0f;
    }
    // liquid takes a non-const pointer but only reads from it.
    return liquid_sumsqf(const_cast<float*>(samples), static_cast<unsigned int>(count));
}

}  // namespace autoscan::dsp::liquid
