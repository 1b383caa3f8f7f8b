#include "frequency_profile.h"

#include <cstdio>

std::vector<FrequencyProfile> defaultFrequencyProfiles() {
    std::vector<FrequencyProfile> profiles;

    FrequencyProfile aprs;
    aprs.frequency_hz = 145800000;
    aprs.mode = "NFM";
    aprs.squelch = 0.15f;
    aprs.bandwidth_hz = 12500;
    aprs.dwell_seconds = 60;
    aprs.label = "APRS 2m";
    profiles.push_back(aprs);

    FrequencyProfile ft8;
    ft8.frequency_hz = 14074000;
    ft8.mode = "USB";
    ft8.squelch = 0.0f;
    ft8.bandwidth_hz = 2500;
    ft8.dwell_seconds = 120;
    ft8.label = "FT8 20m";
    profiles.push_back(ft8);

    FrequencyProfile calling;
    calling.frequency_hz = 144800000;
    calling.mode = "NFM";
    calling.squelch = 0.20f;
    calling.bandwidth_hz = 12500;
    calling.dwell_seconds = 60;
    calling.label = "Calling Channel";
    profiles.push_back(calling);

    return profiles;
}

std::string formatFrequencyMHz(uint64_t frequencyHz) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.3f", static_cast<double>(frequencyHz) / 1e6);
    return std::string(buffer);
}
