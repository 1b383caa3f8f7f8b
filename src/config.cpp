#include "config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <string>

namespace {
std::string trim(const std::string& value) {
    size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start])) != 0) {
        start++;
    }

    size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
        end--;
    }

    return value.substr(start, end - start);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool parseBool(const std::string& raw, bool& out) {
    const std::string value = toLower(trim(raw));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& raw, int& out) {
    try {
        const std::string t = trim(raw);
        size_t idx = 0;
        const int value = std::stoi(t, &idx);
        if (idx != t.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseUInt64(const std::string& raw, uint64_t& out) {
    const std::string t = trim(raw);
    if (t.empty() || t.front() == '-') {
        return false;
    }
    try {
        size_t idx = 0;
        const unsigned long long value = std::stoull(t, &idx);
        if (idx != t.size()) {
            return false;
        }
        out = static_cast<uint64_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseFloat(const std::string& raw, float& out) {
    try {
        const std::string t = trim(raw);
        size_t idx = 0;
        const float value = std::stof(t, &idx);
        if (idx != t.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseDouble(const std::string& raw, double& out) {
    try {
        const std::string t = trim(raw);
        size_t idx = 0;
        const double value = std::stod(t, &idx);
        if (idx != t.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parsePort(const std::string& raw, uint16_t& out) {
    int parsed = 0;
    if (!parseInt(raw, parsed) || parsed < 1 || parsed > 65535) {
        return false;
    }
    out = static_cast<uint16_t>(parsed);
    return true;
}

std::vector<std::string> splitList(const std::string& raw) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= raw.size()) {
        size_t comma = raw.find(',', start);
        if (comma == std::string::npos) {
            comma = raw.size();
        }
        const std::string item = trim(raw.substr(start, comma - start));
        if (!item.empty()) {
            items.push_back(item);
        }
        start = comma + 1;
    }
    return items;
}

void warnInvalid(const std::string& filename, int lineNo, const std::string& section,
                 const std::string& key, const std::string& value) {
    std::cerr << "[Config] " << filename << ":" << lineNo << ": ignoring invalid "
              << section << "." << key << " = '" << value << "'\n";
}
}  // namespace

void Config::loadDefaults() {
    receiver = ReceiverSection{};
    audio = AudioSection{};
    orchestrator = OrchestratorSection{};
    clients = ClientsSection{};
    recorder = RecorderSection{};
    decoder = DecoderSection{};
    control = ControlSection{};
    schedule = ScheduleSection{};
    status = StatusSection{};
    debug = DebugSection{};
    frequencies = defaultFrequencyProfiles();
}

bool Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "[Config] failed to open config file: " << filename << "\n";
        return false;
    }

    std::string section;
    std::string line;
    int lineNo = 0;
    std::vector<FrequencyProfile> parsedFrequencies;

    while (std::getline(file, line)) {
        lineNo++;

        const size_t commentPos = line.find_first_of("#;");
        if (commentPos != std::string::npos) {
            line = line.substr(0, commentPos);
        }

        line = trim(line);
        if (line.empty()) {
            continue;
        }

        if (line.front() == '[' && line.back() == ']') {
            section = toLower(trim(line.substr(1, line.size() - 2)));
            if (section == "frequency") {
                parsedFrequencies.emplace_back();
                parsedFrequencies.back().label.clear();
            }
            continue;
        }

        const size_t equalsPos = line.find('=');
        if (equalsPos == std::string::npos) {
            std::cerr << "[Config] parse warning (" << filename << ":" << lineNo
                      << "): expected key=value\n";
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, equalsPos)));
        const std::string value = trim(line.substr(equalsPos + 1));
        bool accepted = true;

        if (section == "receiver") {
            if (key == "backend") {
                const std::string parsed = toLower(value);
                if (parsed == "rtl_tcp" || parsed == "rigctl" || parsed == "none") {
                    receiver.backend = parsed;
                } else {
                    accepted = false;
                }
            } else if (key == "host") {
                receiver.host = value;
            } else if (key == "port") {
                accepted = parsePort(value, receiver.port);
            }
        } else if (section == "audio") {
            if (key == "source") {
                const std::string parsed = toLower(value);
                if (parsed == "stdin" || parsed == "portaudio") {
                    audio.source = parsed;
                } else {
                    accepted = false;
                }
            } else if (key == "device") {
                audio.device = value;
            } else if (key == "sample_rate") {
                int parsed = 0;
                accepted = parseInt(value, parsed) && parsed >= 1000 && parsed <= 192000;
                if (accepted) {
                    audio.sample_rate = static_cast<uint32_t>(parsed);
                }
            } else if (key == "block_samples") {
                int parsed = 0;
                accepted = parseInt(value, parsed) && parsed > 0;
                if (accepted) {
                    audio.block_samples = parsed;
                }
            } else if (key == "dc_block") {
                accepted = parseBool(value, audio.dc_block);
            } else if (key == "frequency_hz") {
                accepted = parseUInt64(value, audio.frequency_hz);
            }
        } else if (section == "orchestrator") {
            if (key == "enabled") {
                accepted = parseBool(value, orchestrator.enabled);
            } else if (key == "transition_delay") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed >= 0.0;
                if (accepted) {
                    orchestrator.transition_delay = parsed;
                }
            } else if (key == "enable_recording") {
                accepted = parseBool(value, orchestrator.enable_recording);
            } else if (key == "enable_decoders") {
                accepted = parseBool(value, orchestrator.enable_decoders);
            } else if (key == "tune_retry_seconds") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed >= 0.0;
                if (accepted) {
                    orchestrator.tune_retry_seconds = parsed;
                }
            } else if (key == "error_backoff_seconds") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed >= 0.0;
                if (accepted) {
                    orchestrator.error_backoff_seconds = parsed;
                }
            } else if (key == "max_tune_failures") {
                int parsed = 0;
                accepted = parseInt(value, parsed) && parsed >= 0;
                if (accepted) {
                    orchestrator.max_tune_failures = parsed;
                }
            } else if (key == "cycle_mode") {
                const std::string parsed = toLower(value);
                accepted = (parsed == "sequential");
                if (accepted) {
                    orchestrator.cycle_mode = parsed;
                }
            }
        } else if (section == "frequency") {
            FrequencyProfile& entry = parsedFrequencies.back();
            if (key == "frequency_hz" || key == "frequency") {
                accepted = parseUInt64(value, entry.frequency_hz);
            } else if (key == "mode") {
                entry.mode = value;
            } else if (key == "squelch") {
                float parsed = 0.0f;
                accepted = parseFloat(value, parsed);
                if (accepted) {
                    entry.squelch = std::clamp(parsed, 0.0f, 1.0f);
                }
            } else if (key == "bandwidth_hz" || key == "bandwidth") {
                uint64_t parsed = 0;
                accepted = parseUInt64(value, parsed) && parsed <= 0xFFFFFFFFULL;
                if (accepted) {
                    entry.bandwidth_hz = static_cast<uint32_t>(parsed);
                }
            } else if (key == "dwell_seconds" || key == "dwell_time") {
                int parsed = 0;
                accepted = parseInt(value, parsed) && parsed >= 0;
                if (accepted) {
                    entry.dwell_seconds = static_cast<uint32_t>(parsed);
                }
            } else if (key == "label" || key == "description") {
                entry.label = value;
            }
        } else if (section == "clients") {
            if (key == "local_addresses") {
                clients.local_addresses = splitList(value);
            } else if (key == "consider_local_clients") {
                accepted = parseBool(value, clients.consider_local_clients);
            } else if (key == "check_interval") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed > 0.0;
                if (accepted) {
                    clients.check_interval = parsed;
                }
            }
        } else if (section == "recorder") {
            if (key == "enabled") {
                accepted = parseBool(value, recorder.enabled);
            } else if (key == "output_dir") {
                accepted = !value.empty();
                if (accepted) {
                    recorder.output_dir = value;
                }
            } else if (key == "rms_threshold") {
                float parsed = 0.0f;
                accepted = parseFloat(value, parsed) && parsed >= 0.0f && parsed < 1.0f;
                if (accepted) {
                    recorder.rms_threshold = parsed;
                }
            } else if (key == "freq_dwell_seconds") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed >= 0.0;
                if (accepted) {
                    recorder.freq_dwell_seconds = parsed;
                }
            } else if (key == "silence_timeout_seconds") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed > 0.0;
                if (accepted) {
                    recorder.silence_timeout_seconds = parsed;
                }
            } else if (key == "min_duration_seconds") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed >= 0.0;
                if (accepted) {
                    recorder.min_duration_seconds = parsed;
                }
            } else if (key == "retention_days") {
                int parsed = 0;
                accepted = parseInt(value, parsed) && parsed >= 0;
                if (accepted) {
                    recorder.retention_days = parsed;
                }
            } else if (key == "cleanup_interval_seconds") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed > 0.0;
                if (accepted) {
                    recorder.cleanup_interval_seconds = parsed;
                }
            } else if (key == "transcoder") {
                accepted = value.find("{input}") != std::string::npos &&
                           value.find("{output}") != std::string::npos;
                if (accepted) {
                    recorder.transcoder = value;
                }
            } else if (key == "output_extension") {
                std::string parsed = toLower(value);
                if (!parsed.empty() && parsed.front() == '.') {
                    parsed.erase(0, 1);
                }
                accepted = !parsed.empty() && parsed != "wav";
                if (accepted) {
                    recorder.output_extension = parsed;
                }
            } else if (key == "transcode_timeout_seconds") {
                int parsed = 0;
                accepted = parseInt(value, parsed) && parsed > 0;
                if (accepted) {
                    recorder.transcode_timeout_seconds = parsed;
                }
            }
        } else if (section == "decoder") {
            if (key == "output_dir") {
                accepted = !value.empty();
                if (accepted) {
                    decoder.output_dir = value;
                }
            } else if (key == "buffer_size") {
                int parsed = 0;
                accepted = parseInt(value, parsed) && parsed > 0;
                if (accepted) {
                    decoder.buffer_size = parsed;
                }
            } else if (key == "flush_interval") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed > 0.0;
                if (accepted) {
                    decoder.flush_interval = parsed;
                }
            } else if (key == "save_format") {
                const std::string parsed = toLower(value);
                accepted = (parsed == "json" || parsed == "csv" || parsed == "both");
                if (accepted) {
                    decoder.save_format = parsed;
                }
            }
        } else if (section == "control") {
            if (key == "enabled") {
                accepted = parseBool(value, control.enabled);
            } else if (key == "port") {
                accepted = parsePort(value, control.port);
            } else if (key == "password") {
                control.password = value;
            } else if (key == "guest_mode" || key == "guest") {
                accepted = parseBool(value, control.guest_mode);
            }
        } else if (section == "schedule") {
            if (key == "enabled") {
                accepted = parseBool(value, schedule.enabled);
            } else if (key == "path") {
                accepted = !value.empty();
                if (accepted) {
                    schedule.path = value;
                }
            } else if (key == "check_interval_seconds") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed > 0.0;
                if (accepted) {
                    schedule.check_interval_seconds = parsed;
                }
            }
        } else if (section == "status") {
            if (key == "path") {
                status.path = value;
            } else if (key == "interval") {
                double parsed = 0.0;
                accepted = parseDouble(value, parsed) && parsed > 0.0;
                if (accepted) {
                    status.interval = parsed;
                }
            }
        } else if (section == "debug") {
            if (key == "log_level") {
                accepted = parseInt(value, debug.log_level);
            }
        }

        if (!accepted) {
            warnInvalid(filename, lineNo, section, key, value);
        }
    }

    std::vector<FrequencyProfile> validFrequencies;
    for (size_t i = 0; i < parsedFrequencies.size(); i++) {
        const FrequencyProfile& entry = parsedFrequencies[i];
        if (!entry.valid()) {
            std::cerr << "[Config] " << filename << ": dropping [frequency] entry " << (i + 1)
                      << " (frequency_hz and dwell_seconds must be > 0)\n";
            continue;
        }
        validFrequencies.push_back(entry);
    }
    if (!validFrequencies.empty()) {
        frequencies = std::move(validFrequencies);
    } else if (!parsedFrequencies.empty()) {
        std::cerr << "[Config] " << filename << ": no usable [frequency] entries, keeping built-in list\n";
    }

    return true;
}
