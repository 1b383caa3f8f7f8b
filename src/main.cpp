#include <iostream>
#include <csignal>
#include <atomic>
#include <cctype>
#include <cstring>
#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "address_matcher.h"
#include "audio_input.h"
#include "client_presence.h"
#include "config.h"
#include "control_server.h"
#include "decoding_session.h"
#include "orchestrator.h"
#include "receiver_tuner.h"
#include "recording_notifier.h"
#include "recording_scheduler.h"
#include "retention.h"
#include "rigctl_control.h"
#include "rtl_tcp_control.h"
#include "signal_recorder.h"
#include "status_export.h"
#include "transcoder.h"

static std::atomic<bool> g_running(true);

namespace {
std::chrono::milliseconds secondsToMs(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}
}  // namespace

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -c, --config <file>      INI config file\n"
              << "  -p, --port <port>        Control server port (default: 7380)\n"
              << "  -P, --password <pwd>     Control server password\n"
              << "  -G, --guest              Enable guest mode (no password required)\n"
              << "  -o, --output-dir <dir>   Recording output directory\n"
              << "  -r, --rate <hz>          Input audio sample rate (default: 12000)\n"
              << "      --no-auto            Disable the automatic scan orchestrator\n"
              << "  -l, --list-audio         List available audio capture devices\n"
              << "  -h, --help               Show this help\n";
}

int main(int argc, char* argv[]) {
    std::cout << "autoscan-sdr version " << AUTOSCAN_SDR_VERSION << "\n";

    std::string configPath;
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
            continue;
        }
        static constexpr const char* kConfigPrefix = "--config=";
        if (arg.rfind(kConfigPrefix, 0) == 0) {
            configPath = arg.substr(std::strlen(kConfigPrefix));
        }
    }

    Config config;
    config.loadDefaults();
    if (!configPath.empty() && !config.loadFromFile(configPath)) {
        std::cerr << "[Config] using built-in defaults" << std::endl;
        config.loadDefaults();
    }
    const bool verboseLogging = config.debug.log_level > 0;
    if (verboseLogging && !configPath.empty()) {
        std::cout << "[Config] loaded: " << configPath << "\n";
    }

    bool noAuto = false;

    auto readValue = [&](int& index, const std::string& current, const std::string& longName) -> std::string {
        const std::string prefix = "--" + longName + "=";
        if (current.rfind(prefix, 0) == 0) {
            return current.substr(prefix.length());
        }
        if (index + 1 < argc) {
            index++;
            return argv[index];
        }
        return std::string();
    };

    auto parsePositive = [&](const std::string& name, const std::string& value, long maxValue, long& out) -> bool {
        try {
            size_t used = 0;
            const long parsed = std::stol(value, &used);
            if (used != value.size() || parsed <= 0 || parsed > maxValue) {
                std::cerr << "[CLI] invalid --" << name << " value: " << value << "\n";
                return false;
            }
            out = parsed;
            return true;
        } catch (const std::exception&) {
            std::cerr << "[CLI] invalid --" << name << " value: " << value << "\n";
            return false;
        }
    };

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-G" || arg == "--guest") {
            config.control.guest_mode = true;
            continue;
        }
        if (arg == "--no-auto") {
            noAuto = true;
            continue;
        }
        if (arg == "-l" || arg == "--list-audio") {
            return listCaptureDevices() ? 0 : 1;
        }
        if (arg == "-c" || arg == "--config" || arg.rfind("--config=", 0) == 0) {
            const std::string value = readValue(i, arg, "config");
            if (value.empty()) {
                std::cerr << "[CLI] missing value for --config\n";
                return 1;
            }
            continue;
        }
        if (arg == "-p" || arg == "--port" || arg.rfind("--port=", 0) == 0) {
            long port = 0;
            if (!parsePositive("port", readValue(i, arg, "port"), 65535, port)) {
                return 1;
            }
            config.control.port = static_cast<uint16_t>(port);
            continue;
        }
        if (arg == "-P" || arg == "--password" || arg.rfind("--password=", 0) == 0) {
            const std::string value = readValue(i, arg, "password");
            if (value.empty()) {
                std::cerr << "[CLI] missing value for --password\n";
                return 1;
            }
            config.control.password = value;
            continue;
        }
        if (arg == "-o" || arg == "--output-dir" || arg.rfind("--output-dir=", 0) == 0) {
            const std::string value = readValue(i, arg, "output-dir");
            if (value.empty()) {
                std::cerr << "[CLI] missing value for --output-dir\n";
                return 1;
            }
            config.recorder.output_dir = value;
            continue;
        }
        if (arg == "-r" || arg == "--rate" || arg.rfind("--rate=", 0) == 0) {
            long rate = 0;
            if (!parsePositive("rate", readValue(i, arg, "rate"), 384000, rate)) {
                return 1;
            }
            config.audio.sample_rate = static_cast<uint32_t>(rate);
            continue;
        }

        std::cerr << "[CLI] unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
    }

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGPIPE, SIG_IGN);

    // Recorder and conversion pipeline.
    RecordingNotifier notifier;
    std::shared_ptr<ConversionPipeline> pipeline;
    std::unique_ptr<SignalRecorder> recorder;
    if (config.recorder.enabled) {
        auto transcoder = std::make_shared<CommandTranscoder>(
            config.recorder.transcoder, std::chrono::seconds(config.recorder.transcode_timeout_seconds),
            verboseLogging);
        pipeline = std::make_shared<ConversionPipeline>(transcoder, verboseLogging);

        RecorderOptions options;
        options.outputDir = config.recorder.output_dir;
        options.outputExtension = config.recorder.output_extension;
        options.sampleRate = config.audio.sample_rate;
        options.rmsThreshold = config.recorder.rms_threshold;
        options.freqDwellSeconds = config.recorder.freq_dwell_seconds;
        options.silenceTimeoutSeconds = config.recorder.silence_timeout_seconds;
        options.minDurationSeconds = config.recorder.min_duration_seconds;
        options.drainTimeout = std::chrono::seconds(config.recorder.transcode_timeout_seconds);
        try {
            recorder = std::make_unique<SignalRecorder>(options, pipeline, &notifier, verboseLogging);
        } catch (const std::exception& ex) {
            std::cerr << "[APP] recorder setup failed: " << ex.what() << "\n";
            return 1;
        }
    }

    // Decoding sessions.
    DecodingSessionOptions decoderOptions;
    decoderOptions.outputDir = config.decoder.output_dir;
    decoderOptions.bufferSize = static_cast<size_t>(std::max(1, config.decoder.buffer_size));
    decoderOptions.flushInterval = secondsToMs(config.decoder.flush_interval);
    const std::string saveFormat = toLower(config.decoder.save_format);
    decoderOptions.saveJson = saveFormat != "csv";
    decoderOptions.saveCsv = saveFormat == "csv" || saveFormat == "both";
    DecodingSessionManager decoders(decoderOptions, verboseLogging);

    // Client presence.
    ClientPresenceTracker presence(AddressMatcher(config.clients.local_addresses),
                                   config.clients.consider_local_clients, verboseLogging);

    // Receiver backend.
    std::unique_ptr<ReceiverControl> receiver;
    const std::string backend = toLower(config.receiver.backend);
    if (backend == "rtl_tcp") {
        auto rtl = std::make_unique<RtlTcpControl>(config.receiver.host, config.receiver.port, verboseLogging);
        if (!rtl->connect()) {
            std::cerr << "[TUNER] rtl_tcp not reachable at " << config.receiver.host << ":" << config.receiver.port
                      << ", will retry on first tune\n";
        }
        receiver = std::move(rtl);
    } else if (backend == "rigctl") {
        auto rig = std::make_unique<RigctlControl>(config.receiver.host, config.receiver.port, verboseLogging);
        if (!rig->connect()) {
            std::cerr << "[TUNER] rigctld not reachable at " << config.receiver.host << ":" << config.receiver.port
                      << ", will retry on first tune\n";
        }
        receiver = std::move(rig);
    } else if (backend != "none") {
        std::cerr << "[Config] invalid receiver.backend: " << config.receiver.backend
                  << " (expected rtl_tcp, rigctl or none), running recorder only\n";
    }

    std::unique_ptr<ReceiverTuner> tuner;
    std::unique_ptr<Orchestrator> orchestrator;
    if (receiver) {
        tuner = std::make_unique<ReceiverTuner>(*receiver, verboseLogging);
        if (config.orchestrator.enabled && !noAuto) {
            OrchestratorOptions options;
            options.enabled = true;
            options.transitionDelay = secondsToMs(config.orchestrator.transition_delay);
            options.tuneRetry = secondsToMs(config.orchestrator.tune_retry_seconds);
            options.errorBackoff = secondsToMs(config.orchestrator.error_backoff_seconds);
            options.enableRecording = config.orchestrator.enable_recording;
            options.enableDecoders = config.orchestrator.enable_decoders;
            options.maxTuneFailures = config.orchestrator.max_tune_failures;
            orchestrator = std::make_unique<Orchestrator>(config.frequencies, options, *tuner, &presence, &decoders,
                                                          recorder.get(), verboseLogging);
        }
    } else {
        std::cout << "[APP] no receiver backend, automatic scanning disabled\n";
    }

    // Scheduled recordings.
    std::unique_ptr<RecordingScheduler> scheduler;
    if (config.schedule.enabled) {
        std::vector<ScheduleEntry> entries;
        if (!recorder) {
            std::cerr << "[SCHED] recorder disabled, ignoring the recording schedule\n";
        } else if (loadScheduleFile(config.schedule.path, entries)) {
            if (verboseLogging) {
                std::cout << "[SCHED] loaded " << entries.size() << " schedules from " << config.schedule.path
                          << "\n";
            }
            scheduler = std::make_unique<RecordingScheduler>(std::move(entries), tuner.get(), recorder.get(),
                                                             orchestrator.get(),
                                                             secondsToMs(config.schedule.check_interval_seconds),
                                                             verboseLogging);
        }
    }

    StatusSources sources;
    sources.orchestrator = orchestrator.get();
    sources.presence = &presence;
    sources.recorder = recorder.get();
    sources.decoders = &decoders;
    sources.scheduler = scheduler.get();

    // Control server.
    std::unique_ptr<ControlServer> controlServer;
    RecordingNotifier::Handle notifyHandle = 0;
    if (config.control.enabled) {
        controlServer = std::make_unique<ControlServer>(config.control.port, &presence);
        controlServer->setPassword(config.control.password);
        controlServer->setGuestMode(config.control.guest_mode);
        controlServer->setVerboseLogging(verboseLogging);
        controlServer->setStatusCallback([&sources]() { return buildStatusDocument(sources).dump(); });
        controlServer->setRecordingCallback([&recorder]() {
            RecordingStatusEvent event;
            if (recorder) {
                const RecorderStatus status = recorder->getStatus();
                event.recording = status.recording;
                event.frequencyHz = status.frequencyHz;
            }
            return recordingStatusJson(event);
        });
        controlServer->setStateCallback([&orchestrator]() {
            return std::string(orchestratorStateName(orchestrator ? orchestrator->state()
                                                                  : OrchestratorState::Manual));
        });
        controlServer->setDecodingCallback([&decoders](const std::string& decoder, const nlohmann::json& fields) {
            return decoders.addDecoding(decoder, fields);
        });
        ControlServer* server = controlServer.get();
        notifyHandle = notifier.addObserver([server](const RecordingStatusEvent& event) {
            server->pushNotification("N" + recordingStatusJson(event));
        });
        if (!controlServer->start()) {
            std::cerr << "[APP] control server failed to start\n";
            return 1;
        }
    }

    StatusFileWriter statusWriter(config.status.path, secondsToMs(config.status.interval),
                                  [&sources]() { return buildStatusDocument(sources); }, verboseLogging);
    std::unique_ptr<RetentionSweeper> retention;
    if (recorder) {
        retention = std::make_unique<RetentionSweeper>(config.recorder.output_dir, config.recorder.retention_days,
                                                       secondsToMs(config.recorder.cleanup_interval_seconds),
                                                       recorder.get(), verboseLogging);
    }

    // Audio ingestion.
    std::unique_ptr<AudioSource> audioSource;
    std::unique_ptr<AudioIngest> ingest;
    if (recorder) {
        const size_t blockSamples = static_cast<size_t>(std::max(1, config.audio.block_samples));
        const std::string source = toLower(config.audio.source);
        if (source == "portaudio") {
#if defined(AUTOSCAN_HAS_PORTAUDIO)
            audioSource = std::make_unique<PortAudioSource>(config.audio.device, config.audio.sample_rate,
                                                            blockSamples, verboseLogging);
#else
            std::cerr << "[AUDIO] built without PortAudio, falling back to stdin\n";
#endif
        } else if (source != "stdin") {
            std::cerr << "[Config] invalid audio.source: " << config.audio.source << ", using stdin\n";
        }
        if (!audioSource) {
            audioSource = std::make_unique<PcmStreamSource>(0, blockSamples);
        }

        ReceiverTuner* tunerPtr = tuner.get();
        const uint64_t fixedFrequency = config.audio.frequency_hz;
        AudioIngest::FrequencyProvider frequency = [tunerPtr, fixedFrequency]() -> std::optional<uint64_t> {
            if (tunerPtr && tunerPtr->currentFrequency() > 0) {
                return tunerPtr->currentFrequency();
            }
            if (fixedFrequency > 0) {
                return fixedFrequency;
            }
            return std::nullopt;
        };
        ingest = std::make_unique<AudioIngest>(*audioSource, *recorder, frequency, blockSamples,
                                               config.audio.dc_block, verboseLogging);
        if (!ingest->start()) {
            std::cerr << "[APP] audio source " << audioSource->name() << " failed to open\n";
            if (controlServer) {
                controlServer->stop();
            }
            return 1;
        }
    }

    decoders.startFlusher();
    if (orchestrator) {
        orchestrator->start();
    }
    if (scheduler) {
        scheduler->start();
    }
    presence.startMonitoring(secondsToMs(config.clients.check_interval));
    statusWriter.start();
    if (retention) {
        retention->start();
    }

    std::cout << "[APP] running, press Ctrl+C to stop.\n";
    while (g_running) {
        if (ingest && ingest->finished()) {
            std::cout << "[APP] audio input ended\n";
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[APP] shutting down...\n";
    if (ingest) {
        ingest->stop();
    }
    if (scheduler) {
        scheduler->stop();
    }
    if (orchestrator) {
        orchestrator->stop();
    }
    if (recorder) {
        recorder->shutdown();
    }
    decoders.stopFlusher();
    decoders.stopSession();
    if (controlServer) {
        notifier.removeObserver(notifyHandle);
        controlServer->stop();
    }
    presence.stopMonitoring();
    if (retention) {
        retention->stop();
    }
    statusWriter.stop();
    statusWriter.writeOnce();
    if (pipeline) {
        pipeline->stop();
    }

    std::cout << "[APP] shutdown complete.\n";
    return 0;
}
