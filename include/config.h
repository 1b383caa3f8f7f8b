#ifndef CONFIG_H
#define CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

#include "frequency_profile.h"

struct Config {
  struct ReceiverSection {
    std::string backend = "rtl_tcp"; // rtl_tcp|rigctl|none
    std::string host = "localhost";
    uint16_t port = 1234;
  } receiver;

  struct AudioSection {
    std::string source = "stdin"; // stdin|portaudio
    std::string device;
    uint32_t sample_rate = 12000;
    int block_samples = 1200;
    bool dc_block = false;
    uint64_t frequency_hz = 0;
  } audio;

  struct OrchestratorSection {
    bool enabled = true;
    double transition_delay = 2.0;
    bool enable_recording = true;
    bool enable_decoders = true;
    double tune_retry_seconds = 5.0;
    double error_backoff_seconds = 5.0;
    int max_tune_failures = 0; // 0 = keep retrying the same entry
    std::string cycle_mode = "sequential";
  } orchestrator;

  struct ClientsSection {
    std::vector<std::string> local_addresses = {
        "127.0.0.1", "::1", "192.168.0.0/16", "10.0.0.0/8", "172.16.0.0/12"};
    bool consider_local_clients = false;
    double check_interval = 5.0;
  } clients;

  struct RecorderSection {
    bool enabled = true;
    std::string output_dir = "recordings";
    float rms_threshold = 0.02f;
    double freq_dwell_seconds = 2.0;
    double silence_timeout_seconds = 3.0;
    double min_duration_seconds = 5.0;
    int retention_days = 7;
    double cleanup_interval_seconds = 300.0;
    std::string transcoder =
        "ffmpeg -y -loglevel error -i {input} -codec:a libmp3lame -b:a 128k {output}";
    std::string output_extension = "mp3";
    int transcode_timeout_seconds = 300;
  } recorder;

  struct DecoderSection {
    std::string output_dir = "decodings";
    int buffer_size = 100;
    double flush_interval = 5.0;
    std::string save_format = "json"; // json|csv|both
  } decoder;

  struct ControlSection {
    bool enabled = true;
    uint16_t port = 7380;
    std::string password;
    bool guest_mode = false;
  } control;

  struct ScheduleSection {
    bool enabled = false;
    std::string path = "recording_schedule.json";
    double check_interval_seconds = 10.0;
  } schedule;

  struct StatusSection {
    std::string path = "autoscan_status.json";
    double interval = 5.0;
  } status;

  struct DebugSection {
    int log_level = 1;
  } debug;

  // Scan list. Filled from repeated [frequency] sections, otherwise the
  // built-in list.
  std::vector<FrequencyProfile> frequencies = defaultFrequencyProfiles();

  bool loadFromFile(const std::string &filename);
  void loadDefaults();
};

#endif
