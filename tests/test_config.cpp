#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cstdio>
#include <fstream>
#include "config.h"

TEST_CASE("Config loads defaults", "[config]") {
    Config config;
    config.loadDefaults();

    REQUIRE(config.receiver.backend == "rtl_tcp");
    REQUIRE(config.receiver.port == 1234);
    REQUIRE(config.audio.sample_rate == 12000);
    REQUIRE(config.orchestrator.enabled);
    REQUIRE(config.orchestrator.max_tune_failures == 0);
    REQUIRE_FALSE(config.clients.consider_local_clients);
    REQUIRE(config.control.port == 7380);
    REQUIRE(config.recorder.output_extension == "mp3");
    REQUIRE(config.frequencies.size() == 3);
    REQUIRE(config.frequencies[0].frequency_hz == 145800000);
    REQUIRE(config.frequencies[1].mode == "USB");
    REQUIRE(config.frequencies[2].label == "Calling Channel");
}

TEST_CASE("Config parses receiver and orchestrator sections", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config.ini");
    file << "[Receiver]\n";
    file << "backend = RIGCTL\n";
    file << "host = 192.168.1.1\n";
    file << "port = 4532\n";
    file << "[orchestrator]\n";
    file << "transition_delay = 0.5\n";
    file << "enable_recording = no\n";
    file << "max_tune_failures = 3 ; skip after three\n";
    file.close();

    bool result = config.loadFromFile("test_config.ini");
    REQUIRE(result == true);
    REQUIRE(config.receiver.backend == "rigctl");
    REQUIRE(config.receiver.host == "192.168.1.1");
    REQUIRE(config.receiver.port == 4532);
    REQUIRE_THAT(config.orchestrator.transition_delay, Catch::Matchers::WithinAbs(0.5, 1e-9));
    REQUIRE_FALSE(config.orchestrator.enable_recording);
    REQUIRE(config.orchestrator.max_tune_failures == 3);

    std::remove("test_config.ini");
}

TEST_CASE("Config keeps defaults for invalid values", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config.ini");
    file << "[receiver]\n";
    file << "backend = airspy\n";
    file << "port = 70000\n";
    file << "[recorder]\n";
    file << "rms_threshold = loud\n";
    file << "transcoder = lame in.wav out.mp3\n";
    file << "output_extension = .OGG\n";
    file << "[decoder]\n";
    file << "save_format = xml\n";
    file.close();

    REQUIRE(config.loadFromFile("test_config.ini"));
    REQUIRE(config.receiver.backend == "rtl_tcp");
    REQUIRE(config.receiver.port == 1234);
    REQUIRE_THAT(config.recorder.rms_threshold, Catch::Matchers::WithinAbs(0.02, 1e-6));
    REQUIRE(config.recorder.transcoder.find("{input}") != std::string::npos);
    REQUIRE(config.recorder.output_extension == "ogg");
    REQUIRE(config.decoder.save_format == "json");

    std::remove("test_config.ini");
}

TEST_CASE("Config parses repeated frequency sections", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config.ini");
    file << "[frequency]\n";
    file << "frequency_hz = 433920000\n";
    file << "mode = nfm\n";
    file << "squelch = 1.7\n";
    file << "dwell_seconds = 30\n";
    file << "label = ISM\n";
    file << "[frequency]\n";
    file << "frequency_hz = 0\n";
    file << "[frequency]\n";
    file << "frequency_hz = 162400000\n";
    file << "bandwidth_hz = 25000\n";
    file.close();

    REQUIRE(config.loadFromFile("test_config.ini"));
    REQUIRE(config.frequencies.size() == 2);
    REQUIRE(config.frequencies[0].frequency_hz == 433920000);
    REQUIRE(config.frequencies[0].squelch == 1.0f);
    REQUIRE(config.frequencies[0].dwell_seconds == 30);
    REQUIRE(config.frequencies[0].label == "ISM");
    REQUIRE(config.frequencies[1].frequency_hz == 162400000);
    REQUIRE(config.frequencies[1].bandwidth_hz == 25000);
    REQUIRE(config.frequencies[1].dwell_seconds == 60);

    std::remove("test_config.ini");
}

TEST_CASE("Config falls back to built-in frequencies when none are valid", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config.ini");
    file << "[frequency]\n";
    file << "frequency_hz = 145500000\n";
    file << "dwell_seconds = 0\n";
    file.close();

    REQUIRE(config.loadFromFile("test_config.ini"));
    REQUIRE(config.frequencies.size() == 3);
    REQUIRE(config.frequencies[0].frequency_hz == 145800000);

    std::remove("test_config.ini");
}

TEST_CASE("Config parses client address list", "[config]") {
    Config config;
    config.loadDefaults();

    std::ofstream file("test_config.ini");
    file << "[clients]\n";
    file << "local_addresses = 127.0.0.1, 10.1.0.0/16 ,fd00::/8\n";
    file << "consider_local_clients = true\n";
    file.close();

    REQUIRE(config.loadFromFile("test_config.ini"));
    REQUIRE(config.clients.local_addresses.size() == 3);
    REQUIRE(config.clients.local_addresses[1] == "10.1.0.0/16");
    REQUIRE(config.clients.consider_local_clients);

    std::remove("test_config.ini");
}

TEST_CASE("Config reports missing file", "[config]") {
    Config config;
    config.loadDefaults();
    REQUIRE_FALSE(config.loadFromFile("definitely_missing_autoscan.ini"));
    REQUIRE(config.frequencies.size() == 3);
}

TEST_CASE("Config parses the schedule section", "[config]") {
    Config config;
    config.loadDefaults();
    REQUIRE_FALSE(config.schedule.enabled);
    REQUIRE(config.schedule.path == "recording_schedule.json");

    std::ofstream file("test_config.ini");
    file << "[schedule]\n";
    file << "enabled = yes\n";
    file << "path = /etc/autoscan/schedule.json\n";
    file << "check_interval_seconds = 0\n";
    file.close();

    REQUIRE(config.loadFromFile("test_config.ini"));
    REQUIRE(config.schedule.enabled);
    REQUIRE(config.schedule.path == "/etc/autoscan/schedule.json");
    REQUIRE_THAT(config.schedule.check_interval_seconds, Catch::Matchers::WithinAbs(10.0, 1e-9));

    std::remove("test_config.ini");
}
