#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <unistd.h>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>
#include "audio_input.h"
#include "signal_recorder.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {
void writeSamples(int fd, const std::vector<int16_t>& samples) {
    std::vector<uint8_t> bytes;
    for (int16_t s : samples) {
        const uint16_t u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(u & 0xFF));
        bytes.push_back(static_cast<uint8_t>(u >> 8));
    }
    REQUIRE(::write(fd, bytes.data(), bytes.size()) == static_cast<ssize_t>(bytes.size()));
}
}  // namespace

TEST_CASE("PCM stream samples are normalized little-endian int16", "[audio]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    writeSamples(fds[1], {0, 16384, -32768, 32767});
    ::close(fds[1]);

    PcmStreamSource source(fds[0], 8, 100);
    REQUIRE(source.open());
    std::vector<float> block;
    REQUIRE(source.read(block));
    REQUIRE(block.size() == 4);
    REQUIRE(block[0] == 0.0f);
    REQUIRE(block[1] == 0.5f);
    REQUIRE(block[2] == -1.0f);
    REQUIRE_THAT(block[3], Catch::Matchers::WithinAbs(1.0, 1e-4));

    REQUIRE_FALSE(source.read(block));
    REQUIRE(block.empty());
    ::close(fds[0]);
}

TEST_CASE("A quiet PCM stream yields empty blocks, not end of stream", "[audio]") {
    int fds[2];
    REQUIRE(::pipe(fds) == 0);

    PcmStreamSource source(fds[0], 4, 20);
    REQUIRE(source.open());
    std::vector<float> block;
    REQUIRE(source.read(block));
    REQUIRE(block.empty());

    writeSamples(fds[1], {100, 200, 300, 400, 500});
    REQUIRE(source.read(block));
    REQUIRE(block.size() == 4);

    ::close(fds[1]);
    REQUIRE(source.read(block));
    REQUIRE(block.size() == 1);
    ::close(fds[0]);
}

TEST_CASE("Ingest feeds every block to the recorder until the stream ends", "[audio]") {
    const fs::path dir = fs::temp_directory_path() / "autoscan_audio_ingest";
    fs::remove_all(dir);
    RecorderOptions options;
    options.outputDir = dir.string();
    options.freqDwellSeconds = 0.0;
    options.minDurationSeconds = 0.0;
    SignalRecorder recorder(options, nullptr, nullptr, false);

    int fds[2];
    REQUIRE(::pipe(fds) == 0);
    writeSamples(fds[1], std::vector<int16_t>(1200, 8000));
    writeSamples(fds[1], std::vector<int16_t>(1200, 8000));
    ::close(fds[1]);

    PcmStreamSource source(fds[0], 1200, 100);
    AudioIngest ingest(source, recorder, []() { return std::optional<uint64_t>(145800000); }, 1200, true,
                       false);
    REQUIRE(ingest.start());
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!ingest.finished() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    ingest.stop();

    REQUIRE(ingest.finished());
    REQUIRE(ingest.blocksDelivered() == 2);
    const RecorderStatus status = recorder.getStatus();
    REQUIRE(status.recording);
    REQUIRE(status.frequencyHz == std::optional<uint64_t>(145800000));

    recorder.shutdown();
    ::close(fds[0]);
    fs::remove_all(dir);
}
