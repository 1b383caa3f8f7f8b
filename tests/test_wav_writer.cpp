#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>
#include "wav_writer.h"

namespace {
std::vector<uint8_t> readAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

uint32_t readU32(const std::vector<uint8_t>& data, size_t offset) {
    uint32_t value = 0;
    std::memcpy(&value, data.data() + offset, 4);
    return value;
}
}  // namespace

TEST_CASE("WavWriter writes a mono 16-bit header", "[wav]") {
    const std::string path = (std::filesystem::temp_directory_path() / "autoscan_wav_header.wav").string();
    WavWriter writer;
    REQUIRE(writer.open(path, 12000));
    REQUIRE(writer.isOpen());

    std::vector<float> block(1200, 0.1f);
    REQUIRE(writer.write(block.data(), block.size()));
    REQUIRE(writer.write(block.data(), block.size()));
    REQUIRE(writer.close());
    REQUIRE_FALSE(writer.isOpen());

    REQUIRE(writer.dataBytes() == 4800);
    REQUIRE(writer.framesWritten() == 2400);

    const std::vector<uint8_t> data = readAll(path);
    REQUIRE(data.size() == 44 + 4800);
    REQUIRE(std::memcmp(data.data(), "RIFF", 4) == 0);
    REQUIRE(readU32(data, 4) == 36 + 4800);
    REQUIRE(std::memcmp(data.data() + 8, "WAVE", 4) == 0);
    REQUIRE(readU32(data, 24) == 12000);
    REQUIRE(readU32(data, 28) == 24000);
    REQUIRE(readU32(data, 40) == 4800);

    std::remove(path.c_str());
}

TEST_CASE("WavWriter clamps samples", "[wav]") {
    const std::string path = (std::filesystem::temp_directory_path() / "autoscan_wav_clamp.wav").string();
    WavWriter writer;
    REQUIRE(writer.open(path, 8000));
    const float samples[3] = {2.0f, -3.0f, 0.0f};
    REQUIRE(writer.write(samples, 3));
    REQUIRE(writer.close());

    const std::vector<uint8_t> data = readAll(path);
    REQUIRE(data.size() == 44 + 6);
    int16_t pcm[3];
    std::memcpy(pcm, data.data() + 44, sizeof(pcm));
    REQUIRE(pcm[0] == 32767);
    REQUIRE(pcm[1] == -32767);
    REQUIRE(pcm[2] == 0);

    std::remove(path.c_str());
}

TEST_CASE("WavWriter duration follows the payload size", "[wav]") {
    REQUIRE(WavWriter::durationSeconds(24000, 12000) == 1.0);
    REQUIRE(WavWriter::durationSeconds(23999, 12000) < 1.0);
    REQUIRE(WavWriter::durationSeconds(1000, 0) == 0.0);
}

TEST_CASE("WavWriter rejects writes when closed", "[wav]") {
    WavWriter writer;
    const float sample = 0.5f;
    REQUIRE_FALSE(writer.write(&sample, 1));
    REQUIRE(writer.close());
    REQUIRE_FALSE(writer.open("/nonexistent-dir/autoscan/file.wav", 12000));
}
