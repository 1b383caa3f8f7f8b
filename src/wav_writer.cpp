#include "wav_writer.h"

#include <algorithm>
#include <iostream>
#include <vector>

WavWriter::~WavWriter() {
    close();
}

bool WavWriter::open(const std::string& path, uint32_t sampleRate) {
    close();
    if (sampleRate == 0) {
        return false;
    }

    m_handle = std::fopen(path.c_str(), "wb");
    if (!m_handle) {
        std::cerr << "[REC] failed to open staging file: " << path << std::endl;
        return false;
    }
    m_path = path;
    m_sampleRate = sampleRate;
    m_dataSize = 0;
    if (!writeHeader()) {
        std::fclose(m_handle);
        m_handle = nullptr;
        return false;
    }
    return true;
}

bool WavWriter::writeHeader() {
    if (!m_handle) {
        return false;
    }

    const uint32_t sampleRate = m_sampleRate;
    const uint16_t numChannels = CHANNELS;
    const uint16_t bitsPerSample = BITS_PER_SAMPLE;
    const uint32_t byteRate = sampleRate * numChannels * bitsPerSample / 8;
    const uint16_t blockAlign = numChannels * bitsPerSample / 8;
    const uint32_t dataSize = static_cast<uint32_t>(std::min<uint64_t>(m_dataSize, kMaxDataBytes));
    const uint32_t riffSize = 36 + dataSize;
    const uint32_t fmtSize = 16;
    const uint16_t audioFormat = 1;

    if (std::fseek(m_handle, 0, SEEK_SET) != 0) {
        return false;
    }

    bool ok = true;
    ok = ok && std::fwrite("RIFF", 1, 4, m_handle) == 4;
    ok = ok && std::fwrite(&riffSize, 4, 1, m_handle) == 1;
    ok = ok && std::fwrite("WAVE", 1, 4, m_handle) == 4;
    ok = ok && std::fwrite("fmt ", 1, 4, m_handle) == 4;
    ok = ok && std::fwrite(&fmtSize, 4, 1, m_handle) == 1;
    ok = ok && std::fwrite(&audioFormat, 2, 1, m_handle) == 1;
    ok = ok && std::fwrite(&numChannels, 2, 1, m_handle) == 1;
    ok = ok && std::fwrite(&sampleRate, 4, 1, m_handle) == 1;
    ok = ok && std::fwrite(&byteRate, 4, 1, m_handle) == 1;
    ok = ok && std::fwrite(&blockAlign, 2, 1, m_handle) == 1;
    ok = ok && std::fwrite(&bitsPerSample, 2, 1, m_handle) == 1;
    ok = ok && std::fwrite("data", 1, 4, m_handle) == 4;
    ok = ok && std::fwrite(&dataSize, 4, 1, m_handle) == 1;

    if (ok && std::fseek(m_handle, 0, SEEK_END) != 0) {
        ok = false;
    }
    return ok;
}

bool WavWriter::write(const float* samples, size_t count) {
    if (!m_handle) {
        return false;
    }
    if (count == 0) {
        return true;
    }
    if (m_dataSize + static_cast<uint64_t>(count) * BYTES_PER_FRAME > kMaxDataBytes) {
        std::cerr << "[REC] staging file " << m_path << " reached the RIFF size limit" << std::endl;
        return false;
    }

    std::vector<int16_t> buffer(count);
    for (size_t i = 0; i < count; i++) {
        const float s = std::clamp(samples[i], -1.0f, 1.0f);
        buffer[i] = static_cast<int16_t>(s * kInt16Max);
    }

    const size_t written = std::fwrite(buffer.data(), sizeof(int16_t), count, m_handle);
    m_dataSize += static_cast<uint64_t>(written) * sizeof(int16_t);
    return written == count;
}

bool WavWriter::close() {
    if (!m_handle) {
        return true;
    }
    const bool headerOk = writeHeader();
    const bool closeOk = std::fclose(m_handle) == 0;
    m_handle = nullptr;
    return headerOk && closeOk;
}

double WavWriter::durationSeconds(uint64_t dataBytes, uint32_t sampleRate) {
    if (sampleRate == 0) {
        return 0.0;
    }
    return static_cast<double>(dataBytes / BYTES_PER_FRAME) / static_cast<double>(sampleRate);
}
