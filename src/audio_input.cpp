#include "audio_input.h"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

#include "signal_recorder.h"

namespace {
constexpr float kDcBlockerAlpha = 0.999f;

#if defined(AUTOSCAN_HAS_PORTAUDIO)
std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parseDeviceIndex(const std::string& selector, int& outIndex) {
    if (selector.empty()) {
        return false;
    }
    for (char c : selector) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    outIndex = std::stoi(selector);
    return true;
}

PaDeviceIndex selectInputDevice(const std::string& selector) {
    if (selector.empty()) {
        return Pa_GetDefaultInputDevice();
    }

    int requestedIndex = -1;
    if (parseDeviceIndex(selector, requestedIndex)) {
        const int deviceCount = Pa_GetDeviceCount();
        if (requestedIndex >= 0 && requestedIndex < deviceCount) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(requestedIndex);
            if (info && info->maxInputChannels > 0) {
                return static_cast<PaDeviceIndex>(requestedIndex);
            }
        }
        return paNoDevice;
    }

    const std::string needle = toLower(selector);
    const int deviceCount = Pa_GetDeviceCount();
    for (int i = 0; i < deviceCount; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0 || !info->name) {
            continue;
        }
        if (toLower(info->name).find(needle) != std::string::npos) {
            return static_cast<PaDeviceIndex>(i);
        }
    }
    return paNoDevice;
}

void printInputDeviceList() {
    const int deviceCount = Pa_GetDeviceCount();
    std::cerr << "Available PortAudio input devices:\n";
    for (int i = 0; i < deviceCount; i++) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info || info->maxInputChannels <= 0 || !info->name) {
            continue;
        }
        std::cerr << "  [" << i << "] " << info->name << "\n";
    }
}
#endif
}  // namespace

PcmStreamSource::PcmStreamSource(int fd, size_t blockSamples, int pollTimeoutMs)
    : m_fd(fd)
    , m_blockSamples(blockSamples > 0 ? blockSamples : 1200)
    , m_pollTimeoutMs(pollTimeoutMs) {
}

bool PcmStreamSource::open() {
    if (m_fd < 0) {
        std::cerr << "[AUDIO] invalid input descriptor" << std::endl;
        return false;
    }
    m_pending.clear();
    return true;
}

bool PcmStreamSource::read(std::vector<float>& block) {
    block.clear();
    const size_t wantBytes = m_blockSamples * 2;

    while (m_pending.size() < wantBytes) {
        struct pollfd pfd;
        pfd.fd = m_fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int ready = ::poll(&pfd, 1, m_pollTimeoutMs);
        if (ready < 0) {
            if (errno == EINTR) {
                return true;
            }
            std::cerr << "[AUDIO] poll failed: " << std::strerror(errno) << std::endl;
            return false;
        }
        if (ready == 0) {
            return true;
        }

        uint8_t buffer[4096];
        const size_t toRead = std::min(sizeof(buffer), wantBytes - m_pending.size());
        const ssize_t n = ::read(m_fd, buffer, toRead);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                return true;
            }
            std::cerr << "[AUDIO] read failed: " << std::strerror(errno) << std::endl;
            return false;
        }
        if (n == 0) {
            break;
        }
        m_pending.insert(m_pending.end(), buffer, buffer + n);
    }

    const size_t frames = m_pending.size() / 2;
    if (frames == 0) {
        return false;
    }
    block.resize(frames);
    for (size_t i = 0; i < frames; i++) {
        const int16_t sample = static_cast<int16_t>(static_cast<uint16_t>(m_pending[2 * i]) |
                                                    (static_cast<uint16_t>(m_pending[2 * i + 1]) << 8));
        block[i] = static_cast<float>(sample) / kInt16Scale;
    }
    m_pending.erase(m_pending.begin(), m_pending.begin() + static_cast<std::ptrdiff_t>(frames * 2));
    return true;
}

#if defined(AUTOSCAN_HAS_PORTAUDIO)
PortAudioSource::PortAudioSource(std::string deviceSelector, uint32_t sampleRate, size_t blockSamples,
                                 bool verboseLogging)
    : m_deviceSelector(std::move(deviceSelector))
    , m_sampleRate(sampleRate)
    , m_blockSamples(blockSamples > 0 ? blockSamples : 1200)
    , m_verboseLogging(verboseLogging)
    , m_stream(nullptr)
    , m_initialized(false) {
}

PortAudioSource::~PortAudioSource() {
    close();
}

bool PortAudioSource::open() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "[AUDIO] PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }
    m_initialized = true;

    PaStreamParameters inputParams;
    inputParams.device = selectInputDevice(m_deviceSelector);
    if (inputParams.device == paNoDevice) {
        std::cerr << "[AUDIO] PortAudio device not found for selector: " << m_deviceSelector << std::endl;
        printInputDeviceList();
        close();
        return false;
    }
    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(inputParams.device);
    if (!deviceInfo) {
        std::cerr << "[AUDIO] PortAudio failed to get device info" << std::endl;
        close();
        return false;
    }
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = deviceInfo->defaultHighInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;
    if (m_verboseLogging) {
        std::cout << "[AUDIO] capturing from [" << inputParams.device << "]: " << deviceInfo->name << std::endl;
    }

    err = Pa_OpenStream(&m_stream, &inputParams, nullptr, m_sampleRate, m_blockSamples, paClipOff, nullptr,
                        nullptr);
    if (err != paNoError) {
        std::cerr << "[AUDIO] PortAudio open failed: " << Pa_GetErrorText(err) << std::endl;
        m_stream = nullptr;
        close();
        return false;
    }
    err = Pa_StartStream(m_stream);
    if (err != paNoError) {
        std::cerr << "[AUDIO] PortAudio start failed: " << Pa_GetErrorText(err) << std::endl;
        close();
        return false;
    }
    return true;
}

bool PortAudioSource::read(std::vector<float>& block) {
    if (!m_stream) {
        return false;
    }
    block.resize(m_blockSamples);
    const PaError err = Pa_ReadStream(m_stream, block.data(), m_blockSamples);
    if (err == paInputOverflowed) {
        if (m_verboseLogging) {
            std::cerr << "[AUDIO] input overflow" << std::endl;
        }
        return true;
    }
    if (err != paNoError) {
        std::cerr << "[AUDIO] PortAudio read failed: " << Pa_GetErrorText(err) << std::endl;
        block.clear();
        return false;
    }
    return true;
}

void PortAudioSource::close() {
    if (m_stream) {
        Pa_StopStream(m_stream);
        Pa_CloseStream(m_stream);
        m_stream = nullptr;
    }
    if (m_initialized) {
        Pa_Terminate();
        m_initialized = false;
    }
}
#endif

bool listCaptureDevices() {
#if defined(AUTOSCAN_HAS_PORTAUDIO)
    const PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }
    printInputDeviceList();
    Pa_Terminate();
    return true;
#else
    std::cerr << "No capture backend compiled in; only stdin PCM input is available." << std::endl;
    return false;
#endif
}

AudioIngest::AudioIngest(AudioSource& source, SignalRecorder& recorder, FrequencyProvider frequency,
                         size_t blockSamples, bool dcBlock, bool verboseLogging)
    : m_source(source)
    , m_recorder(recorder)
    , m_frequency(std::move(frequency))
    , m_blockSamples(blockSamples > 0 ? blockSamples : 1200)
    , m_verboseLogging(verboseLogging)
    , m_running(false)
    , m_finished(false)
    , m_blocks(0) {
    if (dcBlock) {
        m_dcBlocker.init(kDcBlockerAlpha);
    }
}

AudioIngest::~AudioIngest() {
    stop();
}

void AudioIngest::process(std::vector<float>& block) {
    if (block.empty()) {
        return;
    }
    if (m_dcBlocker.ready()) {
        m_dcBlocker.executeBlock(block.data(), block.size());
    }
    std::optional<uint64_t> frequency;
    if (m_frequency) {
        frequency = m_frequency();
    }
    m_recorder.submitAudioChunk(block.data(), block.size(), frequency);
    m_blocks++;
}

bool AudioIngest::start() {
    if (m_running.exchange(true)) {
        return true;
    }
    if (!m_source.open()) {
        m_running = false;
        return false;
    }
    m_finished = false;
    m_thread = std::thread(&AudioIngest::run, this);
    std::cout << "[AUDIO] ingesting from " << m_source.name() << std::endl;
    return true;
}

void AudioIngest::stop() {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
        m_source.close();
    }
}

void AudioIngest::run() {
    std::vector<float> block;
    block.reserve(m_blockSamples);
    while (m_running) {
        try {
            if (!m_source.read(block)) {
                std::cout << "[AUDIO] " << m_source.name() << " ended" << std::endl;
                m_finished = true;
                break;
            }
            process(block);
        } catch (const std::exception& ex) {
            std::cerr << "[AUDIO] ingest failed: " << ex.what() << std::endl;
        }
    }
    if (m_verboseLogging) {
        std::cout << "[AUDIO] ingest stopped after " << m_blocks << " blocks" << std::endl;
    }
}
