#include "decoding_session.h"

#include <openssl/rand.h>

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace {
bool writeJsonFile(const fs::path& path, const nlohmann::json& doc) {
    const fs::path tmp = path.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << doc.dump(2) << "\n";
        if (!out.good()) {
            return false;
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    return !ec;
}

std::string csvCell(const nlohmann::json& value) {
    if (value.is_null()) {
        return std::string();
    }
    if (value.is_string()) {
        return DecodingSessionManager::csvEscape(value.get<std::string>());
    }
    return DecodingSessionManager::csvEscape(value.dump());
}

std::vector<std::string> splitCsvHeader(const std::string& line) {
    std::vector<std::string> columns;
    std::string current;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); i++) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current.push_back('"');
                i++;
            } else if (c == '"') {
                quoted = false;
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            columns.push_back(current);
            current.clear();
        } else if (c != '\r') {
            current.push_back(c);
        }
    }
    columns.push_back(current);
    return columns;
}
}  // namespace

std::string isoTimestampUtc(std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer);
}

DecodingSessionManager::DecodingSessionManager(DecodingSessionOptions options, bool verboseLogging)
    : m_options(std::move(options))
    , m_verboseLogging(verboseLogging)
    , m_flusherRunning(false) {
    if (m_options.bufferSize == 0) {
        m_options.bufferSize = 1;
    }
}

DecodingSessionManager::~DecodingSessionManager() {
    stopFlusher();
    stopSession();
}

std::string DecodingSessionManager::csvEscape(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string escaped = "\"";
    for (char c : value) {
        if (c == '"') {
            escaped += "\"\"";
        } else {
            escaped.push_back(c);
        }
    }
    escaped += "\"";
    return escaped;
}

std::string DecodingSessionManager::generateSessionId() {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm);

    unsigned char randomData[2];
    if (!RAND_bytes(randomData, sizeof(randomData))) {
        std::random_device rd;
        randomData[0] = static_cast<unsigned char>(rd() & 0xFF);
        randomData[1] = static_cast<unsigned char>(rd() & 0xFF);
    }
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "%02x%02x", randomData[0], randomData[1]);
    return std::string(stamp) + "_" + suffix;
}

std::string DecodingSessionManager::startSession(uint64_t frequencyHz, const std::string& mode) {
    stopSession();

    Session session;
    session.id = generateSessionId();
    session.directory = (fs::path(m_options.outputDir) / session.id).string();
    session.startTime = isoTimestampUtc(std::chrono::system_clock::now());
    session.frequencyHz = frequencyHz;
    session.mode = mode;

    std::error_code ec;
    fs::create_directories(session.directory, ec);
    if (ec) {
        std::cerr << "[DECODE] cannot create session directory " << session.directory << ": " << ec.message()
                  << std::endl;
        return std::string();
    }

    nlohmann::json meta;
    meta["session_id"] = session.id;
    meta["start_time"] = session.startTime;
    meta["frequency"] = frequencyHz;
    meta["mode"] = mode;
    meta["enabled_decoders"] = m_options.enabledDecoders;
    if (!writeJsonFile(fs::path(session.directory) / "session.json", meta)) {
        std::cerr << "[DECODE] failed to write session.json for " << session.id << std::endl;
    }

    const std::string id = session.id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_session = std::move(session);
    }
    if (m_verboseLogging) {
        std::cout << "[DECODE] session " << id << " started (" << frequencyHz << " Hz " << mode << ")"
                  << std::endl;
    }
    return id;
}

bool DecodingSessionManager::addDecoding(const std::string& decoderType, nlohmann::json fields) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session) {
        std::cerr << "[DECODE] no active session, dropping " << decoderType << " decoding" << std::endl;
        return false;
    }

    nlohmann::json entry = fields.is_object() ? std::move(fields) : nlohmann::json{{"value", std::move(fields)}};
    entry["timestamp"] = isoTimestampUtc(std::chrono::system_clock::now());
    entry["session_id"] = m_session->id;
    entry["decoder"] = decoderType;

    m_session->buffer.push_back(std::move(entry));
    m_session->total++;
    m_session->byDecoder[decoderType]++;

    if (m_session->buffer.size() >= m_options.bufferSize) {
        flushLocked();
    }
    return true;
}

bool DecodingSessionManager::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return flushLocked();
}

bool DecodingSessionManager::flushLocked() {
    if (!m_session || m_session->buffer.empty()) {
        return true;
    }

    std::vector<nlohmann::json> batch;
    batch.swap(m_session->buffer);

    bool ok = true;
    if (m_options.saveJson && !appendJsonLocked(batch)) {
        std::cerr << "[DECODE] failed to append " << batch.size() << " decodings to decodings.json" << std::endl;
        ok = false;
    }
    if (m_options.saveCsv && !appendCsvLocked(batch)) {
        std::cerr << "[DECODE] failed to append " << batch.size() << " decodings to decodings.csv" << std::endl;
        ok = false;
    }
    if (ok && m_verboseLogging) {
        std::cout << "[DECODE] flushed " << batch.size() << " decodings for " << m_session->id << std::endl;
    }
    return ok;
}

bool DecodingSessionManager::appendJsonLocked(const std::vector<nlohmann::json>& batch) {
    const fs::path path = fs::path(m_session->directory) / "decodings.json";
    nlohmann::json all = nlohmann::json::array();

    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream in(path);
        try {
            in >> all;
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[DECODE] " << path.string() << " unreadable (" << ex.what() << "), starting a new array"
                      << std::endl;
            all = nlohmann::json::array();
        }
        if (!all.is_array()) {
            all = nlohmann::json::array();
        }
    }
    for (const nlohmann::json& entry : batch) {
        all.push_back(entry);
    }
    return writeJsonFile(path, all);
}

bool DecodingSessionManager::appendCsvLocked(const std::vector<nlohmann::json>& batch) {
    const fs::path path = fs::path(m_session->directory) / "decodings.csv";

    std::vector<std::string> columns;
    std::error_code ec;
    const bool exists = fs::exists(path, ec);
    if (exists) {
        std::ifstream in(path);
        std::string header;
        if (std::getline(in, header) && !header.empty()) {
            columns = splitCsvHeader(header);
        }
    }

    const bool writeHeader = columns.empty();
    if (writeHeader) {
        std::set<std::string> keys;
        for (const nlohmann::json& entry : batch) {
            for (auto it = entry.begin(); it != entry.end(); ++it) {
                keys.insert(it.key());
            }
        }
        columns.assign(keys.begin(), keys.end());
    }

    std::ofstream out(path, std::ios::app);
    if (!out.is_open()) {
        return false;
    }
    if (writeHeader) {
        for (size_t i = 0; i < columns.size(); i++) {
            out << (i ? "," : "") << csvEscape(columns[i]);
        }
        out << "\n";
    }
    for (const nlohmann::json& entry : batch) {
        for (size_t i = 0; i < columns.size(); i++) {
            auto it = entry.find(columns[i]);
            out << (i ? "," : "") << (it != entry.end() ? csvCell(*it) : std::string());
        }
        out << "\n";
    }
    return out.good();
}

nlohmann::json DecodingSessionManager::statisticsLocked() const {
    nlohmann::json stats;
    if (!m_session) {
        return stats;
    }
    stats["session_id"] = m_session->id;
    stats["start_time"] = m_session->startTime;
    stats["frequency"] = m_session->frequencyHz;
    stats["mode"] = m_session->mode;
    stats["total_decodings"] = m_session->total;
    stats["by_decoder"] = nlohmann::json::object();
    for (const auto& entry : m_session->byDecoder) {
        stats["by_decoder"][entry.first] = entry.second;
    }
    return stats;
}

nlohmann::json DecodingSessionManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return statisticsLocked();
}

void DecodingSessionManager::stopSession() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session) {
        return;
    }

    flushLocked();
    nlohmann::json stats = statisticsLocked();
    stats["end_time"] = isoTimestampUtc(std::chrono::system_clock::now());
    if (!writeJsonFile(fs::path(m_session->directory) / "statistics.json", stats)) {
        std::cerr << "[DECODE] failed to write statistics for " << m_session->id << std::endl;
    }
    if (m_verboseLogging) {
        std::cout << "[DECODE] session " << m_session->id << " stopped, " << m_session->total << " decodings"
                  << std::endl;
    }
    m_session.reset();
}

bool DecodingSessionManager::isActive() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session.has_value();
}

std::optional<std::string> DecodingSessionManager::currentSessionId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_session) {
        return std::nullopt;
    }
    return m_session->id;
}

std::string DecodingSessionManager::sessionDirectory() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session ? m_session->directory : std::string();
}

void DecodingSessionManager::startFlusher() {
    if (m_flusherRunning.exchange(true)) {
        return;
    }
    m_flusherThread = std::thread([this]() {
        while (m_flusherRunning) {
            {
                std::unique_lock<std::mutex> lock(m_flusherMutex);
                m_flusherCv.wait_for(lock, m_options.flushInterval, [this]() { return !m_flusherRunning.load(); });
            }
            try {
                flush();
            } catch (const std::exception& ex) {
                std::cerr << "[DECODE] periodic flush failed: " << ex.what() << std::endl;
            }
        }
    });
}

void DecodingSessionManager::stopFlusher() {
    {
        std::lock_guard<std::mutex> lock(m_flusherMutex);
        if (!m_flusherRunning.exchange(false)) {
            return;
        }
    }
    m_flusherCv.notify_all();
    if (m_flusherThread.joinable()) {
        m_flusherThread.join();
    }
}
