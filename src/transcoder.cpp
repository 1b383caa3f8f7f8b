#include "transcoder.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace {
void replaceAll(std::string& text, const std::string& needle, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.replace(pos, needle.size(), value);
        pos += value.size();
    }
}
}  // namespace

CommandTranscoder::CommandTranscoder(std::string commandTemplate, std::chrono::seconds timeout,
                                     bool verboseLogging)
    : m_template(std::move(commandTemplate))
    , m_timeout(timeout)
    , m_verboseLogging(verboseLogging) {
}

std::vector<std::string> CommandTranscoder::expandArguments(const std::string& commandTemplate,
                                                            const std::string& inputPath,
                                                            const std::string& outputPath) {
    std::vector<std::string> args;
    std::istringstream iss(commandTemplate);
    std::string token;
    while (iss >> token) {
        replaceAll(token, "{input}", inputPath);
        replaceAll(token, "{output}", outputPath);
        args.push_back(token);
    }
    return args;
}

bool CommandTranscoder::transcode(const std::string& inputPath, const std::string& outputPath) {
    const std::vector<std::string> args = expandArguments(m_template, inputPath, outputPath);
    if (args.empty()) {
        std::cerr << "[CONVERT] empty transcoder command" << std::endl;
        return false;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const std::string& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    if (m_verboseLogging) {
        std::cout << "[CONVERT] running " << args.front() << " for " << inputPath << std::endl;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[CONVERT] fork failed: " << std::strerror(errno) << std::endl;
        return false;
    }
    if (pid == 0) {
        const int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    const auto deadline = std::chrono::steady_clock::now() + m_timeout;
    int status = 0;
    while (true) {
        const pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            std::cerr << "[CONVERT] waitpid failed: " << std::strerror(errno) << std::endl;
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            std::cerr << "[CONVERT] " << args.front() << " timed out after " << m_timeout.count()
                      << " s" << std::endl;
            std::error_code ec;
            fs::remove(outputPath, ec);
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        const int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        std::cerr << "[CONVERT] " << args.front() << " exited with status " << code << std::endl;
        return false;
    }

    std::error_code ec;
    const auto size = fs::file_size(outputPath, ec);
    if (ec || size == 0) {
        std::cerr << "[CONVERT] " << args.front() << " produced no output at " << outputPath << std::endl;
        return false;
    }
    return true;
}

ConversionPipeline::ConversionPipeline(std::shared_ptr<Transcoder> transcoder, bool verboseLogging)
    : m_transcoder(std::move(transcoder))
    , m_verboseLogging(verboseLogging)
    , m_completed(0)
    , m_failed(0) {
    m_worker = std::thread(&ConversionPipeline::run, this);
}

ConversionPipeline::~ConversionPipeline() {
    stop();
}

void ConversionPipeline::setCompletionCallback(CompletionCallback cb) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_completionCallback = std::move(cb);
}

bool ConversionPipeline::submit(ConversionJob job) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[CONVERT] pipeline stopped, leaving " << job.stagingPath << " unconverted"
                      << std::endl;
            return false;
        }
        m_queue.push_back(std::move(job));
    }
    m_cv.notify_one();
    return true;
}

size_t ConversionPipeline::pending() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size() + (m_busy ? 1 : 0);
}

bool ConversionPipeline::drain(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, timeout, [this]() { return m_queue.empty() && !m_busy; });
}

void ConversionPipeline::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            return;
        }
        m_running = false;
        if (!m_queue.empty()) {
            std::cerr << "[CONVERT] stopping with " << m_queue.size()
                      << " capture(s) left as staging files" << std::endl;
            m_queue.clear();
        }
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
    m_idleCv.notify_all();
}

void ConversionPipeline::run() {
    while (true) {
        ConversionJob job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return !m_running || !m_queue.empty(); });
            if (!m_running && m_queue.empty()) {
                break;
            }
            job = std::move(m_queue.front());
            m_queue.pop_front();
            m_busy = true;
        }

        try {
            process(job);
        } catch (const std::exception& ex) {
            m_failed++;
            std::cerr << "[CONVERT] " << job.stagingPath << ": " << ex.what() << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

void ConversionPipeline::process(const ConversionJob& job) {
    bool success = false;
    if (!m_transcoder) {
        std::cerr << "[CONVERT] no transcoder configured, keeping " << job.stagingPath << std::endl;
    } else {
        success = m_transcoder->transcode(job.stagingPath, job.outputPath);
    }

    if (success) {
        std::error_code ec;
        fs::remove(job.stagingPath, ec);
        if (ec) {
            std::cerr << "[CONVERT] could not remove staging file " << job.stagingPath << ": "
                      << ec.message() << std::endl;
        }
        m_completed++;
        if (m_verboseLogging) {
            std::cout << "[CONVERT] saved " << job.outputPath << " (" << job.durationSeconds << " s)"
                      << std::endl;
        }
    } else {
        m_failed++;
        std::cerr << "[CONVERT] conversion failed, staging file kept at " << job.stagingPath << std::endl;
    }

    CompletionCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        cb = m_completionCallback;
    }
    if (cb) {
        cb(job, success);
    }
}
