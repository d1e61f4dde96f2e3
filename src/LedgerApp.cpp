#include "LedgerApp.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <format>
#include <fstream>
#include <queue>
#include <sstream>

#include <pthread.h>
#include <signal.h>

#include "Notation.hpp"
#include "Persistence.hpp"

std::atomic<bool> keepRunning{true};

namespace {

int64_t unixNow() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        keepRunning = false;
    }
}

/**
 * @brief Blocks SIGINT/SIGTERM on the calling thread until released.
 * @details Threads spawned meanwhile inherit the mask, so a process-wide
 * Ctrl-C is always delivered to the console thread, the one blocked in read().
 */
class ShutdownSignalMask {
public:
    ShutdownSignalMask() {
        sigset_t blocked;
        sigemptyset(&blocked);
        sigaddset(&blocked, SIGINT);
        sigaddset(&blocked, SIGTERM);
        active_ = pthread_sigmask(SIG_BLOCK, &blocked, &previous_) == 0;
    }
    ~ShutdownSignalMask() { release(); }

    void release() {
        if (active_) pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
        active_ = false;
    }

    ShutdownSignalMask(const ShutdownSignalMask&) = delete;
    ShutdownSignalMask& operator=(const ShutdownSignalMask&) = delete;

private:
    sigset_t previous_{};
    bool active_ = false;
};

}

LedgerApp::LedgerApp(std::ostream& out, std::ostream& err)
    : out_(out),
      err_(err),
      outputQueue_(std::make_shared<ThreadSafeQueue<OutputEnvelope>>()),
      inputQueue_(std::make_shared<ThreadSafeQueue<std::string>>()),
      outputHandler_(outputQueue_),
      engine_(outputHandler_),
      parser_(outputHandler_) {}

LedgerApp::~LedgerApp() {
    stop();
}

/**
 * @details Shutdown is ordered: the input queue drains into the engine first,
 * then the output queue drains to the streams, so no response is lost.
 */
void LedgerApp::stop() {
    if (inputQueue_) inputQueue_->stop();
    if (processingThread_.joinable()) processingThread_.join();

    if (outputQueue_) outputQueue_->stop();
    if (outputThread_.joinable()) outputThread_.join();
}

/**
 * @details No SA_RESTART: the read() under std::getline fails with EINTR
 * instead of resuming, so the console loop sees the stop without another line.
 */
bool LedgerApp::installSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    for (int signal : {SIGINT, SIGTERM}) {
        if (sigaction(signal, &action, nullptr) != 0) {
            outputHandler_.logWarning(std::format("Cannot install handler for signal {}: {}",
                                                  signal, std::strerror(errno)));
            return false;
        }
    }
    return true;
}

void LedgerApp::run(std::istream& in, const std::optional<std::string>& savePath) {
    keepRunning = true;
    ShutdownSignalMask workerMask;

    // Pillar 1: Output Tape (batched writes, one flush per batch)
    outputThread_ = std::thread([this]() {
        std::queue<OutputEnvelope> localBatch;
        while (outputQueue_->pop_all(localBatch)) {
            while (!localBatch.empty()) {
                const auto& env = localBatch.front();
                if (env.type == MsgType::Data) {
                    out_.write(env.buffer.data(), static_cast<std::streamsize>(env.length));
                } else {
                    err_.write(env.buffer.data(), static_cast<std::streamsize>(env.length));
                }
                localBatch.pop();
            }
            out_.flush();
            err_.flush();
        }
    });

    // Safe: the processing thread has not started yet.
    if (savePath) loadSave(*savePath);

    // Pillar 2: The Ledger (blocking pop; the shell is interactive, not latency bound)
    processingThread_ = std::thread([this]() {
        while (auto raw = inputQueue_->pop()) {
            parser_.parseAndExecute(*raw, engine_);
        }
    });

    // Pillar 3: Console. Only this thread takes the shutdown signals.
    workerMask.release();
    installSignalHandlers();

    std::string line;
    while (keepRunning && std::getline(in, line)) {
        inputQueue_->push(std::move(line));
    }
    if (!keepRunning) outputHandler_.logWarning("Interrupted, shutting down");

    inputQueue_->stop();
    if (processingThread_.joinable()) processingThread_.join();

    // Safe again: processing has finished.
    if (savePath) writeSave(*savePath);

    stop();
}

void LedgerApp::loadSave(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        outputHandler_.logWarning(std::format("No save at '{}', starting fresh", path));
        return;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto resp = engine_.importDocument(buffer.str());
    if (!resp.isSuccess()) {
        outputHandler_.logError(std::format("Load '{}': {}", path, resp.message));
        return;
    }

    // Managed ventures kept earning while the shell was down.
    if (auto savedAt = engine_.savedAt()) {
        const int64_t away = unixNow() - *savedAt;
        DecimalFloat gain = engine_.applyOfflineProgress(static_cast<double>(away));
        if (gain.isPositive()) {
            const auto credited = std::min(away, static_cast<int64_t>(Config::OFFLINE_CAP_SECONDS));
            outputHandler_.printOffline(credited, Format::money(gain, engine_.notation()));
        }
    }
}

void LedgerApp::writeSave(const std::string& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        outputHandler_.logError(std::format("Cannot open '{}' for writing", path));
        return;
    }

    Json::Value root = engine_.exportState();
    root["savedAt"] = static_cast<Json::Int64>(unixNow());
    file << Persistence::writeDocument(root) << '\n';
    if (!file) {
        outputHandler_.logError(std::format("Write to '{}' failed", path));
    }
}
