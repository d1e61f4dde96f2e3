#pragma once

#include <atomic>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "ThreadSafeQueue.hpp"
#include "OutputHandler.hpp"
#include "LedgerEngine.hpp"
#include "CommandParser.hpp"

extern std::atomic<bool> keepRunning;

/**
 * @brief The command shell: console in, ledger in the middle, streams out.
 * @details Three pillars:
 *   1. Output thread: drains OutputEnvelopes to the data / diagnostic streams.
 *   2. Processing thread: parses lines and drives the LedgerEngine. It is the
 *      only thread that ever touches the engine while run() is active.
 *   3. The calling thread: reads lines from the input stream.
 */
class LedgerApp {
    // Allows the test suite to inspect queues directly without public getters
    friend class LedgerAppE2ESuite;

public:
    explicit LedgerApp(std::ostream& out = std::cout, std::ostream& err = std::cerr);
    ~LedgerApp();

    /**
     * @brief Runs until `in` is exhausted or SIGINT/SIGTERM clears keepRunning.
     * @details A signal also ends a read blocked inside std::getline.
     * @param savePath When set, loaded before the first command and written
     * back after the last one.
     */
    void run(std::istream& in, const std::optional<std::string>& savePath = std::nullopt);

    /**
     * @brief Routes SIGINT/SIGTERM to keepRunning. run() calls this itself.
     * @return false (with a warning) if a handler could not be installed.
     */
    bool installSignalHandlers();

    void stop();

private:
    void loadSave(const std::string& path);
    void writeSave(const std::string& path);

    std::ostream& out_;
    std::ostream& err_;

    std::shared_ptr<ThreadSafeQueue<OutputEnvelope>> outputQueue_;
    std::shared_ptr<ThreadSafeQueue<std::string>> inputQueue_;

    OutputHandler outputHandler_;
    LedgerEngine engine_;
    CommandParser parser_;

    std::thread processingThread_;
    std::thread outputThread_;
};
