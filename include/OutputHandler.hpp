#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <memory>
#include <string_view>

#include "Constants.hpp"
#include "ThreadSafeQueue.hpp"

/**
 * @brief Output Category
 * @details Data lines go to stdout, diagnostics to stderr. The ledger never
 * needs to know which stream is which.
 */
enum class MsgType {
    Data,   // Shell responses (stdout)
    Error   // Errors and warnings (stderr)
};

/**
 * @brief Fixed-size message carrier.
 * @details A std::array instead of std::string keeps the envelope trivially
 * copyable; pushing it is one contiguous copy and no heap allocation.
 */
struct OutputEnvelope {
    std::array<char, Config::Output::ENVELOPE_SIZE> buffer;
    size_t length{0};
    MsgType type{MsgType::Data};

    OutputEnvelope() = default;
    OutputEnvelope(MsgType t) noexcept : type(t) { buffer.fill(0); }

    std::string_view view() const noexcept { return {buffer.data(), length}; }
};

/**
 * @brief The Asynchronous Output Gateway
 * @details Formats every response and diagnostic line into an OutputEnvelope
 * and hands it to the output thread, which owns the actual streams.
 */
class OutputHandler {
private:
    std::shared_ptr<ThreadSafeQueue<OutputEnvelope>> queue_;

    /**
     * @brief Stack-formats one line with std::format_to_n and enqueues it.
     * @details Lines longer than the envelope are truncated, never overrun.
     */
    template <typename... Args>
    void enqueue(MsgType type, std::format_string<Args...> fmt, Args&&... args) noexcept {
        OutputEnvelope env(type);

        auto result = std::format_to_n(env.buffer.data(),
                                       env.buffer.size() - 1,
                                       fmt,
                                       std::forward<Args>(args)...);

        env.length = std::min(static_cast<size_t>(result.size), env.buffer.size() - 1);
        env.buffer[env.length] = '\0';

        queue_->push(std::move(env));
    }

public:
    explicit OutputHandler(std::shared_ptr<ThreadSafeQueue<OutputEnvelope>> queue) : queue_(std::move(queue)) {}

    // --- Shell Responses ---

    /**
     * @brief Wallet line (W): balance and lifetime credited total.
     */
    void printBalance(std::string_view balance, std::string_view lifetime) noexcept {
        enqueue(MsgType::Data, "W, {}, {}\n", balance, lifetime);
    }

    /**
     * @brief Quote line (Q): venture, run length, total cost, Y/N affordable.
     */
    void printQuote(std::string_view id, int64_t count, std::string_view cost, bool affordable) noexcept {
        enqueue(MsgType::Data, "Q, {}, {}, {}, {}\n", id, count, cost, affordable ? 'Y' : 'N');
    }

    /**
     * @brief Purchase line (B): venture, units bought, units now owned, amount
     * paid, remaining balance.
     */
    void printPurchase(std::string_view id, int64_t count, int64_t owned,
                       std::string_view cost, std::string_view balance) noexcept {
        enqueue(MsgType::Data, "B, {}, {}, {}, {}, {}\n", id, count, owned, cost, balance);
    }

    void printVenture(std::string_view id, int64_t owned, std::string_view nextPrice) noexcept {
        enqueue(MsgType::Data, "V, {}, {}, {}\n", id, owned, nextPrice);
    }

    void printBuyMode(std::string_view mode) noexcept {
        enqueue(MsgType::Data, "M, {}\n", mode);
    }

    void printNotation(std::string_view notation) noexcept {
        enqueue(MsgType::Data, "N, {}\n", notation);
    }

    void printSave(std::string_view document) noexcept {
        enqueue(MsgType::Data, "S, {}\n", document);
    }

    /**
     * @brief Manager line (H): venture, price paid, remaining balance.
     */
    void printManager(std::string_view id, std::string_view cost, std::string_view balance) noexcept {
        enqueue(MsgType::Data, "H, {}, {}, {}\n", id, cost, balance);
    }

    /**
     * @brief Time line (T): seconds simulated, amount earned, new balance.
     */
    void printAdvance(double seconds, std::string_view gain, std::string_view balance) noexcept {
        enqueue(MsgType::Data, "T, {:g}, {}, {}\n", seconds, gain, balance);
    }

    // Offline line (O): seconds credited since the save was written, amount earned.
    void printOffline(int64_t seconds, std::string_view gain) noexcept {
        enqueue(MsgType::Data, "O, {}, {}\n", seconds, gain);
    }

    /**
     * @brief Income line (I): income per second, influence held, influence a
     * prestige would award now.
     */
    void printIncome(std::string_view perSecond, int64_t influence, int64_t pending) noexcept {
        enqueue(MsgType::Data, "I, {}, {}, {}\n", perSecond, influence, pending);
    }

    void printPrestige(int64_t gained, int64_t influence) noexcept {
        enqueue(MsgType::Data, "R, {}, {}\n", gained, influence);
    }

    // --- Diagnostics ---

    void logError(std::string_view err) noexcept {
        enqueue(MsgType::Error, "[ERROR] {}\n", err);
    }

    void logWarning(std::string_view msg) noexcept {
        enqueue(MsgType::Error, "[WARN] {}\n", msg);
    }
};
