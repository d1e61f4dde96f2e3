#include "CommandParser.hpp"

#include <cctype>
#include <format>

#include "Constants.hpp"
#include "FriendlyInput.hpp"
#include "Notation.hpp"

CommandParser::CommandParser(OutputHandler& handler) : outputHandler_(handler) {}

std::string_view CommandParser::trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
}

/**
 * @brief Non-Destructive Tokenizer
 * @details Slices the next comma-separated field off `data` without copying
 * and advances the window past the comma.
 */
std::string_view CommandParser::get_token(std::string_view& data) {
    if (data.empty()) return {};

    size_t pos = data.find(',');
    std::string_view token;

    if (pos == std::string_view::npos) {
        token = data;
        data = {};
    } else {
        token = data.substr(0, pos);
        data.remove_prefix(pos + 1);
    }

    return trim(token);
}

std::optional<Command> CommandParser::parse(const std::string& raw) {
    std::string_view data = trim(raw);
    if (data.empty()) return std::nullopt;

    std::string_view type_sv = get_token(data);
    if (type_sv.size() != 1) [[unlikely]] {
        outputHandler_.logError(std::format("Parse Error: Unknown command '{}'", type_sv));
        return std::nullopt;
    }
    const char type = static_cast<char>(std::toupper(static_cast<unsigned char>(type_sv[0])));

    Command cmd;

    if (type == 'Q' || type == 'B') [[likely]] {
        // Expected Format: Q|B, venture[, mode]
        std::string_view id_sv = get_token(data);
        std::string_view mode_sv = get_token(data);

        if (id_sv.empty()) [[unlikely]] {
            outputHandler_.logError(std::format("Parse Error: Missing venture in: {}", raw));
            return std::nullopt;
        }
        if (!Config::isSupported(id_sv)) [[unlikely]] {
            outputHandler_.logError(std::format("Parse Error: Unknown venture '{}'", id_sv));
            return std::nullopt;
        }
        cmd.type = (type == 'Q') ? CommandType::QUOTE : CommandType::BUY;
        cmd.ventureId = std::string(id_sv);

        if (!mode_sv.empty()) {
            cmd.mode = parseBuyMode(mode_sv);
            if (!cmd.mode) [[unlikely]] {
                outputHandler_.logError(std::format("Parse Error: Invalid buy mode '{}'", mode_sv));
                return std::nullopt;
            }
        }
    }
    else if (type == 'D') {
        // The amount may carry thousands separators, so it is the whole remainder.
        std::string_view amount_sv = trim(data);
        data = {};

        auto amount = FriendlyInput::parseAmount(amount_sv);
        if (!amount || *amount <= 0.0) [[unlikely]] {
            outputHandler_.logError(std::format("Parse Error: Invalid amount '{}'", amount_sv));
            return std::nullopt;
        }
        cmd.type = CommandType::DEPOSIT;
        cmd.amount = *amount;
    }
    else if (type == 'H') {
        std::string_view id_sv = get_token(data);
        if (id_sv.empty()) [[unlikely]] {
            outputHandler_.logError(std::format("Parse Error: Missing venture in: {}", raw));
            return std::nullopt;
        }
        if (!Config::isSupported(id_sv)) [[unlikely]] {
            outputHandler_.logError(std::format("Parse Error: Unknown venture '{}'", id_sv));
            return std::nullopt;
        }
        cmd.type = CommandType::HIRE;
        cmd.ventureId = std::string(id_sv);
    }
    else if (type == 'T') {
        std::string_view seconds_sv = get_token(data);
        auto seconds = FriendlyInput::parseAmount(seconds_sv);
        if (!seconds || *seconds <= 0.0) [[unlikely]] {
            outputHandler_.logError(std::format("Parse Error: Invalid duration '{}'", seconds_sv));
            return std::nullopt;
        }
        cmd.type = CommandType::ADVANCE;
        cmd.amount = *seconds;
    }
    else if (type == 'M') {
        std::string_view mode_sv = get_token(data);
        cmd.mode = parseBuyMode(mode_sv);
        if (!cmd.mode) [[unlikely]] {
            outputHandler_.logError(std::format("Parse Error: Invalid buy mode '{}'", mode_sv));
            return std::nullopt;
        }
        cmd.type = CommandType::SET_MODE;
    }
    else if (type == 'N') {
        std::string_view name_sv = get_token(data);
        auto notation = Format::parseNotation(name_sv);
        if (!notation) [[unlikely]] {
            outputHandler_.logError(std::format("Parse Error: Invalid notation '{}'", name_sv));
            return std::nullopt;
        }
        cmd.type = CommandType::SET_NOTATION;
        cmd.notation = *notation;
    }
    else if (type == 'L') {
        // JSON contains commas; the document is the whole remainder.
        std::string_view doc_sv = trim(data);
        data = {};
        if (doc_sv.empty()) [[unlikely]] {
            outputHandler_.logError("Parse Error: Missing save document");
            return std::nullopt;
        }
        cmd.type = CommandType::LOAD;
        cmd.payload = std::string(doc_sv);
    }
    else if (type == 'P') {
        cmd.type = CommandType::PORTFOLIO;
    }
    else if (type == 'S') {
        cmd.type = CommandType::SAVE;
    }
    else if (type == 'F') {
        cmd.type = CommandType::RESET;
    }
    else if (type == 'I') {
        cmd.type = CommandType::INCOME;
    }
    else if (type == 'R') {
        cmd.type = CommandType::PRESTIGE;
    }
    else [[unlikely]] {
        outputHandler_.logError(std::format("Parse Error: Unknown command '{}'", type));
        return std::nullopt;
    }

    // A strict parser: nothing may follow the expected fields.
    if (!data.empty()) [[unlikely]] {
        outputHandler_.logError(std::format("Parse Error: Extra fields in: {}", raw));
        return std::nullopt;
    }

    return cmd;
}

bool CommandParser::parseAndExecute(const std::string& raw, LedgerEngine& engine) {
    auto cmd = parse(raw);
    if (!cmd) return false;

    engine.processCommand(*cmd);
    return true;
}
