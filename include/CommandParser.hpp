#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "LedgerEngine.hpp"
#include "OutputHandler.hpp"
#include "Types.hpp"

/**
 * @brief Line-protocol front end of the shell.
 * @details One command per line, comma separated:
 *   D, <amount>            deposit (rest of line is one friendly amount)
 *   Q, <venture>[, <mode>] quote
 *   B, <venture>[, <mode>] buy
 *   M, <mode>              set buy mode (x1, x10, x100, max)
 *   N, <suffix|sci>        set notation
 *   P                      portfolio
 *   S                      save
 *   L, <json>              load (rest of line is the document)
 *   F                      reset
 *   H, <venture>           hire a manager
 *   T, <seconds>           let managed ventures earn for a while
 *   I                      income per second and influence
 *   R                      prestige: trade lifetime earnings for influence
 */
class CommandParser {
public:
    explicit CommandParser(OutputHandler& handler);

    /**
     * @brief Parses one line; rejected lines are reported on the error channel.
     */
    std::optional<Command> parse(const std::string& raw);

    bool parseAndExecute(const std::string& raw, LedgerEngine& engine);

protected:
    std::string_view get_token(std::string_view& data);
    std::string_view trim(std::string_view sv);

private:
    OutputHandler& outputHandler_;
};
