#include "LedgerEngine.hpp"

#include <cmath>
#include <format>

#include "GrowthEconomy.hpp"
#include "Notation.hpp"
#include "Persistence.hpp"

namespace {

/**
 * @brief Null-safe member lookup: nullptr for a non-object or a missing key.
 * @details Json::Value::operator[] asserts on non-object values, and save
 * documents are untrusted input.
 */
const Json::Value* member(const Json::Value& object, const char* key) {
    if (!object.isObject()) return nullptr;
    return object.find(key, key + std::char_traits<char>::length(key));
}

std::optional<std::string_view> stringMember(const Json::Value& object, const char* key) {
    const Json::Value* v = member(object, key);
    if (v == nullptr || !v->isString()) return std::nullopt;
    const char* begin = nullptr;
    const char* end = nullptr;
    if (!v->getString(&begin, &end)) return std::nullopt;
    return std::string_view(begin, static_cast<size_t>(end - begin));
}

}

LedgerEngine::LedgerEngine(OutputHandler& handler) : outputHandler_(handler) {
    reset();
}

void LedgerEngine::reset() {
    balance_ = DecimalFloat::fromNumber(Config::STARTING_BALANCE);
    lifetime_ = DecimalFloat::zero();
    influence_ = 0;
    savedAt_.reset();
    buyMode_ = BuyMode::X1;
    notation_ = NotationMode::SUFFIX;

    ventures_.clear();
    ventures_.reserve(Config::VENTURES.size());
    for (const auto& tmpl : Config::VENTURES) {
        ventures_.emplace_back(tmpl);
    }
}

// ============================================================================
// SHELL INGRESS
// ============================================================================

void LedgerEngine::processCommand(const Command& cmd) {
    switch (cmd.type) {
        case CommandType::DEPOSIT: {
            auto resp = deposit(DecimalFloat::fromNumber(cmd.amount));
            if (!resp.isSuccess()) {
                outputHandler_.logError(resp.message);
                return;
            }
            emitBalance();
            return;
        }
        case CommandType::QUOTE: {
            auto resp = quote(cmd.ventureId, cmd.mode);
            if (!resp.isSuccess()) {
                outputHandler_.logError(resp.message);
                return;
            }
            const PurchaseQuote& q = *resp.quote;
            outputHandler_.printQuote(q.ventureId, q.count, money(q.cost), q.affordable);
            return;
        }
        case CommandType::BUY: {
            auto resp = buy(cmd.ventureId, cmd.mode);
            if (!resp.isSuccess()) {
                outputHandler_.logError(resp.message);
                return;
            }
            const PurchaseQuote& q = *resp.quote;
            outputHandler_.printPurchase(q.ventureId, q.count, q.owned + q.count,
                                         money(q.cost), money(balance_));
            return;
        }
        case CommandType::SET_MODE:
            setBuyMode(cmd.mode.value_or(BuyMode::X1));
            outputHandler_.printBuyMode(buyModeName(buyMode_));
            return;
        case CommandType::SET_NOTATION:
            setNotation(cmd.notation);
            outputHandler_.printNotation(Format::notationName(notation_));
            return;
        case CommandType::PORTFOLIO:
            emitPortfolio();
            return;
        case CommandType::SAVE:
            outputHandler_.printSave(Persistence::writeDocument(exportState()));
            return;
        case CommandType::LOAD: {
            auto resp = importDocument(cmd.payload);
            if (!resp.isSuccess()) outputHandler_.logError(resp.message);
            emitBalance();
            return;
        }
        case CommandType::RESET:
            reset();
            emitBalance();
            return;
        case CommandType::HIRE: {
            auto resp = hireManager(cmd.ventureId);
            if (!resp.isSuccess()) {
                outputHandler_.logError(resp.message);
                return;
            }
            outputHandler_.printManager(cmd.ventureId, money(resp.amount), money(balance_));
            return;
        }
        case CommandType::ADVANCE: {
            auto resp = advance(cmd.amount);
            if (!resp.isSuccess()) {
                outputHandler_.logError(resp.message);
                return;
            }
            outputHandler_.printAdvance(cmd.amount, money(resp.amount), money(balance_));
            return;
        }
        case CommandType::INCOME:
            outputHandler_.printIncome(money(incomePerSecond()), influence_, pendingInfluence());
            return;
        case CommandType::PRESTIGE: {
            const int64_t gain = pendingInfluence();
            auto resp = prestige();
            if (!resp.isSuccess()) {
                outputHandler_.logError(resp.message);
                return;
            }
            outputHandler_.printPrestige(gain, influence_);
            return;
        }
    }
}

// ============================================================================
// WALLET & PURCHASES
// ============================================================================

LedgerResponse LedgerEngine::deposit(const DecimalFloat& amount) {
    if (!amount.isPositive()) {
        return LedgerResponse::Error(LedgerStatusCode::VALIDATION_FAILURE, "Deposit amount must be positive");
    }
    balance_ = balance_.add(amount);
    lifetime_ = lifetime_.add(amount);
    return LedgerResponse::Success(std::format("Deposited {}", money(amount)));
}

LedgerResponse LedgerEngine::quote(std::string_view ventureId, std::optional<BuyMode> mode) const {
    const Venture* venture = findVenture(ventureId);
    if (!venture) {
        return LedgerResponse::Error(LedgerStatusCode::VENTURE_NOT_FOUND,
                                     std::format("Unknown venture '{}'", ventureId));
    }
    PurchaseQuote q = venture->quote(mode.value_or(buyMode_), balance_);
    return LedgerResponse::Success(std::format("{} x{} costs {}", ventureId, q.count, money(q.cost)), q);
}

/**
 * @details Order matters: the cost is checked with compare() and deducted
 * before the owned count moves, so a failed purchase leaves no trace.
 */
LedgerResponse LedgerEngine::buy(std::string_view ventureId, std::optional<BuyMode> mode) {
    Venture* venture = findVenture(ventureId);
    if (!venture) {
        return LedgerResponse::Error(LedgerStatusCode::VENTURE_NOT_FOUND,
                                     std::format("Unknown venture '{}'", ventureId));
    }

    PurchaseQuote q = venture->quote(mode.value_or(buyMode_), balance_);
    if (q.count <= 0) {
        return LedgerResponse::Error(LedgerStatusCode::NOTHING_AFFORDABLE,
                                     std::format("Cannot afford a single {}", ventureId), q);
    }
    if (q.cost.compare(balance_) > 0) {
        return LedgerResponse::Error(LedgerStatusCode::INSUFFICIENT_FUNDS,
                                     std::format("{} x{} costs {}, balance is {}", ventureId, q.count,
                                                 money(q.cost), money(balance_)), q);
    }

    balance_ = balance_.subtract(q.cost);
    venture->commit(q.count);
    return LedgerResponse::Success(std::format("Bought {} x{}", ventureId, q.count), q);
}

// ============================================================================
// MANAGERS, INCOME & PRESTIGE
// ============================================================================

LedgerResponse LedgerEngine::hireManager(std::string_view ventureId) {
    Venture* venture = findVenture(ventureId);
    if (!venture) {
        return LedgerResponse::Error(LedgerStatusCode::VENTURE_NOT_FOUND,
                                     std::format("Unknown venture '{}'", ventureId));
    }
    if (venture->managed()) {
        return LedgerResponse::Error(LedgerStatusCode::ALREADY_MANAGED,
                                     std::format("{} already has a manager", ventureId));
    }

    const DecimalFloat cost = venture->managerCost();
    if (cost.compare(balance_) > 0) {
        return LedgerResponse::Error(LedgerStatusCode::INSUFFICIENT_FUNDS,
                                     std::format("{} manager costs {}, balance is {}", ventureId,
                                                 money(cost), money(balance_)));
    }

    balance_ = balance_.subtract(cost);
    venture->hireManager();

    auto resp = LedgerResponse::Success(std::format("Hired manager for {}", ventureId));
    resp.amount = cost;
    return resp;
}

LedgerResponse LedgerEngine::advance(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return LedgerResponse::Error(LedgerStatusCode::VALIDATION_FAILURE, "Time step must be positive");
    }

    const DecimalFloat gain = incomePerSecond().scale(seconds);
    balance_ = balance_.add(gain);
    lifetime_ = lifetime_.add(gain);

    auto resp = LedgerResponse::Success(std::format("Earned {}", money(gain)));
    resp.amount = gain;
    return resp;
}

DecimalFloat LedgerEngine::applyOfflineProgress(double elapsedSeconds) {
    const DecimalFloat gain = Growth::offlineGain(incomePerSecond(), elapsedSeconds);
    balance_ = balance_.add(gain);
    lifetime_ = lifetime_.add(gain);
    return gain;
}

double LedgerEngine::profitMultiplier() const noexcept {
    return Growth::influenceProfitMultiplier(influence_);
}

DecimalFloat LedgerEngine::incomePerSecond() const {
    const double multiplier = profitMultiplier();
    DecimalFloat total = DecimalFloat::zero();
    for (const auto& venture : ventures_) {
        total = total.add(venture.incomePerSecond(multiplier));
    }
    return total;
}

int64_t LedgerEngine::pendingInfluence() const noexcept {
    return Growth::influenceGain(lifetime_);
}

LedgerResponse LedgerEngine::prestige() {
    const int64_t gain = pendingInfluence();
    if (gain <= 0) {
        return LedgerResponse::Error(LedgerStatusCode::NOTHING_TO_CLAIM,
                                     std::format("Lifetime {} is too small to earn influence", money(lifetime_)));
    }

    const int64_t keptInfluence = influence_ + gain;
    const DecimalFloat keptLifetime = lifetime_;
    const BuyMode keptMode = buyMode_;
    const NotationMode keptNotation = notation_;

    reset();
    influence_ = keptInfluence;
    lifetime_ = keptLifetime;
    buyMode_ = keptMode;
    notation_ = keptNotation;

    return LedgerResponse::Success(std::format("Gained {} influence", gain));
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<int64_t> LedgerEngine::owned(std::string_view ventureId) const {
    const Venture* venture = findVenture(ventureId);
    if (!venture) return std::nullopt;
    return venture->owned();
}

std::optional<bool> LedgerEngine::managed(std::string_view ventureId) const {
    const Venture* venture = findVenture(ventureId);
    if (!venture) return std::nullopt;
    return venture->managed();
}

LedgerSnapshot LedgerEngine::snapshot() const {
    LedgerSnapshot snap;
    snap.balance = balance_;
    snap.lifetime = lifetime_;
    snap.incomePerSecond = incomePerSecond();
    snap.influence = influence_;
    snap.buyMode = buyMode_;
    snap.notation = notation_;
    snap.ventures.reserve(ventures_.size());
    for (const auto& venture : ventures_) {
        snap.ventures.push_back(venture.snapshot());
    }
    return snap;
}

const Venture* LedgerEngine::findVenture(std::string_view id) const {
    for (const auto& venture : ventures_) {
        if (venture.info().id == id) return &venture;
    }
    return nullptr;
}

Venture* LedgerEngine::findVenture(std::string_view id) {
    for (auto& venture : ventures_) {
        if (venture.info().id == id) return &venture;
    }
    return nullptr;
}

std::string LedgerEngine::money(const DecimalFloat& value) const {
    return Format::money(value, notation_);
}

void LedgerEngine::emitBalance() {
    outputHandler_.printBalance(money(balance_), money(lifetime_));
}

void LedgerEngine::emitPortfolio() {
    emitBalance();
    for (const auto& venture : ventures_) {
        outputHandler_.printVenture(venture.info().id, venture.owned(), money(venture.nextPrice()));
    }
}

// ============================================================================
// PERSISTENCE
// ============================================================================

Json::Value LedgerEngine::exportState() const {
    Json::Value root(Json::objectValue);
    root["v"] = Config::SAVE_VERSION;
    root["money"] = Persistence::toJson(balance_);
    root["lifetime"] = Persistence::toJson(lifetime_);
    root["influence"] = static_cast<Json::Int64>(influence_);

    Json::Value settings(Json::objectValue);
    settings["notation"] = std::string(Format::notationName(notation_));
    settings["buyMode"] = std::string(buyModeName(buyMode_));
    root["settings"] = settings;

    Json::Value businesses(Json::arrayValue);
    for (const auto& venture : ventures_) {
        Json::Value entry(Json::objectValue);
        entry["id"] = std::string(venture.info().id);
        entry["owned"] = static_cast<Json::Int64>(venture.owned());
        entry["manager"] = venture.managed();
        businesses.append(entry);
    }
    root["businesses"] = businesses;
    return root;
}

LedgerResponse LedgerEngine::importDocument(std::string_view document) {
    std::string errors;
    auto root = Persistence::parseDocument(document, errors);
    if (!root) {
        return LedgerResponse::Error(LedgerStatusCode::CORRUPT_SAVE, std::format("Save parse failed: {}", errors));
    }
    return importState(*root);
}

LedgerResponse LedgerEngine::importState(const Json::Value& root) {
    // Validate before touching anything: a rejected load keeps the live ledger.
    if (!root.isObject()) {
        return LedgerResponse::Error(LedgerStatusCode::CORRUPT_SAVE, "Save document is not a JSON object");
    }
    reset();

    if (const Json::Value* version = member(root, "v"); version && version->isInt()
        && version->asInt() > Config::SAVE_VERSION) {
        outputHandler_.logWarning(std::format("Save version {} is newer than {}", version->asInt(), Config::SAVE_VERSION));
    }

    // Missing or damaged money fields load as zero, not as the starting balance.
    auto loadAmount = [&](const char* key) {
        const Json::Value* field = member(root, key);
        if (!field || !field->isObject()) {
            outputHandler_.logWarning(std::format("Save field '{}' missing, loaded as 0", key));
            return DecimalFloat::zero();
        }
        return Persistence::fromJson(*field);
    };
    balance_ = loadAmount("money");
    lifetime_ = loadAmount("lifetime");

    // Absent in version 1 saves; only a present but unusable value warns.
    if (const Json::Value* influence = member(root, "influence")) {
        double held = influence->isNumeric() ? influence->asDouble() : -1.0;
        if (!std::isfinite(held) || held < 0.0 || held > Config::MAX_EXPONENT) {
            outputHandler_.logWarning("Save has invalid influence, loaded as 0");
            held = 0.0;
        }
        influence_ = static_cast<int64_t>(std::trunc(held));
    }

    if (const Json::Value* stamp = member(root, "savedAt"); stamp && stamp->isInt64()) {
        savedAt_ = stamp->asInt64();
    }

    if (const Json::Value* settings = member(root, "settings")) {
        if (auto name = stringMember(*settings, "notation")) {
            notation_ = Format::parseNotation(*name).value_or(NotationMode::SUFFIX);
        }
        if (auto name = stringMember(*settings, "buyMode")) {
            buyMode_ = parseBuyMode(*name).value_or(BuyMode::X1);
        }
    }

    const Json::Value* businesses = member(root, "businesses");
    if (businesses && businesses->isArray()) {
        for (const auto& entry : *businesses) {
            auto id = stringMember(entry, "id");
            if (!id) continue;
            Venture* venture = findVenture(*id);
            if (!venture) {
                outputHandler_.logWarning(std::format("Save names unknown venture '{}', skipped", *id));
                continue;
            }

            const Json::Value* count = member(entry, "owned");
            double owned = (count && count->isNumeric()) ? count->asDouble() : 0.0;
            if (!std::isfinite(owned) || owned < 0.0 || owned > Config::MAX_EXPONENT) {
                outputHandler_.logWarning(std::format("Save has invalid owned count for '{}', loaded as 0", *id));
                owned = 0.0;
            }
            const Json::Value* manager = member(entry, "manager");
            const bool managed = manager && manager->isBool() && manager->asBool();
            venture->restore(static_cast<int64_t>(std::trunc(owned)), managed);
        }
    }

    return LedgerResponse::Success("Save restored");
}
