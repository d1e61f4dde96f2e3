#pragma once

#include <array>
#include <algorithm>
#include <cstdint>
#include <string_view>

/**
 * @namespace Config
 * @brief Global Ledger Configuration & Numeric Guardrails
 * @details
 * Every tunable that changes observed game balance or numeric behaviour lives
 * here so it is named once and shared by the core, the ledger and the tests.
 */
namespace Config {
    // --- DECIMAL-FLOAT POLICY ---

    /**
     * @note Precision cutoff for add/subtract.
     * When two operands are more than 12 orders of magnitude apart the smaller
     * one is below the resolution of the larger one's mantissa and is dropped.
     * Changing this value changes observed balances.
     */
    inline constexpr int64_t PRECISION_CUTOFF_EXPONENT = 12;

    /**
     * @note Largest exponent magnitude accepted by the normalizer.
     * 2^53 is the last integer a double carries exactly; anything past it is
     * sanitized like a non-finite input.
     */
    inline constexpr double MAX_EXPONENT = 9'007'199'254'740'992.0;

    // pow10() below this exponent is indistinguishable from zero.
    inline constexpr double MIN_POW10_EXPONENT = -999'999'999.0;

    // --- GROWTH ECONOMY ---

    /**
     * @note Below log10(ratio) = 6 the affordability ratio is materialized and
     * log1p() keeps the "+1" term exact. Above it the "+1" is negligible and the
     * solver stays in log space.
     */
    inline constexpr double LINEAR_RATIO_LOG_LIMIT = 6.0;

    inline constexpr int64_t MAX_AFFORDABLE_RUN = 1'000'000;

    // Single-unit corrections applied to the analytic estimate.
    inline constexpr int AFFORDABILITY_REFINE_STEPS = 3;

    // --- PRESENTATION ---

    inline constexpr int DEFAULT_DECIMALS = 2;

    // Scientific notation shows one extra place from this exponent on.
    inline constexpr int64_t SCI_DETAIL_EXPONENT = 6;

    /**
     * @brief Suffix table indexed by tier = exponent / 3.
     * Tier 0 has no suffix; it is never used for values >= 1000.
     */
    inline constexpr std::array<std::string_view, 21> SUFFIXES = {
        "", "K", "M", "B", "T",
        "Qa", "Qi", "Sx", "Sp", "Oc", "No",
        "Dc", "Ud", "Dd", "Td", "Qad", "Qid",
        "Sxd", "Spd", "Ocd", "Nod",
    };

    // --- LEDGER ---

    inline constexpr double STARTING_BALANCE = 5.0;

    struct VentureTemplate {
        std::string_view id;
        std::string_view name;
        double baseCost;
        double growth;
        double baseProfit;   // payout per unit per cycle
        double baseCycle;    // seconds
    };

    inline constexpr std::array<VentureTemplate, 10> VENTURES = {{
        {"lemon",   "Lemon Stand",      4.0,      1.14,  1.2,   1.5},
        {"coffee",  "Coffee Cart",      60.0,     1.145, 12.0,  2.0},
        {"truck",   "Food Truck",       720.0,    1.15,  90.0,  3.2},
        {"arcade",  "Arcade",           9200.0,   1.155, 720.0, 5.0},
        {"datac",   "Data Centre",      120000.0, 1.16,  5400.0, 7.5},
        {"bank",    "Bank",             1.7e6,    1.165, 42000.0, 10.0},
        {"biotech", "Biotech Lab",      2.5e7,    1.17,  330000.0, 13.0},
        {"orbital", "Orbital Mining",   3.9e8,    1.175, 2.6e6, 16.0},
        {"quant",   "Quantum Exchange", 6.2e9,    1.18,  2.1e7, 20.0},
        {"dyson",   "Dyson Swarm",      1.1e11,   1.185, 1.7e8, 25.0},
    }};

    // --- INCOME ---

    /**
     * @brief Owned-count milestones. Every threshold reached multiplies the
     * payout by profit and the cycle time by cycle; the effects stack.
     */
    struct Milestone {
        int64_t threshold;
        double profit;
        double cycle;
    };

    inline constexpr std::array<Milestone, 6> MILESTONES = {{
        {25,   2.0,  0.9},
        {50,   2.0,  0.9},
        {100,  2.5,  0.85},
        {200,  3.0,  0.8},
        {500,  5.0,  0.75},
        {1000, 10.0, 0.7},
    }};

    inline constexpr double MIN_CYCLE_SECONDS = 0.05;
    inline constexpr double MAX_CYCLE_SECONDS = 1e9;

    // Manager price = baseCost * (BASE + tier * PER_TIER), tier = catalogue index.
    inline constexpr double MANAGER_COST_BASE = 250.0;
    inline constexpr double MANAGER_COST_PER_TIER = 220.0;

    // --- PRESTIGE ---

    /**
     * @note Influence gained on prestige is floor((log10(lifetime) - 6)^2).
     * Each point of influence held adds 5% to every payout.
     */
    inline constexpr double INFLUENCE_LOG_THRESHOLD = 6.0;
    inline constexpr int64_t MAX_INFLUENCE_GAIN = 2'000'000'000;
    inline constexpr double INFLUENCE_PROFIT_BONUS = 0.05;

    // --- OFFLINE PROGRESS ---

    inline constexpr double OFFLINE_CAP_SECONDS = 8.0 * 3600.0;
    // Restarts quicker than this earn nothing.
    inline constexpr double OFFLINE_MIN_SECONDS = 1.5;

    /**
     * @brief O(N) scan over ten entries; only runs once per command.
     */
    inline const VentureTemplate* findVenture(std::string_view id) {
        auto it = std::ranges::find(VENTURES, id, &VentureTemplate::id);
        return it == VENTURES.end() ? nullptr : &*it;
    }

    inline bool isSupported(std::string_view id) {
        return findVenture(id) != nullptr;
    }

    // Catalogue position; later ventures have dearer managers.
    inline int ventureTier(const VentureTemplate& tmpl) {
        return static_cast<int>(&tmpl - VENTURES.data());
    }

    // --- PERSISTENCE ---

    inline constexpr int SAVE_VERSION = 2;

    // --- OUTPUT GATEWAY ---
    struct Output {
        // A full save document is the longest line the shell ever prints.
        static inline constexpr size_t ENVELOPE_SIZE = 2048;
    };
}
