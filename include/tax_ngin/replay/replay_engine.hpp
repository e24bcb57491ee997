#pragma once

#include <map>
#include <optional>
#include <vector>
#include "tax_ngin/core/config_loader.hpp"
#include "tax_ngin/core/date.hpp"
#include "tax_ngin/core/decimal.hpp"
#include "tax_ngin/core/error.hpp"
#include "tax_ngin/ledger/corpus_ledger.hpp"
#include "tax_ngin/ledger/trade_record.hpp"
#include "tax_ngin/replay/allocation_engine.hpp"
#include "tax_ngin/replay/event_scheduler.hpp"
#include "tax_ngin/replay/tax_settlement_engine.hpp"

namespace tax_ngin {
namespace replay {

/**
 * @brief State carried from one date to the next
 */
struct ReplayState {
    CorpusLedger ledger;
    std::map<uint64_t, OpenPosition> open_positions;  // Keyed by trade id
};

/**
 * @brief Corpus balance recorded during the replay
 */
struct CorpusSnapshot {
    enum class Stage {
        AFTER_SETTLEMENT,  // Exits of the date credited, entries not yet sized
        END_OF_DATE        // Entries of the date debited
    };

    Date date;
    Stage stage{Stage::END_OF_DATE};
    Decimal corpus;
};

/**
 * @brief Result of one per-date step
 */
struct DateOutcome {
    ReplayState state;
    Decimal corpus_before;
    std::optional<DateSettlement> settlement;  // Empty when the date has no exits
    AllocationResult allocation;
    std::vector<TradeRecord> orphan_exits;  // Exits whose entry never opened
};

/**
 * @brief Everything a full replay produced
 */
struct ReplayResult {
    Decimal initial_capital;
    Decimal final_corpus;
    Decimal total_net_post_tax_pnl;
    Decimal open_principal;  // Entry amounts of positions still open

    std::vector<TradeOutput> closed_trades;  // By exit date, stock name, trade id
    std::vector<OpenPosition> open_positions;
    std::vector<CorpusSnapshot> corpus_history;
    std::vector<DateSettlement> settlements;
    std::vector<PositionLimitViolation> violations;
    std::vector<DataError> rejected;
    std::vector<TradeRecord> skipped_entries;
    std::vector<TradeRecord> orphan_exits;
};

/**
 * @brief Replays a trade ledger date by date against a single corpus
 *
 * For each date, all exits are settled and credited before any entry reads
 * the corpus. The engine keeps no state between calls; the same input and
 * configuration always produce the same result.
 */
class ReplayEngine {
public:
    explicit ReplayEngine(const ReplayConfig& config);

    /**
     * @brief Process one date: settle exits, then size entries
     *
     * @param state State after the previous date
     * @param unit Events of this date
     * @return Next state with the date's outputs, or a fatal error naming
     *         the date
     */
    Result<DateOutcome> process_date(const ReplayState& state, const DateWorkUnit& unit) const;

    /**
     * @brief Schedule and replay the full trade list
     * @return ReplayResult, or the first fatal error
     */
    Result<ReplayResult> run(const std::vector<TradeRecord>& trades) const;

    /**
     * @brief final_corpus + open_principal == initial_capital + sum(net_post_tax_pnl)
     * @return INVARIANT_VIOLATION on mismatch
     */
    static Result<void> check_conservation(const ReplayResult& result);

private:
    ReplayConfig config_;
    TaxSettlementEngine settlement_engine_;
    AllocationEngine allocation_engine_;
};

}  // namespace replay
}  // namespace tax_ngin
