#include "tax_ngin/replay/replay_engine.hpp"
#include "tax_ngin/core/logger.hpp"

namespace tax_ngin {
namespace replay {

namespace {

TaxRates rates_from_config(const ReplayConfig& config) {
    TaxRates rates;
    rates.short_term = config.short_term_tax_rate;
    rates.long_term = config.long_term_tax_rate;
    return rates;
}

}  // namespace

ReplayEngine::ReplayEngine(const ReplayConfig& config)
    : config_(config),
      settlement_engine_(rates_from_config(config)),
      allocation_engine_(config.max_stocks, config.position_limit_policy) {}

Result<DateOutcome> ReplayEngine::process_date(const ReplayState& state,
                                               const DateWorkUnit& unit) const {
    DateOutcome outcome;
    outcome.state = state;
    outcome.corpus_before = state.ledger.available();

    DEBUG("Date " << unit.date << ": corpus_before=" << outcome.corpus_before
                  << " exits=" << unit.exits.size() << " entries=" << unit.entries.size());

    // Exits first: every exit of the date settles before any entry is sized
    std::vector<OpenPosition> closing;
    closing.reserve(unit.exits.size());
    for (const auto& record : unit.exits) {
        auto it = outcome.state.open_positions.find(record.id);
        if (it == outcome.state.open_positions.end()) {
            INFO("Skipping exit of " << record.stock_name << " on " << unit.date
                                     << ": position was never opened");
            outcome.orphan_exits.push_back(record);
            continue;
        }
        closing.push_back(it->second);
    }

    if (!closing.empty()) {
        auto settled = settlement_engine_.settle(unit.date, closing, outcome.state.ledger);
        if (settled.is_error()) {
            return forward_error<DateOutcome>(*settled.error());
        }
        for (const auto& position : closing) {
            outcome.state.open_positions.erase(position.record.id);
        }
        outcome.settlement = settled.take_value();
    }

    auto allocated = allocation_engine_.allocate(unit.date, unit.entries,
                                                 outcome.state.open_positions.size(),
                                                 outcome.state.ledger);
    if (allocated.is_error()) {
        return forward_error<DateOutcome>(*allocated.error());
    }
    outcome.allocation = allocated.take_value();

    for (const auto& position : outcome.allocation.opened) {
        outcome.state.open_positions.emplace(position.record.id, position);
    }

    if (!unit.entries.empty()) {
        INFO("Date " << unit.date << ": entries=" << outcome.allocation.opened.size()
                     << " allocation=" << outcome.allocation.per_stock_allocation
                     << " open_positions=" << outcome.state.open_positions.size()
                     << " corpus_after=" << outcome.state.ledger.available());
    }

    return outcome;
}

Result<ReplayResult> ReplayEngine::run(const std::vector<TradeRecord>& trades) const {
    Logger::register_component("ReplayEngine");

    ReplayResult result;
    result.initial_capital = config_.initial_capital.round(2);

    Schedule schedule = EventScheduler::build(trades);
    result.rejected = std::move(schedule.rejected);

    INFO("Starting replay: " << trades.size() << " records, " << schedule.units.size()
                             << " dates, " << result.rejected.size()
                             << " rejected, initial_capital=" << result.initial_capital
                             << ", max_stocks=" << config_.max_stocks);

    ReplayState state;
    state.ledger = CorpusLedger(result.initial_capital);

    for (const auto& unit : schedule.units) {
        auto processed = process_date(state, unit);
        if (processed.is_error()) {
            ERROR("Replay aborted on " << unit.date << ": " << processed.error()->what());
            return forward_error<ReplayResult>(*processed.error());
        }
        DateOutcome outcome = processed.take_value();

        if (outcome.settlement) {
            result.corpus_history.push_back({unit.date, CorpusSnapshot::Stage::AFTER_SETTLEMENT,
                                             outcome.settlement->corpus_after});
            result.total_net_post_tax_pnl += outcome.settlement->net_post_tax_pnl;
            for (const auto& output : outcome.settlement->outputs) {
                result.closed_trades.push_back(output);
            }
            result.settlements.push_back(std::move(*outcome.settlement));
        }
        result.corpus_history.push_back(
            {unit.date, CorpusSnapshot::Stage::END_OF_DATE, outcome.state.ledger.available()});

        if (outcome.allocation.violation) {
            result.violations.push_back(*outcome.allocation.violation);
        }
        for (auto& skipped : outcome.allocation.skipped) {
            result.skipped_entries.push_back(std::move(skipped));
        }
        for (auto& orphan : outcome.orphan_exits) {
            result.orphan_exits.push_back(std::move(orphan));
        }

        state = std::move(outcome.state);
    }

    result.final_corpus = state.ledger.available();
    for (const auto& [id, position] : state.open_positions) {
        result.open_principal += position.entry.entry_amount;
        result.open_positions.push_back(position);
    }

    if (!result.open_positions.empty()) {
        INFO(result.open_positions.size() << " positions still open at end of data, principal="
                                          << result.open_principal);
        for (const auto& position : result.open_positions) {
            DEBUG("Open: " << position.record.stock_name << " since "
                           << position.record.entry_date << " qty=" << position.entry.quantity);
        }
    }

    auto conserved = check_conservation(result);
    if (conserved.is_error()) {
        ERROR(conserved.error()->what());
        return forward_error<ReplayResult>(*conserved.error());
    }

    INFO("Replay complete: closed=" << result.closed_trades.size()
                                    << " open=" << result.open_positions.size()
                                    << " final_corpus=" << result.final_corpus
                                    << " total_net_post_tax_pnl="
                                    << result.total_net_post_tax_pnl);
    return result;
}

Result<void> ReplayEngine::check_conservation(const ReplayResult& result) {
    const Decimal held = result.final_corpus + result.open_principal;
    const Decimal expected = result.initial_capital + result.total_net_post_tax_pnl;
    if (held != expected) {
        const std::string last_date =
            result.corpus_history.empty() ? std::string("start")
                                          : result.corpus_history.back().date.to_iso_string();
        return make_error<void>(ErrorCode::INVARIANT_VIOLATION,
                                "Conservation violated after " + last_date +
                                    ": final_corpus + open_principal = " + held.to_string(2) +
                                    ", initial_capital + net_post_tax_pnl = " +
                                    expected.to_string(2),
                                "ReplayEngine");
    }
    return Result<void>();
}

}  // namespace replay
}  // namespace tax_ngin
