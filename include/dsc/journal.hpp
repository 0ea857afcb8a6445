#ifndef DSC_JOURNAL_HPP
#define DSC_JOURNAL_HPP

#include <functional>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Engine Events
// =============================================================================

struct CollateralDeposited {
    Address user;
    Address token;
    U256 amount;
};

struct CollateralRedeemed {
    Address from;
    Address to;
    Address token;
    U256 amount;
};

using EngineEvent = std::variant<CollateralDeposited, CollateralRedeemed>;

// Receives events after the emitting operation commits
class EngineListener {
public:
    virtual ~EngineListener() = default;

    virtual void on_collateral_deposited(const CollateralDeposited& event) = 0;
    virtual void on_collateral_redeemed(const CollateralRedeemed& event) = 0;
};

// =============================================================================
// Journal - undo log and event buffer of one engine operation
//
// Every effect (ledger write, token movement) records its inverse. On
// failure rollback() replays the inverses newest-first and drops the
// buffered events; on success commit() hands the events out for delivery.
// =============================================================================

class Journal {
public:
    using Undo = std::function<void()>;

    Journal() = default;

    // Non-copyable
    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    void record(std::string label, Undo undo);
    void emit(EngineEvent event);

    // Inverses that themselves fail are logged and skipped so the remaining
    // ones still run. Returns how many failed.
    size_t rollback() noexcept;

    std::vector<EngineEvent> commit();

    size_t pending_undo() const { return undo_.size(); }
    const std::vector<EngineEvent>& events() const { return events_; }

private:
    struct Entry {
        std::string label;
        Undo undo;
    };

    std::vector<Entry> undo_;
    std::vector<EngineEvent> events_;
};

} // namespace dsc

#endif // DSC_JOURNAL_HPP
