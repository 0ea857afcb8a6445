// =============================================================================
// journal.cpp - Operation Undo Log
// =============================================================================

#include "dsc/journal.hpp"
#include "dsc/log.hpp"

#include <exception>

namespace dsc {

void Journal::record(std::string label, Undo undo) {
    undo_.push_back(Entry{std::move(label), std::move(undo)});
}

void Journal::emit(EngineEvent event) {
    events_.push_back(std::move(event));
}

size_t Journal::rollback() noexcept {
    size_t failed = 0;
    for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
        try {
            it->undo();
        } catch (const std::exception& e) {
            log::logger()->error("rollback of '{}' failed: {}", it->label, e.what());
            ++failed;
        }
    }
    undo_.clear();
    events_.clear();
    return failed;
}

std::vector<EngineEvent> Journal::commit() {
    undo_.clear();
    std::vector<EngineEvent> events;
    events.swap(events_);
    return events;
}

} // namespace dsc
