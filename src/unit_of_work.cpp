#include "ddd/unit_of_work.hpp"

#include <exception>
#include <iterator>
#include "ddd/helpers.hpp"
#include "ddd/logging.hpp"

namespace ddd {

namespace {

constexpr const char* kComponent = "unit_of_work";

} // namespace

const char* to_string(UnitOfWorkState state) {
    switch (state) {
        case UnitOfWorkState::Open: return "open";
        case UnitOfWorkState::Committing: return "committing";
        case UnitOfWorkState::Committed: return "committed";
        case UnitOfWorkState::RolledBack: return "rolled_back";
    }
    return "unknown";
}

UnitOfWork::UnitOfWork(EventDispatcher& dispatcher, UnitOfWorkOptions options,
                       CancellationToken cancellation)
    : id_(helpers::generate_uuid()),
      dispatcher_(dispatcher),
      options_(options),
      cancellation_(std::move(cancellation)) {}

UnitOfWork::~UnitOfWork() {
    if (state_ != UnitOfWorkState::Open || entries_.empty()) {
        return;
    }
    log_warn(kComponent, "unit_of_work_abandoned",
             {{"unit", id_}, {"tracked", entries_.size()}});
    discard();
    state_ = UnitOfWorkState::RolledBack;
}

void UnitOfWork::track(std::shared_ptr<AggregateRoot> aggregate, std::function<void()> check,
                       std::function<void()> save) {
    require_open("register");

    auto key = aggregate->key();
    auto it = index_.find(key);
    if (it != index_.end()) {
        if (entries_[it->second].aggregate == aggregate) {
            return;
        }
        throw InvalidArgumentError(key + " is already tracked by this unit of work "
                                         "under another instance");
    }

    index_.emplace(key, entries_.size());
    entries_.push_back({std::move(aggregate), std::move(check), std::move(save)});
    log_debug(kComponent, "aggregate_registered", {{"unit", id_}, {"aggregate", key}});
}

bool UnitOfWork::is_tracked(const AggregateRoot& aggregate) const {
    auto it = index_.find(aggregate.key());
    return it != index_.end() && entries_[it->second].aggregate.get() == &aggregate;
}

std::shared_ptr<AggregateRoot> UnitOfWork::tracked(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : entries_[it->second].aggregate;
}

void UnitOfWork::require_open(const char* operation) const {
    if (state_ != UnitOfWorkState::Open) {
        throw InvalidStateError(std::string("cannot ") + operation + " unit of work " + id_ +
                                ": it is " + to_string(state_));
    }
}

void UnitOfWork::commit() {
    require_open("commit");
    state_ = UnitOfWorkState::Committing;
    log_debug(kComponent, "commit_started", {{"unit", id_}, {"tracked", entries_.size()}});

    try {
        write_all();
    } catch (const std::exception& e) {
        abort_commit(e.what());
        throw;
    } catch (...) {
        abort_commit("unknown error");
        throw;
    }

    dispatch_all();
}

void UnitOfWork::write_all() {
    if (options_.preflight_check) {
        for (const auto& entry : entries_) {
            entry.check();
        }
    }

    for (const auto& entry : entries_) {
        if (cancellation_.is_cancelled()) {
            throw CommitCancelledError(saved_);
        }
        entry.save();
        entry.aggregate->mark_persisted();
        saved_.push_back(entry.aggregate->key());
    }
}

void UnitOfWork::dispatch_all() {
    if (cancellation_.is_cancelled()) {
        discard();
        state_ = UnitOfWorkState::Committed;
        log_warn(kComponent, "commit_cancelled_before_dispatch",
                 {{"unit", id_}, {"saved", saved_}});
        throw CommitCancelledError(saved_);
    }

    std::vector<DomainEvent> events;
    for (const auto& entry : entries_) {
        auto drained = entry.aggregate->drain_events();
        events.insert(events.end(), std::make_move_iterator(drained.begin()),
                      std::make_move_iterator(drained.end()));
    }
    entries_.clear();
    index_.clear();
    state_ = UnitOfWorkState::Committed;

    log_info(kComponent, "committed",
             {{"unit", id_}, {"saved", saved_}, {"events", events.size()}});

    if (events.empty()) {
        return;
    }
    try {
        dispatcher_.dispatch(events);
    } catch (const std::exception& e) {
        log_warn(kComponent, "dispatch_failed_after_commit", {{"unit", id_}, {"error", e.what()}});
        throw;
    }
}

void UnitOfWork::abort_commit(const std::string& reason) {
    discard();
    state_ = UnitOfWorkState::RolledBack;
    if (saved_.empty()) {
        log_info(kComponent, "commit_aborted", {{"unit", id_}, {"error", reason}});
    } else {
        log_warn(kComponent, "commit_aborted_after_partial_save",
                 {{"unit", id_}, {"saved", saved_}, {"error", reason}});
    }
}

void UnitOfWork::rollback() {
    require_open("roll back");
    auto count = entries_.size();
    discard();
    state_ = UnitOfWorkState::RolledBack;
    log_info(kComponent, "rolled_back", {{"unit", id_}, {"tracked", count}});
}

void UnitOfWork::discard() {
    for (const auto& entry : entries_) {
        entry.aggregate->discard_events();
    }
    entries_.clear();
    index_.clear();
}

} // namespace ddd
