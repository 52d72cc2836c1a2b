#include "ddd/event_dispatcher.hpp"

#include <exception>
#include "ddd/logging.hpp"

namespace ddd {

namespace {

void record_failure(std::vector<HandlerFailure>& failures, const DomainEvent& event,
                    const std::string& handler, const std::string& error) {
    log_error("dispatcher", "handler_failed",
              {{"handler", handler},
               {"event_type", event.type()},
               {"event_id", event.event_id()},
               {"error", error}});
    failures.push_back({event.event_id(), event.type(), handler, error});
}

} // namespace

HandlerRegistry& HandlerRegistry::on(const std::string& tag, Handler handler, std::string name) {
    if (tag.empty()) {
        throw InvalidArgumentError("event tag must not be empty");
    }
    if (!handler) {
        throw InvalidArgumentError("handler for " + tag + " must be callable");
    }

    auto& registrations = handlers_[tag];
    if (name.empty()) {
        name = tag + "#" + std::to_string(registrations.size());
    }
    registrations.push_back({std::move(name), std::move(handler)});
    return *this;
}

void HandlerRegistry::dispatch(const std::vector<DomainEvent>& events) {
    std::vector<HandlerFailure> failures;

    for (const auto& event : events) {
        auto it = handlers_.find(event.type());
        if (it == handlers_.end()) {
            log_debug("dispatcher", "event_unhandled",
                      {{"event_type", event.type()}, {"event_id", event.event_id()}});
            continue;
        }

        for (const auto& registration : it->second) {
            try {
                registration.handler(event);
            } catch (const std::exception& e) {
                record_failure(failures, event, registration.name, e.what());
            } catch (...) {
                record_failure(failures, event, registration.name, "unknown error");
            }
        }
    }

    if (!failures.empty()) {
        throw DispatchFailureError(std::move(failures));
    }
}

std::size_t HandlerRegistry::handler_count(const std::string& tag) const {
    auto it = handlers_.find(tag);
    return it == handlers_.end() ? 0 : it->second.size();
}

std::vector<std::string> HandlerRegistry::tags() const {
    std::vector<std::string> result;
    for (const auto& [tag, _] : handlers_) {
        result.push_back(tag);
    }
    return result;
}

} // namespace ddd
