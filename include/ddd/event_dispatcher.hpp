#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "ddd/domain.pb.h"
#include "errors.hpp"
#include "helpers.hpp"

namespace ddd {

/**
 * Capability delivering committed events to interested parties.
 *
 * Delivery is post-commit and best-effort: a failure is reported to the
 * caller but never undoes persistence.
 */
class EventDispatcher {
public:
    virtual ~EventDispatcher() = default;

    /**
     * Deliver events in the given order.
     *
     * @throws DispatchFailureError if any handler failed
     */
    virtual void dispatch(const std::vector<DomainEvent>& events) = 0;
};

/**
 * In-process dispatcher with handlers registered per event tag.
 *
 * Each event goes to every handler registered for its tag, in registration
 * order, one at a time. A throwing handler does not stop delivery; once the
 * whole sequence is delivered, failures are raised together as one
 * DispatchFailureError. Handlers are never retried.
 *
 * Example:
 *   HandlerRegistry handlers;
 *   handlers.on<Renamed>([](const Renamed& event, const DomainEvent& envelope) {
 *       log_info("directory", "user_renamed", {{"user", envelope.aggregate_id()}});
 *   }, "directory-index");
 *   handlers.dispatch(events);
 */
class HandlerRegistry : public EventDispatcher {
public:
    using Handler = std::function<void(const DomainEvent&)>;

    /**
     * Register a handler for the events tagged tag.
     *
     * @param name Reported in failures; defaults to "<tag>#<n>"
     */
    HandlerRegistry& on(const std::string& tag, Handler handler, std::string name = "");

    /**
     * Register a handler receiving the unpacked payload of Event.
     */
    template<typename Event, typename Fn>
    HandlerRegistry& on(Fn handler, std::string name = "") {
        return on(helpers::event_tag<Event>(),
                  [handler = std::move(handler)](const DomainEvent& event) {
                      Event payload;
                      if (!event.payload().UnpackTo(&payload)) {
                          throw InvalidArgumentError("cannot unpack " + event.payload().type_url() +
                                                     " as " + Event::descriptor()->full_name());
                      }
                      handler(payload, event);
                  },
                  std::move(name));
    }

    void dispatch(const std::vector<DomainEvent>& events) override;

    /**
     * Number of handlers registered for tag.
     */
    std::size_t handler_count(const std::string& tag) const;

    /**
     * Tags with at least one handler.
     */
    std::vector<std::string> tags() const;

private:
    struct Registration {
        std::string name;
        Handler handler;
    };

    std::map<std::string, std::vector<Registration>> handlers_;
};

} // namespace ddd
