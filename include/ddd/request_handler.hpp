#pragma once

#include <memory>
#include <string>
#include <utility>
#include "ddd/domain.pb.h"
#include "errors.hpp"
#include "event_dispatcher.hpp"
#include "helpers.hpp"

namespace ddd {

/**
 * Base for requests that change state and return nothing.
 */
struct Command {
    using Response = void;
};

/**
 * Base for requests that read state and return ResponseT.
 */
template<typename ResponseT>
struct Query {
    using Response = ResponseT;
};

/**
 * Application-service entry point for one request type.
 *
 * The request names its result type as Request::Response, which is what
 * deriving from Command or Query<> provides. Handlers typically open a unit
 * of work, load the aggregates involved and call their mutations.
 *
 * Usage:
 *   struct RenameUser : Command {
 *       std::string user_id;
 *       std::string name;
 *   };
 *
 *   class RenameUserHandler : public CommandHandler<RenameUser> {
 *   public:
 *       void handle(const RenameUser& command) override {
 *           run_in_unit_of_work(dispatcher_, options_, [&](UnitOfWork& unit) {
 *               unit.repository(users_).load(command.user_id)->rename(command.name);
 *           });
 *       }
 *   };
 */
template<typename Request>
class RequestHandler {
public:
    using Response = typename Request::Response;

    virtual ~RequestHandler() = default;

    virtual Response handle(const Request& request) = 0;
};

template<typename C>
using CommandHandler = RequestHandler<C>;

template<typename Q>
using QueryHandler = RequestHandler<Q>;

/**
 * Subscriber to one event payload type, registered through subscribe().
 */
template<typename EventT>
class DomainEventHandler {
public:
    using Event = EventT;

    virtual ~DomainEventHandler() = default;

    /**
     * Name reported when this handler fails.
     */
    virtual std::string name() const = 0;

    virtual void handle(const Event& event, const DomainEvent& envelope) = 0;
};

/**
 * Register handler on registry for its event type. The registry shares
 * ownership of the handler.
 *
 * @throws InvalidArgumentError if handler is null
 */
template<typename Handler>
HandlerRegistry& subscribe(HandlerRegistry& registry, std::shared_ptr<Handler> handler) {
    using Event = typename Handler::Event;
    if (!handler) {
        throw InvalidArgumentError("handler for " + helpers::event_tag<Event>() +
                                   " must not be null");
    }
    auto name = handler->name();
    return registry.on<Event>(
        [handler = std::move(handler)](const Event& event, const DomainEvent& envelope) {
            handler->handle(event, envelope);
        },
        std::move(name));
}

} // namespace ddd
