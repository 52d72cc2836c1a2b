#pragma once

#include <functional>
#include <map>
#include <string>
#include <utility>
#include <google/protobuf/any.pb.h>
#include "errors.hpp"
#include "helpers.hpp"

namespace ddd {

/**
 * Fluent registration of the appliers that evolve an aggregate's state,
 * one per event type.
 *
 * Example:
 *   static const auto router = StateRouter<UserState>()
 *       .on<UserRenamed>([](UserState& state, const UserRenamed& event) {
 *           state.set_name(event.new_name());
 *       });
 */
template<typename State>
class StateRouter {
public:
    using Applier = std::function<void(State&, const google::protobuf::Any&)>;

    /**
     * Register the applier for events of message type Event.
     */
    template<typename Event, typename Fn>
    StateRouter& on(Fn applier) {
        appliers_[helpers::event_tag<Event>()] =
            [applier = std::move(applier)](State& state, const google::protobuf::Any& any) {
                Event event;
                if (!any.UnpackTo(&event)) {
                    throw InvalidArgumentError("cannot unpack " + any.type_url() + " as " +
                                               Event::descriptor()->full_name());
                }
                applier(state, event);
            };
        return *this;
    }

    /**
     * Apply one packed event to state.
     *
     * @throws InvalidArgumentError if no applier is registered for the tag
     */
    void apply(State& state, const google::protobuf::Any& event) const {
        auto tag = helpers::tag_from_url(event.type_url());
        auto it = appliers_.find(tag);
        if (it == appliers_.end()) {
            throw InvalidArgumentError("no applier registered for event " + tag);
        }
        it->second(state, event);
    }

    bool handles(const std::string& tag) const {
        return appliers_.count(tag) > 0;
    }

private:
    std::map<std::string, Applier> appliers_;
};

} // namespace ddd
