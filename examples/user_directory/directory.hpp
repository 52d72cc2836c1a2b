#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include "ddd/ddd.hpp"
#include "directory/user.pb.h"

namespace directory {

/// User aggregate.
class User : public ddd::Aggregate<std::string, UserState> {
public:
    DDD_AGGREGATE("user")

    explicit User(std::string id) : Aggregate(std::move(id)) {}

    void register_user(const std::string& name, const std::string& email) {
        apply_mutation([&](const UserState& state) {
            ddd::validation::require(!state.active(), "user already registered");
            ddd::validation::require_not_empty(name, "name");
            ddd::validation::require(email.find('@') != std::string::npos, "email is invalid");
            UserRegistered event;
            event.set_name(name);
            event.set_email(email);
            return event;
        });
    }

    void rename(const std::string& name) {
        apply_mutation([&](const UserState& state) {
            ddd::validation::require(state.active(), "user is not registered");
            ddd::validation::require_not_empty(name, "name");
            UserRenamed event;
            event.set_old_name(state.name());
            event.set_new_name(name);
            return event;
        });
    }

    void assign_to(const std::string& team_id) {
        apply_mutation([&](const UserState& state) {
            ddd::validation::require(state.active(), "user is not registered");
            ddd::validation::require(state.team_id().empty(), "user already belongs to a team");
            UserAssigned event;
            event.set_team_id(team_id);
            return event;
        });
    }

protected:
    const ddd::StateRouter<UserState>& state_router() const override {
        static const auto router = ddd::StateRouter<UserState>()
            .on<UserRegistered>([](UserState& state, const UserRegistered& event) {
                state.set_name(event.name());
                state.set_email(event.email());
                state.set_active(true);
            })
            .on<UserRenamed>([](UserState& state, const UserRenamed& event) {
                state.set_name(event.new_name());
            })
            .on<UserAssigned>([](UserState& state, const UserAssigned& event) {
                state.set_team_id(event.team_id());
            });
        return router;
    }
};

/// Team aggregate; membership is bounded by capacity.
class Team : public ddd::Aggregate<std::string, TeamState> {
public:
    DDD_AGGREGATE("team")

    explicit Team(std::string id) : Aggregate(std::move(id)) {}

    void create(const std::string& name, int capacity) {
        apply_mutation([&](const TeamState& state) {
            ddd::validation::require(state.name().empty(), "team already exists");
            ddd::validation::require_not_empty(name, "name");
            ddd::validation::require_positive(capacity, "capacity");
            TeamCreated event;
            event.set_name(name);
            event.set_capacity(capacity);
            return event;
        });
    }

    void admit(const std::string& user_id) {
        apply_mutation([&](const TeamState& state) {
            const auto& members = state.member_ids();
            ddd::validation::require(
                std::find(members.begin(), members.end(), user_id) == members.end(),
                user_id + " is already a member");
            MemberJoined event;
            event.set_user_id(user_id);
            return event;
        });
    }

protected:
    const ddd::StateRouter<TeamState>& state_router() const override {
        static const auto router = ddd::StateRouter<TeamState>()
            .on<TeamCreated>([](TeamState& state, const TeamCreated& event) {
                state.set_name(event.name());
                state.set_capacity(event.capacity());
            })
            .on<MemberJoined>([](TeamState& state, const MemberJoined& event) {
                state.add_member_ids(event.user_id());
            });
        return router;
    }

    void check_invariants(const TeamState& candidate) const override {
        ddd::validation::require(candidate.member_ids_size() <= candidate.capacity(),
                                 "team " + candidate.name() + " is full");
    }
};

} // namespace directory
