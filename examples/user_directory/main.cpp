#include <map>
#include <memory>
#include <string>
#include "ddd/ddd.hpp"
#include "directory.hpp"

namespace {

constexpr const char* COMPONENT = "user_directory";

/// Read model kept current by event handlers.
struct DirectoryIndex {
    std::map<std::string, std::string> names;
    std::map<std::string, std::string> teams;
};

ddd::HandlerRegistry create_handlers(DirectoryIndex& index) {
    ddd::HandlerRegistry handlers;
    handlers
        .on<directory::UserRegistered>(
            [&index](const directory::UserRegistered& event, const ddd::DomainEvent& envelope) {
                index.names[envelope.aggregate_id()] = event.name();
            },
            "directory-index")
        .on<directory::UserRenamed>(
            [&index](const directory::UserRenamed& event, const ddd::DomainEvent& envelope) {
                index.names[envelope.aggregate_id()] = event.new_name();
            },
            "directory-index")
        .on<directory::MemberJoined>(
            [&index](const directory::MemberJoined& event, const ddd::DomainEvent& envelope) {
                index.teams[event.user_id()] = envelope.aggregate_id();
            },
            "directory-index");
    return handlers;
}

} // namespace

int main() {
    try {
        auto config = ddd::Config::from_env();
        config.apply();

        ddd::InMemoryRepository<directory::User> users;
        ddd::InMemoryRepository<directory::Team> teams;
        DirectoryIndex index;
        auto handlers = create_handlers(index);

        // Register a user and create a team in one transaction
        ddd::run_in_unit_of_work(handlers, config.unit_of_work, [&](ddd::UnitOfWork& unit) {
            auto user = std::make_shared<directory::User>("u-1");
            user->register_user("alice", "alice@example.com");
            unit.repository<directory::User>(users).add(user);

            auto team = std::make_shared<directory::Team>("t-1");
            team->create("platform", 2);
            unit.repository<directory::Team>(teams).add(team);
        });

        // Rename, and move the user into the team atomically
        ddd::run_in_unit_of_work(handlers, config.unit_of_work, [&](ddd::UnitOfWork& unit) {
            auto user = unit.repository<directory::User>(users).load("u-1");
            auto team = unit.repository<directory::Team>(teams).load("t-1");
            user->rename("Alice Liddell");
            user->assign_to(team->id());
            team->admit(user->id());
        });

        ddd::log_info(COMPONENT, "directory_ready",
                      {{"user", index.names["u-1"]},
                       {"team", index.teams["u-1"]},
                       {"user_version", users.load("u-1").version()},
                       {"team_version", teams.load("t-1").version()}});
        return 0;
    } catch (const ddd::DomainError& e) {
        ddd::log_error(COMPONENT, "use_case_failed",
                       {{"error", e.what()}, {"status", static_cast<int>(e.status_code())}});
        return 1;
    }
}
