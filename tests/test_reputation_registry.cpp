#include <catch2/catch_test_macros.hpp>
#include "agentreg/reputation_registry.hpp"
#include "test_support.hpp"
#include <stdexcept>

using namespace agentreg;
using test::call_from;
using test::make_actor;

namespace
{
    struct Fixture
    {
        std::shared_ptr<EventLog> log = std::make_shared<EventLog>();
        std::shared_ptr<IdentityRegistry> identity = std::make_shared<IdentityRegistry>(log);
        ReputationRegistry reputation{identity, log};

        test::Actor client = make_actor(1);
        test::Actor server = make_actor(2);
        AgentId client_id = register_actor(client, "d1");
        AgentId server_id = register_actor(server, "d2");

        AgentId register_actor(const test::Actor &actor, const std::string &domain)
        {
            RegistrationRequest req;
            req.domain = domain;
            req.did = actor.did;
            req.address = actor.address;
            return identity->register_agent(call_from(actor.address), req).value();
        }
    };
}

TEST_CASE("Server owner pre-authorizes feedback once", "[reputation]")
{
    Fixture f;

    auto token = f.reputation.accept_feedback(call_from(f.server.address, 10), f.client_id, f.server_id);
    REQUIRE(token.has_value());
    REQUIRE_FALSE(is_zero(*token));

    auto auth = f.reputation.is_authorized(f.client_id, f.server_id);
    REQUIRE(auth.authorized);
    REQUIRE(auth.auth_id == *token);
    REQUIRE(f.reputation.get_auth_id(f.client_id, f.server_id) == *token);
    REQUIRE(f.reputation.size() == 1);

    auto emitted = f.log->events_named(events::kFeedbackAuthorized);
    REQUIRE(emitted.size() == 1);
    REQUIRE(emitted[0].args["client_agent_id"] == f.client_id);
    REQUIRE(emitted[0].args["server_agent_id"] == f.server_id);
    REQUIRE(emitted[0].args["auth_token"] == to_hex(*token));

    SECTION("Second authorization for the pair")
    {
        auto again = f.reputation.accept_feedback(call_from(f.server.address, 11), f.client_id, f.server_id);
        REQUIRE_FALSE(again.has_value());
        REQUIRE(again.error().code == ErrorCode::FeedbackAlreadyAuthorized);
        REQUIRE(f.reputation.get_auth_id(f.client_id, f.server_id) == *token);
    }

    SECTION("Client owner cannot authorize itself")
    {
        auto res = f.reputation.accept_feedback(call_from(f.client.address, 11), f.client_id, f.server_id);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::UnauthorizedFeedback);
    }

    SECTION("Reverse direction is a separate pair")
    {
        REQUIRE_FALSE(f.reputation.is_authorized(f.server_id, f.client_id).authorized);
        auto reverse = f.reputation.accept_feedback(call_from(f.client.address, 12), f.server_id, f.client_id);
        REQUIRE(reverse.has_value());
        REQUIRE(*reverse != *token);
    }
}

TEST_CASE("Feedback authorization requires existing agents", "[reputation]")
{
    Fixture f;

    auto no_client = f.reputation.accept_feedback(call_from(f.server.address), 42, f.server_id);
    REQUIRE(no_client.error().code == ErrorCode::AgentNotFound);

    auto no_server = f.reputation.accept_feedback(call_from(f.server.address), f.client_id, 42);
    REQUIRE(no_server.error().code == ErrorCode::AgentNotFound);

    REQUIRE(f.reputation.size() == 0);
}

TEST_CASE("Absent authorization reads as zero token", "[reputation]")
{
    Fixture f;
    auto auth = f.reputation.is_authorized(f.client_id, f.server_id);
    REQUIRE_FALSE(auth.authorized);
    REQUIRE(is_zero(auth.auth_id));
    REQUIRE(is_zero(f.reputation.get_auth_id(f.client_id, f.server_id)));
}

TEST_CASE("Authorizations survive identity changes", "[reputation]")
{
    Fixture f;
    auto token = f.reputation.accept_feedback(call_from(f.server.address), f.client_id, f.server_id).value();

    auto rotated = make_actor(9);
    AgentUpdate update;
    update.new_address = rotated.address;
    update.new_did = rotated.did;
    update.new_domain = "renamed.example";
    REQUIRE(f.identity->update_agent(call_from(f.server.address), f.server_id, update).has_value());

    REQUIRE(f.reputation.is_authorized(f.client_id, f.server_id).auth_id == token);

    SECTION("Authority follows the new owner address")
    {
        auto third = make_actor(3);
        auto third_id = f.register_actor(third, "d3");

        auto old_owner = f.reputation.accept_feedback(call_from(f.server.address), third_id, f.server_id);
        REQUIRE(old_owner.error().code == ErrorCode::UnauthorizedFeedback);

        REQUIRE(f.reputation.accept_feedback(call_from(rotated.address), third_id, f.server_id).has_value());
    }
}

TEST_CASE("Tokens differ across pairs", "[reputation]")
{
    Fixture f;
    auto third = make_actor(3);
    auto third_id = f.register_actor(third, "d3");

    auto ctx = call_from(f.server.address, 5);
    auto t1 = f.reputation.accept_feedback(ctx, f.client_id, f.server_id).value();
    auto t2 = f.reputation.accept_feedback(ctx, third_id, f.server_id).value();
    REQUIRE(t1 != t2);
}

TEST_CASE("Reputation registry requires an identity registry", "[reputation]")
{
    REQUIRE_THROWS_AS(ReputationRegistry(nullptr, std::make_shared<EventLog>()), std::invalid_argument);
}
