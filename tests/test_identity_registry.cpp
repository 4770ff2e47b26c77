#include <catch2/catch_test_macros.hpp>
#include "agentreg/identity_registry.hpp"
#include "test_support.hpp"

using namespace agentreg;
using test::call_from;
using test::make_actor;

namespace
{
    RegistrationRequest request_for(const test::Actor &actor, std::string domain, bool with_did = true)
    {
        RegistrationRequest req;
        req.domain = std::move(domain);
        req.did = with_did ? actor.did : "";
        req.address = actor.address;
        req.description = "agent at " + req.domain;
        return req;
    }

    DelegatedRegistration delegated_for(
        const IdentityRegistry &registry,
        const test::Actor &developer,
        const test::Actor &agent,
        uint64_t expiry)
    {
        DelegatedRegistration req;
        req.developer_did = developer.did;
        req.agent_did = agent.did;
        req.agent_address = agent.address;
        req.description = "delegated";
        req.expiry = expiry;

        DelegatedConsent consent{req.developer_did, req.agent_did, req.agent_address, req.description,
                                 registry.nonce(agent.address), expiry};
        req.agent_signature = sign_consent(agent.key, registry.signing_domain(), consent);
        return req;
    }
}

TEST_CASE("Agent ids are sequential from one", "[identity]")
{
    auto log = std::make_shared<EventLog>();
    IdentityRegistry registry(log);

    for (uint8_t i = 1; i <= 5; ++i)
    {
        auto actor = make_actor(i);
        auto id = registry.register_agent(call_from(actor.address), request_for(actor, "", false));
        REQUIRE(id.has_value());
        REQUIRE(*id == i);
    }
    REQUIRE(registry.count() == 5);
    REQUIRE(registry.exists(5));
    REQUIRE_FALSE(registry.exists(6));
    REQUIRE_FALSE(registry.exists(kNoAgent));

    SECTION("Failed registrations do not consume ids")
    {
        auto repeat = make_actor(1);
        REQUIRE_FALSE(registry.register_agent(call_from(repeat.address), request_for(repeat, "")).has_value());

        auto fresh = make_actor(6);
        REQUIRE(registry.register_agent(call_from(fresh.address), request_for(fresh, "")).value() == 6);
    }
}

TEST_CASE("Registration is self-service only", "[identity]")
{
    IdentityRegistry registry(std::make_shared<EventLog>());
    auto alice = make_actor(1);
    auto mallory = make_actor(2);

    auto res = registry.register_agent(call_from(mallory.address), request_for(alice, "alice.example"));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::UnauthorizedRegistration);
    REQUIRE(error_category(res.error().code) == ErrorCategory::Authorization);

    RegistrationRequest zero;
    auto zero_res = registry.register_agent(call_from(Address{}), zero);
    REQUIRE_FALSE(zero_res.has_value());
    REQUIRE(zero_res.error().code == ErrorCode::InvalidAddress);

    REQUIRE(registry.count() == 0);
}

TEST_CASE("Domains resolve case-insensitively and keep display casing", "[identity]")
{
    auto log = std::make_shared<EventLog>();
    IdentityRegistry registry(log);
    auto alice = make_actor(1);

    auto id = registry.register_agent(call_from(alice.address), request_for(alice, "Example.COM")).value();

    for (const char *query : {"EXAMPLE.com", "example.com", "Example.Com", "Example.COM"})
    {
        auto found = registry.resolve_by_domain(query);
        REQUIRE(found.has_value());
        REQUIRE(found->agent_id == id);
        REQUIRE(found->domain == "Example.COM");
    }

    REQUIRE(registry.resolve_by_address(alice.address).value().agent_id == id);
    REQUIRE(registry.resolve_by_did(alice.did).value().agent_id == id);

    auto emitted = log->events_named(events::kAgentRegistered);
    REQUIRE(emitted.size() == 1);
    REQUIRE(emitted[0].args["agent_id"] == id);
    REQUIRE(emitted[0].args["owner"] == to_hex(alice.address));
    REQUIRE(emitted[0].args["domain"] == "Example.COM");
    REQUIRE(emitted[0].args["did"] == alice.did);
}

TEST_CASE("Registration enforces unique identifiers", "[identity]")
{
    IdentityRegistry registry(std::make_shared<EventLog>());
    auto alice = make_actor(1);
    auto bob = make_actor(2);
    REQUIRE(registry.register_agent(call_from(alice.address), request_for(alice, "alice.example")).has_value());

    SECTION("Domain under different casing")
    {
        auto res = registry.register_agent(call_from(bob.address), request_for(bob, "ALICE.example"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::DomainAlreadyRegistered);
        REQUIRE(error_category(res.error().code) == ErrorCategory::Conflict);
    }

    SECTION("DID already held")
    {
        auto res = registry.register_agent(call_from(alice.address), request_for(alice, "second.example"));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::DIDAlreadyRegistered);
    }

    SECTION("Address already registered")
    {
        auto res = registry.register_agent(call_from(alice.address), request_for(alice, "second.example", false));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::AddressAlreadyRegistered);
    }

    SECTION("DID bound to someone else")
    {
        auto req = request_for(bob, "bob.example");
        req.did = alice.did;
        auto res = registry.register_agent(call_from(bob.address), req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::DIDAddressMismatch);
    }

    REQUIRE(registry.count() == 1);
    REQUIRE_FALSE(registry.resolve_by_address(bob.address).has_value());
}

TEST_CASE("Registration honours the identifier requirement", "[identity][policy]")
{
    IdentityRegistryOptions options;
    options.identifier_requirement = IdentifierRequirement::Domain;
    IdentityRegistry registry(std::make_shared<EventLog>(), options);
    auto alice = make_actor(1);

    auto res = registry.register_agent(call_from(alice.address), request_for(alice, ""));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InvalidInput);

    REQUIRE(registry.register_agent(call_from(alice.address), request_for(alice, "alice.example", false)).has_value());
}

TEST_CASE("Registration fee is checked before and burned after commit", "[identity][fee]")
{
    IdentityRegistry registry(std::make_shared<EventLog>(), {}, std::make_unique<BurnFeePolicy>(50));
    auto alice = make_actor(1);

    auto res = registry.register_agent(call_from(alice.address, 1, 10), request_for(alice, "alice.example"));
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InsufficientFee);
    REQUIRE(registry.count() == 0);

    REQUIRE(registry.register_agent(call_from(alice.address, 2, 50), request_for(alice, "alice.example")).has_value());

    const auto &burn = dynamic_cast<const BurnFeePolicy &>(registry.fee_policy());
    REQUIRE(burn.burned_total() == 50);

    SECTION("Rejected registration burns nothing")
    {
        auto again = registry.register_agent(call_from(alice.address, 3, 50), request_for(alice, "other.example"));
        REQUIRE_FALSE(again.has_value());
        REQUIRE(burn.burned_total() == 50);
    }
}

TEST_CASE("Lookups of absent keys fail", "[identity]")
{
    IdentityRegistry registry(std::make_shared<EventLog>());
    auto alice = make_actor(1);

    REQUIRE(registry.get(kNoAgent).error().code == ErrorCode::AgentNotFound);
    REQUIRE(registry.get(1).error().code == ErrorCode::AgentNotFound);
    REQUIRE(registry.resolve_by_domain("nobody.example").error().code == ErrorCode::AgentNotFound);
    REQUIRE(registry.resolve_by_domain("").error().code == ErrorCode::AgentNotFound);
    REQUIRE(registry.resolve_by_address(alice.address).error().code == ErrorCode::AgentNotFound);
    REQUIRE(registry.resolve_by_did(alice.did).error().code == ErrorCode::DIDNotRegistered);
    REQUIRE(error_category(ErrorCode::DIDNotRegistered) == ErrorCategory::NotFound);
}

TEST_CASE("Delegated registration", "[identity][delegated]")
{
    auto log = std::make_shared<EventLog>();
    IdentityRegistry registry(log);
    auto developer = make_actor(1);
    auto agent = make_actor(2);

    SECTION("Valid consent registers the agent and links the developer")
    {
        auto req = delegated_for(registry, developer, agent, 100);
        auto id = registry.register_with_delegated_consent(call_from(developer.address, 100), req);
        REQUIRE(id.has_value());
        REQUIRE(*id == 1);

        auto record = registry.get(*id).value();
        REQUIRE(record.owner == agent.address);
        REQUIRE(record.did == agent.did);
        REQUIRE(record.domain.empty());
        REQUIRE(registry.developer_did(*id) == developer.did);
        REQUIRE(registry.nonce(agent.address) == 1);

        auto emitted = log->events();
        REQUIRE(emitted.size() == 2);
        REQUIRE(emitted[0].name == events::kAgentRegistered);
        REQUIRE(emitted[1].name == events::kAgentDeveloperLinked);
        REQUIRE(emitted[1].args["developer_did"] == developer.did);

        SECTION("Replaying the same consent fails")
        {
            auto replay = registry.register_with_delegated_consent(call_from(developer.address, 100), req);
            REQUIRE_FALSE(replay.has_value());
            REQUIRE(replay.error().code == ErrorCode::InvalidAgentSignature);
        }
    }

    SECTION("Expired consent")
    {
        auto req = delegated_for(registry, developer, agent, 100);
        auto res = registry.register_with_delegated_consent(call_from(developer.address, 101), req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::SignatureExpired);
        REQUIRE(registry.nonce(agent.address) == 0);
    }

    SECTION("Developer DID must bind the caller")
    {
        auto req = delegated_for(registry, developer, agent, 100);
        auto stranger = make_actor(3);
        auto res = registry.register_with_delegated_consent(call_from(stranger.address), req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::DIDAddressMismatch);
    }

    SECTION("Agent DID must bind the agent address")
    {
        auto req = delegated_for(registry, developer, agent, 100);
        req.agent_did = developer.did;
        auto res = registry.register_with_delegated_consent(call_from(developer.address), req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::DIDAddressMismatch);
    }

    SECTION("Consent signed by someone else burns the nonce")
    {
        auto good = delegated_for(registry, developer, agent, 100);
        auto forged = good;
        DelegatedConsent consent{forged.developer_did, forged.agent_did, forged.agent_address,
                                 forged.description, 0, forged.expiry};
        forged.agent_signature = sign_consent(developer.key, registry.signing_domain(), consent);

        auto res = registry.register_with_delegated_consent(call_from(developer.address), forged);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InvalidAgentSignature);
        REQUIRE(registry.nonce(agent.address) == 1);

        // The genuine consent was made for nonce 0 and no longer verifies.
        auto retry = registry.register_with_delegated_consent(call_from(developer.address), good);
        REQUIRE_FALSE(retry.has_value());
        REQUIRE(retry.error().code == ErrorCode::InvalidAgentSignature);
        REQUIRE(registry.count() == 0);
    }

    SECTION("Agent address already registered")
    {
        REQUIRE(registry.register_agent(call_from(agent.address), request_for(agent, "agent.example", false)).has_value());
        auto req = delegated_for(registry, developer, agent, 100);
        auto res = registry.register_with_delegated_consent(call_from(developer.address), req);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::AddressAlreadyRegistered);
        REQUIRE(registry.nonce(agent.address) == 1);
    }
}

TEST_CASE("Delegated registration with nonce consumed only on success", "[identity][delegated]")
{
    IdentityRegistryOptions options;
    options.nonce_policy = NoncePolicy::ConsumeOnSuccess;
    IdentityRegistry registry(std::make_shared<EventLog>(), options);
    auto developer = make_actor(1);
    auto agent = make_actor(2);

    auto good = delegated_for(registry, developer, agent, 100);
    auto forged = good;
    forged.agent_signature[40] ^= 0x01;

    auto res = registry.register_with_delegated_consent(call_from(developer.address), forged);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InvalidAgentSignature);
    REQUIRE(registry.nonce(agent.address) == 0);

    // Rejected consents for other agents leave no nonce behind either.
    for (uint8_t seed = 10; seed < 15; ++seed)
    {
        auto other = make_actor(seed);
        auto req = delegated_for(registry, developer, other, 100);
        req.agent_signature[40] ^= 0x01;
        REQUIRE(registry.register_with_delegated_consent(call_from(developer.address), req).error().code ==
                ErrorCode::InvalidAgentSignature);
    }
    REQUIRE(registry.nonce_count() == 0);

    REQUIRE(registry.register_with_delegated_consent(call_from(developer.address), good).has_value());
    REQUIRE(registry.nonce(agent.address) == 1);
    REQUIRE(registry.nonce_count() == 1);
}

TEST_CASE("Consent is bound to the signing domain", "[identity][delegated]")
{
    IdentityRegistryOptions mainnet;
    IdentityRegistryOptions testnet;
    testnet.signing_domain.chain_id = 80002;

    IdentityRegistry signer_side(std::make_shared<EventLog>(), testnet);
    IdentityRegistry registry(std::make_shared<EventLog>(), mainnet);
    auto developer = make_actor(1);
    auto agent = make_actor(2);

    auto req = delegated_for(signer_side, developer, agent, 100);
    auto res = registry.register_with_delegated_consent(call_from(developer.address), req);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code == ErrorCode::InvalidAgentSignature);
}

TEST_CASE("Agent updates", "[identity][update]")
{
    auto log = std::make_shared<EventLog>();
    IdentityRegistry registry(log);
    auto alice = make_actor(1);
    auto bob = make_actor(2);
    auto carol = make_actor(3);

    auto id = registry.register_agent(call_from(alice.address), request_for(alice, "alice.example")).value();
    auto bob_id = registry.register_agent(call_from(bob.address), request_for(bob, "bob.example")).value();

    SECTION("Only the owner may update")
    {
        AgentUpdate update;
        update.new_description = "hijacked";
        auto res = registry.update_agent(call_from(bob.address), id, update);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::UnauthorizedUpdate);

        auto missing = registry.update_agent(call_from(alice.address), 99, update);
        REQUIRE(missing.error().code == ErrorCode::AgentNotFound);
    }

    SECTION("Address rotation with a new DID moves every index")
    {
        AgentUpdate update;
        update.new_address = carol.address;
        update.new_did = carol.did;
        REQUIRE(registry.update_agent(call_from(alice.address), id, update).has_value());

        REQUIRE(registry.resolve_by_address(carol.address).value().agent_id == id);
        REQUIRE(registry.resolve_by_address(alice.address).error().code == ErrorCode::AgentNotFound);
        REQUIRE(registry.resolve_by_did(carol.did).value().agent_id == id);
        REQUIRE(registry.resolve_by_did(alice.did).error().code == ErrorCode::DIDNotRegistered);

        auto updated = log->events_named(events::kAgentUpdated);
        REQUIRE(updated.size() == 1);
        REQUIRE(updated[0].args["updated_fields"] == nlohmann::json::array({"address", "did"}));
        REQUIRE(updated[0].args["owner"] == to_hex(carol.address));

        SECTION("Old owner lost control")
        {
            AgentUpdate desc;
            desc.new_description = "x";
            REQUIRE(registry.update_agent(call_from(alice.address), id, desc).error().code ==
                    ErrorCode::UnauthorizedUpdate);
            REQUIRE(registry.update_agent(call_from(carol.address), id, desc).has_value());
        }
    }

    SECTION("Retained DID must bind the new address")
    {
        AgentUpdate update;
        update.new_address = carol.address;
        auto res = registry.update_agent(call_from(alice.address), id, update);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::DIDAddressMismatch);
        REQUIRE(registry.get(id).value().owner == alice.address);
    }

    SECTION("New DID is checked against the current address when it is not rotating")
    {
        AgentUpdate update;
        update.new_did = carol.did;
        REQUIRE(registry.update_agent(call_from(alice.address), id, update).error().code ==
                ErrorCode::DIDAddressMismatch);
    }

    SECTION("Address rotation with the DID cleared")
    {
        AgentUpdate update;
        update.new_address = carol.address;
        update.new_did = "";
        REQUIRE(registry.update_agent(call_from(alice.address), id, update).has_value());
        REQUIRE(registry.get(id).value().did.empty());
        REQUIRE(registry.resolve_by_did(alice.did).error().code == ErrorCode::DIDNotRegistered);

        SECTION("Freed address can register again")
        {
            auto again = registry.register_agent(call_from(alice.address), request_for(alice, "", true));
            REQUIRE(again.has_value());
            REQUIRE(*again == 3);
        }
    }

    SECTION("Rotation into a registered address")
    {
        AgentUpdate update;
        update.new_address = bob.address;
        update.new_did = bob.did;
        REQUIRE(registry.update_agent(call_from(alice.address), id, update).error().code ==
                ErrorCode::AddressAlreadyRegistered);
    }

    SECTION("Domain change")
    {
        AgentUpdate update;
        update.new_domain = "Alice.Example";
        REQUIRE(registry.update_agent(call_from(alice.address), id, update).has_value());
        REQUIRE(registry.get(id).value().domain == "Alice.Example");

        update.new_domain = "new-alice.example";
        REQUIRE(registry.update_agent(call_from(alice.address), id, update).has_value());
        REQUIRE(registry.resolve_by_domain("alice.example").error().code == ErrorCode::AgentNotFound);
        REQUIRE(registry.resolve_by_domain("NEW-alice.example").value().agent_id == id);

        update.new_domain = "BOB.example";
        REQUIRE(registry.update_agent(call_from(alice.address), id, update).error().code ==
                ErrorCode::DomainAlreadyRegistered);
    }

    SECTION("A failing field leaves the others untouched")
    {
        AgentUpdate update;
        update.new_domain = "moved.example";
        update.new_description = "moved";
        update.new_did = bob.did;
        auto res = registry.update_agent(call_from(alice.address), id, update);
        REQUIRE_FALSE(res.has_value());

        auto record = registry.get(id).value();
        REQUIRE(record.domain == "alice.example");
        REQUIRE(record.did == alice.did);
        REQUIRE(record.description == "agent at alice.example");
        REQUIRE(registry.resolve_by_domain("moved.example").error().code == ErrorCode::AgentNotFound);
        REQUIRE(log->events_named(events::kAgentUpdated).empty());
    }

    SECTION("Empty update is a silent no-op")
    {
        REQUIRE(registry.update_agent(call_from(alice.address), id, AgentUpdate{}).has_value());
        REQUIRE(log->events_named(events::kAgentUpdated).empty());
    }

    SECTION("Description only")
    {
        REQUIRE(registry.update_description_only(call_from(alice.address), id, "now with forecasts").has_value());
        REQUIRE(registry.get(id).value().description == "now with forecasts");
        REQUIRE(registry.update_description_only(call_from(bob.address), id, "x").error().code ==
                ErrorCode::UnauthorizedUpdate);
    }

    REQUIRE(registry.get(bob_id).value().owner == bob.address);
}

TEST_CASE("Developer DID links", "[identity]")
{
    auto log = std::make_shared<EventLog>();
    IdentityRegistry registry(log);
    auto alice = make_actor(1);
    auto dev1 = make_actor(2);
    auto dev2 = make_actor(3);
    auto id = registry.register_agent(call_from(alice.address), request_for(alice, "alice.example")).value();

    REQUIRE_FALSE(registry.developer_did(id).has_value());

    REQUIRE(registry.link_developer_did(call_from(alice.address), id, dev1.address, dev1.did).has_value());
    REQUIRE(registry.developer_did(id) == dev1.did);

    REQUIRE(registry.link_developer_did(call_from(alice.address), id, dev2.address, dev2.did).has_value());
    REQUIRE(registry.developer_did(id) == dev2.did);
    REQUIRE(log->events_named(events::kAgentDeveloperLinked).size() == 2);

    auto mismatch = registry.link_developer_did(call_from(alice.address), id, dev1.address, dev2.did);
    REQUIRE(mismatch.error().code == ErrorCode::InvalidDeveloperDID);

    auto not_owner = registry.link_developer_did(call_from(dev1.address), id, dev1.address, dev1.did);
    REQUIRE(not_owner.error().code == ErrorCode::UnauthorizedUpdate);

    REQUIRE(registry.developer_did(id) == dev2.did);
}
