#pragma once

#include "consent.hpp"
#include "events.hpp"
#include "primitives.hpp"
#include "registration_policy.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace agentreg
{

    struct AgentRecord
    {
        AgentId agent_id{kNoAgent};
        Address owner{};
        std::string domain; // display casing; lookups use the lower-cased form
        std::string did;
        std::string description;

        nlohmann::json to_json() const;
    };

    struct RegistrationRequest
    {
        std::string domain;
        std::string did;
        Address address{};
        std::string description;
    };

    struct DelegatedRegistration
    {
        std::string developer_did;
        std::string agent_did;
        Address agent_address{};
        std::string description;
        uint64_t expiry{0};
        Bytes agent_signature;
    };

    /**
     * Fields to change on an agent. Unset fields are left alone; an empty
     * domain or DID clears it.
     */
    struct AgentUpdate
    {
        std::optional<Address> new_address;
        std::optional<std::string> new_domain;
        std::optional<std::string> new_did;
        std::optional<std::string> new_description;

        bool empty() const
        {
            return !new_address && !new_domain && !new_did && !new_description;
        }
    };

    /**
     * When the per-address consent nonce advances.
     *
     * ConsumeAfterExpiryCheck burns the nonce as soon as an unexpired consent
     * is presented, even if its signature turns out to be bad. Anyone can
     * therefore invalidate an agent's outstanding consent by submitting a
     * forged one. ConsumeOnSuccess only advances it with a committed
     * registration.
     */
    enum class NoncePolicy
    {
        ConsumeAfterExpiryCheck,
        ConsumeOnSuccess
    };

    std::string_view nonce_policy_name(NoncePolicy policy);

    Result<NoncePolicy> nonce_policy_from_string(std::string_view s);

    struct IdentityRegistryOptions
    {
        IdentifierRequirement identifier_requirement{IdentifierRequirement::None};
        NoncePolicy nonce_policy{NoncePolicy::ConsumeAfterExpiryCheck};
        SigningDomain signing_domain{};
    };

    /**
     * Canonical agent directory.
     *
     * One authoritative record table plus unique secondary indexes on the
     * lower-cased domain, the DID and the owner address. Every mutation
     * validates first and commits all index changes together, so a failed
     * call leaves no trace (except a consumed consent nonce, see NoncePolicy).
     */
    class IdentityRegistry
    {
    public:
        explicit IdentityRegistry(
            std::shared_ptr<EventLog> events,
            IdentityRegistryOptions options = {},
            std::unique_ptr<FeePolicy> fee_policy = nullptr);

        /** Self-registration: the caller must be the prospective owner. */
        Result<AgentId> register_agent(const CallContext &ctx, const RegistrationRequest &request);

        /**
         * Registration submitted by a developer with the agent's offline
         * signed consent. Links the developer DID to the new agent.
         */
        Result<AgentId> register_with_delegated_consent(const CallContext &ctx, const DelegatedRegistration &request);

        Result<void> update_agent(const CallContext &ctx, AgentId agent_id, const AgentUpdate &update);

        Result<void> update_description_only(const CallContext &ctx, AgentId agent_id, std::string description);

        /** Owner-only; replaces any previous link. */
        Result<void> link_developer_did(
            const CallContext &ctx,
            AgentId agent_id,
            const Address &developer_address,
            const std::string &developer_did);

        Result<AgentRecord> get(AgentId agent_id) const;
        Result<AgentRecord> resolve_by_domain(std::string_view domain) const;
        Result<AgentRecord> resolve_by_address(const Address &address) const;
        Result<AgentRecord> resolve_by_did(std::string_view did) const;
        bool exists(AgentId agent_id) const;
        uint64_t count() const;

        std::optional<std::string> developer_did(AgentId agent_id) const;

        /** Next consent nonce expected from this address. */
        uint64_t nonce(const Address &address) const;

        /** Addresses whose nonce has moved past zero. */
        std::size_t nonce_count() const;

        const SigningDomain &signing_domain() const { return options_.signing_domain; }
        const FeePolicy &fee_policy() const { return *fee_policy_; }

    private:
        Result<void> check_did_available(const std::string &did, AgentId self) const;
        AgentId insert_record(AgentRecord record);

        std::shared_ptr<EventLog> events_;
        IdentityRegistryOptions options_;
        std::unique_ptr<FeePolicy> fee_policy_;

        mutable std::shared_mutex mutex_;
        std::unordered_map<AgentId, AgentRecord> agents_;
        std::unordered_map<std::string, AgentId> by_domain_;
        std::unordered_map<std::string, AgentId> by_did_;
        std::map<Address, AgentId> by_address_;
        std::unordered_map<AgentId, std::string> developer_dids_;
        std::map<Address, uint64_t> nonces_;
        AgentId next_id_{1};
    };

} // namespace agentreg
