#include "agentreg/identity_registry.hpp"
#include "agentreg/crypto.hpp"
#include "agentreg/did_validator.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <shared_mutex>

namespace agentreg
{

    namespace
    {
        std::string agent_label(AgentId id)
        {
            return "agent " + std::to_string(id);
        }
    } // namespace

    nlohmann::json AgentRecord::to_json() const
    {
        return nlohmann::json{{"agent_id", agent_id},
                              {"owner", to_hex(owner)},
                              {"domain", domain},
                              {"did", did},
                              {"description", description}};
    }

    std::string_view nonce_policy_name(NoncePolicy policy)
    {
        switch (policy)
        {
        case NoncePolicy::ConsumeAfterExpiryCheck:
            return "after_expiry_check";
        case NoncePolicy::ConsumeOnSuccess:
            return "on_success";
        }
        return "after_expiry_check";
    }

    Result<NoncePolicy> nonce_policy_from_string(std::string_view s)
    {
        if (s == "after_expiry_check")
            return NoncePolicy::ConsumeAfterExpiryCheck;
        if (s == "on_success")
            return NoncePolicy::ConsumeOnSuccess;
        return std::unexpected(RegistryError::config("Invalid nonce policy: " + std::string(s)));
    }

    IdentityRegistry::IdentityRegistry(
        std::shared_ptr<EventLog> events,
        IdentityRegistryOptions options,
        std::unique_ptr<FeePolicy> fee_policy)
        : events_(std::move(events)),
          options_(std::move(options)),
          fee_policy_(fee_policy ? std::move(fee_policy) : std::make_unique<NoFeePolicy>())
    {
        if (!events_)
            events_ = std::make_shared<EventLog>();
    }

    // Caller holds the lock.
    Result<void> IdentityRegistry::check_did_available(const std::string &did, AgentId self) const
    {
        auto it = by_did_.find(did);
        if (it != by_did_.end() && it->second != self)
        {
            return fail(ErrorCode::DIDAlreadyRegistered, "DID already registered: " + did);
        }
        return {};
    }

    // Caller holds the unique lock and has validated every index.
    AgentId IdentityRegistry::insert_record(AgentRecord record)
    {
        record.agent_id = next_id_++;
        if (!record.domain.empty())
            by_domain_[to_lower_ascii(record.domain)] = record.agent_id;
        if (!record.did.empty())
            by_did_[record.did] = record.agent_id;
        by_address_[record.owner] = record.agent_id;

        AgentId id = record.agent_id;
        agents_.emplace(id, std::move(record));
        return id;
    }

    Result<AgentId> IdentityRegistry::register_agent(const CallContext &ctx, const RegistrationRequest &request)
    {
        if (is_zero(request.address))
            return std::unexpected(RegistryError::invalid_address("Agent address must be non-zero"));

        if (ctx.caller != request.address)
        {
            return std::unexpected(RegistryError::unauthorized_registration(
                "Caller " + to_hex(ctx.caller) + " cannot register " + to_hex(request.address)));
        }

        if (auto ok = check_identifiers(options_.identifier_requirement, request.domain, request.did); !ok)
            return std::unexpected(ok.error());

        if (auto paid = fee_policy_->check(ctx); !paid)
            return std::unexpected(paid.error());

        std::unique_lock lock(mutex_);

        if (!request.domain.empty() && by_domain_.contains(to_lower_ascii(request.domain)))
        {
            return fail(ErrorCode::DomainAlreadyRegistered, "Domain already registered: " + request.domain);
        }

        if (!request.did.empty())
        {
            if (!DidValidator::validate(request.did, request.address))
            {
                return std::unexpected(RegistryError::did_address_mismatch(
                    "DID does not embed " + to_hex(request.address)));
            }
            if (auto available = check_did_available(request.did, kNoAgent); !available)
                return std::unexpected(available.error());
        }

        if (by_address_.contains(request.address))
        {
            return fail(ErrorCode::AddressAlreadyRegistered, "Address already registered: " + to_hex(request.address));
        }

        AgentId id = insert_record(AgentRecord{kNoAgent, request.address, request.domain, request.did, request.description});
        fee_policy_->settle(ctx);

        spdlog::info("registered {} owner={} domain='{}' did='{}'", agent_label(id), to_hex(request.address),
                     request.domain, request.did);
        events_->emit(events::agent_registered(id, request.address, request.domain, request.did), ctx.timestamp);
        return id;
    }

    Result<AgentId> IdentityRegistry::register_with_delegated_consent(
        const CallContext &ctx,
        const DelegatedRegistration &request)
    {
        if (is_zero(request.agent_address))
            return std::unexpected(RegistryError::invalid_address("Agent address must be non-zero"));

        if (!DidValidator::validate(request.developer_did, ctx.caller))
        {
            return std::unexpected(RegistryError::did_address_mismatch(
                "Developer DID does not embed caller " + to_hex(ctx.caller)));
        }

        if (!DidValidator::validate(request.agent_did, request.agent_address))
        {
            return std::unexpected(RegistryError::did_address_mismatch(
                "Agent DID does not embed " + to_hex(request.agent_address)));
        }

        if (auto ok = check_identifiers(options_.identifier_requirement, "", request.agent_did); !ok)
            return std::unexpected(ok.error());

        if (auto paid = fee_policy_->check(ctx); !paid)
            return std::unexpected(paid.error());

        if (ctx.timestamp > request.expiry)
        {
            return fail(ErrorCode::SignatureExpired,
                        "Consent expired at " + std::to_string(request.expiry) + ", now " + std::to_string(ctx.timestamp));
        }

        std::unique_lock lock(mutex_);

        auto nonce_it = nonces_.find(request.agent_address);
        const uint64_t expected_nonce = nonce_it == nonces_.end() ? 0 : nonce_it->second;
        DelegatedConsent consent{
            request.developer_did,
            request.agent_did,
            request.agent_address,
            request.description,
            expected_nonce,
            request.expiry};

        if (options_.nonce_policy == NoncePolicy::ConsumeAfterExpiryCheck)
            nonces_[request.agent_address] = expected_nonce + 1;

        auto signer = crypto::recover_signer(consent_digest(options_.signing_domain, consent), request.agent_signature);
        if (!signer || *signer != request.agent_address)
        {
            if (options_.nonce_policy == NoncePolicy::ConsumeAfterExpiryCheck)
            {
                spdlog::warn("rejected consent signature for {} burned nonce {}", to_hex(request.agent_address),
                             consent.nonce);
            }
            return fail(ErrorCode::InvalidAgentSignature,
                        "Consent not signed by " + to_hex(request.agent_address));
        }

        if (auto available = check_did_available(request.agent_did, kNoAgent); !available)
            return std::unexpected(available.error());

        if (by_address_.contains(request.agent_address))
        {
            return fail(ErrorCode::AddressAlreadyRegistered,
                        "Address already registered: " + to_hex(request.agent_address));
        }

        if (options_.nonce_policy == NoncePolicy::ConsumeOnSuccess)
            nonces_[request.agent_address] = expected_nonce + 1;

        AgentId id = insert_record(AgentRecord{kNoAgent, request.agent_address, "", request.agent_did, request.description});
        developer_dids_[id] = request.developer_did;
        fee_policy_->settle(ctx);

        spdlog::info("registered {} owner={} via developer {}", agent_label(id), to_hex(request.agent_address),
                     request.developer_did);
        events_->emit(events::agent_registered(id, request.agent_address, "", request.agent_did), ctx.timestamp);
        events_->emit(events::agent_developer_linked(id, request.developer_did), ctx.timestamp);
        return id;
    }

    Result<void> IdentityRegistry::update_agent(const CallContext &ctx, AgentId agent_id, const AgentUpdate &update)
    {
        std::unique_lock lock(mutex_);

        auto it = agents_.find(agent_id);
        if (it == agents_.end())
            return std::unexpected(RegistryError::agent_not_found("Unknown " + agent_label(agent_id)));

        AgentRecord &current = it->second;
        if (ctx.caller != current.owner)
        {
            return std::unexpected(RegistryError::unauthorized_update(
                "Caller " + to_hex(ctx.caller) + " does not own " + agent_label(agent_id)));
        }

        if (update.empty())
            return {};

        AgentRecord next = current;
        std::vector<std::string> updated_fields;

        if (update.new_address)
        {
            if (is_zero(*update.new_address))
                return std::unexpected(RegistryError::invalid_address("New address must be non-zero"));
            if (*update.new_address != current.owner && by_address_.contains(*update.new_address))
            {
                return fail(ErrorCode::AddressAlreadyRegistered,
                            "Address already registered: " + to_hex(*update.new_address));
            }
            next.owner = *update.new_address;
            updated_fields.emplace_back("address");
        }

        if (update.new_domain)
        {
            if (!update.new_domain->empty())
            {
                auto found = by_domain_.find(to_lower_ascii(*update.new_domain));
                if (found != by_domain_.end() && found->second != agent_id)
                {
                    return fail(ErrorCode::DomainAlreadyRegistered, "Domain already registered: " + *update.new_domain);
                }
            }
            next.domain = *update.new_domain;
            updated_fields.emplace_back("domain");
        }

        if (update.new_did)
        {
            if (!update.new_did->empty())
            {
                if (!DidValidator::validate(*update.new_did, next.owner))
                {
                    return std::unexpected(RegistryError::did_address_mismatch(
                        "DID does not embed " + to_hex(next.owner)));
                }
                if (auto available = check_did_available(*update.new_did, agent_id); !available)
                    return std::unexpected(available.error());
            }
            next.did = *update.new_did;
            updated_fields.emplace_back("did");
        }
        else if (next.owner != current.owner && !next.did.empty() && !DidValidator::validate(next.did, next.owner))
        {
            // A retained DID must keep binding the owner.
            return std::unexpected(RegistryError::did_address_mismatch(
                "Current DID does not embed new address " + to_hex(next.owner)));
        }

        if (update.new_description)
        {
            next.description = *update.new_description;
            updated_fields.emplace_back("description");
        }

        if (auto ok = check_identifiers(options_.identifier_requirement, next.domain, next.did); !ok)
            return std::unexpected(ok.error());

        // All checks passed; swap index entries.
        if (next.owner != current.owner)
        {
            by_address_.erase(current.owner);
            by_address_[next.owner] = agent_id;
        }
        auto old_domain_key = to_lower_ascii(current.domain);
        auto new_domain_key = to_lower_ascii(next.domain);
        if (old_domain_key != new_domain_key)
        {
            if (!old_domain_key.empty())
                by_domain_.erase(old_domain_key);
            if (!new_domain_key.empty())
                by_domain_[new_domain_key] = agent_id;
        }
        if (next.did != current.did)
        {
            if (!current.did.empty())
                by_did_.erase(current.did);
            if (!next.did.empty())
                by_did_[next.did] = agent_id;
        }
        current = std::move(next);

        spdlog::info("updated {} fields={}", agent_label(agent_id), nlohmann::json(updated_fields).dump());
        events_->emit(events::agent_updated(agent_id, updated_fields, current.owner, current.domain, current.did),
                      ctx.timestamp);
        return {};
    }

    Result<void> IdentityRegistry::update_description_only(
        const CallContext &ctx,
        AgentId agent_id,
        std::string description)
    {
        AgentUpdate update;
        update.new_description = std::move(description);
        return update_agent(ctx, agent_id, update);
    }

    Result<void> IdentityRegistry::link_developer_did(
        const CallContext &ctx,
        AgentId agent_id,
        const Address &developer_address,
        const std::string &developer_did)
    {
        std::unique_lock lock(mutex_);

        auto it = agents_.find(agent_id);
        if (it == agents_.end())
            return std::unexpected(RegistryError::agent_not_found("Unknown " + agent_label(agent_id)));

        if (ctx.caller != it->second.owner)
        {
            return std::unexpected(RegistryError::unauthorized_update(
                "Caller " + to_hex(ctx.caller) + " does not own " + agent_label(agent_id)));
        }

        if (!DidValidator::validate(developer_did, developer_address))
        {
            return fail(ErrorCode::InvalidDeveloperDID,
                        "Developer DID does not embed " + to_hex(developer_address));
        }

        developer_dids_[agent_id] = developer_did;

        spdlog::info("linked {} to developer {}", agent_label(agent_id), developer_did);
        events_->emit(events::agent_developer_linked(agent_id, developer_did), ctx.timestamp);
        return {};
    }

    Result<AgentRecord> IdentityRegistry::get(AgentId agent_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = agents_.find(agent_id);
        if (it == agents_.end())
            return std::unexpected(RegistryError::agent_not_found("Unknown " + agent_label(agent_id)));
        return it->second;
    }

    Result<AgentRecord> IdentityRegistry::resolve_by_domain(std::string_view domain) const
    {
        std::shared_lock lock(mutex_);
        auto it = by_domain_.find(to_lower_ascii(domain));
        if (domain.empty() || it == by_domain_.end())
            return std::unexpected(RegistryError::agent_not_found("No agent for domain " + std::string(domain)));
        return agents_.at(it->second);
    }

    Result<AgentRecord> IdentityRegistry::resolve_by_address(const Address &address) const
    {
        std::shared_lock lock(mutex_);
        auto it = by_address_.find(address);
        if (it == by_address_.end())
            return std::unexpected(RegistryError::agent_not_found("No agent for address " + to_hex(address)));
        return agents_.at(it->second);
    }

    Result<AgentRecord> IdentityRegistry::resolve_by_did(std::string_view did) const
    {
        std::shared_lock lock(mutex_);
        auto it = by_did_.find(std::string(did));
        if (did.empty() || it == by_did_.end())
            return fail(ErrorCode::DIDNotRegistered, "DID not registered: " + std::string(did));
        return agents_.at(it->second);
    }

    bool IdentityRegistry::exists(AgentId agent_id) const
    {
        std::shared_lock lock(mutex_);
        return agents_.contains(agent_id);
    }

    uint64_t IdentityRegistry::count() const
    {
        std::shared_lock lock(mutex_);
        return agents_.size();
    }

    std::optional<std::string> IdentityRegistry::developer_did(AgentId agent_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = developer_dids_.find(agent_id);
        if (it == developer_dids_.end())
            return std::nullopt;
        return it->second;
    }

    uint64_t IdentityRegistry::nonce(const Address &address) const
    {
        std::shared_lock lock(mutex_);
        auto it = nonces_.find(address);
        return it == nonces_.end() ? 0 : it->second;
    }

    std::size_t IdentityRegistry::nonce_count() const
    {
        std::shared_lock lock(mutex_);
        return nonces_.size();
    }

} // namespace agentreg
