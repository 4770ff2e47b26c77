#include "agentreg/reputation_registry.hpp"
#include "agentreg/crypto.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

namespace agentreg
{

    ReputationRegistry::ReputationRegistry(
        std::shared_ptr<const IdentityRegistry> identity,
        std::shared_ptr<EventLog> events)
        : identity_(std::move(identity)), events_(std::move(events))
    {
        if (!identity_)
            throw std::invalid_argument("ReputationRegistry requires an identity registry");
        if (!events_)
            events_ = std::make_shared<EventLog>();
    }

    Hash32 ReputationRegistry::derive_token(const CallContext &ctx, AgentId client_agent_id, AgentId server_agent_id)
    {
        Bytes preimage;
        append_u64_be(preimage, client_agent_id);
        append_u64_be(preimage, server_agent_id);
        append_u64_be(preimage, ctx.timestamp);
        preimage.insert(preimage.end(), ctx.entropy.begin(), ctx.entropy.end());
        preimage.insert(preimage.end(), ctx.caller.begin(), ctx.caller.end());
        return crypto::SHA256::hash(preimage);
    }

    Result<Hash32> ReputationRegistry::accept_feedback(
        const CallContext &ctx,
        AgentId client_agent_id,
        AgentId server_agent_id)
    {
        if (!identity_->exists(client_agent_id))
        {
            return std::unexpected(RegistryError::agent_not_found(
                "Unknown client agent " + std::to_string(client_agent_id)));
        }

        auto server = identity_->get(server_agent_id);
        if (!server)
            return std::unexpected(server.error());

        if (ctx.caller != server->owner)
        {
            return std::unexpected(RegistryError::unauthorized_feedback(
                "Only the owner of server agent " + std::to_string(server_agent_id) + " may authorize feedback"));
        }

        std::unique_lock lock(mutex_);
        auto key = std::make_pair(client_agent_id, server_agent_id);
        if (authorizations_.contains(key))
        {
            return fail(ErrorCode::FeedbackAlreadyAuthorized,
                        "Feedback from " + std::to_string(client_agent_id) + " to " +
                            std::to_string(server_agent_id) + " already authorized");
        }

        Hash32 token = derive_token(ctx, client_agent_id, server_agent_id);
        authorizations_.emplace(key, token);

        spdlog::info("feedback authorized client={} server={}", client_agent_id, server_agent_id);
        events_->emit(events::feedback_authorized(client_agent_id, server_agent_id, token), ctx.timestamp);
        return token;
    }

    FeedbackAuthorization ReputationRegistry::is_authorized(AgentId client_agent_id, AgentId server_agent_id) const
    {
        std::shared_lock lock(mutex_);
        auto it = authorizations_.find({client_agent_id, server_agent_id});
        if (it == authorizations_.end())
            return {};
        return FeedbackAuthorization{true, it->second};
    }

    Hash32 ReputationRegistry::get_auth_id(AgentId client_agent_id, AgentId server_agent_id) const
    {
        return is_authorized(client_agent_id, server_agent_id).auth_id;
    }

    std::size_t ReputationRegistry::size() const
    {
        std::shared_lock lock(mutex_);
        return authorizations_.size();
    }

} // namespace agentreg
