#pragma once

#include "events.hpp"
#include "identity_registry.hpp"
#include "primitives.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <utility>

namespace agentreg
{

    struct FeedbackAuthorization
    {
        bool authorized{false};
        Hash32 auth_id{}; // all zero when absent
    };

    /**
     * Feedback pre-authorizations. A server agent's owner grants a client
     * agent the right to rate it; grants are keyed by agent id so they
     * survive address, domain and DID changes, and are never revoked.
     */
    class ReputationRegistry
    {
    public:
        ReputationRegistry(std::shared_ptr<const IdentityRegistry> identity, std::shared_ptr<EventLog> events);

        /** Returns the new authorization token. */
        Result<Hash32> accept_feedback(const CallContext &ctx, AgentId client_agent_id, AgentId server_agent_id);

        FeedbackAuthorization is_authorized(AgentId client_agent_id, AgentId server_agent_id) const;

        Hash32 get_auth_id(AgentId client_agent_id, AgentId server_agent_id) const;

        std::size_t size() const;

    private:
        static Hash32 derive_token(const CallContext &ctx, AgentId client_agent_id, AgentId server_agent_id);

        std::shared_ptr<const IdentityRegistry> identity_;
        std::shared_ptr<EventLog> events_;

        mutable std::shared_mutex mutex_;
        std::map<std::pair<AgentId, AgentId>, Hash32> authorizations_;
    };

} // namespace agentreg
