#pragma once

#include "events.hpp"
#include "identity_registry.hpp"
#include "primitives.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>

namespace agentreg
{

    struct ValidationRequest
    {
        AgentId validator_agent_id{kNoAgent};
        AgentId server_agent_id{kNoAgent};
        Hash32 data_hash{};
        uint64_t timestamp{0};
        bool responded{false};

        nlohmann::json to_json() const;
    };

    struct PendingStatus
    {
        bool exists{false};
        bool pending{false};
    };

    struct ValidationResponse
    {
        bool has_response{false};
        uint8_t score{0};
    };

    /**
     * Time-bounded validation requests keyed by a work digest.
     *
     * Per hash: absent -> pending -> responded, and pending/responded ->
     * expired once now > timestamp + kExpirationWindow. An expired slot is
     * reused by the next request, dropping the old assignment and response.
     */
    class ValidationRegistry
    {
    public:
        static constexpr uint64_t kExpirationWindow = 1000;
        static constexpr int64_t kMaxScore = 100;

        ValidationRegistry(std::shared_ptr<const IdentityRegistry> identity, std::shared_ptr<EventLog> events);

        /**
         * Open a request for data_hash. Re-requesting a live slot only
         * re-emits its event; the stored assignment and timer are kept.
         */
        Result<void> request_validation(
            const CallContext &ctx,
            AgentId validator_agent_id,
            AgentId server_agent_id,
            const Hash32 &data_hash);

        /** Record the designated validator's score in [0, 100]. */
        Result<void> submit_response(const CallContext &ctx, const Hash32 &data_hash, int64_t score);

        Result<ValidationRequest> get_request(const Hash32 &data_hash) const;

        PendingStatus is_pending(const Hash32 &data_hash, uint64_t now) const;

        ValidationResponse get_response(const Hash32 &data_hash) const;

        static constexpr uint64_t expiration_window() { return kExpirationWindow; }

    private:
        static bool is_expired(const ValidationRequest &request, uint64_t now)
        {
            return now > request.timestamp && now - request.timestamp > kExpirationWindow;
        }

        std::shared_ptr<const IdentityRegistry> identity_;
        std::shared_ptr<EventLog> events_;

        mutable std::shared_mutex mutex_;
        std::map<Hash32, ValidationRequest> requests_;
        std::map<Hash32, uint8_t> responses_;
    };

} // namespace agentreg
