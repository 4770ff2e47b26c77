#include "agentreg/validation_registry.hpp"
#include <spdlog/spdlog.h>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

namespace agentreg
{

    nlohmann::json ValidationRequest::to_json() const
    {
        return nlohmann::json{{"validator_agent_id", validator_agent_id},
                              {"server_agent_id", server_agent_id},
                              {"data_hash", to_hex(data_hash)},
                              {"timestamp", timestamp},
                              {"responded", responded}};
    }

    ValidationRegistry::ValidationRegistry(
        std::shared_ptr<const IdentityRegistry> identity,
        std::shared_ptr<EventLog> events)
        : identity_(std::move(identity)), events_(std::move(events))
    {
        if (!identity_)
            throw std::invalid_argument("ValidationRegistry requires an identity registry");
        if (!events_)
            events_ = std::make_shared<EventLog>();
    }

    Result<void> ValidationRegistry::request_validation(
        const CallContext &ctx,
        AgentId validator_agent_id,
        AgentId server_agent_id,
        const Hash32 &data_hash)
    {
        if (is_zero(data_hash))
            return fail(ErrorCode::InvalidDataHash, "Data hash must be non-zero");

        if (!identity_->exists(validator_agent_id))
        {
            return std::unexpected(RegistryError::agent_not_found(
                "Unknown validator agent " + std::to_string(validator_agent_id)));
        }
        if (!identity_->exists(server_agent_id))
        {
            return std::unexpected(RegistryError::agent_not_found(
                "Unknown server agent " + std::to_string(server_agent_id)));
        }

        std::unique_lock lock(mutex_);

        auto it = requests_.find(data_hash);
        if (it != requests_.end() && !is_expired(it->second, ctx.timestamp))
        {
            const auto &live = it->second;
            spdlog::debug("validation request {} still live, re-emitting", to_hex(data_hash));
            events_->emit(events::validation_requested(live.validator_agent_id, live.server_agent_id, data_hash),
                          ctx.timestamp);
            return {};
        }

        if (it != requests_.end())
            spdlog::info("validation request {} expired, reusing slot", to_hex(data_hash));

        requests_[data_hash] = ValidationRequest{validator_agent_id, server_agent_id, data_hash, ctx.timestamp, false};
        responses_.erase(data_hash);

        events_->emit(events::validation_requested(validator_agent_id, server_agent_id, data_hash), ctx.timestamp);
        return {};
    }

    Result<void> ValidationRegistry::submit_response(const CallContext &ctx, const Hash32 &data_hash, int64_t score)
    {
        if (score < 0 || score > kMaxScore)
            return fail(ErrorCode::InvalidResponse, "Score out of range [0, 100]: " + std::to_string(score));

        std::unique_lock lock(mutex_);

        auto it = requests_.find(data_hash);
        if (it == requests_.end())
            return fail(ErrorCode::ValidationRequestNotFound, "No validation request for " + to_hex(data_hash));

        ValidationRequest &request = it->second;
        if (is_expired(request, ctx.timestamp))
        {
            return fail(ErrorCode::RequestExpired,
                        "Validation request " + to_hex(data_hash) + " made at " +
                            std::to_string(request.timestamp) + " has expired");
        }

        if (request.responded)
            return fail(ErrorCode::ValidationAlreadyResponded, "Validation already responded: " + to_hex(data_hash));

        // Resolved now so that a rotated validator address is honoured.
        auto validator = identity_->get(request.validator_agent_id);
        if (!validator)
            return std::unexpected(validator.error());
        if (ctx.caller != validator->owner)
        {
            return std::unexpected(RegistryError::unauthorized_validator(
                "Caller is not the owner of validator agent " + std::to_string(request.validator_agent_id)));
        }

        request.responded = true;
        responses_[data_hash] = static_cast<uint8_t>(score);

        spdlog::info("validation {} scored {} by agent {}", to_hex(data_hash), score, request.validator_agent_id);
        events_->emit(events::validation_responded(request.validator_agent_id, request.server_agent_id, data_hash,
                                                   static_cast<uint8_t>(score)),
                      ctx.timestamp);
        return {};
    }

    Result<ValidationRequest> ValidationRegistry::get_request(const Hash32 &data_hash) const
    {
        std::shared_lock lock(mutex_);
        auto it = requests_.find(data_hash);
        if (it == requests_.end())
            return fail(ErrorCode::ValidationRequestNotFound, "No validation request for " + to_hex(data_hash));
        return it->second;
    }

    PendingStatus ValidationRegistry::is_pending(const Hash32 &data_hash, uint64_t now) const
    {
        std::shared_lock lock(mutex_);
        auto it = requests_.find(data_hash);
        if (it == requests_.end())
            return {};
        return PendingStatus{true, !it->second.responded && !is_expired(it->second, now)};
    }

    ValidationResponse ValidationRegistry::get_response(const Hash32 &data_hash) const
    {
        std::shared_lock lock(mutex_);
        auto it = responses_.find(data_hash);
        if (it == responses_.end())
            return {};
        return ValidationResponse{true, it->second};
    }

} // namespace agentreg
