#include "agentreg/ledger.hpp"
#include "agentreg/crypto.hpp"
#include "agentreg/event_store.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace agentreg
{

    namespace
    {
        Result<const json *> field(const json &tx, const char *key)
        {
            auto it = tx.find(key);
            if (it == tx.end() || it->is_null())
                return std::unexpected(RegistryError::invalid_input(std::string("Missing field '") + key + "'"));
            return &*it;
        }

        Result<std::string> get_string(const json &tx, const char *key)
        {
            auto f = field(tx, key);
            if (!f)
                return std::unexpected(f.error());
            if (!(*f)->is_string())
                return std::unexpected(RegistryError::invalid_input(std::string("Field '") + key + "' must be a string"));
            return (*f)->get<std::string>();
        }

        std::string get_string_or(const json &tx, const char *key, const std::string &fallback)
        {
            auto it = tx.find(key);
            if (it == tx.end() || !it->is_string())
                return fallback;
            return it->get<std::string>();
        }

        Result<uint64_t> get_u64(const json &tx, const char *key)
        {
            auto f = field(tx, key);
            if (!f)
                return std::unexpected(f.error());
            if (!(*f)->is_number_unsigned())
            {
                return std::unexpected(RegistryError::invalid_input(
                    std::string("Field '") + key + "' must be a non-negative integer"));
            }
            return (*f)->get<uint64_t>();
        }

        Result<int64_t> get_i64(const json &tx, const char *key)
        {
            auto f = field(tx, key);
            if (!f)
                return std::unexpected(f.error());
            if (!(*f)->is_number_integer())
                return std::unexpected(RegistryError::invalid_input(std::string("Field '") + key + "' must be an integer"));
            return (*f)->get<int64_t>();
        }

        Result<Address> get_address(const json &tx, const char *key)
        {
            auto s = get_string(tx, key);
            if (!s)
                return std::unexpected(s.error());
            auto addr = address_from_hex(*s);
            if (!addr)
                return std::unexpected(RegistryError::invalid_address(std::string("Field '") + key + "': " + addr.error().what()));
            return *addr;
        }

        Result<Hash32> get_hash(const json &tx, const char *key)
        {
            auto s = get_string(tx, key);
            if (!s)
                return std::unexpected(s.error());
            return hash_from_hex(*s);
        }

        json agent_json(const AgentRecord &record, const IdentityRegistry &identity)
        {
            json j = record.to_json();
            auto developer = identity.developer_did(record.agent_id);
            j["developer_did"] = developer ? json(*developer) : json(nullptr);
            return j;
        }

        Result<json> agent_result(const Result<AgentRecord> &record, const IdentityRegistry &identity)
        {
            if (!record)
                return std::unexpected(record.error());
            return agent_json(*record, identity);
        }

    } // namespace

    Ledger::Ledger(const RegistryConfig &cfg)
        : events_(std::make_shared<EventLog>())
    {
        IdentityRegistryOptions options;
        options.identifier_requirement = cfg.identity.identifier_requirement;
        options.nonce_policy = cfg.identity.nonce_policy;
        options.signing_domain = cfg.signing_domain;

        identity_ = std::make_shared<IdentityRegistry>(events_, options, make_fee_policy(cfg.identity.registration_fee));
        reputation_ = std::make_unique<ReputationRegistry>(identity_, events_);
        validation_ = std::make_unique<ValidationRegistry>(identity_, events_);
    }

    Result<std::unique_ptr<Ledger>> Ledger::open(const RegistryConfig &cfg)
    {
        auto ledger = std::make_unique<Ledger>(cfg);

        if (!cfg.events.jsonl_path.empty())
            ledger->events_->add_sink(std::make_shared<JsonlEventSink>(cfg.events.jsonl_path));

        if (!cfg.events.rocksdb_path.empty())
        {
            auto sink = open_database_sink(cfg.events.rocksdb_path);
            if (!sink)
                return std::unexpected(sink.error());
            ledger->events_->add_sink(*sink);
        }

        return ledger;
    }

    uint64_t Ledger::now() const
    {
        std::lock_guard lock(mutex_);
        return clock_;
    }

    Result<CallContext> Ledger::context_for(const json &tx)
    {
        CallContext ctx;

        if (tx.contains("caller"))
        {
            auto caller = get_address(tx, "caller");
            if (!caller)
                return std::unexpected(caller.error());
            ctx.caller = *caller;
        }

        ctx.timestamp = clock_;
        if (tx.contains("timestamp"))
        {
            auto ts = get_u64(tx, "timestamp");
            if (!ts)
                return std::unexpected(ts.error());
            if (*ts < clock_)
            {
                return std::unexpected(RegistryError::invalid_input(
                    "Timestamp " + std::to_string(*ts) + " is behind the ledger clock " + std::to_string(clock_)));
            }
            ctx.timestamp = *ts;
        }

        if (tx.contains("entropy"))
        {
            auto entropy = get_hash(tx, "entropy");
            if (!entropy)
                return std::unexpected(entropy.error());
            ctx.entropy = *entropy;
        }
        else
        {
            ctx.entropy = crypto::SecureRandom::generate_hash();
        }

        if (tx.contains("value"))
        {
            auto value = get_u64(tx, "value");
            if (!value)
                return std::unexpected(value.error());
            ctx.value = *value;
        }

        return ctx;
    }

    Result<json> Ledger::dispatch(const std::string &op, const json &tx, const CallContext &ctx)
    {
        if (op == "register")
        {
            RegistrationRequest req;
            req.domain = get_string_or(tx, "domain", "");
            req.did = get_string_or(tx, "did", "");
            req.description = get_string_or(tx, "description", "");
            req.address = ctx.caller;
            if (tx.contains("address"))
            {
                auto address = get_address(tx, "address");
                if (!address)
                    return std::unexpected(address.error());
                req.address = *address;
            }
            auto id = identity_->register_agent(ctx, req);
            if (!id)
                return std::unexpected(id.error());
            return json{{"agent_id", *id}};
        }

        if (op == "register_delegated")
        {
            auto developer_did = get_string(tx, "developer_did");
            if (!developer_did)
                return std::unexpected(developer_did.error());
            auto agent_did = get_string(tx, "agent_did");
            if (!agent_did)
                return std::unexpected(agent_did.error());
            auto agent_address = get_address(tx, "agent_address");
            if (!agent_address)
                return std::unexpected(agent_address.error());
            auto expiry = get_u64(tx, "expiry");
            if (!expiry)
                return std::unexpected(expiry.error());
            auto signature_hex = get_string(tx, "signature");
            if (!signature_hex)
                return std::unexpected(signature_hex.error());
            auto signature = bytes_from_hex(*signature_hex);
            if (!signature)
                return std::unexpected(signature.error());

            DelegatedRegistration req;
            req.developer_did = std::move(*developer_did);
            req.agent_did = std::move(*agent_did);
            req.agent_address = *agent_address;
            req.description = get_string_or(tx, "description", "");
            req.expiry = *expiry;
            req.agent_signature = std::move(*signature);

            auto id = identity_->register_with_delegated_consent(ctx, req);
            if (!id)
                return std::unexpected(id.error());
            return json{{"agent_id", *id}};
        }

        if (op == "update_agent")
        {
            auto agent_id = get_u64(tx, "agent_id");
            if (!agent_id)
                return std::unexpected(agent_id.error());

            AgentUpdate update;
            if (tx.contains("new_address"))
            {
                auto address = get_address(tx, "new_address");
                if (!address)
                    return std::unexpected(address.error());
                update.new_address = *address;
            }
            if (tx.contains("new_domain"))
            {
                auto domain = get_string(tx, "new_domain");
                if (!domain)
                    return std::unexpected(domain.error());
                update.new_domain = *domain;
            }
            if (tx.contains("new_did"))
            {
                auto did = get_string(tx, "new_did");
                if (!did)
                    return std::unexpected(did.error());
                update.new_did = *did;
            }
            if (tx.contains("new_description"))
            {
                auto description = get_string(tx, "new_description");
                if (!description)
                    return std::unexpected(description.error());
                update.new_description = *description;
            }
            if (auto res = identity_->update_agent(ctx, *agent_id, update); !res)
                return std::unexpected(res.error());
            return json{{"updated", true}};
        }

        if (op == "update_description")
        {
            auto agent_id = get_u64(tx, "agent_id");
            if (!agent_id)
                return std::unexpected(agent_id.error());
            auto description = get_string(tx, "description");
            if (!description)
                return std::unexpected(description.error());
            if (auto res = identity_->update_description_only(ctx, *agent_id, *description); !res)
                return std::unexpected(res.error());
            return json{{"updated", true}};
        }

        if (op == "link_developer_did")
        {
            auto agent_id = get_u64(tx, "agent_id");
            if (!agent_id)
                return std::unexpected(agent_id.error());
            auto developer_address = get_address(tx, "developer_address");
            if (!developer_address)
                return std::unexpected(developer_address.error());
            auto developer_did = get_string(tx, "developer_did");
            if (!developer_did)
                return std::unexpected(developer_did.error());
            if (auto res = identity_->link_developer_did(ctx, *agent_id, *developer_address, *developer_did); !res)
                return std::unexpected(res.error());
            return json{{"linked", true}};
        }

        if (op == "accept_feedback")
        {
            auto client = get_u64(tx, "client_agent_id");
            if (!client)
                return std::unexpected(client.error());
            auto server = get_u64(tx, "server_agent_id");
            if (!server)
                return std::unexpected(server.error());
            auto token = reputation_->accept_feedback(ctx, *client, *server);
            if (!token)
                return std::unexpected(token.error());
            return json{{"auth_token", to_hex(*token)}};
        }

        if (op == "request_validation")
        {
            auto validator = get_u64(tx, "validator_agent_id");
            if (!validator)
                return std::unexpected(validator.error());
            auto server = get_u64(tx, "server_agent_id");
            if (!server)
                return std::unexpected(server.error());
            auto data_hash = get_hash(tx, "data_hash");
            if (!data_hash)
                return std::unexpected(data_hash.error());
            if (auto res = validation_->request_validation(ctx, *validator, *server, *data_hash); !res)
                return std::unexpected(res.error());
            return json{{"requested", true}};
        }

        if (op == "submit_response")
        {
            auto data_hash = get_hash(tx, "data_hash");
            if (!data_hash)
                return std::unexpected(data_hash.error());
            auto score = get_i64(tx, "score");
            if (!score)
                return std::unexpected(score.error());
            if (auto res = validation_->submit_response(ctx, *data_hash, *score); !res)
                return std::unexpected(res.error());
            return json{{"responded", true}};
        }

        // Read-only operations
        if (op == "get_agent")
        {
            auto agent_id = get_u64(tx, "agent_id");
            if (!agent_id)
                return std::unexpected(agent_id.error());
            return agent_result(identity_->get(*agent_id), *identity_);
        }

        if (op == "resolve_domain")
        {
            auto domain = get_string(tx, "domain");
            if (!domain)
                return std::unexpected(domain.error());
            return agent_result(identity_->resolve_by_domain(*domain), *identity_);
        }

        if (op == "resolve_address")
        {
            auto address = get_address(tx, "address");
            if (!address)
                return std::unexpected(address.error());
            return agent_result(identity_->resolve_by_address(*address), *identity_);
        }

        if (op == "resolve_did")
        {
            auto did = get_string(tx, "did");
            if (!did)
                return std::unexpected(did.error());
            return agent_result(identity_->resolve_by_did(*did), *identity_);
        }

        if (op == "is_authorized")
        {
            auto client = get_u64(tx, "client_agent_id");
            if (!client)
                return std::unexpected(client.error());
            auto server = get_u64(tx, "server_agent_id");
            if (!server)
                return std::unexpected(server.error());
            auto auth = reputation_->is_authorized(*client, *server);
            return json{{"authorized", auth.authorized}, {"auth_token", to_hex(auth.auth_id)}};
        }

        if (op == "get_request")
        {
            auto data_hash = get_hash(tx, "data_hash");
            if (!data_hash)
                return std::unexpected(data_hash.error());
            auto request = validation_->get_request(*data_hash);
            if (!request)
                return std::unexpected(request.error());
            return request->to_json();
        }

        if (op == "is_pending")
        {
            auto data_hash = get_hash(tx, "data_hash");
            if (!data_hash)
                return std::unexpected(data_hash.error());
            auto status = validation_->is_pending(*data_hash, ctx.timestamp);
            return json{{"exists", status.exists}, {"pending", status.pending}};
        }

        if (op == "get_response")
        {
            auto data_hash = get_hash(tx, "data_hash");
            if (!data_hash)
                return std::unexpected(data_hash.error());
            auto response = validation_->get_response(*data_hash);
            return json{{"has_response", response.has_response}, {"score", response.score}};
        }

        return std::unexpected(RegistryError::invalid_input("Unknown operation '" + op + "'"));
    }

    json Ledger::apply(const json &tx)
    {
        std::lock_guard lock(mutex_);

        std::string op = tx.is_object() ? get_string_or(tx, "op", "") : "";
        json receipt{{"op", op}};

        auto fail_receipt = [&](const RegistryError &err) {
            spdlog::debug("{} rejected: {} ({})", op, error_code_name(err.code), err.what());
            receipt["ok"] = false;
            receipt["error"] = {{"code", std::string(error_code_name(err.code))},
                                {"category", std::string(error_category_name(error_category(err.code)))},
                                {"message", err.what()}};
            return receipt;
        };

        if (op.empty())
            return fail_receipt(RegistryError::invalid_input("Transaction must be an object with an 'op' field"));

        auto ctx = context_for(tx);
        if (!ctx)
            return fail_receipt(ctx.error());
        clock_ = ctx->timestamp;

        auto result = dispatch(op, tx, *ctx);
        if (!result)
            return fail_receipt(result.error());

        receipt["ok"] = true;
        receipt["result"] = std::move(*result);
        return receipt;
    }

    Result<std::vector<json>> Ledger::replay(const json &txs)
    {
        if (!txs.is_array())
            return std::unexpected(RegistryError::parsing("Transaction script must be a JSON array"));

        std::vector<json> receipts;
        receipts.reserve(txs.size());
        for (const auto &tx : txs)
            receipts.push_back(apply(tx));
        return receipts;
    }

} // namespace agentreg
