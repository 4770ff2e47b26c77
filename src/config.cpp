#include "agentreg/config.hpp"
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace agentreg
{
    namespace
    {
        // stoull accepts leading whitespace and a sign, and wraps negatives.
        Result<uint64_t> parse_u64(const std::string &text, const char *what)
        {
            if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front())))
                return std::unexpected(RegistryError::config(std::string("Invalid ") + what + ": " + text));

            try
            {
                std::size_t used = 0;
                auto value = std::stoull(text, &used);
                if (used != text.size())
                    throw std::invalid_argument(text);
                return static_cast<uint64_t>(value);
            }
            catch (const std::logic_error &)
            {
                return std::unexpected(RegistryError::config(std::string("Invalid ") + what + ": " + text));
            }
        }

        Result<void> parse_toml(const toml::table &tbl, RegistryConfig &cfg)
        {
            if (auto domain = tbl["signing_domain"].as_table())
            {
                if (auto name = (*domain)["name"].value<std::string>())
                    cfg.signing_domain.name = *name;
                if (auto version = (*domain)["version"].value<std::string>())
                    cfg.signing_domain.version = *version;
                if (auto chain = (*domain)["chain_id"].value<int64_t>())
                {
                    if (*chain < 0)
                        return std::unexpected(RegistryError::config("chain_id must be non-negative"));
                    cfg.signing_domain.chain_id = static_cast<uint64_t>(*chain);
                }
                if (auto contract = (*domain)["verifying_contract"].value<std::string>())
                {
                    auto addr = address_from_hex(*contract);
                    if (!addr)
                        return std::unexpected(RegistryError::config("Invalid verifying_contract: " + *contract));
                    cfg.signing_domain.verifying_contract = *addr;
                }
            }

            if (auto identity = tbl["identity"].as_table())
            {
                if (auto req = (*identity)["identifier_requirement"].value<std::string>())
                {
                    auto parsed = identifier_requirement_from_string(*req);
                    if (!parsed)
                        return std::unexpected(parsed.error());
                    cfg.identity.identifier_requirement = *parsed;
                }
                if (auto fee = (*identity)["registration_fee"].value<int64_t>())
                {
                    if (*fee < 0)
                        return std::unexpected(RegistryError::config("registration_fee must be non-negative"));
                    cfg.identity.registration_fee = static_cast<uint64_t>(*fee);
                }
                if (auto policy = (*identity)["nonce_policy"].value<std::string>())
                {
                    auto parsed = nonce_policy_from_string(*policy);
                    if (!parsed)
                        return std::unexpected(parsed.error());
                    cfg.identity.nonce_policy = *parsed;
                }
            }

            if (auto events = tbl["events"].as_table())
            {
                if (auto path = (*events)["jsonl_path"].value<std::string>())
                    cfg.events.jsonl_path = *path;
                if (auto path = (*events)["rocksdb_path"].value<std::string>())
                    cfg.events.rocksdb_path = *path;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }

            return {};
        }

    } // namespace

    Result<RegistryConfig> ConfigLoader::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(RegistryError::config("Unable to open config file: " + path));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return from_string(buffer.str());
    }

    Result<RegistryConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        RegistryConfig cfg{};

        try
        {
            auto tbl = toml::parse(toml_content);
            if (auto res = parse_toml(tbl, cfg); !res)
                return std::unexpected(res.error());
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(RegistryError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto res = apply_env_overrides(cfg); !res)
            return std::unexpected(res.error());
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(RegistryConfig &cfg)
    {
        if (const char *chain = std::getenv("AGENTREG_CHAIN_ID"))
        {
            auto parsed = parse_u64(chain, "AGENTREG_CHAIN_ID");
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.signing_domain.chain_id = *parsed;
        }
        if (const char *req = std::getenv("AGENTREG_IDENTIFIER_REQUIREMENT"))
        {
            auto parsed = identifier_requirement_from_string(req);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.identity.identifier_requirement = *parsed;
        }
        if (const char *fee = std::getenv("AGENTREG_REGISTRATION_FEE"))
        {
            auto parsed = parse_u64(fee, "AGENTREG_REGISTRATION_FEE");
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.identity.registration_fee = *parsed;
        }
        if (const char *policy = std::getenv("AGENTREG_NONCE_POLICY"))
        {
            auto parsed = nonce_policy_from_string(policy);
            if (!parsed)
                return std::unexpected(parsed.error());
            cfg.identity.nonce_policy = *parsed;
        }
        if (const char *path = std::getenv("AGENTREG_EVENTS_JSONL"))
            cfg.events.jsonl_path = path;
        if (const char *level = std::getenv("AGENTREG_LOG_LEVEL"))
            cfg.logging.level = level;
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const RegistryConfig &cfg)
    {
        nlohmann::json j;
        j["signing_domain"] = {
            {"name", cfg.signing_domain.name},
            {"version", cfg.signing_domain.version},
            {"chain_id", cfg.signing_domain.chain_id},
            {"verifying_contract", to_hex(cfg.signing_domain.verifying_contract)},
            {"separator", to_hex(cfg.signing_domain.separator())}};
        j["identity"] = {
            {"identifier_requirement", std::string(identifier_requirement_name(cfg.identity.identifier_requirement))},
            {"registration_fee", cfg.identity.registration_fee},
            {"nonce_policy", std::string(nonce_policy_name(cfg.identity.nonce_policy))}};
        j["events"] = {{"jsonl_path", cfg.events.jsonl_path}, {"rocksdb_path", cfg.events.rocksdb_path}};
        j["logging"] = {{"level", cfg.logging.level}};
        return j;
    }

    Result<void> apply_log_level(const std::string &level)
    {
        auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off")
        {
            return std::unexpected(RegistryError::config("Unknown log level: " + level));
        }
        spdlog::set_level(parsed);
        return {};
    }

} // namespace agentreg
