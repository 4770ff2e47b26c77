#include "agentreg/cli.hpp"
#include "agentreg/config.hpp"
#include "agentreg/consent.hpp"
#include "agentreg/crypto.hpp"
#include "agentreg/did_validator.hpp"
#include "agentreg/ledger.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <sstream>

namespace agentreg::cli
{

	namespace
	{
		Result<std::string> read_file(const std::string &path)
		{
			std::ifstream f(path);
			if (!f.is_open())
				return std::unexpected(RegistryError::io("Unable to open file: " + path));
			std::stringstream buf;
			buf << f.rdbuf();
			return buf.str();
		}

		// File values first, then AGENTREG_* overrides; with no file only the overrides apply.
		Result<RegistryConfig> load_config(const std::string &path)
		{
			if (path.empty())
				return ConfigLoader::from_string("");
			return ConfigLoader::load(path);
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Agent trust registry"};

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");
		std::string log_level;
		app.add_option("--log-level", log_level, "Override the configured log level");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");
		cfg_cmd->add_option("--file", config_path, "Config path")->required();

		std::string keygen_out;
		auto keygen_cmd = app.add_subcommand("keygen", "Generate an Ed25519 keypair JSON with its address");
		keygen_cmd->add_option("--out", keygen_out, "Output file path (defaults to stdout)");

		std::string did_address;
		std::string did_prefix{DidValidator::kDefaultPrefix};
		auto did_make_cmd = app.add_subcommand("did-make", "Build an address-controlled DID");
		did_make_cmd->add_option("--address", did_address, "0x-prefixed 20-byte address")->required();
		did_make_cmd->add_option("--prefix", did_prefix, "DID prefix with three ':' separators");

		std::string did_value;
		auto did_validate_cmd = app.add_subcommand("did-validate", "Check that a DID embeds an address");
		did_validate_cmd->add_option("--did", did_value, "DID string")->required();
		did_validate_cmd->add_option("--address", did_address, "Expected 0x-prefixed address")->required();

		std::string key_path;
		DelegatedConsent consent;
		auto consent_cmd = app.add_subcommand("consent-sign", "Sign a delegated registration consent as the agent");
		consent_cmd->add_option("--key", key_path, "Path to the agent's keypair JSON")->required();
		consent_cmd->add_option("--developer-did", consent.developer_did, "Developer DID")->required();
		consent_cmd->add_option("--agent-did", consent.agent_did, "Agent DID")->required();
		consent_cmd->add_option("--description", consent.description, "Agent description");
		consent_cmd->add_option("--nonce", consent.nonce, "Agent's current consent nonce")->required();
		consent_cmd->add_option("--expiry", consent.expiry, "Last logical timestamp the consent is valid")->required();
		consent_cmd->add_option("--config", config_path, "Config TOML holding the signing domain");

		std::string script_path;
		std::string events_out;
		auto replay_cmd = app.add_subcommand("replay", "Apply a JSON transaction script and print receipts");
		replay_cmd->add_option("--file", script_path, "Path to a JSON array of transactions")->required();
		replay_cmd->add_option("--events-out", events_out, "Append emitted events to this JSONL file");
		replay_cmd->add_option("--config", config_path, "Config TOML for the ledger");

		CLI11_PARSE(app, argc, argv);

		auto cfg = load_config(config_path);
		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return 1;
		}
		if (auto res = apply_log_level(log_level.empty() ? cfg->logging.level : log_level); !res)
		{
			std::cerr << res.error().what() << std::endl;
			return 1;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*keygen_cmd)
		{
			auto kp = crypto::Ed25519KeyPair::generate();
			if (!kp)
			{
				std::cerr << kp.error().what() << std::endl;
				return 1;
			}
			if (keygen_out.empty())
			{
				std::cout << kp->to_json() << std::endl;
				return 0;
			}
			std::ofstream out(keygen_out);
			if (!out.is_open())
			{
				std::cerr << "Unable to open output file" << std::endl;
				return 1;
			}
			out << kp->to_json() << std::endl;
			std::cout << to_hex(kp->address()) << std::endl;
			return 0;
		}

		if (*did_make_cmd)
		{
			auto addr = address_from_hex(did_address);
			if (!addr)
			{
				std::cerr << addr.error().what() << std::endl;
				return 1;
			}
			auto did = DidValidator::make_address_did(*addr, did_prefix);
			if (!did)
			{
				std::cerr << did.error().what() << std::endl;
				return 1;
			}
			std::cout << *did << std::endl;
			return 0;
		}

		if (*did_validate_cmd)
		{
			auto addr = address_from_hex(did_address);
			if (!addr)
			{
				std::cerr << addr.error().what() << std::endl;
				return 1;
			}
			if (!DidValidator::validate(did_value, *addr))
			{
				std::cerr << "DID does not embed " << to_hex(*addr) << std::endl;
				return 2;
			}
			std::cout << "DID OK" << std::endl;
			return 0;
		}

		if (*consent_cmd)
		{
			auto key_json = read_file(key_path);
			if (!key_json)
			{
				std::cerr << key_json.error().what() << std::endl;
				return 1;
			}
			auto kp = crypto::Ed25519KeyPair::from_json(*key_json);
			if (!kp)
			{
				std::cerr << kp.error().what() << std::endl;
				return 1;
			}

			consent.agent_address = kp->address();
			auto signature = sign_consent(*kp, cfg->signing_domain, consent);

			// Shaped as a register_delegated transaction minus the caller.
			nlohmann::json tx = {
				{"op", "register_delegated"},
				{"developer_did", consent.developer_did},
				{"agent_did", consent.agent_did},
				{"agent_address", to_hex(consent.agent_address)},
				{"description", consent.description},
				{"nonce", consent.nonce},
				{"expiry", consent.expiry},
				{"digest", to_hex(consent_digest(cfg->signing_domain, consent))},
				{"signature", to_hex(signature)}};
			std::cout << tx.dump(2) << std::endl;
			return 0;
		}

		if (*replay_cmd)
		{
			if (!events_out.empty())
				cfg->events.jsonl_path = events_out;

			auto script = read_file(script_path);
			if (!script)
			{
				std::cerr << script.error().what() << std::endl;
				return 1;
			}
			nlohmann::json txs = nlohmann::json::parse(*script, nullptr, false);
			if (txs.is_discarded())
			{
				std::cerr << "Transaction script is not valid JSON: " << script_path << std::endl;
				return 1;
			}

			auto ledger = Ledger::open(*cfg);
			if (!ledger)
			{
				std::cerr << ledger.error().what() << std::endl;
				return 1;
			}
			auto receipts = (*ledger)->replay(txs);
			if (!receipts)
			{
				std::cerr << receipts.error().what() << std::endl;
				return 1;
			}

			std::size_t failed = 0;
			for (const auto &r : *receipts)
			{
				if (!r.value("ok", false))
					++failed;
			}
			spdlog::info("replayed {} transactions ({} rejected), {} events, chain {}",
						 receipts->size(), failed, (*ledger)->events().size(),
						 (*ledger)->events().verify_chain() ? "intact" : "BROKEN");

			std::cout << nlohmann::json(*receipts).dump(2) << std::endl;
			return 0;
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace agentreg::cli
