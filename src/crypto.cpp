#include "agentreg/crypto.hpp"
#include <sodium.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;

namespace agentreg::crypto
{

    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    namespace
    {
        template <std::size_t N>
        Result<std::array<uint8_t, N>> fixed_from_hex(const json &j, const char *key)
        {
            auto bytes = bytes_from_hex(j.at(key).get<std::string>());
            if (!bytes)
                return std::unexpected(bytes.error());
            if (bytes->size() != N)
                return std::unexpected(RegistryError::crypto(std::string("Key file field has the wrong length: ") + key));

            std::array<uint8_t, N> out;
            std::copy(bytes->begin(), bytes->end(), out.begin());
            return out;
        }
    } // namespace

    Result<Ed25519KeyPair> Ed25519KeyPair::generate()
    {
        Ed25519Seed seed;
        randombytes_buf(seed.data(), seed.size());
        auto keypair = from_seed(seed);
        sodium_memzero(seed.data(), seed.size());
        return keypair;
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_seed(const Ed25519Seed &seed)
    {
        Ed25519KeyPair keypair;
        if (crypto_sign_seed_keypair(keypair.public_key.data(), keypair.secret_key.data(), seed.data()) != 0)
        {
            return std::unexpected(RegistryError::crypto("Failed to derive Ed25519 keypair from seed"));
        }
        return keypair;
    }

    Ed25519Seed Ed25519KeyPair::seed() const
    {
        Ed25519Seed out;
        crypto_sign_ed25519_sk_to_seed(out.data(), secret_key.data());
        return out;
    }

    Ed25519Signature Ed25519KeyPair::sign(const Bytes &message) const
    {
        Ed25519Signature signature;
        crypto_sign_detached(signature.data(), nullptr, message.data(), message.size(), secret_key.data());
        return signature;
    }

    bool Ed25519KeyPair::verify(
        const Bytes &message,
        const Ed25519Signature &signature,
        const Ed25519PublicKey &public_key)
    {
        return crypto_sign_verify_detached(signature.data(), message.data(), message.size(), public_key.data()) == 0;
    }

    Address Ed25519KeyPair::address() const
    {
        return address_from_public_key(public_key);
    }

    std::string Ed25519KeyPair::to_json() const
    {
        json j = {
            {"address", to_hex(address())},
            {"public_key", to_hex(public_key)},
            {"seed", to_hex(seed())}};
        return j.dump(2);
    }

    Result<Ed25519KeyPair> Ed25519KeyPair::from_json(const std::string &json_str)
    {
        json j = json::parse(json_str, nullptr, false);
        if (j.is_discarded() || !j.is_object())
            return std::unexpected(RegistryError::parsing("Key file is not a JSON object"));

        try
        {
            auto seed = fixed_from_hex<32>(j, "seed");
            if (!seed)
                return std::unexpected(seed.error());

            auto keypair = from_seed(*seed);
            if (!keypair)
                return keypair;

            if (j.contains("public_key"))
            {
                auto listed = fixed_from_hex<32>(j, "public_key");
                if (!listed)
                    return std::unexpected(listed.error());
                if (*listed != keypair->public_key)
                    return std::unexpected(RegistryError::crypto("Public key does not match seed"));
            }
            if (j.contains("address"))
            {
                auto listed = address_from_hex(j.at("address").get<std::string>());
                if (!listed)
                    return std::unexpected(listed.error());
                if (*listed != keypair->address())
                    return std::unexpected(RegistryError::crypto("Address does not match seed"));
            }
            return keypair;
        }
        catch (const json::exception &e)
        {
            return std::unexpected(RegistryError::parsing(std::string("Malformed key file: ") + e.what()));
        }
    }

    Hash32 SHA256::hash(const Bytes &data)
    {
        Hash32 output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    Hash32 SHA256::hash(const std::string &data)
    {
        Hash32 output;
        crypto_hash_sha256(output.data(), reinterpret_cast<const uint8_t *>(data.data()), data.size());
        return output;
    }

    Hash32 SecureRandom::generate_hash()
    {
        Hash32 out;
        randombytes_buf(out.data(), out.size());
        return out;
    }

    Address address_from_public_key(const Ed25519PublicKey &public_key)
    {
        auto digest = SHA256::hash(Bytes(public_key.begin(), public_key.end()));
        Address address;
        std::copy(digest.end() - address.size(), digest.end(), address.begin());
        return address;
    }

    RecoverableSignature sign_recoverable(const Ed25519KeyPair &keypair, const Hash32 &digest)
    {
        auto sig = keypair.sign(Bytes(digest.begin(), digest.end()));

        RecoverableSignature out;
        std::copy(keypair.public_key.begin(), keypair.public_key.end(), out.begin());
        std::copy(sig.begin(), sig.end(), out.begin() + keypair.public_key.size());
        return out;
    }

    std::optional<Address> recover_signer(const Hash32 &digest, const Bytes &signature)
    {
        if (signature.size() != std::tuple_size_v<RecoverableSignature>)
            return std::nullopt;

        Ed25519PublicKey pub;
        Ed25519Signature sig;
        std::copy_n(signature.begin(), pub.size(), pub.begin());
        std::copy_n(signature.begin() + pub.size(), sig.size(), sig.begin());

        if (!Ed25519KeyPair::verify(Bytes(digest.begin(), digest.end()), sig, pub))
            return std::nullopt;

        return address_from_public_key(pub);
    }

} // namespace agentreg::crypto
