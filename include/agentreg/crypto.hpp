#pragma once

#include "primitives.hpp"
#include "types.hpp"
#include <array>
#include <optional>
#include <string>

namespace agentreg::crypto
{

    using Ed25519Seed = std::array<uint8_t, 32>;
    using Ed25519PublicKey = std::array<uint8_t, 32>;
    using Ed25519SecretKey = std::array<uint8_t, 64>;
    using Ed25519Signature = std::array<uint8_t, 64>;

    /** Public key followed by the detached signature. */
    using RecoverableSignature = std::array<uint8_t, 96>;

    /**
     * Signing key of an account. The account address is derived from the
     * public key, so a key pair always knows which address it controls.
     */
    class Ed25519KeyPair
    {
    public:
        Ed25519PublicKey public_key;
        Ed25519SecretKey secret_key;

        /** Fresh key from a random seed. */
        static Result<Ed25519KeyPair> generate();

        static Result<Ed25519KeyPair> from_seed(const Ed25519Seed &seed);

        Ed25519Seed seed() const;

        Ed25519Signature sign(const Bytes &message) const;

        static bool verify(
            const Bytes &message,
            const Ed25519Signature &signature,
            const Ed25519PublicKey &public_key);

        Address address() const;

        /**
         * Key file contents: hex seed, public key and address.
         * The secret key is rebuilt from the seed on load.
         */
        std::string to_json() const;

        /**
         * Load a key file written by to_json(). When the file lists a
         * public key or address, both must match the one derived from the seed.
         */
        static Result<Ed25519KeyPair> from_json(const std::string &json);
    };

    class SHA256
    {
    public:
        static Hash32 hash(const Bytes &data);

        static Hash32 hash(const std::string &data);
    };

    class SecureRandom
    {
    public:
        static Hash32 generate_hash();
    };

    /** Last 20 bytes of SHA-256 over the public key. */
    Address address_from_public_key(const Ed25519PublicKey &public_key);

    /** Sign a 32-byte digest, embedding the signer's public key. */
    RecoverableSignature sign_recoverable(const Ed25519KeyPair &keypair, const Hash32 &digest);

    /**
     * Recover the signer address of a digest.
     * Returns nullopt when the signature is malformed or does not verify.
     */
    std::optional<Address> recover_signer(const Hash32 &digest, const Bytes &signature);

} // namespace agentreg::crypto
