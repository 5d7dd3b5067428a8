// pow_core.cpp
#include <algorithm>
#include <cmath>
#include <cstring>
#include <openssl/sha.h>
#include "pow_core.h"
#include "pow_core_internal.h"
#include "invalid_configuration.h"

namespace
{
    using powcurve::Hash;
    using powcurve::Seed;

    class Sha256ThresholdPow final : public powcurve::PowFunction
    {
    public:
        std::string name() const override { return "threshold"; }

        Hash generate_candidate(const Seed &seed, uint64_t nonce) const override
        {
            return pow_internal::sha256_candidate(seed, nonce);
        }

        bool meets_difficulty(const Hash &hash, uint64_t difficulty) const override
        {
            return pow_internal::hash_prefix_u64(hash) <= pow_internal::target_for_difficulty(difficulty);
        }

        double expected_attempts(uint64_t difficulty) const override
        {
            return difficulty == 0 ? 1.0 : static_cast<double>(difficulty);
        }
    };

    class Sha256LeadingZerosPow final : public powcurve::PowFunction
    {
    public:
        std::string name() const override { return "leading-zeros"; }

        Hash generate_candidate(const Seed &seed, uint64_t nonce) const override
        {
            return pow_internal::sha256_candidate(seed, nonce);
        }

        bool meets_difficulty(const Hash &hash, uint64_t difficulty) const override
        {
            if (difficulty > max_difficulty())
                return false;
            return pow_internal::has_leading_zeros(hash.data(), static_cast<int>(difficulty));
        }

        double expected_attempts(uint64_t difficulty) const override
        {
            return std::ldexp(1.0, static_cast<int>(std::min(difficulty, max_difficulty())));
        }

        uint64_t max_difficulty() const override { return SHA256_DIGEST_LENGTH * 8; }
    };

    // Cheap predicate without hashing cost; the candidate carries the nonce itself.
    class ModuloPow final : public powcurve::PowFunction
    {
    public:
        std::string name() const override { return "modulo"; }

        Hash generate_candidate(const Seed &, uint64_t nonce) const override
        {
            Hash candidate{};
            pow_internal::store_u64_le(nonce, candidate.data());
            return candidate;
        }

        bool meets_difficulty(const Hash &hash, uint64_t difficulty) const override
        {
            if (difficulty == 0)
                return true;
            return pow_internal::load_u64_le(hash.data()) % difficulty == 0;
        }

        double expected_attempts(uint64_t difficulty) const override
        {
            // sequential nonces from a random offset: uniform on [1, difficulty]
            return difficulty == 0 ? 1.0 : (static_cast<double>(difficulty) + 1.0) / 2.0;
        }
    };

    int hex_value(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }
}

namespace pow_internal
{
    powcurve::Hash sha256_candidate(const powcurve::Seed &seed, uint64_t nonce)
    {
        unsigned char input[INPUT_SIZE];
        std::memcpy(input, seed.data(), seed.size());
        store_u64_le(nonce, input + seed.size());

        powcurve::Hash digest{};
        SHA256(input, INPUT_SIZE, digest.data());
        return digest;
    }

    uint64_t hash_prefix_u64(const powcurve::Hash &hash)
    {
        uint64_t value = 0;
        for (int i = 0; i < 8; ++i)
        {
            value = (value << 8) | hash[i];
        }
        return value;
    }

    uint64_t target_for_difficulty(uint64_t difficulty)
    {
        if (difficulty == 0)
            difficulty = 1;
        return UINT64_MAX / difficulty;
    }

    bool has_leading_zeros(const unsigned char *digest, int bits_required)
    {
        if (bits_required <= 0)
            return true;
        if (digest == nullptr || bits_required > SHA256_DIGEST_LENGTH * 8)
            return false;

        int full_bytes = bits_required / 8;
        int remaining_bits = bits_required % 8;

        for (int i = 0; i < full_bytes; ++i)
        {
            if (digest[i] != 0)
                return false;
        }

        if (remaining_bits)
        {
            const unsigned char mask = static_cast<unsigned char>(0xFF << (8 - remaining_bits));
            if ((digest[full_bytes] & mask) != 0)
                return false;
        }

        return true;
    }

    void store_u64_le(uint64_t value, uint8_t *output)
    {
        for (int i = 0; i < 8; ++i)
        {
            output[i] = static_cast<uint8_t>(value >> (8 * i));
        }
    }

    uint64_t load_u64_le(const uint8_t *input)
    {
        uint64_t value = 0;
        for (int i = 7; i >= 0; --i)
        {
            value = (value << 8) | input[i];
        }
        return value;
    }
}

namespace powcurve
{
    std::unique_ptr<PowFunction> make_pow_function(const std::string &name)
    {
        if (name == "threshold")
            return std::make_unique<Sha256ThresholdPow>();
        if (name == "leading-zeros")
            return std::make_unique<Sha256LeadingZerosPow>();
        if (name == "modulo")
            return std::make_unique<ModuloPow>();
        throw InvalidConfiguration("Unknown proof-of-work function: " + name);
    }

    std::string to_hex(const std::array<uint8_t, 32> &bytes)
    {
        std::string out;
        out.reserve(bytes.size() * 2);
        for (uint8_t b : bytes)
        {
            out += pow_internal::hex_digits[b >> 4];
            out += pow_internal::hex_digits[b & 0x0F];
        }
        return out;
    }

    Seed parse_seed_hex(const std::string &hex)
    {
        Seed seed{};
        if (hex.size() != seed.size() * 2)
        {
            throw InvalidConfiguration("Seed must be 64 hex digits, got " + std::to_string(hex.size()));
        }
        for (size_t i = 0; i < seed.size(); ++i)
        {
            int hi = hex_value(hex[2 * i]);
            int lo = hex_value(hex[2 * i + 1]);
            if (hi < 0 || lo < 0)
            {
                throw InvalidConfiguration("Seed is not valid hex: " + hex);
            }
            seed[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return seed;
    }
}
