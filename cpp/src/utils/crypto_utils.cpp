/**
 * @file crypto_utils.cpp
 * @brief libsodium behind walkie::crypto.
 */
#include "utils/crypto_utils.hpp"
#include "wk_service.hpp"

#include <sodium.h>

#include <atomic>
#include <stdexcept>
#include <vector>

namespace walkie::crypto
{

static_assert(PWHASH_SALT_BYTES == crypto_pwhash_SALTBYTES);

namespace
{

std::atomic<bool> g_sodium_ready{false};

/// sodium_init() returns 0 on first success, 1 if already initialized, -1 on failure.
bool sodium_ready() noexcept
{
    if (g_sodium_ready.load(std::memory_order_acquire))
        return true;
    if (::sodium_init() < 0)
        return false;
    g_sodium_ready.store(true, std::memory_order_release);
    return true;
}

void crypto_startup()
{
    if (!sodium_ready())
        throw std::runtime_error("CryptoUtils: sodium_init() failed");
    LOGGER_DEBUG("[CryptoUtils] libsodium {} ready", ::sodium_version_string());
}

void crypto_shutdown()
{
    g_sodium_ready.store(false, std::memory_order_release);
}

} // namespace

bool compute_blake2b(uint8_t *out, size_t out_len, const void *data, size_t len) noexcept
{
    if (out == nullptr || (data == nullptr && len != 0))
    {
        LOGGER_ERROR("[CryptoUtils] compute_blake2b: null buffer");
        return false;
    }
    if (out_len < crypto_generichash_BYTES_MIN || out_len > crypto_generichash_BYTES_MAX)
    {
        LOGGER_ERROR("[CryptoUtils] compute_blake2b: digest length {} out of range", out_len);
        return false;
    }
    if (!sodium_ready())
        return false;
    return ::crypto_generichash(out, out_len, static_cast<const unsigned char *>(data), len,
                                nullptr, 0) == 0;
}

bool derive_key(uint8_t *out, size_t out_len, std::string_view password,
                const std::array<uint8_t, PWHASH_SALT_BYTES> &salt, uint64_t opslimit,
                size_t memlimit) noexcept
{
    if (out == nullptr || !sodium_ready())
        return false;
    if (::crypto_pwhash(out, out_len, password.data(), password.size(), salt.data(), opslimit,
                        memlimit, crypto_pwhash_ALG_ARGON2ID13) != 0)
    {
        LOGGER_ERROR("[CryptoUtils] Argon2id failed (ops={}, mem={} bytes)", opslimit, memlimit);
        return false;
    }
    return true;
}

uint64_t pwhash_opslimit_interactive() noexcept
{
    return crypto_pwhash_OPSLIMIT_INTERACTIVE;
}

size_t pwhash_memlimit_interactive() noexcept
{
    return crypto_pwhash_MEMLIMIT_INTERACTIVE;
}

uint64_t pwhash_opslimit_min() noexcept
{
    return crypto_pwhash_OPSLIMIT_MIN;
}

size_t pwhash_memlimit_min() noexcept
{
    return crypto_pwhash_MEMLIMIT_MIN;
}

uint64_t generate_random_u64() noexcept
{
    uint64_t value = 0;
    if (sodium_ready())
        ::randombytes_buf(&value, sizeof(value));
    return value;
}

std::string generate_random_hex(size_t n_bytes)
{
    if (!sodium_ready())
        throw std::runtime_error("CryptoUtils: libsodium unavailable");
    std::vector<uint8_t> bytes(n_bytes);
    ::randombytes_buf(bytes.data(), bytes.size());
    return format_tools::bytes_to_hex(bytes.data(), bytes.size());
}

utils::ModuleDef GetLifecycleModule()
{
    utils::ModuleDef module("CryptoUtils");
    module.add_dependency("walkie::utils::Logger");
    module.set_startup(&crypto_startup);
    module.set_shutdown(&crypto_shutdown, std::chrono::milliseconds(1000));
    return module;
}

} // namespace walkie::crypto
