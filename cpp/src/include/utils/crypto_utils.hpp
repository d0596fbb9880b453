#pragma once
/**
 * @file crypto_utils.hpp
 * @brief BLAKE2b, Argon2id and random ids on top of libsodium.
 *
 * libsodium is a private dependency of walkie_utils, so its cost constants are
 * exported as functions instead of macros.
 */
#include "walkie_utils_export.h"
#include "utils/module_def.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace walkie::crypto
{

/// crypto_pwhash_SALTBYTES.
inline constexpr size_t PWHASH_SALT_BYTES = 16;

/**
 * @brief Unkeyed BLAKE2b of @p data into @p out_len bytes (16 to 64).
 * @return false for a null buffer or a digest length out of range.
 */
WALKIE_UTILS_EXPORT bool compute_blake2b(uint8_t *out, size_t out_len, const void *data,
                                         size_t len) noexcept;

/// Argon2id13. False only when libsodium fails, usually for lack of memory.
WALKIE_UTILS_EXPORT bool derive_key(uint8_t *out, size_t out_len, std::string_view password,
                                    const std::array<uint8_t, PWHASH_SALT_BYTES> &salt,
                                    uint64_t opslimit, size_t memlimit) noexcept;

WALKIE_UTILS_EXPORT uint64_t pwhash_opslimit_interactive() noexcept;
WALKIE_UTILS_EXPORT size_t pwhash_memlimit_interactive() noexcept;
WALKIE_UTILS_EXPORT uint64_t pwhash_opslimit_min() noexcept;
WALKIE_UTILS_EXPORT size_t pwhash_memlimit_min() noexcept;

/// Zero if libsodium could not be initialized.
WALKIE_UTILS_EXPORT uint64_t generate_random_u64() noexcept;

/// 2 * @p n_bytes lowercase hex characters.
/// @throws std::runtime_error if libsodium could not be initialized.
WALKIE_UTILS_EXPORT std::string generate_random_hex(size_t n_bytes);

/// Module "CryptoUtils"; startup throws if sodium_init() fails.
WALKIE_UTILS_EXPORT utils::ModuleDef GetLifecycleModule();

} // namespace walkie::crypto
