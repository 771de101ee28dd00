#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace strata {

using encrypt_fn = std::function<std::string(const std::string& plaintext)>;
using decrypt_fn = std::function<std::string(const std::string& ciphertext)>;

struct encryption_config {
    bool use_encryption = false;
    encrypt_fn encrypt;
    decrypt_fn decrypt;

    encryption_config() = default;
    encryption_config(encrypt_fn e, decrypt_fn d)
        : use_encryption(true), encrypt(std::move(e)), decrypt(std::move(d)) {}

    bool can_encrypt() const { return use_encryption && static_cast<bool>(encrypt); }
    bool can_decrypt() const { return use_encryption && static_cast<bool>(decrypt); }
};

// Stored-form member names
inline constexpr const char* encrypted_payload_key = "encrypted_payload";
inline constexpr const char* encrypted_fields_key = "encrypted_fields";

/// Transform a record into its stored JSON form.
///
/// Without encryption the result is {"id", "payload"}. With an empty field set
/// the whole payload becomes {"id", "encrypted_payload"}; otherwise each
/// listed top-level field present in the payload moves into
/// "encrypted_fields" and the rest stays in "payload". When `collection` is
/// given it is stamped on encrypted forms.
///
/// Throws encryption_error if the callback throws.
json encrypt_record(const record& rec,
                    const std::set<std::string>& encrypted_fields,
                    const encryption_config& config,
                    const std::optional<std::string>& collection = std::nullopt);

/// Exact inverse of encrypt_record. Plain stored forms pass through.
/// Throws encryption_error if the callback throws or yields invalid JSON.
record decrypt_record(const json& stored, const encryption_config& config);

/// True if `stored` carries ciphertext of either shape.
bool is_encrypted_form(const json& stored);

} // namespace strata

#endif // __cplusplus
