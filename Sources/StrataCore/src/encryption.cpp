#include "strata/encryption.hpp"
#include "strata/errors.hpp"

namespace strata {

namespace {

std::string run_encrypt(const encryption_config& config, const std::string& plaintext) {
    try {
        return config.encrypt(plaintext);
    } catch (const std::exception& e) {
        throw encryption_error(std::string("Encryption callback failed: ") + e.what());
    }
}

json run_decrypt(const encryption_config& config, const json& ciphertext) {
    if (!ciphertext.is_string()) {
        throw encryption_error("Ciphertext is not a string");
    }
    std::string plaintext;
    try {
        plaintext = config.decrypt(ciphertext.get<std::string>());
    } catch (const std::exception& e) {
        throw encryption_error(std::string("Decryption callback failed: ") + e.what());
    }
    try {
        return json::parse(plaintext);
    } catch (const json::parse_error& e) {
        throw encryption_error(std::string("Decrypted value is not valid JSON: ") + e.what());
    }
}

} // namespace

bool is_encrypted_form(const json& stored) {
    return stored.is_object() &&
           (stored.contains(encrypted_payload_key) || stored.contains(encrypted_fields_key));
}

json encrypt_record(const record& rec,
                    const std::set<std::string>& encrypted_fields,
                    const encryption_config& config,
                    const std::optional<std::string>& collection) {
    if (!config.can_encrypt()) {
        return json{{"id", rec.id}, {"payload", rec.payload}};
    }

    json stored = json::object();
    stored["id"] = rec.id;
    if (collection) {
        stored["collection"] = *collection;
    }

    if (encrypted_fields.empty() || !rec.payload.is_object()) {
        stored[encrypted_payload_key] = run_encrypt(config, rec.payload.dump());
        return stored;
    }

    json payload = rec.payload;
    json encrypted = json::object();
    for (const auto& field : encrypted_fields) {
        auto it = payload.find(field);
        if (it == payload.end()) continue;
        encrypted[field] = run_encrypt(config, it->dump());
        payload.erase(it);
    }

    stored["payload"] = std::move(payload);
    stored[encrypted_fields_key] = std::move(encrypted);
    return stored;
}

record decrypt_record(const json& stored, const encryption_config& config) {
    record rec;
    if (!stored.is_object()) {
        return rec;
    }
    rec.id = stored.value("id", std::string());

    if (!is_encrypted_form(stored) || !config.can_decrypt()) {
        // Without a decrypt callback an encrypted form is handed back as-is
        auto it = stored.find("payload");
        rec.payload = (it != stored.end() && !is_encrypted_form(stored)) ? *it : stored;
        return rec;
    }

    auto whole = stored.find(encrypted_payload_key);
    if (whole != stored.end()) {
        rec.payload = run_decrypt(config, *whole);
        return rec;
    }

    json payload = stored.value("payload", json::object());
    const json& fields = stored.at(encrypted_fields_key);
    if (!fields.is_object()) {
        throw encryption_error("encrypted_fields is not an object in record " + rec.id);
    }
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        payload[it.key()] = run_decrypt(config, it.value());
    }
    rec.payload = std::move(payload);
    return rec;
}

} // namespace strata
