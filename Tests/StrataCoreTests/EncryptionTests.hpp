#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace encryption_tests {

using test_support::throws;

// ============================================================================
// Whole-payload encryption
// ============================================================================

void test_whole_payload_round_trip() {
    std::cout << "  test_whole_payload_round_trip..." << std::flush;

    auto config = test_support::reversing_encryption();
    strata::record rec{"users/u1", {{"collection", "users"}, {"name", "Ann"}, {"tags", {"a", "b"}}}};

    auto stored = strata::encrypt_record(rec, {}, config, std::string("users"));
    assert(stored.contains("encrypted_payload"));
    assert(!stored.contains("payload"));
    assert(stored["collection"] == "users");
    assert(stored.dump().find("Ann") == std::string::npos);
    assert(strata::is_encrypted_form(stored));

    auto back = strata::decrypt_record(stored, config);
    assert(back.id == rec.id);
    assert(back.payload == rec.payload);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Field-level encryption
// ============================================================================

void test_field_level_round_trip() {
    std::cout << "  test_field_level_round_trip..." << std::flush;

    auto config = test_support::reversing_encryption();
    strata::record rec{"users/u2", {{"collection", "users"},
                                    {"name", "Bob"},
                                    {"ssn", "123-45-6789"},
                                    {"profile", {{"age", 41}, {"city", "Oslo"}}}}};

    auto stored = strata::encrypt_record(rec, {"ssn", "profile", "not_present"}, config);
    assert(stored["payload"].contains("name"));
    assert(!stored["payload"].contains("ssn"));
    assert(!stored["payload"].contains("profile"));
    assert(stored["encrypted_fields"].size() == 2);
    assert(!stored["encrypted_fields"].contains("not_present"));
    assert(stored.dump().find("123-45-6789") == std::string::npos);

    auto back = strata::decrypt_record(stored, config);
    assert(back.payload == rec.payload);

    std::cout << " OK" << std::endl;
}

void test_field_level_with_no_fields_present() {
    std::cout << "  test_field_level_with_no_fields_present..." << std::flush;

    auto config = test_support::reversing_encryption();
    strata::record rec{"posts/p1", {{"collection", "posts"}, {"title", "Hello"}}};

    auto stored = strata::encrypt_record(rec, {"secret"}, config);
    assert(stored.contains("encrypted_fields"));
    assert(stored["encrypted_fields"].is_object());
    assert(stored["encrypted_fields"].empty());
    assert(stored["payload"] == rec.payload);

    auto back = strata::decrypt_record(stored, config);
    assert(back.payload == rec.payload);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Disabled directions and failures
// ============================================================================

void test_missing_callbacks_pass_through() {
    std::cout << "  test_missing_callbacks_pass_through..." << std::flush;

    strata::record rec{"users/u3", {{"collection", "users"}, {"name", "Cy"}}};

    // Default config: encryption off
    strata::encryption_config off;
    auto plain = strata::encrypt_record(rec, {"name"}, off);
    assert(plain == strata::json({{"id", "users/u3"}, {"payload", rec.payload}}));
    assert(strata::decrypt_record(plain, off) == rec);

    // Enabled but without callbacks
    strata::encryption_config no_callbacks;
    no_callbacks.use_encryption = true;
    auto stored = strata::encrypt_record(rec, {}, no_callbacks);
    assert(!strata::is_encrypted_form(stored));
    assert(strata::decrypt_record(stored, no_callbacks) == rec);

    // Turned off after the fact: ciphertext comes back untouched
    auto encrypted = strata::encrypt_record(rec, {}, test_support::reversing_encryption());
    auto opaque = strata::decrypt_record(encrypted, off);
    assert(opaque.payload == encrypted);

    std::cout << " OK" << std::endl;
}

void test_callback_failures() {
    std::cout << "  test_callback_failures..." << std::flush;

    strata::record rec{"users/u4", {{"collection", "users"}, {"name", "Di"}}};

    strata::encryption_config broken(
        [](const std::string&) -> std::string { throw std::runtime_error("key unavailable"); },
        [](const std::string&) -> std::string { throw std::runtime_error("key unavailable"); });
    assert(throws<strata::encryption_error>([&] { strata::encrypt_record(rec, {}, broken); }));

    // Decrypts to text that is not JSON
    strata::encryption_config garbled(
        [](const std::string& p) { return p; },
        [](const std::string&) { return std::string("{not json"); });
    auto stored = strata::encrypt_record(rec, {}, garbled);
    assert(throws<strata::encryption_error>([&] { strata::decrypt_record(stored, garbled); }));

    // Ciphertext from another key
    auto foreign = strata::json{{"id", "users/u4"}, {"encrypted_payload", "plain-text"}};
    try {
        strata::decrypt_record(foreign, test_support::reversing_encryption());
        assert(false);
    } catch (const strata::storage_error& e) {
        assert(e.kind() == strata::error_kind::encryption_error);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Encryption through the strategies
// ============================================================================

void test_encrypted_fields_are_not_indexed() {
    std::cout << "  test_encrypted_fields_are_not_indexed..." << std::flush;

    auto conn = std::make_shared<strata::sqlite_connection>(":memory:");
    strata::collection_config users;
    users.indexes = {"name", "ssn"};
    users.encrypted_fields = {"ssn"};

    strata::storage db(conn,
                       std::make_unique<strata::table_per_collection_strategy>(
                           strata::collection_config_map{{"users", users}},
                           test_support::reversing_encryption()));
    db.initialize();

    strata::json payload = {{"collection", "users"}, {"id", "u1"}, {"v", 3}, {"name", "Ann"}, {"ssn", "123-45"}};
    db.write_records({{strata::record{"u1", payload}}, {}});

    auto row = conn->query_one("SELECT name, ssn, data FROM users WHERE id = ?", {std::string("u1")});
    assert(row.has_value());
    assert(strata::detail::column_text(*row, "name") == std::string("Ann"));
    assert(std::holds_alternative<std::nullptr_t>(row->at("ssn")));
    auto data = strata::detail::column_text(*row, "data");
    assert(data && data->find("123-45") == std::string::npos);

    auto back = db.read_record("users", "u1");
    assert(back.has_value());
    assert(*back == payload);

    std::cout << " OK" << std::endl;
}

void test_whole_payload_storage() {
    std::cout << "  test_whole_payload_storage..." << std::flush;

    auto conn = std::make_shared<strata::sqlite_connection>(":memory:");
    strata::storage db(conn,
                       std::make_unique<strata::shared_table_strategy>(test_support::reversing_encryption()));
    db.initialize();

    auto doc = test_support::make_doc("notes", "n1", 2, {{"body", "meet at seven"}});
    db.write_records({{doc}, {}});

    auto row = conn->query_one("SELECT data FROM docs WHERE id = ?", {doc.id});
    assert(row.has_value());
    auto data = strata::json::parse(*strata::detail::column_text(*row, "data"));
    assert(data.contains("encrypted_payload"));
    assert(data.dump().find("seven") == std::string::npos);

    assert(db.read_record("docs", doc.id).value() == doc.payload);

    // Collection filtering still works on decrypted payloads
    auto notes = db.read_all_records("notes");
    assert(notes.size() == 1);
    assert(notes[0].payload == doc.payload);
    assert(db.read_all_records("other").empty());

    // Inventory is never encrypted
    assert(db.read_inventory().version_of("notes", doc.id) == 2);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing encryption..." << std::endl;
    test_whole_payload_round_trip();
    test_field_level_round_trip();
    test_field_level_with_no_fields_present();
    test_missing_callbacks_pass_through();
    test_callback_failures();
    test_encrypted_fields_are_not_indexed();
    test_whole_payload_storage();
    std::cout << "  Encryption tests passed!" << std::endl;
}

} // namespace encryption_tests
