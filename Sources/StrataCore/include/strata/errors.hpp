#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace strata {

enum class error_kind {
    not_ready,        ///< operation before initialize() or after close()
    malformed_input,  ///< missing collection tag, bad inventory operation, ...
    schema_error,     ///< DDL failure during initialize / ensure_table
    io_error,         ///< statement execution, connection creation/validation
    encryption_error  ///< encryption callback failed or produced bad output
};

inline const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::not_ready: return "not_ready";
        case error_kind::malformed_input: return "malformed_input";
        case error_kind::schema_error: return "schema_error";
        case error_kind::io_error: return "io_error";
        case error_kind::encryption_error: return "encryption_error";
    }
    return "unknown";
}

class storage_error : public std::runtime_error {
public:
    storage_error(error_kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

class not_ready_error : public storage_error {
public:
    explicit not_ready_error(const std::string& msg)
        : storage_error(error_kind::not_ready, msg) {}
};

class malformed_input_error : public storage_error {
public:
    explicit malformed_input_error(const std::string& msg)
        : storage_error(error_kind::malformed_input, msg) {}
};

class schema_error : public storage_error {
public:
    explicit schema_error(const std::string& msg)
        : storage_error(error_kind::schema_error, msg) {}
};

class db_error : public storage_error {
public:
    explicit db_error(const std::string& msg)
        : storage_error(error_kind::io_error, msg) {}
};

/// No healthy pooled connection could be produced in time.
class acquire_error : public db_error {
public:
    explicit acquire_error(const std::string& msg) : db_error(msg) {}
};

class encryption_error : public storage_error {
public:
    explicit encryption_error(const std::string& msg)
        : storage_error(error_kind::encryption_error, msg) {}
};

} // namespace strata

#endif // __cplusplus
