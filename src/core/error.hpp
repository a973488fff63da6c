#pragma once

#include <string>
#include <string_view>

namespace lumen {

/**
 * ErrorKind - Which stage of discovery or control failed.
 *
 * Configuration and TransportSend reach the caller. Parse, FieldMissing and
 * FieldInvalid only ever describe a single datagram and are dropped by the
 * discovery loop.
 */
enum class ErrorKind {
    Configuration,
    TransportSend,
    Parse,
    FieldMissing,
    FieldInvalid,
    Connection,
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::TransportSend: return "transport-send";
        case ErrorKind::Parse: return "parse";
        case ErrorKind::FieldMissing: return "field-missing";
        case ErrorKind::FieldInvalid: return "field-invalid";
        case ErrorKind::Connection: return "connection";
    }
    return "unknown";
}

/**
 * Error - A failure with its kind and a human readable message.
 *
 * Field errors also carry the header name and, for FieldInvalid, the raw
 * value that failed to parse.
 */
struct Error {
    ErrorKind kind{ErrorKind::Configuration};
    std::string message;
    std::string field;
    std::string raw_value;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] static Error configuration(std::string msg) {
        return Error{ErrorKind::Configuration, std::move(msg)};
    }

    [[nodiscard]] static Error transport_send(std::string msg) {
        return Error{ErrorKind::TransportSend, std::move(msg)};
    }

    [[nodiscard]] static Error parse(std::string msg) {
        return Error{ErrorKind::Parse, std::move(msg)};
    }

    [[nodiscard]] static Error field_missing(std::string field_name) {
        Error e{ErrorKind::FieldMissing, "missing field '" + field_name + "'"};
        e.field = std::move(field_name);
        return e;
    }

    [[nodiscard]] static Error field_invalid(std::string field_name, std::string raw) {
        Error e{ErrorKind::FieldInvalid,
                "invalid value '" + raw + "' for field '" + field_name + "'"};
        e.field = std::move(field_name);
        e.raw_value = std::move(raw);
        return e;
    }

    [[nodiscard]] static Error connection(std::string msg) {
        return Error{ErrorKind::Connection, std::move(msg)};
    }

    bool operator==(const Error& other) const = default;
};

} // namespace lumen
