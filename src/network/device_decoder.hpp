#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include "network/response_parser.hpp"

#include <QString>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <type_traits>

namespace lumen::network {

/**
 * Build a Device from the headers of one advertisement.
 *
 * Fields are read in a fixed order (id, model, fw_ver, power, support, bright,
 * color_mode, ct, rgb, hue, sat, name) and the first problem wins:
 * FieldMissing when a header is absent, FieldInvalid (with the raw value) when
 * it does not parse. No partially filled Device is ever returned.
 *
 * `location` is supplied by the caller; it is not read from the headers.
 */
[[nodiscard]] Result<Device, Error> decode_device(const HeaderMap& headers, const Endpoint& location);

/**
 * Control endpoint for an advertisement: the `Location` header when it holds a
 * usable `scheme://a.b.c.d:port`, otherwise the datagram's source address.
 */
[[nodiscard]] Endpoint resolve_location(const HeaderMap& headers, const Endpoint& source);

// Strict unsigned decimal: ASCII digits only (no sign, no whitespace, no
// non-Latin digits), range-checked for T.
template<typename T>
[[nodiscard]] std::optional<T> parse_unsigned(const QString& text) {
    static_assert(std::is_unsigned_v<T>);

    if (text.isEmpty()) {
        return std::nullopt;
    }
    for (const QChar c : text) {
        if (c < QLatin1Char('0') || c > QLatin1Char('9')) {
            return std::nullopt;
        }
    }

    const auto latin = text.toLatin1();

    uint64_t value = 0;
    const auto* begin = latin.constData();
    const auto* end = begin + latin.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value, 10);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    if (value > std::numeric_limits<T>::max()) {
        return std::nullopt;
    }
    return static_cast<T>(value);
}

} // namespace lumen::network
