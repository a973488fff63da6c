#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QHash>
#include <QString>
#include <cstddef>

namespace lumen::network {

// Header name -> value, names kept exactly as sent.
using HeaderMap = QHash<QString, QString>;

inline constexpr std::size_t kMaxHeaders = 17;

struct ParsedResponse {
    int status_code = 0;
    QString reason;
    HeaderMap headers;
};

/**
 * Parse one discovery response datagram.
 *
 * The bytes are decoded as lossy UTF-8 (bad sequences become U+FFFD) and any
 * NUL padding from a fixed receive buffer is dropped. Expects an HTTP/1.x
 * status line followed by `Name: value` lines, at most kMaxHeaders of them.
 * A repeated header name keeps the last value.
 */
[[nodiscard]] Result<ParsedResponse, Error> parse_response(const QByteArray& datagram);

} // namespace lumen::network
