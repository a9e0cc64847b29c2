#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

namespace calendraft {
namespace codec {

// Accepts exactly "YYYYMMDDTHHMMSSZ" or "YYYYMMDD" (midnight UTC).
std::optional<QDateTime> parseInstant(const QString &value);

// Like parseInstant, but also reads a floating "YYYYMMDDTHHMMSS" as UTC.
std::optional<QDateTime> parseLenientInstant(const QString &value);

bool isValidIcsDate(const QString &value);

// Sub-second precision is truncated.
QString formatInstant(const QDateTime &instant);
QString formatDateOnly(const QDateTime &instant);

} // namespace codec
} // namespace calendraft
