#pragma once

#include <QString>
#include <QtGlobal>
#include <optional>

namespace calendraft {
namespace codec {

enum class DurationUnit
{
    Seconds,
    Minutes,
    Hours,
    Days,
};

struct Duration
{
    int value = 0;
    DurationUnit unit = DurationUnit::Minutes;
};

/**
 * Reads an ISO 8601 duration ("-P1DT2H30M", "PT15M", ...) and keeps only
 * the largest non-zero unit: "P1DT2H" yields {1, Days}. The sign is ignored.
 */
std::optional<Duration> parseDuration(const QString &value);
bool isValidDuration(const QString &value);

// Single-unit forms only: P{n}D, PT{n}H, PT{n}M, PT{n}S. Empty for n <= 0.
QString formatDuration(int value, DurationUnit unit);
QString formatNegativeDuration(int value, DurationUnit unit);

// Seconds are rounded up to the next whole minute.
std::optional<int> durationToMinutes(const QString &value);

// Exact signed length of a multi-unit duration (weeks included).
std::optional<qint64> durationToSeconds(const QString &value);

QString durationUnitName(DurationUnit unit);

} // namespace codec
} // namespace calendraft
