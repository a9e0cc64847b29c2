#pragma once

#include <QDateTime>
#include <QString>
#include <optional>

#include "calendraft/codec/DurationCodec.hpp"

namespace calendraft {
namespace codec {

enum class AlarmWhen
{
    Before,
    At,
    After,
};

struct AlarmTrigger
{
    AlarmWhen when = AlarmWhen::Before;
    int value = 0;
    DurationUnit unit = DurationUnit::Minutes;
};

// Matches the fixed-width absolute form YYYYMMDDTHHMMSS with optional Z.
bool isAbsoluteTrigger(const QString &trigger);

/**
 * Absolute triggers map to {At, 0, Minutes}; the instant itself is not kept,
 * callers derive it from the event start (see triggerFireTime()).
 * Relative triggers keep the largest of days, hours and minutes.
 */
std::optional<AlarmTrigger> parseTrigger(const QString &trigger);

// Returns an empty string for AlarmWhen::At.
QString formatTrigger(AlarmWhen when, int value, DurationUnit unit);

// When the reminder fires for an event starting at eventStart.
std::optional<QDateTime> triggerFireTime(const QString &trigger, const QDateTime &eventStart);

} // namespace codec
} // namespace calendraft
