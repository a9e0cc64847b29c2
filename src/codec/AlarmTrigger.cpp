#include "calendraft/codec/AlarmTrigger.hpp"

#include "calendraft/codec/DateCodec.hpp"

#include <QRegularExpression>

namespace calendraft {
namespace codec {

bool isAbsoluteTrigger(const QString &trigger)
{
    static const QRegularExpression pattern(QStringLiteral("^\\d{8}T\\d{6}(Z)?$"));
    return pattern.match(trigger.trimmed()).hasMatch();
}

std::optional<AlarmTrigger> parseTrigger(const QString &trigger)
{
    if (trigger.trimmed().isEmpty()) {
        return std::nullopt;
    }
    if (isAbsoluteTrigger(trigger)) {
        return AlarmTrigger{AlarmWhen::At, 0, DurationUnit::Minutes};
    }

    const auto duration = parseDuration(trigger);
    if (!duration || duration->unit == DurationUnit::Seconds) {
        return std::nullopt;
    }
    const AlarmWhen when = trigger.trimmed().startsWith('-') ? AlarmWhen::Before : AlarmWhen::After;
    return AlarmTrigger{when, duration->value, duration->unit};
}

QString formatTrigger(AlarmWhen when, int value, DurationUnit unit)
{
    if (when == AlarmWhen::At) {
        return {};
    }

    const QString prefix = when == AlarmWhen::Before ? QStringLiteral("-") : QString();
    switch (unit) {
    case DurationUnit::Days:
        return prefix + QStringLiteral("P%1D").arg(value);
    case DurationUnit::Hours:
        return prefix + QStringLiteral("PT%1H").arg(value);
    case DurationUnit::Seconds:
        return prefix + QStringLiteral("PT%1S").arg(value);
    case DurationUnit::Minutes:
    default:
        return prefix + QStringLiteral("PT%1M").arg(value);
    }
}

std::optional<QDateTime> triggerFireTime(const QString &trigger, const QDateTime &eventStart)
{
    if (isAbsoluteTrigger(trigger)) {
        return parseLenientInstant(trigger);
    }
    if (!eventStart.isValid()) {
        return std::nullopt;
    }
    const auto offset = durationToSeconds(trigger);
    if (!offset) {
        return std::nullopt;
    }
    return eventStart.addSecs(*offset);
}

} // namespace codec
} // namespace calendraft
