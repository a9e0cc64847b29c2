#include "calendraft/codec/RecurrenceRule.hpp"

#include "calendraft/codec/DateCodec.hpp"

#include <QRegularExpression>

namespace calendraft {
namespace codec {

namespace {
QList<int> parseIntegerList(const QString &value)
{
    QList<int> numbers;
    const QStringList parts = value.split(',', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        bool ok = false;
        const int number = part.trimmed().toInt(&ok);
        if (ok) {
            numbers << number;
        }
    }
    return numbers;
}

QString joinIntegers(const QList<int> &numbers)
{
    QStringList parts;
    parts.reserve(numbers.size());
    for (int number : numbers) {
        parts << QString::number(number);
    }
    return parts.join(',');
}

QStringList parseWeekdays(const QString &value)
{
    static const QRegularExpression weekdayPattern(QStringLiteral("^[+-]?\\d{0,2}(MO|TU|WE|TH|FR|SA|SU)$"));

    QStringList days;
    const QStringList parts = value.toUpper().split(',', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const QString day = part.trimmed();
        if (weekdayPattern.match(day).hasMatch()) {
            days << day;
        }
    }
    return days;
}
} // namespace

QString frequencyToString(RecurrenceFrequency frequency)
{
    switch (frequency) {
    case RecurrenceFrequency::Weekly:
        return QStringLiteral("WEEKLY");
    case RecurrenceFrequency::Monthly:
        return QStringLiteral("MONTHLY");
    case RecurrenceFrequency::Yearly:
        return QStringLiteral("YEARLY");
    case RecurrenceFrequency::Daily:
    default:
        return QStringLiteral("DAILY");
    }
}

std::optional<RecurrenceFrequency> frequencyFromString(const QString &value)
{
    const QString normalized = value.trimmed().toUpper();
    if (normalized == QLatin1String("DAILY")) {
        return RecurrenceFrequency::Daily;
    }
    if (normalized == QLatin1String("WEEKLY")) {
        return RecurrenceFrequency::Weekly;
    }
    if (normalized == QLatin1String("MONTHLY")) {
        return RecurrenceFrequency::Monthly;
    }
    if (normalized == QLatin1String("YEARLY")) {
        return RecurrenceFrequency::Yearly;
    }
    return std::nullopt;
}

std::optional<RecurrenceRule> RecurrenceRule::parse(const QString &rule)
{
    QString body = rule.trimmed();
    if (body.startsWith(QLatin1String("RRULE:"), Qt::CaseInsensitive)) {
        body = body.mid(6);
    }
    if (body.isEmpty()) {
        return std::nullopt;
    }

    RecurrenceRule result;
    bool hasFrequency = false;
    const QStringList parts = body.split(';', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        const int equals = part.indexOf('=');
        if (equals <= 0) {
            continue;
        }
        const QString key = part.left(equals).trimmed().toUpper();
        const QString value = part.mid(equals + 1).trimmed();
        if (value.isEmpty()) {
            continue;
        }

        if (key == QLatin1String("FREQ")) {
            const auto frequency = frequencyFromString(value);
            if (!frequency) {
                return std::nullopt;
            }
            result.frequency = *frequency;
            hasFrequency = true;
        } else if (key == QLatin1String("INTERVAL")) {
            bool ok = false;
            const int interval = value.toInt(&ok);
            if (ok && interval > 0) {
                result.interval = interval;
            }
        } else if (key == QLatin1String("COUNT")) {
            bool ok = false;
            const int count = value.toInt(&ok);
            if (ok && count > 0) {
                result.count = count;
            }
        } else if (key == QLatin1String("UNTIL")) {
            if (const auto until = parseLenientInstant(value)) {
                result.until = *until;
            }
        } else if (key == QLatin1String("BYDAY")) {
            result.byDay = parseWeekdays(value);
        } else if (key == QLatin1String("BYMONTH")) {
            result.byMonth = parseIntegerList(value);
        } else if (key == QLatin1String("BYMONTHDAY")) {
            result.byMonthDay = parseIntegerList(value);
        } else if (key == QLatin1String("BYSETPOS")) {
            bool ok = false;
            const int position = value.toInt(&ok);
            if (ok && position != 0) {
                result.bySetPos = position;
            }
        }
    }

    if (!hasFrequency) {
        return std::nullopt;
    }
    return result;
}

QString RecurrenceRule::toString() const
{
    QStringList parts;
    parts << QStringLiteral("FREQ=%1").arg(frequencyToString(frequency));
    if (interval > 1) {
        parts << QStringLiteral("INTERVAL=%1").arg(interval);
    }
    if (count && *count > 0) {
        parts << QStringLiteral("COUNT=%1").arg(*count);
    }
    if (until.isValid()) {
        parts << QStringLiteral("UNTIL=%1T235959Z").arg(formatDateOnly(until));
    }
    if (!byDay.isEmpty()) {
        parts << QStringLiteral("BYDAY=%1").arg(byDay.join(','));
    }
    if (!byMonth.isEmpty()) {
        parts << QStringLiteral("BYMONTH=%1").arg(joinIntegers(byMonth));
    }
    if (!byMonthDay.isEmpty()) {
        parts << QStringLiteral("BYMONTHDAY=%1").arg(joinIntegers(byMonthDay));
    }
    if (bySetPos && *bySetPos != 0) {
        parts << QStringLiteral("BYSETPOS=%1").arg(*bySetPos);
    }
    return parts.join(';');
}

} // namespace codec
} // namespace calendraft
