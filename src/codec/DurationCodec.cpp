#include "calendraft/codec/DurationCodec.hpp"

#include <QRegularExpression>

#include <limits>

namespace calendraft {
namespace codec {

namespace {
// Keeps QDateTime::addSecs() and millisecond arithmetic in range.
constexpr qint64 MaxDurationSeconds = std::numeric_limits<qint64>::max() / 1000;

int capturedNumber(const QString &text, const QRegularExpression &pattern)
{
    const auto match = pattern.match(text);
    if (!match.hasMatch()) {
        return 0;
    }
    bool ok = false;
    const int number = match.captured(1).toInt(&ok);
    return ok ? number : -1;
}

QString stripPrefix(const QString &value)
{
    QString clean = value.trimmed();
    if (clean.startsWith('-') || clean.startsWith('+')) {
        clean.remove(0, 1);
    }
    if (clean.startsWith('P', Qt::CaseInsensitive)) {
        clean.remove(0, 1);
    }
    return clean;
}
} // namespace

std::optional<Duration> parseDuration(const QString &value)
{
    static const QRegularExpression daysPattern(QStringLiteral("(\\d+)D"),
                                                QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression timePattern(QStringLiteral("T(.+)"),
                                                QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression hoursPattern(QStringLiteral("(\\d+)H"),
                                                 QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression minutesPattern(QStringLiteral("(\\d+)M"),
                                                   QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression secondsPattern(QStringLiteral("(\\d+)S"),
                                                   QRegularExpression::CaseInsensitiveOption);

    if (value.trimmed().isEmpty()) {
        return std::nullopt;
    }

    const QString body = stripPrefix(value);
    const int days = capturedNumber(body, daysPattern);
    const auto timeMatch = timePattern.match(body);
    if (days < 0 || (!timeMatch.hasMatch() && days == 0)) {
        return std::nullopt;
    }

    int hours = 0;
    int minutes = 0;
    int seconds = 0;
    if (timeMatch.hasMatch()) {
        const QString timePart = timeMatch.captured(1);
        hours = capturedNumber(timePart, hoursPattern);
        minutes = capturedNumber(timePart, minutesPattern);
        seconds = capturedNumber(timePart, secondsPattern);
        if (hours < 0 || minutes < 0 || seconds < 0) {
            return std::nullopt;
        }
    }

    if (days > 0) {
        return Duration{days, DurationUnit::Days};
    }
    if (hours > 0) {
        return Duration{hours, DurationUnit::Hours};
    }
    if (minutes > 0) {
        return Duration{minutes, DurationUnit::Minutes};
    }
    if (seconds > 0) {
        return Duration{seconds, DurationUnit::Seconds};
    }
    return std::nullopt;
}

bool isValidDuration(const QString &value)
{
    return parseDuration(value).has_value();
}

QString formatDuration(int value, DurationUnit unit)
{
    if (value <= 0) {
        return {};
    }
    switch (unit) {
    case DurationUnit::Days:
        return QStringLiteral("P%1D").arg(value);
    case DurationUnit::Hours:
        return QStringLiteral("PT%1H").arg(value);
    case DurationUnit::Seconds:
        return QStringLiteral("PT%1S").arg(value);
    case DurationUnit::Minutes:
    default:
        return QStringLiteral("PT%1M").arg(value);
    }
}

QString formatNegativeDuration(int value, DurationUnit unit)
{
    const QString positive = formatDuration(value, unit);
    if (positive.isEmpty()) {
        return {};
    }
    return QLatin1Char('-') + positive;
}

std::optional<int> durationToMinutes(const QString &value)
{
    const auto parsed = parseDuration(value);
    if (!parsed) {
        return std::nullopt;
    }
    qint64 minutes = parsed->value;
    switch (parsed->unit) {
    case DurationUnit::Days:
        minutes *= 24 * 60;
        break;
    case DurationUnit::Hours:
        minutes *= 60;
        break;
    case DurationUnit::Seconds:
        minutes = (minutes + 59) / 60;
        break;
    case DurationUnit::Minutes:
    default:
        break;
    }
    if (minutes > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(minutes);
}

std::optional<qint64> durationToSeconds(const QString &value)
{
    static const QRegularExpression pattern(
        QStringLiteral("^([+-])?P(?:(\\d+)W)?(?:(\\d+)D)?(?:T(?:(\\d+)H)?(?:(\\d+)M)?(?:(\\d+)S)?)?$"),
        QRegularExpression::CaseInsensitiveOption);

    const QString clean = value.trimmed();
    const auto match = pattern.match(clean);
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    bool anyComponent = false;
    bool valid = true;
    auto component = [&](int index) -> qint64 {
        const QString text = match.captured(index);
        if (text.isEmpty()) {
            return 0;
        }
        anyComponent = true;
        bool ok = false;
        const qint64 number = text.toLongLong(&ok);
        if (!ok || number > MaxDurationSeconds) {
            valid = false;
            return 0;
        }
        return number;
    };

    const qint64 weeks = component(2);
    const qint64 days = component(3);
    const qint64 hours = component(4);
    const qint64 minutes = component(5);
    const qint64 seconds = component(6);
    if (!anyComponent || !valid) {
        return std::nullopt;
    }

    // Every term is bounded first, so none of the sums below can overflow.
    const qint64 terms[] = {weeks, days, hours, minutes, seconds};
    const qint64 scale[] = {7 * 86400, 86400, 3600, 60, 1};
    qint64 total = 0;
    for (int i = 0; i < 5; ++i) {
        if (terms[i] > (MaxDurationSeconds - total) / scale[i]) {
            return std::nullopt;
        }
        total += terms[i] * scale[i];
    }
    return match.captured(1) == QLatin1String("-") ? -total : total;
}

QString durationUnitName(DurationUnit unit)
{
    switch (unit) {
    case DurationUnit::Seconds:
        return QStringLiteral("seconds");
    case DurationUnit::Hours:
        return QStringLiteral("hours");
    case DurationUnit::Days:
        return QStringLiteral("days");
    case DurationUnit::Minutes:
    default:
        return QStringLiteral("minutes");
    }
}

} // namespace codec
} // namespace calendraft
