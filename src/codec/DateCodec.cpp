#include "calendraft/codec/DateCodec.hpp"

#include <QDate>
#include <QRegularExpression>
#include <QTime>

namespace calendraft {
namespace codec {

namespace {
constexpr auto DATE_FORMAT = "yyyyMMdd";
constexpr auto DATE_TIME_FORMAT = "yyyyMMdd'T'hhmmss'Z'";

std::optional<QDateTime> makeInstant(const QString &datePart, const QString &timePart)
{
    const QDate date = QDate::fromString(datePart, QLatin1String(DATE_FORMAT));
    if (!date.isValid()) {
        return std::nullopt;
    }
    QTime time(0, 0);
    if (!timePart.isEmpty()) {
        time = QTime::fromString(timePart, QStringLiteral("hhmmss"));
        if (!time.isValid()) {
            return std::nullopt;
        }
    }
    return QDateTime(date, time, Qt::UTC);
}
} // namespace

std::optional<QDateTime> parseInstant(const QString &value)
{
    static const QRegularExpression dateTimePattern(QStringLiteral("^(\\d{8})T(\\d{6})Z$"));
    static const QRegularExpression datePattern(QStringLiteral("^\\d{8}$"));

    if (value.size() == 16) {
        const auto match = dateTimePattern.match(value);
        if (!match.hasMatch()) {
            return std::nullopt;
        }
        return makeInstant(match.captured(1), match.captured(2));
    }
    if (value.size() == 8 && datePattern.match(value).hasMatch()) {
        return makeInstant(value, QString());
    }
    return std::nullopt;
}

std::optional<QDateTime> parseLenientInstant(const QString &value)
{
    static const QRegularExpression floatingPattern(QStringLiteral("^(\\d{8})T(\\d{6})$"));

    const QString clean = value.trimmed();
    if (auto strict = parseInstant(clean)) {
        return strict;
    }
    const auto match = floatingPattern.match(clean);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    return makeInstant(match.captured(1), match.captured(2));
}

bool isValidIcsDate(const QString &value)
{
    return parseInstant(value).has_value();
}

QString formatInstant(const QDateTime &instant)
{
    if (!instant.isValid()) {
        return {};
    }
    return instant.toUTC().toString(QLatin1String(DATE_TIME_FORMAT));
}

QString formatDateOnly(const QDateTime &instant)
{
    if (!instant.isValid()) {
        return {};
    }
    return instant.toUTC().date().toString(QLatin1String(DATE_FORMAT));
}

} // namespace codec
} // namespace calendraft
