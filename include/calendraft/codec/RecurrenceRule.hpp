#pragma once

#include <QDateTime>
#include <QList>
#include <QString>
#include <QStringList>
#include <optional>

namespace calendraft {
namespace codec {

enum class RecurrenceFrequency
{
    Daily,
    Weekly,
    Monthly,
    Yearly,
};

/**
 * Structured view of an RRULE value. Events keep the rule as text; this type
 * is for callers that need to inspect or build one.
 */
struct RecurrenceRule
{
    RecurrenceFrequency frequency = RecurrenceFrequency::Daily;
    int interval = 1;
    std::optional<int> count;
    QDateTime until;
    QStringList byDay; // "MO", "-1FR", "2TU"
    QList<int> byMonth;
    QList<int> byMonthDay;
    std::optional<int> bySetPos;

    // Returns nullopt when FREQ is missing or unknown.
    static std::optional<RecurrenceRule> parse(const QString &rule);

    // UNTIL is emitted as the last second of its day.
    QString toString() const;
};

QString frequencyToString(RecurrenceFrequency frequency);
std::optional<RecurrenceFrequency> frequencyFromString(const QString &value);

} // namespace codec
} // namespace calendraft
