#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <vector>

#include "calendraft/core/CodecSettings.hpp"
#include "calendraft/data/Event.hpp"

namespace calendraft {
namespace data {

/**
 * Serializes events into one VCALENDAR document, in the given order.
 *
 * Absent DTSTAMP, CREATED and LAST-MODIFIED fall back to fallbackTimestamp
 * (the current time when it is invalid). A missing UID becomes "{id}@{uidDomain}".
 * Lines are joined with CRLF; folding only happens when settings ask for it.
 */
class EventGenerator
{
public:
    explicit EventGenerator(core::CodecSettings settings = {});

    QString generate(const QString &calendarName, const std::vector<CalendarEvent> &events,
                     const QDateTime &fallbackTimestamp = {}) const;

    QStringList eventLines(const CalendarEvent &event, const QDateTime &fallbackTimestamp) const;
    QString serializeLines(const QStringList &lines) const;

private:
    void appendIdentity(const CalendarEvent &event, const QDateTime &fallback, QStringList &lines) const;
    static void appendMetadata(const CalendarEvent &event, QStringList &lines);
    static void appendRecurrence(const CalendarEvent &event, QStringList &lines);
    static void appendExtensions(const CalendarEvent &event, QStringList &lines);
    static void appendOrganizer(const CalendarEvent &event, QStringList &lines);
    static void appendAttendees(const CalendarEvent &event, QStringList &lines);
    static void appendAlarms(const CalendarEvent &event, QStringList &lines);

    core::CodecSettings m_settings;
};

} // namespace data
} // namespace calendraft
