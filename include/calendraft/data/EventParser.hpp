#pragma once

#include <QString>
#include <QStringList>
#include <optional>
#include <vector>

#include "calendraft/data/Event.hpp"

namespace calendraft {
namespace data {

struct Component;
struct ContentLine;

struct ParseResult
{
    std::vector<CalendarEvent> events;
    QStringList errors;   // skipped events and unreadable documents
    QStringList warnings; // values dropped while keeping their event
    QString calendarName; // X-WR-CALNAME, when present
};

/**
 * Decodes the VEVENT blocks of an iCalendar document. A broken event is
 * reported in ParseResult::errors and skipped; the others are still returned.
 */
class EventParser
{
public:
    EventParser() = default;

    ParseResult parse(const QString &document) const;

private:
    std::optional<CalendarEvent> parseEvent(const Component &vevent, ParseResult &result) const;

    static bool readDates(const Component &vevent, CalendarEvent &event);
    static void readMetadata(const Component &vevent, CalendarEvent &event, ParseResult &result);
    static void readRecurrence(const Component &vevent, CalendarEvent &event, ParseResult &result);
    static void readGeo(const Component &vevent, CalendarEvent &event, ParseResult &result);
    static void readOrganizer(const Component &vevent, CalendarEvent &event);
    static void readAttendees(const Component &vevent, CalendarEvent &event, ParseResult &result);
    static void readAlarms(const Component &vevent, CalendarEvent &event, ParseResult &result);

    static QVector<QDateTime> readDateList(const Component &vevent, const QString &propertyName,
                                           const QString &summary, ParseResult &result);
};

} // namespace data
} // namespace calendraft
