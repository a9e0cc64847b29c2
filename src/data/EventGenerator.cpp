#include "calendraft/data/EventGenerator.hpp"

#include "calendraft/codec/AlarmTrigger.hpp"
#include "calendraft/codec/DateCodec.hpp"
#include "calendraft/codec/TextEscaping.hpp"
#include "calendraft/core/Logging.hpp"
#include "calendraft/data/IcsDocument.hpp"

#include <QLocale>
#include <QTime>

namespace calendraft {
namespace data {

namespace {
constexpr auto LINE_BREAK = "\r\n";

void appendText(QStringList &lines, const char *name, const QString &value)
{
    if (!value.isEmpty()) {
        lines << QString::fromLatin1(name) + QLatin1Char(':') + codec::escapeText(value);
    }
}

void appendRaw(QStringList &lines, const char *name, const QString &value)
{
    if (!value.isEmpty()) {
        lines << QString::fromLatin1(name) + QLatin1Char(':') + value;
    }
}

QString escapedList(const QStringList &items)
{
    QStringList escaped;
    escaped.reserve(items.size());
    for (const QString &item : items) {
        escaped << codec::escapeText(item);
    }
    return escaped.join(',');
}

QString instantList(const QVector<QDateTime> &instants)
{
    QStringList formatted;
    formatted.reserve(instants.size());
    for (const QDateTime &instant : instants) {
        if (instant.isValid()) {
            formatted << codec::formatInstant(instant);
        }
    }
    return formatted.join(',');
}

QString formatCoordinate(double value)
{
    return QString::number(value, 'g', QLocale::FloatingPointShortest);
}

QDateTime effectiveFallback(const QDateTime &fallback)
{
    if (fallback.isValid()) {
        return fallback;
    }
    QDateTime now = QDateTime::currentDateTimeUtc();
    now.setTime(QTime(now.time().hour(), now.time().minute(), now.time().second()));
    return now;
}
} // namespace

EventGenerator::EventGenerator(core::CodecSettings settings)
    : m_settings(std::move(settings))
{
}

QString EventGenerator::generate(const QString &calendarName, const std::vector<CalendarEvent> &events,
                                 const QDateTime &fallbackTimestamp) const
{
    const QDateTime fallback = effectiveFallback(fallbackTimestamp);

    QStringList lines;
    lines << QStringLiteral("BEGIN:VCALENDAR");
    lines << QStringLiteral("VERSION:2.0");
    lines << QStringLiteral("PRODID:") + m_settings.productId;
    lines << QStringLiteral("CALSCALE:GREGORIAN");
    lines << QStringLiteral("METHOD:PUBLISH");
    appendText(lines, "X-WR-CALNAME", calendarName);

    for (const CalendarEvent &event : events) {
        lines << eventLines(event, fallback);
    }

    lines << QStringLiteral("END:VCALENDAR");

    qCDebug(CALENDRAFT_GENERATOR) << "Generated" << events.size() << "events for" << calendarName;
    return serializeLines(lines);
}

QStringList EventGenerator::eventLines(const CalendarEvent &event, const QDateTime &fallbackTimestamp) const
{
    const QDateTime fallback = effectiveFallback(fallbackTimestamp);

    QStringList lines;
    lines << QStringLiteral("BEGIN:VEVENT");
    appendIdentity(event, fallback, lines);
    appendMetadata(event, lines);
    appendRecurrence(event, lines);
    appendExtensions(event, lines);
    appendOrganizer(event, lines);
    appendAttendees(event, lines);
    appendAlarms(event, lines);
    lines << QStringLiteral("END:VEVENT");
    return lines;
}

QString EventGenerator::serializeLines(const QStringList &lines) const
{
    if (!m_settings.foldLines) {
        return lines.join(QLatin1String(LINE_BREAK));
    }
    QStringList folded;
    folded.reserve(lines.size());
    for (const QString &line : lines) {
        folded << foldLine(line, m_settings.foldWidth);
    }
    return folded.join(QLatin1String(LINE_BREAK));
}

void EventGenerator::appendIdentity(const CalendarEvent &event, const QDateTime &fallback, QStringList &lines) const
{
    const QString uid = !event.uid.isEmpty()
        ? event.uid
        : QStringLiteral("%1@%2").arg(event.id.toString(QUuid::WithoutBraces), m_settings.uidDomain);
    appendText(lines, "UID", uid);
    appendRaw(lines, "DTSTAMP", codec::formatInstant(event.dtstamp.isValid() ? event.dtstamp : fallback));
    appendRaw(lines, "DTSTART", codec::formatInstant(event.startDate));
    appendRaw(lines, "DTEND", codec::formatInstant(event.endDate));
    appendText(lines, "SUMMARY", event.title);
    appendText(lines, "DESCRIPTION", event.description);
    appendText(lines, "LOCATION", event.location);
    appendRaw(lines, "CREATED", codec::formatInstant(event.created.isValid() ? event.created : fallback));
    appendRaw(lines, "LAST-MODIFIED",
              codec::formatInstant(event.lastModified.isValid() ? event.lastModified : fallback));
}

void EventGenerator::appendMetadata(const CalendarEvent &event, QStringList &lines)
{
    appendRaw(lines, "STATUS", event.status.trimmed().toUpper());
    if (event.priority) {
        lines << QStringLiteral("PRIORITY:%1").arg(*event.priority);
    }
    appendRaw(lines, "CATEGORIES", escapedList(event.categories));
    appendText(lines, "URL", event.url);
    appendRaw(lines, "CLASS", event.classification.trimmed().toUpper());
    appendText(lines, "COMMENT", event.comment);
    appendText(lines, "CONTACT", event.contact);
    appendRaw(lines, "RESOURCES", escapedList(event.resources));
    if (event.sequence) {
        lines << QStringLiteral("SEQUENCE:%1").arg(*event.sequence);
    }
    appendRaw(lines, "TRANSP", event.transparency.trimmed().toUpper());
}

void EventGenerator::appendRecurrence(const CalendarEvent &event, QStringList &lines)
{
    appendRaw(lines, "RRULE", event.recurrenceRule.trimmed());
    appendRaw(lines, "RDATE", instantList(event.recurrenceDates));
    appendRaw(lines, "EXDATE", instantList(event.exceptionDates));
}

void EventGenerator::appendExtensions(const CalendarEvent &event, QStringList &lines)
{
    if (event.geo) {
        lines << QStringLiteral("GEO:%1;%2").arg(formatCoordinate(event.geo->latitude),
                                                 formatCoordinate(event.geo->longitude));
    }
    appendRaw(lines, "RECURRENCE-ID", event.recurrenceId);
    appendText(lines, "RELATED-TO", event.relatedTo);
    appendRaw(lines, "COLOR", event.color);
}

void EventGenerator::appendOrganizer(const CalendarEvent &event, QStringList &lines)
{
    if (event.organizerEmail.isEmpty()) {
        return;
    }
    QString line = QStringLiteral("ORGANIZER");
    if (!event.organizerName.isEmpty()) {
        line += QStringLiteral(";CN=") + codec::formatParameterValue(event.organizerName);
    }
    line += QStringLiteral(":mailto:") + event.organizerEmail;
    lines << line;
}

void EventGenerator::appendAttendees(const CalendarEvent &event, QStringList &lines)
{
    for (const Attendee &attendee : event.attendees) {
        QStringList params;
        if (!attendee.name.isEmpty()) {
            params << QStringLiteral("CN=") + codec::formatParameterValue(attendee.name);
        }
        if (attendee.role) {
            params << QStringLiteral("ROLE=") + attendeeRoleToString(*attendee.role);
        }
        if (attendee.status) {
            params << QStringLiteral("PARTSTAT=") + participationStatusToString(*attendee.status);
        }
        if (attendee.rsvp) {
            params << QStringLiteral("RSVP=TRUE");
        }
        const QString paramText = params.isEmpty() ? QString() : QLatin1Char(';') + params.join(';');
        lines << QStringLiteral("ATTENDEE%1:mailto:%2").arg(paramText, attendee.email);
    }
}

void EventGenerator::appendAlarms(const CalendarEvent &event, QStringList &lines)
{
    for (const Alarm &alarm : event.alarms) {
        lines << QStringLiteral("BEGIN:VALARM");
        if (codec::isAbsoluteTrigger(alarm.trigger)) {
            lines << QStringLiteral("TRIGGER;VALUE=DATE-TIME:") + alarm.trigger.trimmed();
        } else {
            lines << QStringLiteral("TRIGGER:") + alarm.trigger.trimmed();
        }
        lines << QStringLiteral("ACTION:") + alarmActionToString(alarm.action);
        appendText(lines, "SUMMARY", alarm.summary);
        appendText(lines, "DESCRIPTION", alarm.description);
        appendRaw(lines, "DURATION", alarm.duration);
        if (alarm.repeat) {
            lines << QStringLiteral("REPEAT:%1").arg(*alarm.repeat);
        }
        lines << QStringLiteral("END:VALARM");
    }
}

} // namespace data
} // namespace calendraft
