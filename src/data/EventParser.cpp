#include "calendraft/data/EventParser.hpp"

#include "calendraft/codec/DateCodec.hpp"
#include "calendraft/codec/DurationCodec.hpp"
#include "calendraft/codec/TextEscaping.hpp"
#include "calendraft/core/Logging.hpp"
#include "calendraft/data/IcsDocument.hpp"

#include <QRegularExpression>

namespace calendraft {
namespace data {

namespace {
const QString UntitledEvent = QStringLiteral("Untitled Event");

QString rawValue(const Component &component, const QString &name)
{
    const ContentLine *line = component.property(name);
    return line ? line->value.trimmed() : QString();
}

QString textValue(const Component &component, const QString &name)
{
    const ContentLine *line = component.property(name);
    return line ? codec::unescapeText(line->value) : QString();
}

QDateTime dateValue(const Component &component, const QString &name)
{
    const ContentLine *line = component.property(name);
    if (!line) {
        return {};
    }
    const auto instant = codec::parseLenientInstant(line->value);
    return instant ? *instant : QDateTime();
}

std::optional<int> integerValue(const Component &component, const QString &name)
{
    const ContentLine *line = component.property(name);
    if (!line) {
        return std::nullopt;
    }
    bool ok = false;
    const int number = line->value.trimmed().toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return number;
}

QStringList listValue(const Component &component, const QString &name)
{
    QStringList items;
    for (const ContentLine *line : component.allProperties(name)) {
        items << codec::splitTextList(line->value);
    }
    return items;
}

void addWarning(ParseResult &result, const QString &warning)
{
    qCWarning(CALENDRAFT_PARSER) << warning;
    result.warnings << warning;
}

struct Address
{
    QString name;
    QString email;
};

// Reads "mailto:x", a bare address, or the malformed "CN=Name:mailto:x".
Address readAddress(const QString &value)
{
    static const QRegularExpression inlineName(QStringLiteral("CN=([^:]+):mailto:(.+)"),
                                               QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression mailtoPrefix(QStringLiteral("^mailto:"),
                                                 QRegularExpression::CaseInsensitiveOption);

    Address address;
    const QString clean = value.trimmed();
    const auto match = inlineName.match(clean);
    if (match.hasMatch()) {
        address.name = match.captured(1).trimmed();
        address.email = match.captured(2).trimmed();
        return address;
    }
    address.email = clean;
    address.email.remove(mailtoPrefix);
    address.email = address.email.trimmed();
    return address;
}

// Clears an enumerated value the wire may not carry.
void checkEnumerated(QString &value, bool (*isValid)(const QString &), const char *propertyName,
                     const QString &summary, ParseResult &result)
{
    if (value.isEmpty() || isValid(value)) {
        return;
    }
    const QString warning = QStringLiteral("%1 value \"%2\" in event \"%3\" is not recognised, omitted.")
                                .arg(QLatin1String(propertyName), value, summary);
    addWarning(result, warning);
    value.clear();
}
} // namespace

ParseResult EventParser::parse(const QString &document) const
{
    ParseResult result;

    QString errorMessage;
    const auto calendar = parseComponentTree(document, &errorMessage, &result.warnings);
    if (!calendar) {
        const QString error = QStringLiteral("Failed to parse ICS file: %1").arg(errorMessage);
        qCWarning(CALENDRAFT_PARSER) << error;
        result.errors << error;
        return result;
    }

    if (const ContentLine *name = calendar->property(QStringLiteral("X-WR-CALNAME"))) {
        result.calendarName = codec::unescapeText(name->value).trimmed();
    }

    const auto vevents = calendar->childrenNamed(QStringLiteral("VEVENT"));
    for (const Component *vevent : vevents) {
        if (auto event = parseEvent(*vevent, result)) {
            result.events.push_back(std::move(*event));
        }
    }

    if (vevents.empty()) {
        result.errors << QStringLiteral("No events found in the ICS file.");
    }

    qCDebug(CALENDRAFT_PARSER) << "Parsed" << result.events.size() << "of" << vevents.size() << "events,"
                               << result.errors.size() << "errors," << result.warnings.size() << "warnings";
    return result;
}

std::optional<CalendarEvent> EventParser::parseEvent(const Component &vevent, ParseResult &result) const
{
    CalendarEvent event;
    event.title = textValue(vevent, QStringLiteral("SUMMARY"));
    if (event.title.trimmed().isEmpty()) {
        event.title = UntitledEvent;
    }

    if (!readDates(vevent, event)) {
        const QString error = QStringLiteral("Event \"%1\" is missing start or end date, skipping.").arg(event.title);
        qCWarning(CALENDRAFT_PARSER) << error;
        result.errors << error;
        return std::nullopt;
    }

    event.uid = textValue(vevent, QStringLiteral("UID"));
    event.dtstamp = dateValue(vevent, QStringLiteral("DTSTAMP"));
    event.created = dateValue(vevent, QStringLiteral("CREATED"));
    event.lastModified = dateValue(vevent, QStringLiteral("LAST-MODIFIED"));
    event.recurrenceId = rawValue(vevent, QStringLiteral("RECURRENCE-ID"));
    event.relatedTo = textValue(vevent, QStringLiteral("RELATED-TO"));
    event.color = rawValue(vevent, QStringLiteral("COLOR"));

    readMetadata(vevent, event, result);
    readRecurrence(vevent, event, result);
    readGeo(vevent, event, result);
    readOrganizer(vevent, event);
    readAttendees(vevent, event, result);
    readAlarms(vevent, event, result);
    return event;
}

bool EventParser::readDates(const Component &vevent, CalendarEvent &event)
{
    event.startDate = dateValue(vevent, QStringLiteral("DTSTART"));
    if (!event.startDate.isValid()) {
        return false;
    }

    event.endDate = dateValue(vevent, QStringLiteral("DTEND"));
    if (!event.endDate.isValid()) {
        // DURATION counts every component, not just the largest one.
        const auto seconds = codec::durationToSeconds(rawValue(vevent, QStringLiteral("DURATION")));
        if (!seconds) {
            return false;
        }
        event.endDate = event.startDate.addSecs(*seconds);
    }
    return event.endDate.isValid();
}

void EventParser::readMetadata(const Component &vevent, CalendarEvent &event, ParseResult &result)
{
    event.description = textValue(vevent, QStringLiteral("DESCRIPTION"));
    event.location = textValue(vevent, QStringLiteral("LOCATION"));
    event.status = rawValue(vevent, QStringLiteral("STATUS")).toUpper();
    event.priority = integerValue(vevent, QStringLiteral("PRIORITY"));
    event.categories = listValue(vevent, QStringLiteral("CATEGORIES"));
    event.url = textValue(vevent, QStringLiteral("URL"));
    event.classification = rawValue(vevent, QStringLiteral("CLASS")).toUpper();
    event.comment = textValue(vevent, QStringLiteral("COMMENT"));
    event.contact = textValue(vevent, QStringLiteral("CONTACT"));
    event.resources = listValue(vevent, QStringLiteral("RESOURCES"));
    event.sequence = integerValue(vevent, QStringLiteral("SEQUENCE"));
    event.transparency = rawValue(vevent, QStringLiteral("TRANSP")).toUpper();

    checkEnumerated(event.status, isValidEventStatus, "STATUS", event.title, result);
    checkEnumerated(event.classification, isValidEventClass, "CLASS", event.title, result);
    checkEnumerated(event.transparency, isValidEventTransparency, "TRANSP", event.title, result);
    if (event.priority && !isValidPriority(*event.priority)) {
        const QString warning = QStringLiteral("PRIORITY %1 in event \"%2\" is outside 0-9, omitted.")
                                    .arg(*event.priority)
                                    .arg(event.title);
        addWarning(result, warning);
        event.priority.reset();
    }
}

void EventParser::readRecurrence(const Component &vevent, CalendarEvent &event, ParseResult &result)
{
    event.recurrenceRule = rawValue(vevent, QStringLiteral("RRULE"));
    event.recurrenceDates = readDateList(vevent, QStringLiteral("RDATE"), event.title, result);
    event.exceptionDates = readDateList(vevent, QStringLiteral("EXDATE"), event.title, result);
}

QVector<QDateTime> EventParser::readDateList(const Component &vevent, const QString &propertyName,
                                             const QString &summary, ParseResult &result)
{
    QVector<QDateTime> dates;
    for (const ContentLine *line : vevent.allProperties(propertyName)) {
        const QStringList values = line->value.split(',', Qt::SkipEmptyParts);
        for (const QString &value : values) {
            if (const auto instant = codec::parseLenientInstant(value)) {
                dates.append(*instant);
                continue;
            }
            const QString warning = QStringLiteral("%1 value \"%2\" in event \"%3\" could not be read, omitted.")
                                        .arg(propertyName, value.trimmed(), summary);
            addWarning(result, warning);
        }
    }
    return dates;
}

void EventParser::readGeo(const Component &vevent, CalendarEvent &event, ParseResult &result)
{
    const ContentLine *line = vevent.property(QStringLiteral("GEO"));
    if (!line) {
        return;
    }

    const QStringList parts = line->value.trimmed().split(';');
    if (parts.size() == 2) {
        bool latitudeOk = false;
        bool longitudeOk = false;
        const double latitude = parts.at(0).trimmed().toDouble(&latitudeOk);
        const double longitude = parts.at(1).trimmed().toDouble(&longitudeOk);
        if (latitudeOk && longitudeOk) {
            event.geo = GeoPosition{latitude, longitude};
            return;
        }
    }
    const QString warning = QStringLiteral("GEO value \"%1\" in event \"%2\" is not \"latitude;longitude\", omitted.")
                                .arg(line->value.trimmed(), event.title);
    addWarning(result, warning);
}

void EventParser::readOrganizer(const Component &vevent, CalendarEvent &event)
{
    const ContentLine *line = vevent.property(QStringLiteral("ORGANIZER"));
    if (!line) {
        return;
    }
    const Address address = readAddress(line->value);
    event.organizerEmail = address.email;
    event.organizerName = address.name;
    const QString commonName = line->parameter(QStringLiteral("CN")).trimmed();
    if (!commonName.isEmpty()) {
        event.organizerName = commonName;
    }
}

void EventParser::readAttendees(const Component &vevent, CalendarEvent &event, ParseResult &result)
{
    for (const ContentLine *line : vevent.allProperties(QStringLiteral("ATTENDEE"))) {
        const Address address = readAddress(line->value);
        if (address.email.isEmpty()) {
            const QString warning = QStringLiteral("Attendee without address in event \"%1\", omitted.").arg(event.title);
            addWarning(result, warning);
            continue;
        }

        Attendee attendee;
        attendee.email = address.email;
        attendee.name = address.name;
        if (attendee.name.isEmpty()) {
            attendee.name = line->parameter(QStringLiteral("CN")).trimmed();
        }

        const QString role = line->parameter(QStringLiteral("ROLE"));
        if (!role.isEmpty()) {
            bool recognized = false;
            attendee.role = attendeeRoleFromString(role, &recognized);
            if (!recognized) {
                addWarning(result, QStringLiteral("Unknown attendee role \"%1\" in event \"%2\", using %3.")
                                       .arg(role, event.title, attendeeRoleToString(*attendee.role)));
            }
        }

        const QString status = line->parameter(QStringLiteral("PARTSTAT"));
        if (!status.isEmpty()) {
            bool recognized = false;
            attendee.status = participationStatusFromString(status, &recognized);
            if (!recognized) {
                addWarning(result, QStringLiteral("Unknown participation status \"%1\" in event \"%2\", using %3.")
                                       .arg(status, event.title, participationStatusToString(*attendee.status)));
            }
        }

        attendee.rsvp = line->parameter(QStringLiteral("RSVP")).trimmed().compare(QLatin1String("TRUE"),
                                                                                 Qt::CaseInsensitive) == 0;
        event.attendees.append(attendee);
    }
}

void EventParser::readAlarms(const Component &vevent, CalendarEvent &event, ParseResult &result)
{
    for (const Component *valarm : vevent.childrenNamed(QStringLiteral("VALARM"))) {
        const QString trigger = rawValue(*valarm, QStringLiteral("TRIGGER"));
        const QString action = rawValue(*valarm, QStringLiteral("ACTION"));
        if (trigger.isEmpty() || action.isEmpty()) {
            const QString warning = QStringLiteral("Alarm without TRIGGER or ACTION in event \"%1\", omitted.")
                                        .arg(event.title);
            addWarning(result, warning);
            continue;
        }

        Alarm alarm;
        alarm.trigger = trigger;
        bool recognized = false;
        alarm.action = alarmActionFromString(action, &recognized);
        if (!recognized) {
            addWarning(result, QStringLiteral("Unknown alarm action \"%1\" in event \"%2\", using %3.")
                                   .arg(action, event.title, alarmActionToString(alarm.action)));
        }
        alarm.summary = textValue(*valarm, QStringLiteral("SUMMARY"));
        alarm.description = textValue(*valarm, QStringLiteral("DESCRIPTION"));
        alarm.duration = rawValue(*valarm, QStringLiteral("DURATION"));
        alarm.repeat = integerValue(*valarm, QStringLiteral("REPEAT"));
        event.alarms.append(alarm);
    }
}

} // namespace data
} // namespace calendraft
