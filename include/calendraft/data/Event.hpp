#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QVector>
#include <optional>

namespace calendraft {
namespace data {

enum class AttendeeRole
{
    Chair,
    RequiredParticipant,
    OptionalParticipant,
    NonParticipant,
};

enum class ParticipationStatus
{
    NeedsAction,
    Accepted,
    Declined,
    Tentative,
    Delegated,
};

enum class AlarmAction
{
    Display,
    Email,
    Audio,
};

struct Attendee
{
    QString name;
    QString email;
    std::optional<AttendeeRole> role;
    std::optional<ParticipationStatus> status;
    bool rsvp = false;
};

struct Alarm
{
    QString trigger; // relative duration or absolute YYYYMMDDTHHMMSSZ
    AlarmAction action = AlarmAction::Display;
    QString summary;
    QString description;
    QString duration;
    std::optional<int> repeat;
};

struct GeoPosition
{
    double latitude = 0.0;
    double longitude = 0.0;
};

struct CalendarEvent
{
    QUuid id = QUuid::createUuid();

    QString uid;
    QDateTime dtstamp;
    QDateTime created;
    QDateTime lastModified;
    QString recurrenceId;
    QString relatedTo;

    QDateTime startDate;
    QDateTime endDate;

    QString title;
    QString description;
    QString location;
    QString status;
    std::optional<int> priority;
    QStringList categories;
    QString url;
    QString classification;
    QString comment;
    QString contact;
    QStringList resources;
    std::optional<int> sequence;
    QString transparency;

    QString recurrenceRule; // RRULE value, kept verbatim
    QVector<QDateTime> recurrenceDates;
    QVector<QDateTime> exceptionDates;

    std::optional<GeoPosition> geo;
    QString color;

    QString organizerName;
    QString organizerEmail;
    QVector<Attendee> attendees;
    QVector<Alarm> alarms;
};

// Unrecognised values fall back to RequiredParticipant, NeedsAction and Display.
QString attendeeRoleToString(AttendeeRole role);
AttendeeRole attendeeRoleFromString(const QString &value, bool *recognized = nullptr);
QString participationStatusToString(ParticipationStatus status);
ParticipationStatus participationStatusFromString(const QString &value, bool *recognized = nullptr);
QString alarmActionToString(AlarmAction action);
AlarmAction alarmActionFromString(const QString &value, bool *recognized = nullptr);

bool isValidEventStatus(const QString &value);
bool isValidEventClass(const QString &value);
bool isValidEventTransparency(const QString &value);
bool isValidPriority(int value);

} // namespace data
} // namespace calendraft
