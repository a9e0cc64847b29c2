#include "calendraft/data/Event.hpp"

#include <cstddef>
#include <initializer_list>
#include <utility>

namespace calendraft {
namespace data {

namespace {
template<typename Enum, std::size_t N>
Enum lookup(const QString &value, const std::pair<const char *, Enum> (&table)[N], Enum fallback, bool *recognized)
{
    const QString normalized = value.trimmed().toUpper();
    for (const auto &entry : table) {
        if (normalized == QLatin1String(entry.first)) {
            if (recognized) {
                *recognized = true;
            }
            return entry.second;
        }
    }
    if (recognized) {
        *recognized = false;
    }
    return fallback;
}

template<typename Enum, std::size_t N>
QString name(Enum value, const std::pair<const char *, Enum> (&table)[N])
{
    for (const auto &entry : table) {
        if (entry.second == value) {
            return QString::fromLatin1(entry.first);
        }
    }
    return {};
}

const std::pair<const char *, AttendeeRole> RoleNames[] = {
    {"CHAIR", AttendeeRole::Chair},
    {"REQ-PARTICIPANT", AttendeeRole::RequiredParticipant},
    {"OPT-PARTICIPANT", AttendeeRole::OptionalParticipant},
    {"NON-PARTICIPANT", AttendeeRole::NonParticipant},
};

const std::pair<const char *, ParticipationStatus> StatusNames[] = {
    {"NEEDS-ACTION", ParticipationStatus::NeedsAction},
    {"ACCEPTED", ParticipationStatus::Accepted},
    {"DECLINED", ParticipationStatus::Declined},
    {"TENTATIVE", ParticipationStatus::Tentative},
    {"DELEGATED", ParticipationStatus::Delegated},
};

const std::pair<const char *, AlarmAction> ActionNames[] = {
    {"DISPLAY", AlarmAction::Display},
    {"EMAIL", AlarmAction::Email},
    {"AUDIO", AlarmAction::Audio},
};

bool isOneOf(const QString &value, std::initializer_list<const char *> allowed)
{
    for (const char *candidate : allowed) {
        if (value == QLatin1String(candidate)) {
            return true;
        }
    }
    return false;
}
} // namespace

QString attendeeRoleToString(AttendeeRole role)
{
    return name(role, RoleNames);
}

AttendeeRole attendeeRoleFromString(const QString &value, bool *recognized)
{
    return lookup(value, RoleNames, AttendeeRole::RequiredParticipant, recognized);
}

QString participationStatusToString(ParticipationStatus status)
{
    return name(status, StatusNames);
}

ParticipationStatus participationStatusFromString(const QString &value, bool *recognized)
{
    return lookup(value, StatusNames, ParticipationStatus::NeedsAction, recognized);
}

QString alarmActionToString(AlarmAction action)
{
    return name(action, ActionNames);
}

AlarmAction alarmActionFromString(const QString &value, bool *recognized)
{
    return lookup(value, ActionNames, AlarmAction::Display, recognized);
}

bool isValidEventStatus(const QString &value)
{
    return isOneOf(value.toUpper(), {"CONFIRMED", "TENTATIVE", "CANCELLED"});
}

bool isValidEventClass(const QString &value)
{
    return isOneOf(value.toUpper(), {"PUBLIC", "PRIVATE", "CONFIDENTIAL"});
}

bool isValidEventTransparency(const QString &value)
{
    return isOneOf(value.toUpper(), {"OPAQUE", "TRANSPARENT"});
}

bool isValidPriority(int value)
{
    return value >= 0 && value <= 9;
}

} // namespace data
} // namespace calendraft
