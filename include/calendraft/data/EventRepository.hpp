#pragma once

#include <optional>
#include <vector>

#include "calendraft/data/Event.hpp"

namespace calendraft {
namespace data {

class EventRepository
{
public:
    virtual ~EventRepository() = default;

    virtual std::vector<CalendarEvent> fetchEvents() const = 0;
    virtual std::vector<CalendarEvent> fetchEvents(const QDateTime &from, const QDateTime &to) const = 0;
    virtual std::optional<CalendarEvent> findById(const QUuid &id) const = 0;
    virtual std::optional<CalendarEvent> findByUid(const QString &uid) const = 0;
    // Returns false when the event duplicates a stored one.
    virtual bool addEvent(CalendarEvent event) = 0;
    virtual bool removeEvent(const QUuid &id) = 0;
};

} // namespace data
} // namespace calendraft
