#include "calendraft/data/InMemoryEventRepository.hpp"

#include "calendraft/core/Logging.hpp"

#include <algorithm>

namespace calendraft {
namespace data {

QString ImportSummary::describe(int total) const
{
    if (skipped == 0) {
        return QStringLiteral("%1 of %2 events imported.").arg(added).arg(total);
    }
    return QStringLiteral("%1 of %2 events imported; %3 skipped as duplicates: %4")
        .arg(added)
        .arg(total)
        .arg(skipped)
        .arg(skippedTitles.join(QStringLiteral(", ")));
}

InMemoryEventRepository::InMemoryEventRepository(DuplicateCriteria criteria)
    : m_criteria(criteria)
{
}

InMemoryEventRepository::~InMemoryEventRepository() = default;

std::vector<CalendarEvent> InMemoryEventRepository::fetchEvents() const
{
    return m_events;
}

std::vector<CalendarEvent> InMemoryEventRepository::fetchEvents(const QDateTime &from, const QDateTime &to) const
{
    std::vector<CalendarEvent> events;
    for (const auto &event : m_events) {
        if (event.endDate < from || event.startDate > to) {
            continue;
        }
        events.push_back(event);
    }
    std::sort(events.begin(), events.end(), [](const CalendarEvent &lhs, const CalendarEvent &rhs) {
        if (lhs.startDate == rhs.startDate) {
            return lhs.endDate < rhs.endDate;
        }
        return lhs.startDate < rhs.startDate;
    });
    return events;
}

std::optional<CalendarEvent> InMemoryEventRepository::findById(const QUuid &id) const
{
    const auto it = std::find_if(m_events.cbegin(), m_events.cend(),
                                 [&id](const CalendarEvent &event) { return event.id == id; });
    if (it == m_events.cend()) {
        return std::nullopt;
    }
    return *it;
}

std::optional<CalendarEvent> InMemoryEventRepository::findByUid(const QString &uid) const
{
    if (uid.isEmpty()) {
        return std::nullopt;
    }
    const auto it = std::find_if(m_events.cbegin(), m_events.cend(),
                                 [&uid](const CalendarEvent &event) { return event.uid == uid; });
    if (it == m_events.cend()) {
        return std::nullopt;
    }
    return *it;
}

bool InMemoryEventRepository::addEvent(CalendarEvent event)
{
    if (event.id.isNull()) {
        event.id = QUuid::createUuid();
    }
    for (const CalendarEvent &stored : m_events) {
        if (areDuplicates(event, stored, m_criteria)) {
            qCDebug(CALENDRAFT_STORE) << "Skipping duplicate event" << event.title;
            return false;
        }
    }
    m_events.push_back(std::move(event));
    return true;
}

bool InMemoryEventRepository::removeEvent(const QUuid &id)
{
    const auto it = std::find_if(m_events.begin(), m_events.end(),
                                 [&id](const CalendarEvent &event) { return event.id == id; });
    if (it == m_events.end()) {
        return false;
    }
    m_events.erase(it);
    return true;
}

ImportSummary InMemoryEventRepository::importEvents(std::vector<CalendarEvent> events)
{
    ImportSummary summary;
    for (CalendarEvent &event : events) {
        const QString title = event.title;
        if (addEvent(std::move(event))) {
            ++summary.added;
        } else {
            ++summary.skipped;
            summary.skippedTitles << title;
        }
    }
    qCInfo(CALENDRAFT_STORE) << summary.describe(static_cast<int>(events.size()));
    return summary;
}

std::size_t InMemoryEventRepository::count() const
{
    return m_events.size();
}

} // namespace data
} // namespace calendraft
