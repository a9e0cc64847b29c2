#pragma once

#include <QString>
#include <QStringList>
#include <cstddef>

#include "calendraft/data/DuplicateDetection.hpp"
#include "calendraft/data/EventRepository.hpp"

namespace calendraft {
namespace data {

struct ImportSummary
{
    int added = 0;
    int skipped = 0;
    QStringList skippedTitles;

    QString describe(int total) const;
};

// Keeps events in insertion order and refuses duplicates.
class InMemoryEventRepository : public EventRepository
{
public:
    explicit InMemoryEventRepository(DuplicateCriteria criteria = {});
    ~InMemoryEventRepository() override;

    std::vector<CalendarEvent> fetchEvents() const override;
    std::vector<CalendarEvent> fetchEvents(const QDateTime &from, const QDateTime &to) const override;
    std::optional<CalendarEvent> findById(const QUuid &id) const override;
    std::optional<CalendarEvent> findByUid(const QString &uid) const override;
    bool addEvent(CalendarEvent event) override;
    bool removeEvent(const QUuid &id) override;

    ImportSummary importEvents(std::vector<CalendarEvent> events);
    std::size_t count() const;

private:
    DuplicateCriteria m_criteria;
    std::vector<CalendarEvent> m_events;
};

} // namespace data
} // namespace calendraft
