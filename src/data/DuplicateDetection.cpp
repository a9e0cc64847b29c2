#include "calendraft/data/DuplicateDetection.hpp"

#include <QtGlobal>

namespace calendraft {
namespace data {

namespace {
QString normalizeText(const QString &text)
{
    return text.simplified().toLower();
}

bool withinTolerance(const QDateTime &lhs, const QDateTime &rhs, int toleranceSeconds)
{
    if (!lhs.isValid() || !rhs.isValid()) {
        return lhs.isValid() == rhs.isValid();
    }
    return qAbs(lhs.secsTo(rhs)) <= toleranceSeconds;
}
} // namespace

DuplicateCriteria DuplicateCriteria::fromSettings(const core::CodecSettings &settings)
{
    DuplicateCriteria criteria;
    criteria.toleranceSeconds = settings.duplicateToleranceSeconds;
    criteria.useUid = settings.duplicatesByUid;
    criteria.useTitle = settings.duplicatesByTitle;
    criteria.useLocation = settings.duplicatesByLocation;
    return criteria;
}

bool areDuplicates(const CalendarEvent &lhs, const CalendarEvent &rhs, const DuplicateCriteria &criteria)
{
    if (criteria.useUid && !lhs.uid.isEmpty() && !rhs.uid.isEmpty()) {
        return lhs.uid == rhs.uid;
    }
    if (criteria.useTitle && normalizeText(lhs.title) != normalizeText(rhs.title)) {
        return false;
    }
    if (!withinTolerance(lhs.startDate, rhs.startDate, criteria.toleranceSeconds)
        || !withinTolerance(lhs.endDate, rhs.endDate, criteria.toleranceSeconds)) {
        return false;
    }
    if (criteria.useLocation && normalizeText(lhs.location) != normalizeText(rhs.location)) {
        return false;
    }
    return true;
}

DeduplicationResult deduplicateEvents(std::vector<CalendarEvent> events, const DuplicateCriteria &criteria)
{
    DeduplicationResult result;
    result.unique.reserve(events.size());
    for (CalendarEvent &event : events) {
        bool duplicate = false;
        for (const CalendarEvent &kept : result.unique) {
            if (areDuplicates(event, kept, criteria)) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) {
            result.duplicates.push_back(std::move(event));
        } else {
            result.unique.push_back(std::move(event));
        }
    }
    return result;
}

} // namespace data
} // namespace calendraft
