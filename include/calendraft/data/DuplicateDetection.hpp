#pragma once

#include <vector>

#include "calendraft/core/CodecSettings.hpp"
#include "calendraft/data/Event.hpp"

namespace calendraft {
namespace data {

struct DuplicateCriteria
{
    int toleranceSeconds = 60;
    bool useUid = true;
    bool useTitle = true;
    bool useLocation = false;

    static DuplicateCriteria fromSettings(const core::CodecSettings &settings);
};

/**
 * Two events with a UID each are duplicates exactly when the UIDs match.
 * Otherwise they must share a normalised title, start and end within the
 * tolerance and, when enabled, the same location.
 */
bool areDuplicates(const CalendarEvent &lhs, const CalendarEvent &rhs, const DuplicateCriteria &criteria);

struct DeduplicationResult
{
    std::vector<CalendarEvent> unique;
    std::vector<CalendarEvent> duplicates;
};

// Keeps the first occurrence of every duplicate group, in input order.
DeduplicationResult deduplicateEvents(std::vector<CalendarEvent> events, const DuplicateCriteria &criteria);

} // namespace data
} // namespace calendraft
