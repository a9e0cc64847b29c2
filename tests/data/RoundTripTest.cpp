#include <QtTest/QtTest>

#include "calendraft/codec/AlarmTrigger.hpp"
#include "calendraft/data/EventGenerator.hpp"
#include "calendraft/data/EventParser.hpp"

using namespace calendraft;
using namespace calendraft::data;

namespace {
const QDateTime Stamp(QDate(2024, 1, 2), QTime(3, 4, 5), Qt::UTC);

CalendarEvent richEvent()
{
    CalendarEvent event;
    event.uid = QStringLiteral("rich-1@example.com");
    event.title = QStringLiteral(" Offsite; day 1, morning");
    event.description = QStringLiteral("Agenda:\n- intro\n- C:\\plans\n");
    event.location = QStringLiteral("Main hall, building 2");
    event.startDate = QDateTime(QDate(2024, 9, 10), QTime(7, 0), Qt::UTC);
    event.endDate = QDateTime(QDate(2024, 9, 10), QTime(11, 45), Qt::UTC);
    event.dtstamp = QDateTime(QDate(2024, 8, 1), QTime(12, 0), Qt::UTC);
    event.lastModified = QDateTime(QDate(2024, 8, 15), QTime(9, 30), Qt::UTC);
    event.recurrenceId = QStringLiteral("20240910T070000Z");
    event.relatedTo = QStringLiteral("series-7@example.com");
    event.status = QStringLiteral("CONFIRMED");
    event.priority = 5;
    event.categories = {QStringLiteral("Team"), QStringLiteral("Travel, onsite")};
    event.url = QStringLiteral("https://example.com/offsite");
    event.classification = QStringLiteral("PUBLIC");
    event.comment = QStringLiteral("Bring laptops; chargers provided");
    event.contact = QStringLiteral("Front desk, +49 30 1234");
    event.resources = {QStringLiteral("Projector"), QStringLiteral("Catering, vegetarian")};
    event.sequence = 4;
    event.transparency = QStringLiteral("OPAQUE");
    event.recurrenceRule = QStringLiteral("FREQ=YEARLY;BYMONTH=9");
    event.recurrenceDates = {QDateTime(QDate(2024, 12, 3), QTime(7, 0), Qt::UTC),
                             QDateTime(QDate(2025, 3, 4), QTime(7, 0), Qt::UTC)};
    event.exceptionDates = {QDateTime(QDate(2025, 9, 10), QTime(7, 0), Qt::UTC)};
    event.geo = GeoPosition{52.520008, 13.404954};
    event.color = QStringLiteral("teal");
    event.organizerName = QStringLiteral("Doe, Jane");
    event.organizerEmail = QStringLiteral("jane@example.com");

    Attendee attendee;
    attendee.name = QStringLiteral("Alice");
    attendee.email = QStringLiteral("alice@example.com");
    attendee.role = AttendeeRole::OptionalParticipant;
    attendee.status = ParticipationStatus::Tentative;
    attendee.rsvp = true;
    event.attendees = {attendee};

    Alarm alarm;
    alarm.trigger = codec::formatTrigger(codec::AlarmWhen::Before, 1, codec::DurationUnit::Days);
    alarm.summary = QStringLiteral("Offsite tomorrow");
    alarm.description = QStringLiteral("Pack, and print tickets");
    alarm.duration = QStringLiteral("PT15M");
    alarm.repeat = 2;
    event.alarms = {alarm};
    return event;
}
} // namespace

class RoundTripTest : public QObject
{
    Q_OBJECT

private slots:
    void preservesEveryField();
    void preservesOrderAndCount();
    void survivesFolding();
};

void RoundTripTest::preservesEveryField()
{
    const CalendarEvent original = richEvent();
    const QString document = EventGenerator().generate(QStringLiteral("Offsites"), {original}, Stamp);
    const ParseResult result = EventParser().parse(document);

    QVERIFY2(result.errors.isEmpty(), qPrintable(result.errors.join('\n')));
    QVERIFY2(result.warnings.isEmpty(), qPrintable(result.warnings.join('\n')));
    QCOMPARE(result.calendarName, QStringLiteral("Offsites"));
    QCOMPARE(result.events.size(), std::size_t(1));

    const CalendarEvent &parsed = result.events.front();
    QVERIFY(parsed.id != original.id);
    QCOMPARE(parsed.uid, original.uid);
    QCOMPARE(parsed.title, original.title);
    QCOMPARE(parsed.description, original.description);
    QCOMPARE(parsed.location, original.location);
    QCOMPARE(parsed.startDate, original.startDate);
    QCOMPARE(parsed.endDate, original.endDate);
    QCOMPARE(parsed.dtstamp, original.dtstamp);
    QCOMPARE(parsed.created, Stamp);
    QCOMPARE(parsed.lastModified, original.lastModified);
    QCOMPARE(parsed.recurrenceId, original.recurrenceId);
    QCOMPARE(parsed.relatedTo, original.relatedTo);
    QCOMPARE(parsed.status, original.status);
    QCOMPARE(parsed.priority, original.priority);
    QCOMPARE(parsed.categories, original.categories);
    QCOMPARE(parsed.url, original.url);
    QCOMPARE(parsed.classification, original.classification);
    QCOMPARE(parsed.comment, original.comment);
    QCOMPARE(parsed.contact, original.contact);
    QCOMPARE(parsed.resources, original.resources);
    QCOMPARE(parsed.sequence, original.sequence);
    QCOMPARE(parsed.transparency, original.transparency);
    QCOMPARE(parsed.recurrenceRule, original.recurrenceRule);
    QCOMPARE(parsed.recurrenceDates, original.recurrenceDates);
    QCOMPARE(parsed.exceptionDates, original.exceptionDates);
    QCOMPARE(parsed.color, original.color);

    QVERIFY(parsed.geo.has_value());
    QCOMPARE(parsed.geo->latitude, original.geo->latitude);
    QCOMPARE(parsed.geo->longitude, original.geo->longitude);

    QCOMPARE(parsed.organizerName, original.organizerName);
    QCOMPARE(parsed.organizerEmail, original.organizerEmail);
    QCOMPARE(parsed.attendees.size(), 1);
    QCOMPARE(parsed.attendees.front().name, QStringLiteral("Alice"));
    QCOMPARE(parsed.attendees.front().email, QStringLiteral("alice@example.com"));
    QCOMPARE(parsed.attendees.front().role, original.attendees.front().role);
    QCOMPARE(parsed.attendees.front().status, original.attendees.front().status);
    QVERIFY(parsed.attendees.front().rsvp);

    QCOMPARE(parsed.alarms.size(), 1);
    QCOMPARE(parsed.alarms.front().trigger, QStringLiteral("-P1D"));
    QCOMPARE(parsed.alarms.front().action, AlarmAction::Display);
    QCOMPARE(parsed.alarms.front().summary, original.alarms.front().summary);
    QCOMPARE(parsed.alarms.front().description, original.alarms.front().description);
    QCOMPARE(parsed.alarms.front().duration, original.alarms.front().duration);
    QCOMPARE(parsed.alarms.front().repeat, original.alarms.front().repeat);
}

void RoundTripTest::preservesOrderAndCount()
{
    std::vector<CalendarEvent> events;
    for (int i = 0; i < 5; ++i) {
        CalendarEvent event;
        event.title = QStringLiteral("Event %1").arg(i);
        event.startDate = QDateTime(QDate(2024, 5, 5 - i), QTime(10, 0), Qt::UTC);
        event.endDate = event.startDate.addSecs(1800);
        events.push_back(event);
    }

    const ParseResult result = EventParser().parse(EventGenerator().generate(QString(), events, Stamp));
    QVERIFY(result.errors.isEmpty());
    QCOMPARE(result.events.size(), events.size());
    for (std::size_t i = 0; i < events.size(); ++i) {
        QCOMPARE(result.events.at(i).title, events.at(i).title);
        QCOMPARE(result.events.at(i).startDate, events.at(i).startDate);
        QCOMPARE(result.events.at(i).uid,
                 QStringLiteral("%1@calendraft").arg(events.at(i).id.toString(QUuid::WithoutBraces)));
    }
}

void RoundTripTest::survivesFolding()
{
    CalendarEvent event = richEvent();
    event.description = QString::fromUtf8("\xE2\x82\xAC").repeated(60) + QStringLiteral(" long, folded; text");

    core::CodecSettings settings;
    settings.foldLines = true;
    settings.foldWidth = 40;
    const ParseResult result = EventParser().parse(EventGenerator(settings).generate(QString(), {event}, Stamp));

    QCOMPARE(result.events.size(), std::size_t(1));
    QCOMPARE(result.events.front().description, event.description);
    QCOMPARE(result.events.front().title, event.title);
}

QTEST_GUILESS_MAIN(RoundTripTest)
#include "RoundTripTest.moc"
