#include <QtTest/QtTest>

#include "calendraft/codec/RecurrenceRule.hpp"

using namespace calendraft::codec;

class RecurrenceRuleTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesFullRule();
    void stripsPropertyPrefix();
    void requiresKnownFrequency();
    void ignoresInvalidParts();
    void formatsMinimalRule();
    void formatsUntilAsEndOfDay();
};

void RecurrenceRuleTest::parsesFullRule()
{
    const auto rule = RecurrenceRule::parse(
        QStringLiteral("FREQ=MONTHLY;INTERVAL=2;COUNT=10;BYDAY=-1FR,mo;BYMONTH=1,6;BYMONTHDAY=15;BYSETPOS=-1"));
    QVERIFY(rule.has_value());
    QCOMPARE(rule->frequency, RecurrenceFrequency::Monthly);
    QCOMPARE(rule->interval, 2);
    QCOMPARE(rule->count, std::optional<int>(10));
    QCOMPARE(rule->byDay, (QStringList{QStringLiteral("-1FR"), QStringLiteral("MO")}));
    QCOMPARE(rule->byMonth, (QList<int>{1, 6}));
    QCOMPARE(rule->byMonthDay, QList<int>{15});
    QCOMPARE(rule->bySetPos, std::optional<int>(-1));
    QVERIFY(!rule->until.isValid());
}

void RecurrenceRuleTest::stripsPropertyPrefix()
{
    const auto rule = RecurrenceRule::parse(QStringLiteral("RRULE:FREQ=WEEKLY;UNTIL=20241231T000000Z"));
    QVERIFY(rule.has_value());
    QCOMPARE(rule->frequency, RecurrenceFrequency::Weekly);
    QCOMPARE(rule->until, QDateTime(QDate(2024, 12, 31), QTime(0, 0), Qt::UTC));
}

void RecurrenceRuleTest::requiresKnownFrequency()
{
    QVERIFY(!RecurrenceRule::parse(QString()).has_value());
    QVERIFY(!RecurrenceRule::parse(QStringLiteral("COUNT=3")).has_value());
    QVERIFY(!RecurrenceRule::parse(QStringLiteral("FREQ=HOURLY")).has_value());
    QCOMPARE(frequencyFromString(QStringLiteral(" yearly ")), std::optional<RecurrenceFrequency>(RecurrenceFrequency::Yearly));
}

void RecurrenceRuleTest::ignoresInvalidParts()
{
    const auto rule = RecurrenceRule::parse(QStringLiteral("FREQ=DAILY;INTERVAL=0;COUNT=x;BYDAY=XX,TU;JUNK"));
    QVERIFY(rule.has_value());
    QCOMPARE(rule->interval, 1);
    QVERIFY(!rule->count.has_value());
    QCOMPARE(rule->byDay, QStringList{QStringLiteral("TU")});
}

void RecurrenceRuleTest::formatsMinimalRule()
{
    RecurrenceRule rule;
    rule.frequency = RecurrenceFrequency::Weekly;
    QCOMPARE(rule.toString(), QStringLiteral("FREQ=WEEKLY"));

    rule.interval = 2;
    rule.byDay = {QStringLiteral("MO"), QStringLiteral("WE")};
    rule.count = 4;
    QCOMPARE(rule.toString(), QStringLiteral("FREQ=WEEKLY;INTERVAL=2;COUNT=4;BYDAY=MO,WE"));
}

void RecurrenceRuleTest::formatsUntilAsEndOfDay()
{
    RecurrenceRule rule;
    rule.until = QDateTime(QDate(2025, 3, 1), QTime(9, 30), Qt::UTC);
    QCOMPARE(rule.toString(), QStringLiteral("FREQ=DAILY;UNTIL=20250301T235959Z"));
}

QTEST_GUILESS_MAIN(RecurrenceRuleTest)
#include "RecurrenceRuleTest.moc"
