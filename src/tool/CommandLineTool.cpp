#include "calendraft/tool/CommandLineTool.hpp"

#include "calendraft/codec/AlarmTrigger.hpp"
#include "calendraft/codec/DateCodec.hpp"
#include "calendraft/codec/RecurrenceRule.hpp"
#include "calendraft/core/Logging.hpp"
#include "calendraft/data/EventGenerator.hpp"
#include "calendraft/data/EventParser.hpp"
#include "calendraft/data/InMemoryEventRepository.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

namespace calendraft {
namespace tool {

namespace {
void printDiagnostics(const data::ParseResult &result, QTextStream &err)
{
    for (const QString &error : result.errors) {
        err << "error: " << error << '\n';
    }
    for (const QString &warning : result.warnings) {
        err << "warning: " << warning << '\n';
    }
}

QString describeAlarm(const data::Alarm &alarm, const QDateTime &eventStart)
{
    const auto trigger = codec::parseTrigger(alarm.trigger);
    if (!trigger) {
        return alarm.trigger;
    }
    if (trigger->when == codec::AlarmWhen::At) {
        const auto fireTime = codec::triggerFireTime(alarm.trigger, eventStart);
        return QStringLiteral("at %1").arg(fireTime ? codec::formatInstant(*fireTime) : alarm.trigger);
    }
    return QStringLiteral("%1 %2 %3")
        .arg(trigger->value)
        .arg(codec::durationUnitName(trigger->unit),
             trigger->when == codec::AlarmWhen::Before ? QStringLiteral("before") : QStringLiteral("after"));
}

QString defaultCalendarName(const data::ParseResult &result, const QString &path)
{
    if (!result.calendarName.isEmpty()) {
        return result.calendarName;
    }
    return QFileInfo(path).completeBaseName();
}
} // namespace

CommandLineTool::CommandLineTool(core::CodecSettings settings)
    : m_settings(std::move(settings))
{
}

int CommandLineTool::run(const QStringList &arguments, QTextStream &out, QTextStream &err)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Parse, convert and merge iCalendar files."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption outputOption({QStringLiteral("o"), QStringLiteral("output")},
                                          QStringLiteral("Write the generated document to <file>."),
                                          QStringLiteral("file"));
    const QCommandLineOption nameOption({QStringLiteral("n"), QStringLiteral("name")},
                                        QStringLiteral("Calendar name of the generated document."),
                                        QStringLiteral("name"));
    const QCommandLineOption foldOption(QStringLiteral("fold"),
                                        QStringLiteral("Fold generated lines at 75 octets."));
    const QCommandLineOption prodIdOption(QStringLiteral("prodid"),
                                          QStringLiteral("Product identifier of the generated document."),
                                          QStringLiteral("id"));
    parser.addOption(outputOption);
    parser.addOption(nameOption);
    parser.addOption(foldOption);
    parser.addOption(prodIdOption);
    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("parse, convert or merge."));
    parser.addPositionalArgument(QStringLiteral("files"), QStringLiteral("iCalendar files to read."),
                                 QStringLiteral("<file>..."));

    if (!parser.parse(arguments)) {
        err << parser.errorText() << '\n';
        return 1;
    }
    if (parser.isSet(helpOption)) {
        out << parser.helpText();
        return 0;
    }

    if (parser.isSet(foldOption)) {
        m_settings.foldLines = true;
    }
    if (parser.isSet(prodIdOption)) {
        m_settings.productId = parser.value(prodIdOption);
    }

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        err << "Missing command; expected parse, convert or merge.\n";
        return 1;
    }
    const QString command = positional.takeFirst();
    if (positional.isEmpty()) {
        err << "Missing input file.\n";
        return 1;
    }

    const QString output = parser.value(outputOption);
    const QString name = parser.value(nameOption);
    if (command == QLatin1String("parse")) {
        return runParse(positional, out, err);
    }
    if (command == QLatin1String("convert")) {
        if (positional.size() != 1) {
            err << "convert expects exactly one input file.\n";
            return 1;
        }
        return runConvert(positional.first(), output, name, out, err);
    }
    if (command == QLatin1String("merge")) {
        return runMerge(positional, output, name, out, err);
    }

    err << "Unknown command: " << command << '\n';
    return 1;
}

int CommandLineTool::runParse(const QStringList &files, QTextStream &out, QTextStream &err) const
{
    const data::EventParser eventParser;
    int exitCode = 0;
    for (const QString &path : files) {
        QString content;
        if (!readDocument(path, &content, err)) {
            exitCode = 1;
            continue;
        }
        const data::ParseResult result = eventParser.parse(content);
        out << path << ": " << result.events.size() << " events, " << result.errors.size() << " errors, "
            << result.warnings.size() << " warnings\n";
        if (!result.calendarName.isEmpty()) {
            out << "  calendar: " << result.calendarName << '\n';
        }
        for (const data::CalendarEvent &event : result.events) {
            out << "  " << codec::formatInstant(event.startDate) << "  " << event.title << '\n';
            if (const auto rule = codec::RecurrenceRule::parse(event.recurrenceRule)) {
                out << "    repeats: " << rule->toString() << '\n';
            }
            for (const data::Alarm &alarm : event.alarms) {
                out << "    alarm: " << describeAlarm(alarm, event.startDate) << '\n';
            }
        }
        printDiagnostics(result, err);
        if (result.events.empty()) {
            exitCode = 1;
        }
    }
    return exitCode;
}

int CommandLineTool::runConvert(const QString &file, const QString &output, const QString &name, QTextStream &out,
                                QTextStream &err) const
{
    QString content;
    if (!readDocument(file, &content, err)) {
        return 1;
    }
    const data::ParseResult result = data::EventParser().parse(content);
    printDiagnostics(result, err);
    if (result.events.empty()) {
        return 1;
    }

    const data::EventGenerator generator(m_settings);
    const QString calendarName = name.isEmpty() ? defaultCalendarName(result, file) : name;
    return writeDocument(output, generator.generate(calendarName, result.events), out, err) ? 0 : 1;
}

int CommandLineTool::runMerge(const QStringList &files, const QString &output, const QString &name, QTextStream &out,
                              QTextStream &err) const
{
    const data::EventParser eventParser;
    data::InMemoryEventRepository repository(data::DuplicateCriteria::fromSettings(m_settings));
    int total = 0;
    int skipped = 0;
    for (const QString &path : files) {
        QString content;
        if (!readDocument(path, &content, err)) {
            return 1;
        }
        data::ParseResult result = eventParser.parse(content);
        printDiagnostics(result, err);
        total += static_cast<int>(result.events.size());
        const data::ImportSummary summary = repository.importEvents(std::move(result.events));
        skipped += summary.skipped;
    }

    if (repository.count() == 0) {
        err << "No events found in the input files.\n";
        return 1;
    }
    qCInfo(CALENDRAFT_TOOL) << "Merged" << repository.count() << "of" << total << "events," << skipped
                            << "duplicates skipped";

    const data::EventGenerator generator(m_settings);
    const QString calendarName = name.isEmpty() ? QStringLiteral("Merged calendar") : name;
    return writeDocument(output, generator.generate(calendarName, repository.fetchEvents()), out, err) ? 0 : 1;
}

bool CommandLineTool::readDocument(const QString &path, QString *content, QTextStream &err)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        err << "Cannot read " << path << ": " << file.errorString() << '\n';
        return false;
    }
    *content = QString::fromUtf8(file.readAll());
    return true;
}

bool CommandLineTool::writeDocument(const QString &path, const QString &content, QTextStream &out,
                                    QTextStream &err)
{
    if (path.isEmpty()) {
        out << content << "\r\n";
        return true;
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        err << "Cannot write " << path << ": " << file.errorString() << '\n';
        return false;
    }
    file.write(content.toUtf8());
    if (!file.commit()) {
        err << "Cannot write " << path << ": " << file.errorString() << '\n';
        return false;
    }
    qCDebug(CALENDRAFT_TOOL) << "Wrote" << path;
    return true;
}

} // namespace tool
} // namespace calendraft
