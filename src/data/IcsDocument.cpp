#include "calendraft/data/IcsDocument.hpp"

namespace calendraft {
namespace data {

namespace {
QString stripQuotes(const QString &value)
{
    if (value.size() >= 2 && value.startsWith('"') && value.endsWith('"')) {
        return value.mid(1, value.size() - 2);
    }
    return value;
}

int utf8Length(QChar ch)
{
    const ushort code = ch.unicode();
    if (code < 0x80) {
        return 1;
    }
    if (code < 0x800) {
        return 2;
    }
    if (ch.isSurrogate()) {
        return 2; // each half of a four byte sequence
    }
    return 3;
}
} // namespace

QString ContentLine::parameter(const QString &parameterName) const
{
    for (const auto &param : parameters) {
        if (param.first.compare(parameterName, Qt::CaseInsensitive) == 0) {
            return param.second;
        }
    }
    return {};
}

bool ContentLine::hasParameter(const QString &parameterName) const
{
    for (const auto &param : parameters) {
        if (param.first.compare(parameterName, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    return false;
}

const ContentLine *Component::property(const QString &propertyName) const
{
    for (const ContentLine &line : properties) {
        if (line.name == propertyName) {
            return &line;
        }
    }
    return nullptr;
}

std::vector<const ContentLine *> Component::allProperties(const QString &propertyName) const
{
    std::vector<const ContentLine *> result;
    for (const ContentLine &line : properties) {
        if (line.name == propertyName) {
            result.push_back(&line);
        }
    }
    return result;
}

std::vector<const Component *> Component::childrenNamed(const QString &componentName) const
{
    std::vector<const Component *> result;
    for (const Component &child : children) {
        if (child.name == componentName) {
            result.push_back(&child);
        }
    }
    return result;
}

QStringList unfoldLines(const QString &text)
{
    QString normalized = text;
    if (normalized.startsWith(QChar(0xFEFF))) {
        normalized.remove(0, 1);
    }
    normalized.replace(QLatin1String("\r\n"), QLatin1String("\n"));
    normalized.replace('\r', '\n');

    QStringList lines;
    QString accumulator;
    bool hasAccumulator = false;
    const QStringList rawLines = normalized.split('\n');
    for (const QString &line : rawLines) {
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
            continue;
        }
        if (hasAccumulator && !accumulator.isEmpty()) {
            lines << accumulator;
        }
        accumulator = line;
        hasAccumulator = true;
    }
    if (hasAccumulator && !accumulator.isEmpty()) {
        lines << accumulator;
    }
    return lines;
}

std::optional<ContentLine> parseContentLine(const QString &line)
{
    ContentLine result;

    // Property name runs up to the first ';' or ':'.
    int pos = 0;
    while (pos < line.size() && line.at(pos) != ';' && line.at(pos) != ':') {
        ++pos;
    }
    if (pos == 0 || pos == line.size()) {
        return std::nullopt;
    }
    result.name = line.left(pos).trimmed().toUpper();

    while (pos < line.size() && line.at(pos) == ';') {
        ++pos;
        const int start = pos;
        bool quoted = false;
        while (pos < line.size()) {
            const QChar ch = line.at(pos);
            if (ch == '"') {
                quoted = !quoted;
            } else if (!quoted && (ch == ';' || ch == ':')) {
                break;
            }
            ++pos;
        }
        if (pos == line.size()) {
            return std::nullopt;
        }
        const QString parameter = line.mid(start, pos - start);
        const int equals = parameter.indexOf('=');
        if (equals > 0) {
            result.parameters.append(qMakePair(parameter.left(equals).trimmed().toUpper(),
                                               stripQuotes(parameter.mid(equals + 1))));
        } else if (!parameter.trimmed().isEmpty()) {
            result.parameters.append(qMakePair(parameter.trimmed().toUpper(), QString()));
        }
    }

    result.value = line.mid(pos + 1);
    return result;
}

std::optional<Component> parseComponentTree(const QString &text, QString *errorMessage,
                                            QStringList *warnings)
{
    auto fail = [errorMessage](const QString &message) -> std::optional<Component> {
        if (errorMessage) {
            *errorMessage = message;
        }
        return std::nullopt;
    };
    auto warn = [warnings](const QString &message) {
        if (warnings) {
            warnings->append(message);
        }
    };

    const QStringList lines = unfoldLines(text);
    if (lines.isEmpty()) {
        return fail(QStringLiteral("document is empty"));
    }

    std::vector<Component> stack;
    std::optional<Component> root;
    int lineNumber = 0;
    for (const QString &rawLine : lines) {
        ++lineNumber;
        const QString line = rawLine.trimmed().isEmpty() ? QString() : rawLine;
        if (line.isEmpty()) {
            continue;
        }
        if (root) {
            warn(QStringLiteral("Ignoring content after END:%1 on line %2.").arg(root->name).arg(lineNumber));
            break;
        }

        const auto contentLine = parseContentLine(line);
        if (!contentLine) {
            return fail(QStringLiteral("invalid line %1 (no \":\" separator): %2").arg(lineNumber).arg(line.left(40)));
        }

        if (contentLine->name == QLatin1String("BEGIN")) {
            Component component;
            component.name = contentLine->value.trimmed().toUpper();
            if (component.name.isEmpty()) {
                return fail(QStringLiteral("BEGIN without component name on line %1").arg(lineNumber));
            }
            if (stack.empty() && component.name != QLatin1String("VCALENDAR")) {
                return fail(QStringLiteral("expected BEGIN:VCALENDAR, found BEGIN:%1").arg(component.name));
            }
            stack.push_back(std::move(component));
            continue;
        }

        if (stack.empty()) {
            return fail(QStringLiteral("expected BEGIN:VCALENDAR on line %1").arg(lineNumber));
        }

        if (contentLine->name == QLatin1String("END")) {
            const QString name = contentLine->value.trimmed().toUpper();
            if (name != stack.back().name) {
                return fail(QStringLiteral("unexpected END:%1 on line %2 inside %3")
                                .arg(name)
                                .arg(lineNumber)
                                .arg(stack.back().name));
            }
            Component finished = std::move(stack.back());
            stack.pop_back();
            if (stack.empty()) {
                root = std::move(finished);
            } else {
                stack.back().children.push_back(std::move(finished));
            }
            continue;
        }

        stack.back().properties.push_back(*contentLine);
    }

    // Close blocks left open by a truncated download.
    while (!stack.empty()) {
        warn(QStringLiteral("Missing END:%1, closing it at end of file.").arg(stack.back().name));
        Component finished = std::move(stack.back());
        stack.pop_back();
        if (stack.empty()) {
            root = std::move(finished);
        } else {
            stack.back().children.push_back(std::move(finished));
        }
    }

    if (!root) {
        return fail(QStringLiteral("no VCALENDAR component found"));
    }
    return root;
}

QStringList foldLine(const QString &line, int width)
{
    QStringList chunks;
    QString current;
    int currentOctets = 0;
    for (int i = 0; i < line.size(); ++i) {
        const QChar ch = line.at(i);
        int octets = utf8Length(ch);
        // Never split a surrogate pair.
        const bool pair = ch.isHighSurrogate() && i + 1 < line.size();
        if (pair) {
            octets += utf8Length(line.at(i + 1));
        }
        // Continuation lines carry a leading space.
        const int limit = chunks.isEmpty() ? width : width - 1;
        if (currentOctets + octets > limit && !current.isEmpty()) {
            chunks << current;
            current.clear();
            currentOctets = 0;
        }
        current.append(ch);
        if (pair) {
            current.append(line.at(++i));
        }
        currentOctets += octets;
    }
    if (!current.isEmpty() || chunks.isEmpty()) {
        chunks << current;
    }
    for (int i = 1; i < chunks.size(); ++i) {
        chunks[i].prepend(' ');
    }
    return chunks;
}

} // namespace data
} // namespace calendraft
