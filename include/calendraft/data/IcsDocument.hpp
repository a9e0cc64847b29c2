#pragma once

#include <QPair>
#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>
#include <vector>

namespace calendraft {
namespace data {

// One unfolded "NAME;PARAM=VALUE:value" line. Names are upper-cased.
struct ContentLine
{
    QString name;
    QVector<QPair<QString, QString>> parameters;
    QString value;

    QString parameter(const QString &parameterName) const;
    bool hasParameter(const QString &parameterName) const;
};

struct Component
{
    QString name;
    std::vector<ContentLine> properties;
    std::vector<Component> children;

    const ContentLine *property(const QString &propertyName) const;
    std::vector<const ContentLine *> allProperties(const QString &propertyName) const;
    std::vector<const Component *> childrenNamed(const QString &componentName) const;
};

// Joins continuation lines; accepts CRLF, LF and CR endings.
QStringList unfoldLines(const QString &text);

std::optional<ContentLine> parseContentLine(const QString &line);

/**
 * Builds the BEGIN/END component tree of a document. Returns nullopt and
 * sets errorMessage when the text cannot be tokenized. Recoverable oddities
 * (unterminated blocks, trailing text) are reported through warnings.
 */
std::optional<Component> parseComponentTree(const QString &text, QString *errorMessage,
                                            QStringList *warnings = nullptr);

// Splits a line into chunks of at most width octets of UTF-8.
QStringList foldLine(const QString &line, int width = 75);

} // namespace data
} // namespace calendraft
