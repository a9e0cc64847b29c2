#pragma once

#include <QString>
#include <QStringList>

namespace calendraft {
namespace codec {

// Escapes backslash, semicolon, comma and newline; drops carriage returns.
QString escapeText(const QString &text);
QString unescapeText(const QString &text);

// Splits a TEXT list on commas that are not escaped, then unescapes and trims each item.
QStringList splitTextList(const QString &value);

// Parameter values are quoted when they contain ':', ';' or ','.
QString formatParameterValue(const QString &value);

} // namespace codec
} // namespace calendraft
