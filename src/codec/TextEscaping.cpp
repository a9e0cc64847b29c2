#include "calendraft/codec/TextEscaping.hpp"

namespace calendraft {
namespace codec {

QString escapeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', QLatin1String("\\\\"));
    encoded.replace(';', QLatin1String("\\;"));
    encoded.replace(',', QLatin1String("\\,"));
    encoded.replace('\n', QLatin1String("\\n"));
    encoded.remove('\r');
    return encoded;
}

QString unescapeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch != '\\' || i + 1 == text.size()) {
            decoded.append(ch);
            continue;
        }
        const QChar next = text.at(++i);
        if (next == 'n' || next == 'N') {
            decoded.append('\n');
        } else if (next == '\\' || next == ';' || next == ',') {
            decoded.append(next);
        } else {
            // Unknown escape, keep it as written.
            decoded.append(ch);
            decoded.append(next);
        }
    }
    return decoded;
}

QStringList splitTextList(const QString &value)
{
    QStringList items;
    QString current;
    for (int i = 0; i < value.size(); ++i) {
        const QChar ch = value.at(i);
        if (ch == '\\' && i + 1 < value.size()) {
            current.append(ch);
            current.append(value.at(++i));
            continue;
        }
        if (ch == ',') {
            items << current;
            current.clear();
            continue;
        }
        current.append(ch);
    }
    items << current;

    QStringList cleaned;
    cleaned.reserve(items.size());
    for (const QString &item : qAsConst(items)) {
        const QString text = unescapeText(item).trimmed();
        if (!text.isEmpty()) {
            cleaned << text;
        }
    }
    return cleaned;
}

QString formatParameterValue(const QString &value)
{
    QString clean = value;
    clean.remove('"');
    clean.remove('\r');
    clean.replace('\n', ' ');
    if (clean.contains(':') || clean.contains(';') || clean.contains(',')) {
        return QLatin1Char('"') + clean + QLatin1Char('"');
    }
    return clean;
}

} // namespace codec
} // namespace calendraft
