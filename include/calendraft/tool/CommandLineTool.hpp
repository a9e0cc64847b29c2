#pragma once

#include <QString>
#include <QStringList>

#include "calendraft/core/CodecSettings.hpp"

class QTextStream;

namespace calendraft {
namespace tool {

/**
 * Implements the calendraft-ics commands:
 *   parse <file>...                 summary and diagnostics per document
 *   convert <file> [-o out]         re-generate one document
 *   merge <file>... [-o out]        combine documents, dropping duplicates
 * Returns the process exit code.
 */
class CommandLineTool
{
public:
    explicit CommandLineTool(core::CodecSettings settings = {});

    int run(const QStringList &arguments, QTextStream &out, QTextStream &err);

private:
    int runParse(const QStringList &files, QTextStream &out, QTextStream &err) const;
    int runConvert(const QString &file, const QString &output, const QString &name, QTextStream &out,
                   QTextStream &err) const;
    int runMerge(const QStringList &files, const QString &output, const QString &name, QTextStream &out,
                 QTextStream &err) const;

    static bool readDocument(const QString &path, QString *content, QTextStream &err);
    static bool writeDocument(const QString &path, const QString &content, QTextStream &out, QTextStream &err);

    core::CodecSettings m_settings;
};

} // namespace tool
} // namespace calendraft
