#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include <cstdio>

#include "version.h"

#include "calendraft/core/CodecSettings.hpp"
#include "calendraft/tool/CommandLineTool.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Calendraft"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("calendraft.app"));
    QCoreApplication::setApplicationName(QStringLiteral("calendraft-ics"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kCalendraftVersion));

    QCoreApplication app(argc, argv);

    QSettings settings;
    const auto codecSettings = calendraft::core::CodecSettings::load(settings);

    QTextStream out(stdout);
    QTextStream err(stderr);
    calendraft::tool::CommandLineTool tool(codecSettings);
    return tool.run(app.arguments(), out, err);
}
