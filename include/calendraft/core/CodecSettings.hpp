#pragma once

#include <QString>

class QSettings;

namespace calendraft {
namespace core {

struct CodecSettings
{
    QString productId = QStringLiteral("-//Calendraft//Calendraft//EN");
    QString uidDomain = QStringLiteral("calendraft");
    bool foldLines = false;
    int foldWidth = 75;

    int duplicateToleranceSeconds = 60;
    bool duplicatesByUid = true;
    bool duplicatesByTitle = true;
    bool duplicatesByLocation = false;

    static CodecSettings load(QSettings &settings);
    void save(QSettings &settings) const;
};

} // namespace core
} // namespace calendraft
