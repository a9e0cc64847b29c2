#include "calendraft/core/CodecSettings.hpp"

#include "calendraft/core/Logging.hpp"

#include <QSettings>

namespace calendraft {
namespace core {

namespace {
constexpr int MinimumFoldWidth = 8;
}

CodecSettings CodecSettings::load(QSettings &settings)
{
    CodecSettings result;

    settings.beginGroup(QStringLiteral("codec"));
    result.productId = settings.value(QStringLiteral("productId"), result.productId).toString();
    result.uidDomain = settings.value(QStringLiteral("uidDomain"), result.uidDomain).toString();
    result.foldLines = settings.value(QStringLiteral("foldLines"), result.foldLines).toBool();
    result.foldWidth = settings.value(QStringLiteral("foldWidth"), result.foldWidth).toInt();
    settings.endGroup();

    settings.beginGroup(QStringLiteral("duplicates"));
    result.duplicateToleranceSeconds =
        settings.value(QStringLiteral("toleranceSeconds"), result.duplicateToleranceSeconds).toInt();
    result.duplicatesByUid = settings.value(QStringLiteral("byUid"), result.duplicatesByUid).toBool();
    result.duplicatesByTitle = settings.value(QStringLiteral("byTitle"), result.duplicatesByTitle).toBool();
    result.duplicatesByLocation =
        settings.value(QStringLiteral("byLocation"), result.duplicatesByLocation).toBool();
    settings.endGroup();

    if (result.productId.trimmed().isEmpty()) {
        result.productId = CodecSettings{}.productId;
    }
    if (result.uidDomain.trimmed().isEmpty()) {
        result.uidDomain = CodecSettings{}.uidDomain;
    }
    if (result.foldWidth < MinimumFoldWidth) {
        qCWarning(CALENDRAFT_CODEC) << "Ignoring fold width" << result.foldWidth << "- using 75";
        result.foldWidth = 75;
    }
    if (result.duplicateToleranceSeconds < 0) {
        result.duplicateToleranceSeconds = 0;
    }
    return result;
}

void CodecSettings::save(QSettings &settings) const
{
    settings.beginGroup(QStringLiteral("codec"));
    settings.setValue(QStringLiteral("productId"), productId);
    settings.setValue(QStringLiteral("uidDomain"), uidDomain);
    settings.setValue(QStringLiteral("foldLines"), foldLines);
    settings.setValue(QStringLiteral("foldWidth"), foldWidth);
    settings.endGroup();

    settings.beginGroup(QStringLiteral("duplicates"));
    settings.setValue(QStringLiteral("toleranceSeconds"), duplicateToleranceSeconds);
    settings.setValue(QStringLiteral("byUid"), duplicatesByUid);
    settings.setValue(QStringLiteral("byTitle"), duplicatesByTitle);
    settings.setValue(QStringLiteral("byLocation"), duplicatesByLocation);
    settings.endGroup();
}

} // namespace core
} // namespace calendraft
