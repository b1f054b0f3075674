#include "core/shared/ids.h"

#include <QDateTime>
#include <QRandomGenerator>

namespace vd {

QString generateId(const QString& prefix)
{
    return QStringLiteral("%1-%2-%3")
        .arg(prefix)
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(QRandomGenerator::global()->generate64(), 16, 16, QLatin1Char('0'));
}

} // namespace vd
