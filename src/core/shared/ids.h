#pragma once

#include <QString>

namespace vd {

// "<prefix>-<msecs since epoch>-<16 hex digits>"
QString generateId(const QString& prefix);

} // namespace vd
