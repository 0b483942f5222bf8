/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionFault.h"

#include <KLocalizedString>

namespace TidalRelay
{

QString SessionFault::toString() const
{
    if (message.isEmpty()) {
        return kindName(kind);
    }
    return QStringLiteral("%1: %2").arg(kindName(kind), message);
}

QString SessionFault::kindName(Kind kind)
{
    switch (kind) {
    case Kind::SpawnFailure:
        return i18n("Spawn failure");
    case Kind::BootstrapReadFailure:
        return i18n("Bootstrap read failure");
    case Kind::WriteFailure:
        return i18n("Write failure");
    case Kind::PumpFault:
    default:
        return i18n("Pump fault");
    }
}

} // namespace TidalRelay

#include "moc_SessionFault.cpp"
