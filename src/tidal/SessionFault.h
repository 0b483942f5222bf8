/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONFAULT_H
#define SESSIONFAULT_H

#include <QMetaType>
#include <QObject>
#include <QString>

namespace TidalRelay
{

/**
 * A failure raised by a session or one of its parts.
 *
 * Faults never escape as exceptions; they travel through the
 * faultOccurred() signals and end up as error notifications.
 */
struct SessionFault {
    Q_GADGET

public:
    enum class Kind {
        SpawnFailure,           // Interpreter missing or failed to launch
        BootstrapReadFailure,   // Bootstrap script missing or unreadable
        WriteFailure,           // Pipe closed or broken during a send
        PumpFault               // Read error while draining output
    };
    Q_ENUM(Kind)

    SessionFault() = default;
    SessionFault(Kind faultKind, const QString &faultMessage)
        : kind(faultKind)
        , message(faultMessage)
    {
    }

    Kind kind = Kind::SpawnFailure;
    QString message;

    /**
     * Whether the fault aborts a start attempt
     */
    bool isFatal() const
    {
        return kind == Kind::SpawnFailure || kind == Kind::BootstrapReadFailure;
    }

    /**
     * Human readable text, e.g. "Write failure: broken pipe"
     */
    QString toString() const;

    static QString kindName(Kind kind);
};

} // namespace TidalRelay

Q_DECLARE_METATYPE(TidalRelay::SessionFault)

#endif // SESSIONFAULT_H
