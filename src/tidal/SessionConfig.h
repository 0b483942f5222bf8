/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONCONFIG_H
#define SESSIONCONFIG_H

#include <QString>

namespace TidalRelay
{

/**
 * Parameters for one interpreter session.
 *
 * Built from TidalSettings by the host, or by hand in tests.
 */
struct SessionConfig {
    QString interpreterPath;    // Executable launched with no arguments
    QString bootScriptPath;     // Lines replayed right after spawn

    int pollIntervalMs = 200;   // Output drain cadence
    int startTimeoutMs = 5000;  // Wait for the process to come up
    int writeTimeoutMs = 1000;  // Flush bound for a single send
    int stopTimeoutMs = 3000;   // Wait for the killed process to be reaped

    bool isValid() const
    {
        return !interpreterPath.isEmpty() && !bootScriptPath.isEmpty();
    }
};

} // namespace TidalRelay

#endif // SESSIONCONFIG_H
