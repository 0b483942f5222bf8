/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LINEREADER_H
#define LINEREADER_H

#include <QPointer>
#include <QString>
#include <QStringDecoder>

class QIODevice;

namespace TidalRelay
{

/**
 * LineReader drains one read channel of a device without blocking.
 *
 * poll() hands back whatever text is buffered right now, which may be an
 * empty string. It never waits for more input, so a single pump can service
 * several channels on a fixed cadence. UTF-8 sequences split across two
 * reads are kept back until they are complete.
 */
class LineReader
{
public:
    /**
     * @param device Device to read from (typically a QProcess)
     * @param channel Read channel, e.g. QProcess::StandardError
     */
    explicit LineReader(QIODevice *device, int channel = 0);

    /**
     * Return all text currently available on the channel
     */
    QString poll();

    int channel() const { return m_channel; }

private:
    QPointer<QIODevice> m_device;
    int m_channel = 0;
    QStringDecoder m_decoder;
};

} // namespace TidalRelay

#endif // LINEREADER_H
