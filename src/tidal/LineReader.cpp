/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "LineReader.h"

#include <QIODevice>
#include <QProcess>

namespace TidalRelay
{

LineReader::LineReader(QIODevice *device, int channel)
    : m_device(device)
    , m_channel(channel)
    , m_decoder(QStringConverter::Utf8)
{
}

QString LineReader::poll()
{
    if (!m_device || !m_device->isReadable()) {
        return QString();
    }

    QByteArray bytes;
    if (auto *process = qobject_cast<QProcess *>(m_device.data())) {
        // stdout and stderr are two read channels of the same process
        bytes = m_channel == QProcess::StandardError ? process->readAllStandardError() : process->readAllStandardOutput();
    } else {
        if (m_device->bytesAvailable() <= 0) {
            return QString();
        }
        bytes = m_device->readAll();
    }

    if (bytes.isEmpty()) {
        return QString();
    }

    QString text = m_decoder.decode(bytes);
    return text;
}

} // namespace TidalRelay
