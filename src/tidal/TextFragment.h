/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TEXTFRAGMENT_H
#define TEXTFRAGMENT_H

#include <QMetaType>
#include <QString>

namespace TidalRelay
{

/**
 * A span of source text destined for the interpreter.
 *
 * The text is trimmed; start and end are offsets into the document the
 * fragment was taken from, suitable for highlighting what was sent.
 */
struct TextFragment {
    QString text;
    int start = -1;
    int end = -1;

    /**
     * Blank fragments are never forwarded
     */
    bool isBlank() const { return text.trimmed().isEmpty(); }

    /**
     * Text as it should be sent: tabs become two spaces
     */
    QString payload() const;

    /**
     * Fragment covering [start, end) of the document
     */
    static TextFragment fromRange(const QString &document, int start, int end);

    /**
     * Fragment covering one line (0-based)
     */
    static TextFragment fromLine(const QString &document, int line);

    /**
     * Fragment covering the block of non-blank lines around a line
     *
     * Empty if the line itself is blank.
     */
    static TextFragment fromParagraph(const QString &document, int line);

    /**
     * The editor rule: the selection if it has any content, else the caret line
     */
    static TextFragment select(const QString &document, int selectionStart, int selectionEnd, int caretLine);

    /**
     * Offset of the first character of a line, or -1 past the last line
     */
    static int lineStartOffset(const QString &document, int line);

    /**
     * Offset just past the last character of a line (before its newline)
     */
    static int lineEndOffset(const QString &document, int line);
};

} // namespace TidalRelay

Q_DECLARE_METATYPE(TidalRelay::TextFragment)

#endif // TEXTFRAGMENT_H
