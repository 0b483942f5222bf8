/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TextFragment.h"

#include <utility>

namespace TidalRelay
{

QString TextFragment::payload() const
{
    QString result = text;
    result.replace(QLatin1Char('\t'), QStringLiteral("  "));
    return result;
}

TextFragment TextFragment::fromRange(const QString &document, int start, int end)
{
    if (start > end) {
        std::swap(start, end);
    }
    start = qBound(0, start, int(document.size()));
    end = qBound(0, end, int(document.size()));

    TextFragment fragment;
    fragment.text = document.mid(start, end - start).trimmed();
    fragment.start = start;
    fragment.end = end;
    return fragment;
}

TextFragment TextFragment::fromLine(const QString &document, int line)
{
    const int start = lineStartOffset(document, line);
    if (start < 0) {
        return TextFragment();
    }
    return fromRange(document, start, lineEndOffset(document, line));
}

TextFragment TextFragment::fromParagraph(const QString &document, int line)
{
    if (fromLine(document, line).isBlank()) {
        return TextFragment();
    }

    int first = line;
    while (first > 0 && !fromLine(document, first - 1).isBlank()) {
        --first;
    }

    int last = line;
    while (lineStartOffset(document, last + 1) >= 0 && !fromLine(document, last + 1).isBlank()) {
        ++last;
    }

    return fromRange(document, lineStartOffset(document, first), lineEndOffset(document, last));
}

TextFragment TextFragment::select(const QString &document, int selectionStart, int selectionEnd, int caretLine)
{
    if (selectionStart != selectionEnd) {
        TextFragment selected = fromRange(document, selectionStart, selectionEnd);
        if (!selected.isBlank()) {
            return selected;
        }
    }

    // Nothing useful selected: fall back to the caret line
    return fromLine(document, caretLine);
}

int TextFragment::lineStartOffset(const QString &document, int line)
{
    if (line < 0) {
        return -1;
    }

    int offset = 0;
    for (int i = 0; i < line; ++i) {
        const int newline = document.indexOf(QLatin1Char('\n'), offset);
        if (newline < 0) {
            return -1;
        }
        offset = newline + 1;
    }
    return offset;
}

int TextFragment::lineEndOffset(const QString &document, int line)
{
    const int start = lineStartOffset(document, line);
    if (start < 0) {
        return -1;
    }
    const int newline = document.indexOf(QLatin1Char('\n'), start);
    return newline < 0 ? int(document.size()) : newline;
}

} // namespace TidalRelay
