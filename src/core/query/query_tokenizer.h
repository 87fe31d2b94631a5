#pragma once

#include <QString>
#include <QStringList>

namespace pa {

// Lower-cases text and splits it into runs of letters/digits. '+' is kept
// as a token of its own so "S24+" yields {"s24", "+"}.
class QueryTokenizer {
public:
    static QStringList tokenize(const QString& text);

    // Drops every token equal to one of the given words.
    static QStringList stripTokens(const QStringList& tokens, const QStringList& words);

    // Index of the first contiguous occurrence of needle in haystack at or
    // after from, or -1.
    static int indexOfSequence(const QStringList& haystack, const QStringList& needle, int from = 0);
};

} // namespace pa
