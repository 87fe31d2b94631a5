#include "core/query/query_tokenizer.h"

#include <algorithm>

namespace pa {

QStringList QueryTokenizer::tokenize(const QString& text)
{
    QStringList tokens;
    QString current;

    auto flush = [&]() {
        if (!current.isEmpty()) {
            tokens.append(current);
            current.clear();
        }
    };

    for (const QChar ch : text) {
        if (ch.isLetterOrNumber()) {
            current.append(ch.toLower());
        } else if (ch == QLatin1Char('+')) {
            flush();
            tokens.append(QStringLiteral("+"));
        } else {
            flush();
        }
    }
    flush();

    return tokens;
}

QStringList QueryTokenizer::stripTokens(const QStringList& tokens, const QStringList& words)
{
    QStringList kept;
    kept.reserve(tokens.size());
    for (const QString& token : tokens) {
        if (!words.contains(token)) {
            kept.append(token);
        }
    }
    return kept;
}

int QueryTokenizer::indexOfSequence(const QStringList& haystack, const QStringList& needle, int from)
{
    if (needle.isEmpty()) {
        return -1;
    }

    const int last = static_cast<int>(haystack.size() - needle.size());
    for (int i = std::max(0, from); i <= last; ++i) {
        bool matched = true;
        for (int j = 0; j < needle.size(); ++j) {
            if (haystack[i + j] != needle[j]) {
                matched = false;
                break;
            }
        }
        if (matched) {
            return i;
        }
    }
    return -1;
}

} // namespace pa
