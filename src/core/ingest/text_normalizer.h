#pragma once

#include <QString>

namespace ul {

// TextNormalizer -- canonical form of regulatory text before chunking.
//
// Operations performed, in order:
// 1. Collapse every whitespace run (including newlines) to a single space
// 2. Word-initial "art." (any case, optional trailing spaces) becomes "Articolo "
// 3. "comma" followed by whitespace becomes "comma "
// 4. Strip NUL characters
// 5. Trim leading/trailing whitespace
class TextNormalizer {
public:
    static QString normalize(const QString& raw);
};

} // namespace ul
