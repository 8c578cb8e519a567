#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cuisine::util {

// Number of characters typical of UTF-8 text that was decoded as Latin-1 (Ã, Â, â).
std::size_t mojibakeScore(std::string_view text);

// Undoes one round of UTF-8 -> Latin-1/Windows-1252 mis-decoding ("RÃ©ponse" -> "Réponse").
// The original text is returned unless the repaired text decodes cleanly and scores strictly lower.
std::string repairMojibake(const std::string& text);

// Removes every HTML tag and comment; script-like elements lose their content too.
std::string stripMarkup(std::string_view text);

// Removes C0 (except tab, LF, CR), DEL and C1 control characters.
std::string stripControlChars(std::string_view text);

// Trims ASCII and Unicode whitespace from both ends.
std::string trim(std::string_view text);

// Free-text input boundary: mojibake repair, markup removal, control-character removal.
// The stages repeat until the text stops changing, so sanitize(sanitize(x)) == sanitize(x).
std::string sanitize(const std::string& text);

}
