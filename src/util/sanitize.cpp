#include "util/sanitize.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <utility>

namespace cuisine::util {

namespace {

bool decodeUtf8(const std::string_view s, std::u32string& out) {
    out.clear();
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<unsigned char>(s[i]);
        char32_t cp = 0;
        size_t len = 0;
        if (lead < 0x80) { cp = lead; len = 1; }
        else if ((lead & 0xE0) == 0xC0) { cp = lead & 0x1F; len = 2; }
        else if ((lead & 0xF0) == 0xE0) { cp = lead & 0x0F; len = 3; }
        else if ((lead & 0xF8) == 0xF0) { cp = lead & 0x07; len = 4; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const auto cont = static_cast<unsigned char>(s[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;

        out.push_back(cp);
        i += len;
    }
    return true;
}

void appendUtf8(std::string& out, const char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Windows-1252 characters occupying the 0x80-0x9F range.
constexpr std::array<std::pair<char32_t, unsigned char>, 27> CP1252_HIGH = {{
    {0x20AC, 0x80}, {0x201A, 0x82}, {0x0192, 0x83}, {0x201E, 0x84}, {0x2026, 0x85},
    {0x2020, 0x86}, {0x2021, 0x87}, {0x02C6, 0x88}, {0x2030, 0x89}, {0x0160, 0x8A},
    {0x2039, 0x8B}, {0x0152, 0x8C}, {0x017D, 0x8E}, {0x2018, 0x91}, {0x2019, 0x92},
    {0x201C, 0x93}, {0x201D, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
    {0x02DC, 0x98}, {0x2122, 0x99}, {0x0161, 0x9A}, {0x203A, 0x9B}, {0x0153, 0x9C},
    {0x017E, 0x9E}, {0x0178, 0x9F},
}};

std::optional<unsigned char> singleByteFor(const char32_t cp) {
    if (cp <= 0xFF) return static_cast<unsigned char>(cp);
    for (const auto& [wide, byte] : CP1252_HIGH)
        if (wide == cp) return byte;
    return std::nullopt;
}

bool isUnicodeSpace(const char32_t cp) {
    switch (cp) {
        case 0x09: case 0x0A: case 0x0B: case 0x0C: case 0x0D: case 0x20:
        case 0xA0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
        case 0x205F: case 0x3000: case 0xFEFF:
            return true;
        default:
            return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool isAsciiAlpha(const char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool isTagNameChar(const char c) {
    return isAsciiAlpha(c) || (c >= '0' && c <= '9') || c == '-' || c == ':';
}

std::string lower(const std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](const char c) {
        return c >= 'A' && c <= 'Z' ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return out;
}

// Elements whose content is dropped along with the element itself.
bool dropsContent(const std::string& name) {
    static constexpr std::array<std::string_view, 12> names = {
        "script", "style", "template", "iframe", "noscript", "noembed",
        "noframes", "xmp", "title", "svg", "math", "head"
    };
    return std::find(names.begin(), names.end(), name) != names.end();
}

size_t findTagEnd(const std::string_view text, size_t pos) {
    char quote = 0;
    for (; pos < text.size(); ++pos) {
        const char c = text[pos];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '>') {
            return pos;
        }
    }
    return std::string_view::npos;
}

size_t findClosingTag(const std::string_view text, size_t pos, const std::string& name) {
    const auto haystack = lower(text.substr(pos));
    const auto found = haystack.find("</" + name);
    return found == std::string::npos ? std::string_view::npos : pos + found;
}

}

std::size_t mojibakeScore(const std::string_view text) {
    std::size_t score = 0;
    for (size_t i = 0; i + 1 < text.size(); ++i) {
        if (static_cast<unsigned char>(text[i]) != 0xC3) continue;
        const auto next = static_cast<unsigned char>(text[i + 1]);
        if (next == 0x83 || next == 0x82 || next == 0xA2) ++score;
    }
    return score;
}

std::string repairMojibake(const std::string& text) {
    const auto before = mojibakeScore(text);
    if (before == 0) return text;

    std::u32string codePoints;
    if (!decodeUtf8(text, codePoints)) return text;

    std::string bytes;
    bytes.reserve(codePoints.size());
    for (const auto cp : codePoints) {
        const auto byte = singleByteFor(cp);
        if (!byte) return text;
        bytes.push_back(static_cast<char>(*byte));
    }

    std::u32string check;
    if (!decodeUtf8(bytes, check)) return text;
    if (mojibakeScore(bytes) >= before) return text;
    return bytes;
}

std::string stripMarkup(const std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (c != '<' || i + 1 >= text.size()) {
            out.push_back(c);
            ++i;
            continue;
        }

        if (text.substr(i, 4) == "<!--") {
            const auto end = text.find("-->", i + 4);
            if (end == std::string_view::npos) break;
            i = end + 3;
            continue;
        }

        const char next = text[i + 1];
        if (next == '!' || next == '?') {
            const auto end = text.find('>', i + 2);
            if (end == std::string_view::npos) break;
            i = end + 1;
            continue;
        }

        const bool closing = next == '/';
        const size_t nameStart = i + (closing ? 2 : 1);
        if (nameStart >= text.size() || !isAsciiAlpha(text[nameStart])) {
            out.push_back(c);
            ++i;
            continue;
        }

        size_t nameEnd = nameStart;
        while (nameEnd < text.size() && isTagNameChar(text[nameEnd])) ++nameEnd;
        const auto name = lower(text.substr(nameStart, nameEnd - nameStart));

        const auto tagEnd = findTagEnd(text, nameEnd);
        if (tagEnd == std::string_view::npos) break;
        const bool selfClosing = tagEnd > 0 && text[tagEnd - 1] == '/';
        i = tagEnd + 1;

        if (!closing && !selfClosing && dropsContent(name)) {
            const auto close = findClosingTag(text, i, name);
            if (close == std::string_view::npos) break;
            const auto closeEnd = text.find('>', close);
            if (closeEnd == std::string_view::npos) break;
            i = closeEnd + 1;
        }
    }

    return out;
}

std::string stripControlChars(const std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') continue;
        if (c == 0x7F) continue;
        if (c == 0xC2 && i + 1 < text.size()) {
            const auto next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x80 && next <= 0x9F) {
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string trim(const std::string_view text) {
    std::u32string codePoints;
    if (!decodeUtf8(text, codePoints)) {
        const auto first = text.find_first_not_of(" \t\n\v\f\r");
        if (first == std::string_view::npos) return {};
        const auto last = text.find_last_not_of(" \t\n\v\f\r");
        return std::string(text.substr(first, last - first + 1));
    }

    size_t begin = 0, end = codePoints.size();
    while (begin < end && isUnicodeSpace(codePoints[begin])) ++begin;
    while (end > begin && isUnicodeSpace(codePoints[end - 1])) --end;

    std::string out;
    out.reserve(text.size());
    for (size_t i = begin; i < end; ++i) appendUtf8(out, codePoints[i]);
    return out;
}

std::string sanitize(const std::string& text) {
    // Every stage only shortens the string, so this reaches a fixed point.
    // Removing a tag or a control character can join the pieces around it into a new tag.
    std::string out = text;
    for (;;) {
        auto next = stripControlChars(stripMarkup(repairMojibake(out)));
        if (next == out) return out;
        out = std::move(next);
    }
}

}
