#pragma once
#include <string>

namespace promptguard {

// ---------------------------------------------------------------------------
// Canonicalizes prompt text so common obfuscations collapse to plain text
// before pattern matching. Stages run in this fixed order:
//
//   1. base64 unmasking  : printable payloads decoded in place
//   2. case fold         : ASCII lower case
//   3. leetspeak fold    : 1→i 3→e 4→a 0→o 5→s 7→t
//   4. homoglyph fold    : NFKD, drop non-ASCII, re-fold case + leetspeak
//   5. whitespace collapse
//
// Base64 runs before the case fold because the payload is case-sensitive.
// Homoglyph fold runs after leetspeak so decomposed accents never sit between
// digits being substituted.
//
// normalize() is total: any byte sequence in, ASCII out, never throws.
// normalize(normalize(x)) == normalize(x).
// ---------------------------------------------------------------------------
class Normalizer {
public:
    static constexpr std::size_t MIN_BASE64_RUN = 20;

    std::string normalize(const std::string& text) const;

    // Individual stages.
    static std::string unmask_base64(const std::string& text);
    static std::string fold_case(std::string text);
    static std::string fold_leetspeak(std::string text);
    static std::string fold_homoglyphs(const std::string& text);
    static std::string collapse_whitespace(const std::string& text);

    // Strict base64 decode (length multiple of 4, padding only at the end).
    // Returns false on any malformed input.
    static bool decode_base64(const std::string& encoded, std::string& out);
};

} // namespace promptguard
