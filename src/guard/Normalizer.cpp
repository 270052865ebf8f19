#include "guard/Normalizer.hpp"
#include <openssl/evp.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <iostream>

using namespace promptguard;

namespace {

bool is_b64_char(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

bool is_ascii_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

// Decoded payload must be well-formed UTF-8 made only of printable or
// whitespace code points. Accented text counts; stage 4 folds it later.
bool is_printable_text(const std::string& s) {
    const uint8_t* p = reinterpret_cast<const uint8_t*>(s.data());
    const int32_t len = static_cast<int32_t>(s.size());
    int32_t i = 0;
    while (i < len) {
        UChar32 c;
        U8_NEXT(p, i, len, c);
        if (c < 0) return false;
        if (u_isspace(c)) continue;
        if (!u_isprint(c)) return false;
    }
    return true;
}

// Base64 of real text almost always mixes cases. Requiring both keeps the
// stage an identity on already-normalized (all lower-case) text.
bool has_mixed_case(const std::string& s, std::size_t begin, std::size_t end) {
    bool upper = false, lower = false;
    for (std::size_t i = begin; i < end; ++i) {
        unsigned char c = s[i];
        if (c >= 'A' && c <= 'Z') upper = true;
        else if (c >= 'a' && c <= 'z') lower = true;
        if (upper && lower) return true;
    }
    return false;
}

char leet(char c) {
    switch (c) {
        case '1': return 'i';
        case '3': return 'e';
        case '4': return 'a';
        case '0': return 'o';
        case '5': return 's';
        case '7': return 't';
        default:  return c;
    }
}

} // namespace

std::string Normalizer::normalize(const std::string& text) const {
    if (text.empty()) return "";

    std::string out = unmask_base64(text);
    out = fold_case(std::move(out));
    out = fold_leetspeak(std::move(out));
    out = fold_homoglyphs(out);
    return collapse_whitespace(out);
}

bool Normalizer::decode_base64(const std::string& encoded, std::string& out) {
    if (encoded.empty() || encoded.size() % 4 != 0) return false;

    std::size_t pad = 0;
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        unsigned char c = encoded[i];
        if (c == '=') {
            // Padding: at most two, only at the very end.
            if (i + 2 < encoded.size()) return false;
            pad++;
        } else if (pad > 0 || !is_b64_char(c)) {
            return false;
        }
    }

    std::string buf(encoded.size() / 4 * 3, '\0');
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&buf[0]),
                            reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
    if (n < 0 || static_cast<std::size_t>(n) < pad) return false;

    // EVP_DecodeBlock counts the zero bytes produced by padding.
    buf.resize(static_cast<std::size_t>(n) - pad);
    out.swap(buf);
    return true;
}

std::string Normalizer::unmask_base64(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_b64_char(static_cast<unsigned char>(text[i]))) {
            out.push_back(text[i++]);
            continue;
        }

        std::size_t run_end = i;
        while (run_end < text.size() && is_b64_char(static_cast<unsigned char>(text[run_end])))
            run_end++;

        std::size_t end = run_end;
        while (end < text.size() && end - run_end < 2 && text[end] == '=')
            end++;

        std::string decoded;
        if (run_end - i >= MIN_BASE64_RUN &&
            has_mixed_case(text, i, run_end) &&
            decode_base64(text.substr(i, end - i), decoded) &&
            !decoded.empty() &&
            is_printable_text(decoded)) {
            std::cout << "[NORMALIZER] base64 run decoded (" << (end - i)
                      << " -> " << decoded.size() << " bytes)\n";
            out += decoded;
        } else {
            out.append(text, i, end - i);
        }
        i = end;
    }
    return out;
}

std::string Normalizer::fold_case(std::string text) {
    for (auto& c : text) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return text;
}

std::string Normalizer::fold_leetspeak(std::string text) {
    for (auto& c : text) c = leet(c);
    return text;
}

std::string Normalizer::fold_homoglyphs(const std::string& text) {
    std::string decomposed;

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    if (U_SUCCESS(status)) {
        // Ill-formed UTF-8 becomes U+FFFD here and is dropped below.
        icu::UnicodeString src = icu::UnicodeString::fromUTF8(icu::StringPiece(text));
        icu::UnicodeString dst = nfkd->normalize(src, status);
        if (U_SUCCESS(status)) dst.toUTF8String(decomposed);
    }
    if (U_FAILURE(status)) {
        std::cerr << "[NORMALIZER] NFKD unavailable (" << u_errorName(status)
                  << "): stripping non-ASCII only\n";
        decomposed = text;
    }

    std::string ascii;
    ascii.reserve(decomposed.size());
    for (unsigned char c : decomposed) {
        if (c < 0x80) ascii.push_back(static_cast<char>(c));
    }

    // Decomposition can surface new upper case or digits (Ａ → A, ① → 1).
    return fold_leetspeak(fold_case(std::move(ascii)));
}

std::string Normalizer::collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool pending_space = false;
    for (unsigned char c : text) {
        if (is_ascii_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}
