#include "fsgate/sanitizer.hpp"
#include <exception>

namespace fsgate {

namespace {

bool keep_ascii(unsigned char c) {
    return c == '\n' || c == '\t' || (c >= 0x20 && c < 0x7F);
}

bool is_dropped_codepoint(char32_t cp) {
    if (cp >= 0x80 && cp <= 0x9F) return true;            // C1 controls
    if (cp >= 0xFDD0 && cp <= 0xFDEF) return true;         // noncharacters
    return (cp & 0xFFFE) == 0xFFFE;                        // U+xFFFE, U+xFFFF
}

// Length of the well-formed UTF-8 sequence starting at pos, 0 when malformed.
size_t utf8_sequence(std::string_view text, size_t pos, char32_t& cp) {
    auto lead = static_cast<unsigned char>(text[pos]);
    size_t len;
    char32_t min;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2; cp = lead & 0x1F; min = 0x80;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3; cp = lead & 0x0F; min = 0x800;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4; cp = lead & 0x07; min = 0x10000;
    } else {
        return 0;
    }
    if (pos + len > text.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        auto c = static_cast<unsigned char>(text[pos + k]);
        if ((c & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (c & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_control_escape(std::string_view hex) {
    int v = 0;
    for (char c : hex) {
        int h = hex_value(c);
        if (h < 0) return false;
        v = v * 16 + h;
    }
    if (v == 0x09 || v == 0x0A) return false;
    return v < 0x20 || v == 0x7F || (v >= 0x80 && v <= 0x9F);
}

} // anonymous namespace

std::string Sanitizer::clean_text(std::string_view text) noexcept {
    try {
        std::string out;
        out.reserve(text.size());
        size_t i = 0;
        while (i < text.size()) {
            auto c = static_cast<unsigned char>(text[i]);
            if (c < 0x80) {
                if (keep_ascii(c)) out.push_back(static_cast<char>(c));
                ++i;
                continue;
            }
            char32_t cp = 0;
            size_t len = utf8_sequence(text, i, cp);
            if (len == 0) {
                ++i;
                continue;
            }
            if (!is_dropped_codepoint(cp)) out.append(text.substr(i, len));
            i += len;
        }
        return out;
    } catch (const std::exception&) {
        return std::string(PLACEHOLDER);
    }
}

nlohmann::json Sanitizer::sanitize(const nlohmann::json& value) noexcept {
    using value_t = nlohmann::json::value_t;
    try {
        switch (value.type()) {
            case value_t::string:
                return clean_text(value.get_ref<const std::string&>());
            case value_t::object: {
                nlohmann::json out = nlohmann::json::object();
                for (auto it = value.begin(); it != value.end(); ++it) {
                    out[clean_text(it.key())] = sanitize(it.value());
                }
                return out;
            }
            case value_t::array: {
                nlohmann::json out = nlohmann::json::array();
                for (const auto& item : value) {
                    out.push_back(sanitize(item));
                }
                return out;
            }
            case value_t::null:
            case value_t::boolean:
            case value_t::number_integer:
            case value_t::number_unsigned:
            case value_t::number_float:
            case value_t::binary:
                return value;
            case value_t::discarded:
                return nullptr;
        }
        return value;
    } catch (const std::exception&) {
        return std::string(PLACEHOLDER);
    }
}

std::string Sanitizer::scrub_encoded(std::string_view encoded) noexcept {
    try {
        std::string out;
        out.reserve(encoded.size());
        bool in_string = false;
        const size_t n = encoded.size();
        for (size_t i = 0; i < n; ++i) {
            auto c = static_cast<unsigned char>(encoded[i]);
            // A frame is a single line: raw control bytes never belong in it.
            if (c < 0x20 || c == 0x7F) continue;

            if (!in_string) {
                if (c == '"') in_string = true;
                out.push_back(static_cast<char>(c));
                continue;
            }
            if (c == '"') {
                in_string = false;
                out.push_back('"');
                continue;
            }
            if (c != '\\' || i + 1 >= n) {
                out.push_back(static_cast<char>(c));
                continue;
            }

            char esc = encoded[i + 1];
            if (esc == 'b' || esc == 'f' || esc == 'r') {
                ++i;
                continue;
            }
            if (esc == 'u' && i + 5 < n && is_control_escape(encoded.substr(i + 2, 4))) {
                i += 5;
                continue;
            }
            out.push_back('\\');
            out.push_back(esc);
            ++i;
        }
        return out;
    } catch (const std::exception&) {
        return std::string();
    }
}

bool Sanitizer::is_clean(std::string_view text) noexcept {
    return clean_text(text) == text;
}

} // namespace fsgate
