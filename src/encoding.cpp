#include "fsgate/encoding.hpp"
#include "fsgate/error.hpp"
#include <algorithm>
#include <cctype>

namespace fsgate {

namespace {

constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void append_utf8(std::string& out, unsigned char byte) {
    if (byte < 0x80) {
        out.push_back(static_cast<char>(byte));
    } else {
        out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
        out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
    }
}

} // anonymous namespace

Encoding parse_encoding(std::string_view name) {
    std::string n = lowercase(name);
    if (n.empty() || n == "utf-8" || n == "utf8") return Encoding::Utf8;
    if (n == "us-ascii" || n == "ascii") return Encoding::Ascii;
    if (n == "iso-8859-1" || n == "iso8859-1" || n == "latin1" || n == "latin-1") return Encoding::Latin1;
    throw InvalidArgumentError("Unsupported encoding: " + std::string(name));
}

std::string decode_text(std::string_view bytes, Encoding encoding) {
    switch (encoding) {
        case Encoding::Utf8:
            return std::string(bytes);
        case Encoding::Ascii: {
            std::string out;
            out.reserve(bytes.size());
            for (char c : bytes) {
                if (static_cast<unsigned char>(c) < 0x80) {
                    out.push_back(c);
                } else {
                    out.append(REPLACEMENT);
                }
            }
            return out;
        }
        case Encoding::Latin1: {
            std::string out;
            out.reserve(bytes.size() * 2);
            for (char c : bytes) append_utf8(out, static_cast<unsigned char>(c));
            return out;
        }
    }
    return std::string(bytes);
}

std::string encode_text(std::string_view text, Encoding encoding) {
    switch (encoding) {
        case Encoding::Utf8:
            return std::string(text);
        case Encoding::Ascii:
            for (char c : text) {
                if (static_cast<unsigned char>(c) >= 0x80) {
                    throw InvalidArgumentError("Content cannot be encoded as US-ASCII");
                }
            }
            return std::string(text);
        case Encoding::Latin1: {
            std::string out;
            out.reserve(text.size());
            for (size_t i = 0; i < text.size(); ++i) {
                auto c = static_cast<unsigned char>(text[i]);
                if (c < 0x80) {
                    out.push_back(static_cast<char>(c));
                    continue;
                }
                // Only two-byte sequences up to U+00FF fit in Latin-1
                if ((c == 0xC2 || c == 0xC3) && i + 1 < text.size()) {
                    auto next = static_cast<unsigned char>(text[i + 1]);
                    if ((next & 0xC0) == 0x80) {
                        out.push_back(static_cast<char>(((c & 0x1F) << 6) | (next & 0x3F)));
                        ++i;
                        continue;
                    }
                }
                throw InvalidArgumentError("Content cannot be encoded as ISO-8859-1");
            }
            return out;
        }
    }
    return std::string(text);
}

} // namespace fsgate
