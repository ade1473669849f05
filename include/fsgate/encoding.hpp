#pragma once
#include <string>
#include <string_view>

namespace fsgate {

enum class Encoding {
    Utf8,
    Ascii,
    Latin1
};

/// Accepts UTF-8, US-ASCII and ISO-8859-1 (also latin1), any case.
/// Throws InvalidArgumentError for anything else.
[[nodiscard]] Encoding parse_encoding(std::string_view name);

/// File bytes to UTF-8 text. Bytes outside US-ASCII become U+FFFD when
/// decoding ASCII.
[[nodiscard]] std::string decode_text(std::string_view bytes, Encoding encoding);

/// UTF-8 text to file bytes. Throws InvalidArgumentError when the text is
/// malformed or holds characters the encoding cannot represent.
[[nodiscard]] std::string encode_text(std::string_view text, Encoding encoding);

} // namespace fsgate
