#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace fsgate {

/// Strips control and non-printable characters from everything headed for the wire.
class Sanitizer {
public:
    /// Substituted for a string leaf whose cleaning failed.
    static constexpr std::string_view PLACEHOLDER = "[unprintable]";

    /// Remove ASCII controls other than '\n' and '\t', C1 controls, Unicode
    /// noncharacters and malformed UTF-8 sequences. Never throws.
    [[nodiscard]] static std::string clean_text(std::string_view text) noexcept;

    /// Recursively clean every string leaf and object key. Structure, array
    /// order and non-string scalars are preserved. Never throws.
    [[nodiscard]] static nlohmann::json sanitize(const nlohmann::json& value) noexcept;

    /// Second pass over already-encoded JSON text: drops raw control bytes and
    /// escape sequences that decode to controls other than '\n' and '\t'.
    [[nodiscard]] static std::string scrub_encoded(std::string_view encoded) noexcept;

    /// True when the text contains nothing clean_text would remove.
    [[nodiscard]] static bool is_clean(std::string_view text) noexcept;
};

} // namespace fsgate
