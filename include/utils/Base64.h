#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace VoiceGuard {
namespace Utils {

/**
 * Base64 (RFC 4648, standard alphabet) codec for audio payloads, on top of
 * OpenSSL's EVP block encoder
 *
 * Decoding is strict: ASCII whitespace is skipped, anything else outside
 * the alphabet, misplaced padding, or a length that is not a multiple of
 * four rejects the whole input.
 */
class Base64 {
public:
    /**
     * @brief Decode base64 text, accepting an optional data-URL prefix
     * @return Decoded bytes, or std::nullopt when the text is not valid base64
     */
    static std::optional<std::vector<uint8_t>> decode(const std::string& text);

    // Encode with '=' padding
    static std::string encode(const uint8_t* data, size_t length);
    static std::string encode(const std::vector<uint8_t>& data);

    /**
     * @brief Remove a "data:<mime>;base64," prefix if present
     *
     * Text that starts with "data:" but has no comma is returned unchanged.
     */
    static std::string stripDataUrlPrefix(const std::string& text);
};

} // namespace Utils
} // namespace VoiceGuard
