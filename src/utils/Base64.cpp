#include "utils/Base64.h"
#include <openssl/evp.h>

namespace VoiceGuard {
namespace Utils {

namespace {

bool isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

std::string Base64::stripDataUrlPrefix(const std::string& text) {
    if (text.compare(0, 5, "data:") != 0) {
        return text;
    }

    size_t comma = text.find(',');
    if (comma == std::string::npos) {
        return text;
    }
    return text.substr(comma + 1);
}

std::optional<std::vector<uint8_t>> Base64::decode(const std::string& text) {
    const std::string payload = stripDataUrlPrefix(text);

    // EVP_DecodeBlock rejects bad characters but reads '=' anywhere as a
    // zero sextet, so padding placement is checked here
    std::string compact;
    compact.reserve(payload.size());
    size_t padding = 0;

    for (char c : payload) {
        if (isWhitespace(c)) {
            continue;
        }
        if (c == '=') {
            if (++padding > 2) {
                return std::nullopt;
            }
        } else if (padding > 0) {
            return std::nullopt;
        }
        compact.push_back(c);
    }

    if (compact.size() % 4 != 0) {
        return std::nullopt;
    }
    if (compact.empty()) {
        return std::vector<uint8_t>();
    }

    std::vector<uint8_t> output(compact.size() / 4 * 3);
    int written = EVP_DecodeBlock(output.data(),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    // A short count means trailing characters were dropped as line noise
    if (written < 0 || static_cast<size_t>(written) != output.size()) {
        return std::nullopt;
    }

    // Padding decodes to trailing zero bytes
    output.resize(static_cast<size_t>(written) - padding);
    return output;
}

std::string Base64::encode(const uint8_t* data, size_t length) {
    if (length == 0) {
        return std::string();
    }

    // Four output characters per started triple, plus the terminator
    std::string output((length + 2) / 3 * 4 + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&output[0]),
                                  data,
                                  static_cast<int>(length));
    output.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return output;
}

std::string Base64::encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

} // namespace Utils
} // namespace VoiceGuard
