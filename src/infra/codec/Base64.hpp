#pragma once
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <boost/beast/core/detail/base64.hpp>

#include "Errors.hpp"

// Thin wrappers over Beast's base64 codec for media payloads.
namespace voxbridge::Base64 {

inline std::string Encode(std::span<const uint8_t> bytes) {
    namespace b64 = boost::beast::detail::base64;
    std::string out(b64::encoded_size(bytes.size()), '\0');
    out.resize(b64::encode(out.data(), bytes.data(), bytes.size()));
    return out;
}

/**
 * @throws MalformedFrameError on unpadded input or characters outside the
 *         base64 alphabet.
 */
inline std::vector<uint8_t> Decode(std::string_view text) {
    namespace b64 = boost::beast::detail::base64;
    // decoded_size() is only an upper bound for whole quads; a partial quad
    // would be written past the buffer.
    if (text.size() % 4 != 0) {
        throw MalformedFrameError("Invalid base64 payload: length " + std::to_string(text.size()) +
                                  " is not a multiple of 4");
    }
    std::vector<uint8_t> out(b64::decoded_size(text.size()));
    auto [written, consumed] = b64::decode(out.data(), text.data(), text.size());

    // Decoding stops at the first '=' or at an invalid character; only padding
    // may follow.
    for (std::size_t i = consumed; i < text.size(); ++i) {
        if (text[i] != '=') {
            throw MalformedFrameError("Invalid base64 payload");
        }
    }

    out.resize(written);
    return out;
}

}  // namespace voxbridge::Base64
