//
// Created by cv2 on 22.12.2025.
//

#pragma once
#include <vector>
#include <string>
#include <memory>
#include <cstdint>
#include <expected>
#include <openssl/evp.h>

namespace comb::crypto {

    using Bytes = std::vector<uint8_t>;

    enum class Error {
        DigestInitFailed,
        DigestUpdateFailed,
        DigestFinalFailed
    };

    // Streaming SHA-256 accumulator.
    // Feed it any number of update() calls, then finish() once.
    class Sha256 {
    public:
        Sha256();

        std::expected<void, Error> update(const uint8_t* data, size_t len);

        // Returns the 32-byte digest. The accumulator cannot be reused afterwards.
        std::expected<Bytes, Error> finish();

    private:
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_;
        bool ready_ = false;
        bool finished_ = false;
    };

    // One-shot helpers
    std::expected<Bytes, Error> sha256(const Bytes& data);

    std::string to_hex(const Bytes& data);

    // Hex of the digest, cut down to hex_chars characters (whole digest when 0)
    std::expected<std::string, Error> sha256_hex(const Bytes& data, size_t hex_chars = 0);

} // namespace comb::crypto
