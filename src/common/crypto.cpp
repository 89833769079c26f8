//
// Created by cv2 on 22.12.2025.
//

#include "crypto.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <format>

namespace comb::crypto {

Sha256::Sha256() : ctx_(EVP_MD_CTX_new(), EVP_MD_CTX_free) {
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) == 1) {
        ready_ = true;
    }
}

std::expected<void, Error> Sha256::update(const uint8_t* data, size_t len) {
    if (!ready_ || finished_) return std::unexpected(Error::DigestInitFailed);
    if (len == 0) return {};

    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1)
        return std::unexpected(Error::DigestUpdateFailed);
    return {};
}

std::expected<Bytes, Error> Sha256::finish() {
    if (!ready_ || finished_) return std::unexpected(Error::DigestInitFailed);
    finished_ = true;

    Bytes digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &len) != 1)
        return std::unexpected(Error::DigestFinalFailed);

    digest.resize(len);
    return digest;
}

std::expected<Bytes, Error> sha256(const Bytes& data) {
    Sha256 acc;
    if (auto res = acc.update(data.data(), data.size()); !res)
        return std::unexpected(res.error());
    return acc.finish();
}

std::string to_hex(const Bytes& data) {
    std::string s;
    s.reserve(data.size() * 2);
    for (auto b : data) s += std::format("{:02x}", b);
    return s;
}

std::expected<std::string, Error> sha256_hex(const Bytes& data, size_t hex_chars) {
    auto digest = sha256(data);
    if (!digest) return std::unexpected(digest.error());

    std::string hex = to_hex(*digest);
    if (hex_chars > 0 && hex_chars < hex.size()) hex.resize(hex_chars);
    return hex;
}

} // namespace comb::crypto
