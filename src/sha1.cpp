#include "stamp/sha1.hpp"

#include <format>
#include <openssl/evp.h>
#include <stdexcept>

namespace stamp {

void Sha1Hasher::CtxDeleter::operator()(EVP_MD_CTX *ctx) const {
    EVP_MD_CTX_free(ctx);
}

Sha1Hasher::Sha1Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to allocate SHA-1 context");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-1 context");
    }
}

Sha1Hasher::~Sha1Hasher() = default;
Sha1Hasher::Sha1Hasher(Sha1Hasher &&) noexcept = default;
Sha1Hasher &Sha1Hasher::operator=(Sha1Hasher &&) noexcept = default;

void Sha1Hasher::update(std::string_view bytes) {
    if (!ctx_) {
        throw std::logic_error("Sha1Hasher used after finish()");
    }
    if (bytes.empty())
        return;
    if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
        throw std::runtime_error("SHA-1 update failed");
    }
}

void Sha1Hasher::update(uint8_t byte) {
    const char c = static_cast<char>(byte);
    update(std::string_view(&c, 1));
}

void Sha1Hasher::update(const Sha1Digest &digest) {
    update(std::string_view(reinterpret_cast<const char *>(digest.data()), digest.size()));
}

Sha1Digest Sha1Hasher::finish() {
    if (!ctx_) {
        throw std::logic_error("Sha1Hasher::finish() called twice");
    }
    Sha1Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != SHA1_DIGEST_SIZE) {
        throw std::runtime_error("SHA-1 finalization failed");
    }
    ctx_.reset();
    return out;
}

Sha1Digest sha1_of(std::string_view bytes) {
    Sha1Hasher hasher;
    hasher.update(bytes);
    return hasher.finish();
}

std::string to_hex(const Sha1Digest &digest) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out(SHA1_DIGEST_SIZE * 2, '0');
    for (size_t i = 0; i < digest.size(); ++i) {
        out[2 * i] = HEX[digest[i] >> 4];
        out[2 * i + 1] = HEX[digest[i] & 0xF];
    }
    return out;
}

Result<Sha1Digest> digest_from_hex(std::string_view hex) {
    if (hex.size() != SHA1_DIGEST_SIZE * 2) {
        return std::unexpected(std::format("Malformed SHA-1 (expected {} hex digits): {}", SHA1_DIGEST_SIZE * 2, hex));
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };

    Sha1Digest out{};
    for (size_t i = 0; i < out.size(); ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return std::unexpected(std::format("Malformed SHA-1 (non-hex digit): {}", hex));
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

} // namespace stamp
