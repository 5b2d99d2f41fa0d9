#pragma once

#include "stamp/utility.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;

namespace stamp {

inline constexpr size_t SHA1_DIGEST_SIZE = 20;

using Sha1Digest = std::array<uint8_t, SHA1_DIGEST_SIZE>;

/**
 * @brief Streaming SHA-1 accumulator backed by OpenSSL's EVP interface.
 *
 * `finish()` may be called once; the hasher is exhausted afterwards.
 * Throws std::runtime_error if OpenSSL fails to initialize or update the context.
 */
class Sha1Hasher {
public:
    Sha1Hasher();
    ~Sha1Hasher();

    Sha1Hasher(Sha1Hasher &&) noexcept;
    Sha1Hasher &operator=(Sha1Hasher &&) noexcept;
    Sha1Hasher(const Sha1Hasher &) = delete;
    Sha1Hasher &operator=(const Sha1Hasher &) = delete;

    void update(std::string_view bytes);
    void update(uint8_t byte);
    void update(const Sha1Digest &digest);

    Sha1Digest finish();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st *ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

Sha1Digest sha1_of(std::string_view bytes);

/// Lower-case hex, always 2 * SHA1_DIGEST_SIZE characters.
std::string to_hex(const Sha1Digest &digest);

Result<Sha1Digest> digest_from_hex(std::string_view hex);

} // namespace stamp
