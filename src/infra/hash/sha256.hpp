#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include "digest.hpp"
#include "../error_handler/error.hpp"

// Предварительное объявление, чтобы не тянуть OpenSSL в заголовок
struct evp_md_ctx_st;

namespace cverify::infra {

struct EvpMdCtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
};

using EvpMdCtxPtr = std::unique_ptr<evp_md_ctx_st, EvpMdCtxDeleter>;

/// Инкрементальный SHA-256 поверх OpenSSL EVP.
/// update() можно вызывать сколько угодно раз, finalize() ровно один.
class Sha256Accumulator {
public:
    Sha256Accumulator();

    Sha256Accumulator(const Sha256Accumulator&) = delete;
    Sha256Accumulator& operator=(const Sha256Accumulator&) = delete;
    Sha256Accumulator(Sha256Accumulator&&) noexcept = default;
    Sha256Accumulator& operator=(Sha256Accumulator&&) noexcept = default;

    [[nodiscard]] auto update(std::span<const std::byte> data) -> VoidResult;
    [[nodiscard]] auto finalize() -> Result<Digest>;

    [[nodiscard]] auto is_finalized() const -> bool { return finalized_; }
    [[nodiscard]] auto bytes_hashed() const -> std::uint64_t { return bytes_hashed_; }

private:
    EvpMdCtxPtr ctx_;
    std::uint64_t bytes_hashed_ = 0;
    bool finalized_ = false;
};

// Дайджест буфера целиком (одним вызовом)
[[nodiscard]] auto sha256_of(std::span<const std::byte> data) -> Result<Digest>;

} // namespace cverify::infra
