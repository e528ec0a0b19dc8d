#include "sha256.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <iterator>

namespace cverify::infra {

namespace {

auto openssl_error(std::string_view what) -> Error {
    unsigned long err_code = ERR_get_error();
    char buf[256] = {};
    ERR_error_string_n(err_code, buf, sizeof(buf));
    return make_error(ErrorCode::Unknown, fmt::format("SHA-256: {} ({})", what, buf));
}

} // namespace

void EvpMdCtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    if (ctx) {
        EVP_MD_CTX_free(ctx);
    }
}

std::string Digest::hex() const {
    std::string out;
    out.reserve(size * 2);
    for (auto b : bytes_) {
        fmt::format_to(std::back_inserter(out), "{:02x}", b);
    }
    return out;
}

Sha256Accumulator::Sha256Accumulator()
    : ctx_(EVP_MD_CTX_new())
{
    // Ошибка инициализации всплывёт при первом update()/finalize()
    if (ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        ctx_.reset();
    }
}

auto Sha256Accumulator::update(std::span<const std::byte> data) -> VoidResult {
    if (finalized_) {
        return std::unexpected(make_error(ErrorCode::Unknown, "SHA-256: update after finalize"));
    }
    if (!ctx_) {
        return std::unexpected(openssl_error("context initialization failed"));
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
        return std::unexpected(openssl_error("EVP_DigestUpdate failed"));
    }
    bytes_hashed_ += data.size();
    return {};
}

auto Sha256Accumulator::finalize() -> Result<Digest> {
    if (finalized_) {
        return std::unexpected(make_error(ErrorCode::Unknown, "SHA-256: finalize called twice"));
    }
    if (!ctx_) {
        return std::unexpected(openssl_error("context initialization failed"));
    }

    Digest digest;
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.bytes_.data(), &len) != 1 || len != Digest::size) {
        return std::unexpected(openssl_error("EVP_DigestFinal_ex failed"));
    }
    finalized_ = true;
    return digest;
}

auto sha256_of(std::span<const std::byte> data) -> Result<Digest> {
    Sha256Accumulator acc;
    if (auto res = acc.update(data); !res) {
        return std::unexpected(std::move(res.error()));
    }
    return acc.finalize();
}

} // namespace cverify::infra
