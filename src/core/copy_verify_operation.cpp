#include "copy_verify_operation.hpp"
#include <algorithm>
#include <chrono>
#include <string>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "copy_engine/small_file_copier.hpp"
#include "copy_engine/stream_copy_engine.hpp"
#include "verifier/destination_verifier.hpp"
#include "../extensions/metadata.hpp"

namespace cverify::core {

namespace {

using infra::ErrorCode;
using infra::Stage;

auto fail(infra::Error&& err) -> infra::Result<CopyOutcome> {
    return std::unexpected(infra::log_and_return(std::move(err)));
}

// Буфер не больше файла, но не меньше минимального
auto buffer_for(std::size_t configured, std::uint64_t file_size) -> std::size_t {
    const auto wanted = std::max<std::uint64_t>(file_size, kMinBufferSize);
    return static_cast<std::size_t>(std::min<std::uint64_t>(configured, wanted));
}

auto to_mb_per_sec(double bytes_per_sec) -> double {
    return bytes_per_sec / (1024.0 * 1024.0);
}

} // namespace

CopyVerifyOperation::CopyVerifyOperation(const adapters::fs::FileSystem& fs,
                                         CopyStrategySelector selector)
    : fs_(fs), selector_(selector) {}

auto CopyVerifyOperation::execute(const CopyRequest& request, const OperationControl& control) const
    -> infra::Result<CopyOutcome>
{
    const auto started = std::chrono::steady_clock::now();
    const auto& src = request.source_path;
    const auto& dst = request.destination_path;

    // 1. Источник: существует и это обычный файл
    auto size = adapters::fs::regular_file_size(src);
    if (!size) {
        return fail(std::move(size.error()).at(Stage::Validate, src));
    }

    // 2. Назначение: не каталог и не сам источник
    if (dst.empty() || !dst.has_filename()) {
        return fail(infra::make_error(ErrorCode::PathError,
                    fmt::format("Invalid destination path: '{}'", dst.string()))
                    .at(Stage::Validate, dst));
    }
    std::error_code ec;
    if (std::filesystem::exists(dst, ec)) {
        if (std::filesystem::is_directory(dst, ec)) {
            return fail(infra::make_error(ErrorCode::PathError,
                        fmt::format("Destination is a directory: {}", dst.string()))
                        .at(Stage::Validate, dst));
        }
        if (std::filesystem::equivalent(src, dst, ec)) {
            return fail(infra::make_error(ErrorCode::PathError,
                        fmt::format("Destination is the source file: {}", dst.string()))
                        .at(Stage::Validate, dst));
        }
    }

    if (auto parent = adapters::fs::ensure_parent_directory(dst); !parent) {
        return fail(std::move(parent.error()).at(Stage::Validate, dst));
    }

    // 3. Стратегия
    const auto strategy = selector_.select(*size);
    const auto buffer_size = buffer_for(effective_buffer_size(request), *size);
    const std::string label = src.filename().string();

    spdlog::debug("Copy {} -> {}: {} bytes, strategy {}, buffer {} bytes, hash {}",
                  src.string(), dst.string(), *size, strategy_name(strategy),
                  buffer_size, request.compute_hash ? "on" : "off");

    // 4. Копирование
    auto in = fs_.open_input(src);
    if (!in) {
        auto err = std::move(in.error());
        err.code = ErrorCode::SourceNotFound;
        return fail(std::move(err).at(Stage::Validate, src));
    }

    auto out = fs_.open_output(dst);
    if (!out) {
        auto err = std::move(out.error());
        err.code = ErrorCode::PathError;
        return fail(std::move(err).at(Stage::Validate, dst));
    }

    infra::Result<CopyPassResult> pass = [&] {
        if (strategy == CopyStrategy::Small) {
            return SmallFileCopier(request.compute_hash).copy(**in, **out, *size, control, label, src);
        }
        StreamCopyEngine engine(buffer_size, request.compute_hash);
        return engine.copy(**in, **out, *size, control, label);
    }();

    // Дескриптор записи закрывается до верификации
    in->reset();
    auto closed = (*out)->close();
    out->reset();

    if (!pass) {
        auto err = std::move(pass.error());
        if (err.path.empty()) err.path = dst;
        return fail(std::move(err));
    }
    if (!closed) {
        return fail(std::move(closed.error()).at(Stage::Copy, dst));
    }

    CopyOutcome outcome{
        .status = pass->status,
        .strategy_used = strategy,
        .bytes_copied = pass->bytes_copied,
        .chunks = pass->chunks,
        .buffer_size = strategy == CopyStrategy::Small ? static_cast<std::size_t>(*size) : buffer_size,
        .source_digest = pass->source_digest,
        .average_speed = pass->average_speed,
        .peak_speed = pass->peak_speed
    };

    if (outcome.status == CopyStatus::Cancelled) {
        outcome.duration = std::chrono::steady_clock::now() - started;
        spdlog::info("Cancelled: {} ({} of {} bytes written, destination left unverified)",
                     dst.string(), outcome.bytes_copied, *size);
        return outcome;
    }

    // 5. Верификация: новое чтение назначения с диска
    if (request.compute_hash) {
        DestinationVerifier verifier(fs_, buffer_for(effective_buffer_size(request), outcome.bytes_copied));
        auto verified = verifier.verify(dst, outcome.bytes_copied, control, label);
        if (!verified) {
            return fail(std::move(verified.error()));
        }
        if (verified->status == CopyStatus::Cancelled) {
            outcome.status = CopyStatus::Cancelled;
            outcome.duration = std::chrono::steady_clock::now() - started;
            spdlog::info("Cancelled during verification: {}", dst.string());
            return outcome;
        }

        outcome.destination_digest = verified->digest;
        if (!outcome.source_digest || outcome.source_digest != outcome.destination_digest) {
            auto err = infra::make_error(ErrorCode::HashMismatch,
                fmt::format("Hash verification failed: {} does not match {}", dst.string(), src.string()));
            err.source_digest = outcome.source_digest;
            err.destination_digest = outcome.destination_digest;
            return fail(std::move(err).at(Stage::Verify, dst));
        }
        outcome.verified = true;
    }

    // 6. Метаданные: best effort
    if (request.preserve_metadata) {
        auto metadata_res = extensions::copy_metadata(src, dst);
        if (!metadata_res) {
            spdlog::warn("Failed to copy metadata for {}: {}",
                        src.string(), metadata_res.error().message);
        } else {
            outcome.metadata_preserved = true;
        }
    }

    outcome.duration = std::chrono::steady_clock::now() - started;

    spdlog::info("Copied {} -> {}: {} bytes in {:.2f}s ({:.1f} MB/s, {}){}",
                 src.string(), dst.string(), outcome.bytes_copied,
                 std::chrono::duration<double>(outcome.duration).count(),
                 to_mb_per_sec(outcome.average_speed), strategy_name(strategy),
                 outcome.verified ? fmt::format(", sha256 {}", outcome.destination_digest->hex()) : "");
    return outcome;
}

} // namespace cverify::core
