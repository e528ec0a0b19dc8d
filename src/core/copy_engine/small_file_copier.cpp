#include "small_file_copier.hpp"
#include <array>
#include <chrono>
#include <fmt/core.h>
#include "chunk_buffer.hpp"
#include "../../infra/hash/sha256.hpp"

namespace cverify::core {

namespace {

auto in_copy_stage(infra::Error&& err) -> infra::Error {
    err.stage = infra::Stage::Copy;
    return std::move(err);
}

} // namespace

auto SmallFileCopier::copy(adapters::fs::InputFile& src,
                           adapters::fs::OutputFile& dst,
                           std::uint64_t file_size,
                           const OperationControl& control,
                           std::string_view file_label,
                           const std::filesystem::path& source_path)
    -> infra::Result<CopyPassResult>
{
    CopyPassResult result{};
    if (control.is_cancelled()) {
        result.status = CopyStatus::Cancelled;
        return result;
    }
    if (control.pause_gate) {
        control.pause_gate->wait_while_paused(control.cancelled);
        if (control.is_cancelled()) {
            result.status = CopyStatus::Cancelled;
            return result;
        }
    }

    const auto start = std::chrono::steady_clock::now();

    ChunkBuffer buffer(static_cast<std::size_t>(file_size));
    auto n = src.read(buffer.writable());
    if (!n) {
        return std::unexpected(in_copy_stage(std::move(n.error())));
    }

    // Источник должен закончиться ровно на file_size: хвост, дописанный после
    // проверки размера, иначе молча потеряется, а верификация его не заметит
    std::array<std::byte, 1> tail{};
    auto extra = src.read(tail);
    if (!extra) {
        return std::unexpected(in_copy_stage(std::move(extra.error())));
    }
    if (*n != file_size || *extra != 0) {
        auto err = infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Source {} changed during copy: expected {} bytes, read {}{}",
                        source_path.empty() ? std::string(file_label) : source_path.string(), file_size, *n, *extra != 0 ? " and more" : ""));
        err.path = source_path;
        return std::unexpected(in_copy_stage(std::move(err)));
    }

    const auto data = buffer.slice(*n);

    if (compute_hash_) {
        auto digest = infra::sha256_of(data);
        if (!digest) {
            return std::unexpected(in_copy_stage(std::move(digest.error())));
        }
        result.source_digest = *digest;
    }

    if (!data.empty()) {
        auto written = dst.write(data);
        if (!written) {
            return std::unexpected(in_copy_stage(std::move(written.error())));
        }
        if (*written != data.size()) {
            return std::unexpected(in_copy_stage(infra::make_error(infra::ErrorCode::IncompleteWrite,
                fmt::format("Incomplete write: {} of {} bytes", *written, data.size()))));
        }
        result.chunks = 1;
    }

    if (auto synced = dst.sync(); !synced) {
        return std::unexpected(in_copy_stage(std::move(synced.error())));
    }

    result.bytes_copied = *n;

    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    result.average_speed = seconds > 0.0 ? static_cast<double>(*n) / seconds : 0.0;
    result.peak_speed = result.average_speed;

    control.report(ProgressEvent{
        .phase = Phase::CopyingAndHashing,
        .file = file_label,
        .bytes_done = result.bytes_copied,
        .total_bytes = file_size,
        .current_speed = result.average_speed,
        .average_speed = result.average_speed
    });
    return result;
}

} // namespace cverify::core
