#include "stream_copy_engine.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../throughput/throughput_sampler.hpp"
#include "../../infra/hash/sha256.hpp"

namespace cverify::core {

StreamCopyEngine::StreamCopyEngine(std::size_t buffer_size, bool compute_hash)
    : buffer_(buffer_size), compute_hash_(compute_hash) {}

auto StreamCopyEngine::fail(infra::Error&& err) -> infra::Result<CopyPassResult> {
    state_ = EngineState::Failed;
    err.stage = infra::Stage::Copy;
    return std::unexpected(std::move(err));
}

auto StreamCopyEngine::copy(adapters::fs::InputFile& src,
                            adapters::fs::OutputFile& dst,
                            std::uint64_t total_bytes,
                            const OperationControl& control,
                            std::string_view file_label)
    -> infra::Result<CopyPassResult>
{
    std::optional<infra::Sha256Accumulator> hasher;
    if (compute_hash_) {
        hasher.emplace();
    }

    ThroughputSampler sampler;
    sampler.start();

    CopyPassResult result{};
    ProgressEvent event{
        .phase = Phase::CopyingAndHashing,
        .file = file_label,
        .total_bytes = total_bytes
    };
    control.report(event);

    spdlog::debug("Streaming {} ({} bytes) with {} byte buffer", file_label, total_bytes, buffer_.capacity());

    for (;;) {
        if (control.is_cancelled()) {
            state_ = EngineState::Cancelled;
            result.status = CopyStatus::Cancelled;
            spdlog::info("Copy of {} cancelled after {} bytes ({} chunks)",
                         file_label, result.bytes_copied, result.chunks);
            return result;
        }

        if (control.pause_gate) {
            control.pause_gate->wait_while_paused(control.cancelled);
            if (control.is_cancelled()) continue;
        }

        state_ = EngineState::Reading;
        auto n = src.read(buffer_.writable());
        if (!n) {
            return fail(std::move(n.error()));
        }
        if (*n == 0) {
            break; // EOF
        }

        const auto chunk = buffer_.slice(*n);

        state_ = EngineState::HashingWriting;
        if (hasher) {
            if (auto h = hasher->update(chunk); !h) {
                return fail(std::move(h.error()));
            }
        }

        auto written = dst.write(chunk);
        if (!written) {
            return fail(std::move(written.error()));
        }
        if (*written != chunk.size()) {
            // Дописывать со сдвигом не будем: за такую копию движок не ручается
            return fail(infra::make_error(infra::ErrorCode::IncompleteWrite,
                fmt::format("Incomplete write: {} of {} bytes at offset {}",
                            *written, chunk.size(), result.bytes_copied)));
        }

        result.bytes_copied += *n;
        ++result.chunks;

        if (auto sample = sampler.record(*n)) {
            event.bytes_done = result.bytes_copied;
            event.current_speed = sample->current_speed;
            event.average_speed = sample->average_speed;
            control.report(event);
        }
    }

    state_ = EngineState::Flushing;
    if (auto synced = dst.sync(); !synced) {
        return fail(std::move(synced.error()));
    }

    state_ = EngineState::Finalizing;
    if (hasher) {
        auto digest = hasher->finalize();
        if (!digest) {
            return fail(std::move(digest.error()));
        }
        result.source_digest = *digest;
    }

    const auto last = sampler.finish();
    result.average_speed = last.average_speed;
    result.peak_speed = sampler.peak_speed();

    event.bytes_done = result.bytes_copied;
    event.current_speed = last.current_speed;
    event.average_speed = last.average_speed;
    control.report(event);

    state_ = EngineState::Completed;
    return result;
}

} // namespace cverify::core
