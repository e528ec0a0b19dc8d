#include "destination_verifier.hpp"
#include <string>
#include <spdlog/spdlog.h>
#include "../copy_engine/chunk_buffer.hpp"
#include "../throughput/throughput_sampler.hpp"
#include "../../infra/hash/sha256.hpp"

namespace cverify::core {

namespace {

auto hash_stream(adapters::fs::InputFile& in,
                 std::size_t buffer_size,
                 std::uint64_t expected_bytes,
                 Phase phase,
                 std::string_view label,
                 const OperationControl& control)
    -> infra::Result<HashPassResult>
{
    ChunkBuffer buffer(buffer_size);
    infra::Sha256Accumulator hasher;
    ThroughputSampler sampler;
    sampler.start();

    HashPassResult result{};
    ProgressEvent event{.phase = phase, .file = label, .total_bytes = expected_bytes};
    control.report(event);

    for (;;) {
        if (control.is_cancelled()) {
            result.status = CopyStatus::Cancelled;
            return result;
        }
        if (control.pause_gate) {
            control.pause_gate->wait_while_paused(control.cancelled);
            if (control.is_cancelled()) continue;
        }

        auto n = in.read(buffer.writable());
        if (!n) {
            return std::unexpected(std::move(n.error()));
        }
        if (*n == 0) break;

        if (auto h = hasher.update(buffer.slice(*n)); !h) {
            return std::unexpected(std::move(h.error()));
        }
        result.bytes_read += *n;

        if (auto sample = sampler.record(*n)) {
            event.bytes_done = result.bytes_read;
            event.current_speed = sample->current_speed;
            event.average_speed = sample->average_speed;
            control.report(event);
        }
    }

    auto digest = hasher.finalize();
    if (!digest) {
        return std::unexpected(std::move(digest.error()));
    }
    result.digest = *digest;

    const auto last = sampler.finish();
    result.average_speed = last.average_speed;

    event.bytes_done = result.bytes_read;
    event.current_speed = last.current_speed;
    event.average_speed = last.average_speed;
    control.report(event);
    return result;
}

} // namespace

DestinationVerifier::DestinationVerifier(const adapters::fs::FileSystem& fs, std::size_t buffer_size)
    : fs_(fs), buffer_size_(buffer_size) {}

auto DestinationVerifier::verify(const std::filesystem::path& destination,
                                 std::uint64_t expected_bytes,
                                 const OperationControl& control,
                                 std::string_view file_label) const
    -> infra::Result<HashPassResult>
{
    auto to_verification_error = [&](infra::Error&& err) {
        if (err.code == infra::ErrorCode::IoError) {
            err.code = infra::ErrorCode::VerificationRead;
        }
        err.stage = infra::Stage::Verify;
        err.path = destination;
        return std::unexpected(std::move(err));
    };

    auto in = fs_.open_input(destination);
    if (!in) {
        return to_verification_error(std::move(in.error()));
    }

    const std::string fallback_label = destination.filename().string();
    auto res = hash_stream(**in, buffer_size_, expected_bytes, Phase::Verifying,
                           file_label.empty() ? std::string_view(fallback_label) : file_label,
                           control);
    if (!res) {
        return to_verification_error(std::move(res.error()));
    }

    if (res->status == CopyStatus::Completed && res->bytes_read != expected_bytes) {
        spdlog::warn("Destination {} holds {} bytes, {} were written",
                     destination.string(), res->bytes_read, expected_bytes);
    }
    return res;
}

auto digest_file(const std::filesystem::path& path,
                 std::size_t buffer_size,
                 const OperationControl& control,
                 const adapters::fs::FileSystem& fs)
    -> infra::Result<HashPassResult>
{
    auto size = adapters::fs::regular_file_size(path);
    if (!size) {
        return std::unexpected(std::move(size.error()).at(infra::Stage::Validate, path));
    }

    auto in = fs.open_input(path);
    if (!in) {
        auto err = std::move(in.error());
        err.code = infra::ErrorCode::SourceNotFound;
        return std::unexpected(std::move(err).at(infra::Stage::Validate, path));
    }

    auto res = hash_stream(**in, buffer_size, *size, Phase::Hashing,
                           path.filename().native(), control);
    if (!res) {
        return std::unexpected(std::move(res.error()).at(infra::Stage::Copy, path));
    }
    return res;
}

} // namespace cverify::core
