#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include "chunk_buffer.hpp"
#include "../copy_types.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/hash/digest.hpp"

namespace cverify::core {

// Результат фазы копирования (общий для потокового и small-пути)
struct CopyPassResult {
    CopyStatus status = CopyStatus::Completed;
    std::uint64_t bytes_copied = 0;
    std::uint64_t chunks = 0;
    std::optional<infra::Digest> source_digest;
    double average_speed = 0.0;
    double peak_speed = 0.0;
};

enum class EngineState {
    Idle,
    Reading,
    HashingWriting,
    Flushing,
    Finalizing,
    Completed,
    Cancelled,
    Failed,
};

/// Однопроходный цикл read -> hash -> write по одному переиспользуемому буферу.
/// Один экземпляр обслуживает одну операцию и не разделяется между потоками.
class StreamCopyEngine {
public:
    StreamCopyEngine(std::size_t buffer_size, bool compute_hash);

    [[nodiscard]] auto copy(adapters::fs::InputFile& src,
                            adapters::fs::OutputFile& dst,
                            std::uint64_t total_bytes,
                            const OperationControl& control,
                            std::string_view file_label = {})
        -> infra::Result<CopyPassResult>;

    [[nodiscard]] auto state() const -> EngineState { return state_; }
    [[nodiscard]] auto buffer() const -> const ChunkBuffer& { return buffer_; }

private:
    auto fail(infra::Error&& err) -> infra::Result<CopyPassResult>;

    ChunkBuffer buffer_;
    bool compute_hash_;
    EngineState state_ = EngineState::Idle;
};

} // namespace cverify::core
