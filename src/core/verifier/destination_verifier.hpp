#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include "../copy_types.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/hash/digest.hpp"

namespace cverify::core {

struct HashPassResult {
    CopyStatus status = CopyStatus::Completed;
    std::optional<infra::Digest> digest;   // есть только при Completed
    std::uint64_t bytes_read = 0;
    double average_speed = 0.0;
};

/// Повторно открывает записанный файл новым дескриптором и считает дайджест
/// с нуля. Ничего из фазы записи не используется.
/// Ошибки чтения отдаются как VerificationRead, а не IoError.
/// file_label: ключ файла в событиях прогресса, по умолчанию имя назначения.
class DestinationVerifier {
public:
    DestinationVerifier(const adapters::fs::FileSystem& fs, std::size_t buffer_size);

    [[nodiscard]] auto verify(const std::filesystem::path& destination,
                              std::uint64_t expected_bytes,
                              const OperationControl& control,
                              std::string_view file_label = {}) const
        -> infra::Result<HashPassResult>;

private:
    const adapters::fs::FileSystem& fs_;
    std::size_t buffer_size_;
};

// Дайджест произвольного файла тем же путём чтения (режим --hash-only)
[[nodiscard]] auto digest_file(const std::filesystem::path& path,
                               std::size_t buffer_size,
                               const OperationControl& control,
                               const adapters::fs::FileSystem& fs = adapters::fs::posix_file_system())
    -> infra::Result<HashPassResult>;

} // namespace cverify::core
