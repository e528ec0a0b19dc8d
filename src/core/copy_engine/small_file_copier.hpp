#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include "stream_copy_engine.hpp"

namespace cverify::core {

// Копирование файла целиком: одно чтение в буфер по размеру файла,
// один хеш, одна запись, fsync. Без цикла и без замеров по интервалам.
// Если источник оказался длиннее или короче file_size, это IoError.
class SmallFileCopier {
public:
    explicit SmallFileCopier(bool compute_hash) : compute_hash_(compute_hash) {}

    [[nodiscard]] auto copy(adapters::fs::InputFile& src,
                            adapters::fs::OutputFile& dst,
                            std::uint64_t file_size,
                            const OperationControl& control,
                            std::string_view file_label = {},
                            const std::filesystem::path& source_path = {})
        -> infra::Result<CopyPassResult>;

private:
    bool compute_hash_;
};

} // namespace cverify::core
