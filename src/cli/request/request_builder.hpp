#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <expected>
#include "../../core/copy_types.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"

namespace cverify::cli {

// CopyRequest из уже слитого Config: движок сам конфиг не читает
[[nodiscard]] auto make_request(const infra::Config& config,
                                const std::filesystem::path& source,
                                const std::filesystem::path& destination) -> core::CopyRequest;

/// Пары (источник, назначение) для командной строки.
/// Один источник: destination - путь файла, если это не существующий каталог.
/// Несколько источников: destination - каталог, файлы кладутся по имени.
[[nodiscard]] auto plan_requests(const infra::Config& config,
                                 const std::vector<std::string>& sources,
                                 const std::filesystem::path& destination)
    -> infra::Result<std::vector<core::CopyRequest>>;

} // namespace cverify::cli
