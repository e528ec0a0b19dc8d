// include/cverify/extensions/metadata.hpp
#pragma once

#include <filesystem>
#include "../infra/error_handler/error.hpp"

namespace cverify::extensions {

// Права доступа и время модификации источника -> назначение.
// Вызывается только после успешной верификации.
[[nodiscard]] auto copy_metadata(const std::filesystem::path& src,
                                 const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>;

} // namespace cverify::extensions
