// metadata.cpp
#include <filesystem>
#include <expected>
#include <fmt/core.h>
#include "metadata.hpp"
namespace cverify::extensions {

auto copy_metadata(const std::filesystem::path& src,
                   const std::filesystem::path& dst)
    -> std::expected<void, infra::Error>
{
    std::error_code ec;

    // Права (только POSIX). Сначала права: смена прав не трогает mtime
#ifndef _WIN32
    auto perms = std::filesystem::status(src, ec).permissions();
    if (!ec) {
        std::filesystem::permissions(dst, perms, std::filesystem::perm_options::replace, ec);
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
                             fmt::format("Permission copy failed for {}: {}", dst.string(), ec.message()))
                             .at(infra::Stage::Finalize, dst));
    }
#endif

    // Временные метки
    auto time = std::filesystem::last_write_time(src, ec);
    if (!ec) {
        std::filesystem::last_write_time(dst, time, ec);
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
                             fmt::format("Timestamp copy failed for {}: {}", dst.string(), ec.message()))
                             .at(infra::Stage::Finalize, dst));
    }
    return {};
}

} // namespace cverify::extensions
