#include "fs.hpp"

#include <cerrno>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cverify::adapters::fs {

using infra::ErrorCode;

// =============== Input ===============

PosixInputFile::PosixInputFile(int fd, std::filesystem::path path)
    : fd_(fd), path_(std::move(path)) {}

PosixInputFile::~PosixInputFile() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

auto PosixInputFile::read(std::span<std::byte> buffer) -> infra::Result<std::size_t> {
    std::size_t total = 0;
    while (total < buffer.size()) {
        ssize_t n = ::read(fd_, buffer.data() + total, buffer.size() - total);
        if (n == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_os_error(ErrorCode::IoError, "Read failed", path_, errno));
        }
        if (n == 0) break; // EOF
        total += static_cast<std::size_t>(n);
    }
    return total;
}

// =============== Output ===============

PosixOutputFile::PosixOutputFile(int fd, std::filesystem::path path)
    : fd_(fd), path_(std::move(path)) {}

PosixOutputFile::~PosixOutputFile() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

auto PosixOutputFile::write(std::span<const std::byte> data) -> infra::Result<std::size_t> {
    // Один вызов write(2): короткую запись не дописываем, а отдаём наверх
    for (;;) {
        ssize_t n = ::write(fd_, data.data(), data.size());
        if (n == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_os_error(ErrorCode::IoError, "Write failed", path_, errno));
        }
        return static_cast<std::size_t>(n);
    }
}

auto PosixOutputFile::sync() -> infra::VoidResult {
    if (::fsync(fd_) == -1) {
        return std::unexpected(infra::make_os_error(ErrorCode::IoError, "fsync failed", path_, errno));
    }
    return {};
}

auto PosixOutputFile::close() -> infra::VoidResult {
    if (fd_ == -1) return {};
    int fd = fd_;
    fd_ = -1;
    if (::close(fd) == -1 && errno != EINTR) {
        return std::unexpected(infra::make_os_error(ErrorCode::IoError, "close failed", path_, errno));
    }
    return {};
}

// =============== FileSystem ===============

auto PosixFileSystem::open_input(const std::filesystem::path& path) const
    -> infra::Result<std::unique_ptr<InputFile>>
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(infra::make_os_error(ErrorCode::IoError, "Cannot open", path, errno));
    }
#ifdef POSIX_FADV_SEQUENTIAL
    (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);
#endif
    return std::make_unique<PosixInputFile>(fd, path);
}

auto PosixFileSystem::open_output(const std::filesystem::path& path) const
    -> infra::Result<std::unique_ptr<OutputFile>>
{
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd == -1) {
        return std::unexpected(infra::make_os_error(ErrorCode::IoError, "Cannot create", path, errno));
    }
    return std::make_unique<PosixOutputFile>(fd, path);
}

auto posix_file_system() -> const FileSystem& {
    static const PosixFileSystem instance;
    return instance;
}

// =============== Helpers ===============

auto regular_file_size(const std::filesystem::path& path) -> infra::Result<std::uintmax_t> {
    std::error_code ec;
    auto st = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(st)) {
        return std::unexpected(infra::make_error(ErrorCode::SourceNotFound,
                             fmt::format("Source does not exist: {}", path.string())));
    }
    if (!std::filesystem::is_regular_file(st)) {
        return std::unexpected(infra::make_error(ErrorCode::SourceNotFound,
                             fmt::format("Source is not a regular file: {}", path.string())));
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(ErrorCode::SourceNotFound,
                             fmt::format("Cannot stat source {}: {}", path.string(), ec.message())));
    }
    return size;
}

auto ensure_parent_directory(const std::filesystem::path& path) -> infra::VoidResult {
    auto parent = path.parent_path();
    if (parent.empty()) return {};

    std::error_code ec;
    if (std::filesystem::is_directory(parent, ec)) return {};

    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return std::unexpected(infra::make_error(ErrorCode::PathError,
                             fmt::format("Cannot create destination directory {}: {}",
                                         parent.string(), ec.message())));
    }
    spdlog::debug("Created destination directory {}", parent.string());
    return {};
}

} // namespace cverify::adapters::fs
