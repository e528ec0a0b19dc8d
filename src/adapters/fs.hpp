#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include "infra/error_handler/error.hpp"

namespace cverify::adapters::fs {

// Источник байтов для копирования/верификации
class InputFile {
public:
    virtual ~InputFile() = default;

    // Читает, пока span не заполнен или не достигнут EOF.
    // 0 означает конец потока.
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> = 0;
};

// Приёмник байтов. write() возвращает число байт, которое сообщила ОС
class OutputFile {
public:
    virtual ~OutputFile() = default;

    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> infra::Result<std::size_t> = 0;
    [[nodiscard]] virtual auto sync() -> infra::VoidResult = 0;
    [[nodiscard]] virtual auto close() -> infra::VoidResult = 0;
};

class FileSystem {
public:
    virtual ~FileSystem() = default;

    [[nodiscard]] virtual auto open_input(const std::filesystem::path& path) const
        -> infra::Result<std::unique_ptr<InputFile>> = 0;

    // Создаёт или усекает файл
    [[nodiscard]] virtual auto open_output(const std::filesystem::path& path) const
        -> infra::Result<std::unique_ptr<OutputFile>> = 0;
};

// =============== POSIX ===============

class PosixInputFile final : public InputFile {
public:
    PosixInputFile(int fd, std::filesystem::path path);
    ~PosixInputFile() override;

    PosixInputFile(const PosixInputFile&) = delete;
    PosixInputFile& operator=(const PosixInputFile&) = delete;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> override;

private:
    int fd_;
    std::filesystem::path path_;
};

class PosixOutputFile final : public OutputFile {
public:
    PosixOutputFile(int fd, std::filesystem::path path);
    ~PosixOutputFile() override;

    PosixOutputFile(const PosixOutputFile&) = delete;
    PosixOutputFile& operator=(const PosixOutputFile&) = delete;

    [[nodiscard]] auto write(std::span<const std::byte> data) -> infra::Result<std::size_t> override;
    [[nodiscard]] auto sync() -> infra::VoidResult override;
    [[nodiscard]] auto close() -> infra::VoidResult override;

private:
    int fd_;
    std::filesystem::path path_;
};

class PosixFileSystem final : public FileSystem {
public:
    [[nodiscard]] auto open_input(const std::filesystem::path& path) const
        -> infra::Result<std::unique_ptr<InputFile>> override;
    [[nodiscard]] auto open_output(const std::filesystem::path& path) const
        -> infra::Result<std::unique_ptr<OutputFile>> override;
};

[[nodiscard]] auto posix_file_system() -> const FileSystem&;

// Размер обычного файла; SourceNotFound, если пути нет или это не файл
[[nodiscard]] auto regular_file_size(const std::filesystem::path& path)
    -> infra::Result<std::uintmax_t>;

// Создаёт родительский каталог назначения при отсутствии
[[nodiscard]] auto ensure_parent_directory(const std::filesystem::path& path)
    -> infra::VoidResult;

} // namespace cverify::adapters::fs
