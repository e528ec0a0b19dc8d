#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>
#include "../hash/digest.hpp"

namespace cverify::infra {

enum class ErrorCode {
    // Фатальные ошибки (операция прекращается, повтор бессмысленен)
    SourceNotFound,
    PathError,
    IncompleteWrite,
    VerificationRead,
    HashMismatch,
    InvalidArgument,

    // Восстанавливаемые (вызывающий может повторить операцию целиком)
    IoError,

    // Системные
    Unknown,
};

// Фаза операции, в которой произошла ошибка
enum class Stage {
    Validate,
    Copy,
    Verify,
    Finalize,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Контекст операции
    std::filesystem::path path;
    Stage stage = Stage::Validate;
    int os_error = 0;
    std::optional<Digest> source_digest;
    std::optional<Digest> destination_digest;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::IoError;
    }

    auto at(Stage s, const std::filesystem::path& p) && -> Error&& {
        stage = s;
        path = p;
        return std::move(*this);
    }
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto code_name(ErrorCode code) -> std::string_view;
[[nodiscard]] auto stage_name(Stage stage) -> std::string_view;

// Вспомогательные функции-конструкторы
[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Ошибка системного вызова: errno попадает в os_error и в текст
[[nodiscard]] auto make_os_error(
    ErrorCode code,
    std::string_view what,
    const std::filesystem::path& path,
    int err,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace cverify::infra
