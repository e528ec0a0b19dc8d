#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace cverify::args_parser{
    struct CLIArgs;
}

namespace cverify::infra {


struct Config {
    // I/O
    std::optional<std::uint32_t> threads;     // параллельных операций в CLI
    std::optional<std::size_t> buffer_size;   // bytes

    // Behavior
    bool verify = true;
    bool preserve_metadata = true;
    bool progress = true;
    bool quiet = false;

    // Logging: trace|debug|info|warn|error|critical|off
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.cverify.yaml
///   2. $XDG_CONFIG_HOME/cverify/config.yaml
///   3. ~/.config/cverify/config.yaml
/// Возвращает Config по умолчанию, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Разбор конкретного файла (без поиска)
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const cverify::args_parser::CLIArgs& args) -> Config;

} // namespace cverify::infra
