#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace cverify::infra {
    void Config::merge_with(const Config& other) {
        if (other.threads) threads = other.threads;
        if (other.buffer_size) buffer_size = other.buffer_size;
        if (other.log_level) log_level = other.log_level;

        // CLI может только выключить
        if (!other.verify) verify = false;
        if (!other.preserve_metadata) preserve_metadata = false;
        if (!other.progress) progress = false;
        if (other.quiet) quiet = true;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".cverify.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "cverify" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "cverify" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from_path(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["threads"]) cfg.threads = config["threads"].as<std::uint32_t>();
            if (config["buffer_size"]) cfg.buffer_size = config["buffer_size"].as<std::size_t>();

            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["preserve_metadata"]) cfg.preserve_metadata = config["preserve_metadata"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (cfg.threads && *cfg.threads == 0) {
                return std::unexpected(fmt::format("Invalid {}: threads must be positive", path.string()));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from_path(path);
        }

        // Файл не найден: конфиг по умолчанию, это не ошибка
        return Config{};
    }


    auto config_from_cli(const cverify::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.threads = args.threads;
        cfg.buffer_size = args.buffer_size;
        cfg.verify = !args.no_verify;
        cfg.preserve_metadata = !args.no_preserve_metadata;
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        if (args.verbose) cfg.log_level = "debug";
        return cfg;
    }

} // namespace cverify::infra
