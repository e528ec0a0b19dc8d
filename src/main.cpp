#include <iostream>
#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "infra/thread_pool/thread_pool.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "cli/request/request_builder.hpp"
#include "core/copy_verify_operation.hpp"
#include "core/verifier/destination_verifier.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <future>
#include <vector>

using GIT = cverify::build_info::GitInfo;
using ARGS = cverify::args_parser::CLIArgs;
using CONFIG = cverify::infra::Config;
using CONTROL = cverify::core::OperationControl;
using MONITOR = cverify::infra::ProgressMonitor;

constexpr auto load_from_cli = cverify::infra::config_from_cli;
constexpr auto load_config_file = cverify::infra::load_config_from_file;
constexpr auto args_parser = cverify::args_parser::parse_args;
constexpr auto git = cverify::build_info::get_git_info();

constexpr int kExitCancelled = 130; // SIGINT

static auto
out_git_verse(const GIT& git)
-> void {
    fmt::print("cverify {}\n", git.version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git commit short: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
apply_log_level(const CONFIG& config)
-> void {
    if (config.quiet) {
        spdlog::set_level(spdlog::level::err);
        return;
    }
    if (config.log_level) {
        auto level = spdlog::level::from_str(*config.log_level);
        if (level == spdlog::level::off && *config.log_level != "off") {
            spdlog::warn("Unknown log level '{}', keeping info", *config.log_level);
            return;
        }
        spdlog::set_level(level);
    }
}

static auto
run_hash_only(const ARGS& args, const CONFIG& config, const CONTROL& control)
-> int {
    const auto buffer_size = cverify::core::effective_buffer_size(
        cverify::core::CopyRequest{.buffer_size_bytes = config.buffer_size});

    int exit_code = 0;
    for (const auto& file : args.sources) {
        auto res = cverify::core::digest_file(file, buffer_size, control);
        if (!res) {
            auto err = cverify::infra::log_and_return(std::move(res.error()));
            if (exit_code == 0) exit_code = err.to_exit_code();
            continue;
        }
        if (res->status == cverify::core::CopyStatus::Cancelled) {
            spdlog::warn("Hashing cancelled");
            return kExitCancelled;
        }
        fmt::print("{}  {}\n", res->digest->hex(), file);
    }
    return exit_code;
}

static auto
run_copy(const ARGS& args, const CONFIG& config, const CONTROL& control, MONITOR& monitor)
-> int {
    auto plan = cverify::cli::plan_requests(config, args.sources, args.destination);
    if (!plan) {
        auto err = cverify::infra::log_and_return(std::move(plan.error()));
        return err.to_exit_code();
    }

    std::uint64_t total_bytes = 0;
    for (const auto& req : *plan) {
        std::error_code ec;
        auto size = std::filesystem::file_size(req.source_path, ec);
        if (!ec) total_bytes += size;
    }
    monitor.set_total(plan->size(), total_bytes);

    const cverify::core::CopyVerifyOperation operation;
    cverify::infra::ThreadPool pool{config.threads.value_or(1)};

    spdlog::debug("Copying {} file(s) with {} worker(s)", plan->size(), pool.size());

    auto start_time = std::chrono::steady_clock::now();

    std::vector<std::future<cverify::infra::Result<cverify::core::CopyOutcome>>> futures;
    futures.reserve(plan->size());
    for (const auto& req : *plan) {
        futures.push_back(pool.enqueue_with_future([&operation, &control, &monitor, req]() {
            auto res = operation.execute(req, control);
            monitor.file_done(req.source_path.filename().string(), res ? res->bytes_copied : 0);
            return res;
        }));
    }

    struct Line { std::string digest; std::string path; };
    std::vector<Line> lines;
    std::uint64_t copied = 0, failed = 0, cancelled = 0, bytes = 0;
    int exit_code = 0;

    for (std::size_t i = 0; i < futures.size(); ++i) {
        auto res = futures[i].get();
        if (!res) {
            ++failed;
            if (exit_code == 0) exit_code = res.error().to_exit_code();
            continue;
        }
        if (res->status == cverify::core::CopyStatus::Cancelled) {
            ++cancelled;
            continue;
        }
        ++copied;
        bytes += res->bytes_copied;
        if (res->verified) {
            lines.push_back({res->destination_digest->hex(), (*plan)[i].destination_path.string()});
        }
    }

    monitor.stop();

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    for (const auto& line : lines) {
        fmt::print("{}  {}\n", line.digest, line.path);
    }

    if (!config.quiet) {
        spdlog::info("Files copied: {} ({}), failed: {}, cancelled: {}",
                     copied, cverify::infra::format_bytes(static_cast<double>(bytes)), failed, cancelled);
        spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);
        if (bytes > 0 && duration.count() > 0) {
            spdlog::info("Average speed: {}",
                         cverify::infra::format_speed(bytes / (duration.count() / 1000.0)));
        }
        if (!config.verify) {
            spdlog::warn("Verification disabled: copies were not checked against the source");
        }
    }

    if (cancelled > 0 || cverify::infra::is_interrupted()) {
        return kExitCancelled;
    }
    return exit_code;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        int parse_status = 0;
        auto args_opt = args_parser(argc, argv, parse_status);
        if (!args_opt) {
            return parse_status; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.version) {
            out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 64;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        spdlog::debug("Merging CLI config with file config...");
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет
        apply_log_level(config);

        MONITOR monitor(config.progress && !args.hash_only, config.quiet);
        CONTROL control(&monitor);
        cverify::infra::ScopedSignalHandler signals(control.cancelled);

        if (args.hash_only) {
            return run_hash_only(args, config, control);
        }
        return run_copy(args, config, control, monitor);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
