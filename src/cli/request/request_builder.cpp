#include "request_builder.hpp"
#include <set>
#include <system_error>
#include <fmt/core.h>

namespace cverify::cli {

auto make_request(const infra::Config& config,
                  const std::filesystem::path& source,
                  const std::filesystem::path& destination) -> core::CopyRequest
{
    return core::CopyRequest{
        .source_path = source,
        .destination_path = destination,
        .buffer_size_bytes = config.buffer_size,
        .compute_hash = config.verify,
        .preserve_metadata = config.preserve_metadata
    };
}

auto plan_requests(const infra::Config& config,
                   const std::vector<std::string>& sources,
                   const std::filesystem::path& destination)
    -> infra::Result<std::vector<core::CopyRequest>>
{
    std::error_code ec;
    const bool dest_is_dir = std::filesystem::is_directory(destination, ec);

    std::vector<core::CopyRequest> requests;
    if (sources.size() == 1 && !dest_is_dir) {
        requests.push_back(make_request(config, sources.front(), destination));
        return requests;
    }

    if (std::filesystem::exists(destination, ec) && !dest_is_dir) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                             fmt::format("Destination must be a directory for {} sources: {}",
                                         sources.size(), destination.string())));
    }

    // Два источника с одним именем перезаписали бы друг друга
    std::set<std::filesystem::path> names;
    for (const auto& src : sources) {
        std::filesystem::path source(src);
        auto name = source.filename();
        if (!names.insert(name).second) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                 fmt::format("Duplicate file name among sources: {}", name.string())));
        }
        requests.push_back(make_request(config, source, destination / name));
    }
    return requests;
}

} // namespace cverify::cli
