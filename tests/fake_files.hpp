#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "adapters/fs.hpp"
#include "core/copy_types.hpp"

namespace cverify::test {

// Источник в памяти
class MemoryInput final : public adapters::fs::InputFile {
public:
    explicit MemoryInput(std::vector<std::byte> data) : data_(std::move(data)) {}

    auto read(std::span<std::byte> buffer) -> infra::Result<std::size_t> override {
        const auto n = std::min(buffer.size(), data_.size() - pos_);
        if (n > 0) {
            std::memcpy(buffer.data(), data_.data() + pos_, n);
        }
        pos_ += n;
        return n;
    }

private:
    std::vector<std::byte> data_;
    std::size_t pos_ = 0;
};

// Приёмник в памяти; запоминает адрес каждого переданного буфера.
// short_write_at: номер записи (с 0), на которой ОС "записала" меньше.
class MemoryOutput final : public adapters::fs::OutputFile {
public:
    std::vector<std::byte> data;
    std::vector<const std::byte*> write_pointers;
    std::vector<std::size_t> write_sizes;
    std::size_t short_write_at = static_cast<std::size_t>(-1);
    int syncs = 0;
    std::function<void()> after_write;

    auto write(std::span<const std::byte> chunk) -> infra::Result<std::size_t> override {
        const auto index = write_pointers.size();
        write_pointers.push_back(chunk.data());
        write_sizes.push_back(chunk.size());

        auto n = chunk.size();
        if (index == short_write_at && n > 0) {
            n = n / 2;
        }
        data.insert(data.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
        if (after_write) after_write();
        return n;
    }

    auto sync() -> infra::VoidResult override {
        ++syncs;
        return {};
    }

    auto close() -> infra::VoidResult override { return {}; }
};

// Собирает все события прогресса
class RecordingSink final : public core::ProgressSink {
public:
    struct Record {
        core::Phase phase;
        std::string file;
        std::uint64_t bytes_done;
        std::uint64_t total_bytes;
    };

    void on_progress(const core::ProgressEvent& event) override {
        std::lock_guard lock(mutex_);
        events_.push_back({event.phase, std::string(event.file), event.bytes_done, event.total_bytes});
    }

    [[nodiscard]] auto events() const -> std::vector<Record> {
        std::lock_guard lock(mutex_);
        return events_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Record> events_;
};

} // namespace cverify::test
