#pragma once

#include <cstddef>
#include <memory>
#include <span>

namespace cverify::core {

// Один буфер на всю операцию: читаем в него, хешируем из него, пишем из него.
// Размер фиксируется в конструкторе и больше не меняется.
class ChunkBuffer {
public:
    explicit ChunkBuffer(std::size_t capacity)
        : data_(capacity > 0 ? std::make_unique_for_overwrite<std::byte[]>(capacity) : nullptr)
        , capacity_(capacity) {}

    ChunkBuffer(const ChunkBuffer&) = delete;
    ChunkBuffer& operator=(const ChunkBuffer&) = delete;

    [[nodiscard]] auto data() const -> const std::byte* { return data_.get(); }
    [[nodiscard]] auto capacity() const -> std::size_t { return capacity_; }

    [[nodiscard]] auto writable() -> std::span<std::byte> { return {data_.get(), capacity_}; }

    // Ровно прочитанный срез, а не вся ёмкость
    [[nodiscard]] auto slice(std::size_t n) const -> std::span<const std::byte> {
        return {data_.get(), n};
    }

private:
    std::unique_ptr<std::byte[]> data_;
    std::size_t capacity_;
};

} // namespace cverify::core
