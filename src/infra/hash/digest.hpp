#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace cverify::infra {

class Sha256Accumulator;

/// 256-битный SHA-256 дайджест.
/// Создаётся только через Sha256Accumulator::finalize(), поэтому
/// частично вычисленное значение снаружи не наблюдаемо.
class Digest {
public:
    static constexpr std::size_t size = 32;

    [[nodiscard]] auto bytes() const -> const std::array<std::uint8_t, size>& { return bytes_; }
    [[nodiscard]] auto hex() const -> std::string;

    friend bool operator==(const Digest&, const Digest&) = default;

private:
    friend class Sha256Accumulator;
    Digest() = default;

    std::array<std::uint8_t, size> bytes_{};
};

} // namespace cverify::infra
