#pragma once
#include <termspace/core/Error.hpp>
#include <termspace/core/Geometry.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

namespace TS {

/**
 * Terminal abstraction consumed by the runtime: raw bytes in, rendered text out.
 */
class Platform {
public:
    virtual ~Platform() = default;

    virtual auto init() -> Expected<void>  = 0;
    virtual auto close() -> Expected<void> = 0;

    [[nodiscard]] virtual auto size() const -> Size = 0;

    // Reads available bytes into buffer, waiting at most timeout.
    // Returns 0 when nothing arrived in time.
    virtual auto readInput(std::span<char> buffer, std::chrono::milliseconds timeout) -> Expected<std::size_t> = 0;

    virtual auto writeString(std::string_view text) -> Expected<void> = 0;
    virtual auto clear() -> Expected<void>                             = 0;

    // A size change observed since the last call.
    virtual auto takeResize() -> std::optional<Size> { return std::nullopt; }

    // Best-effort return to cooked mode; safe to call from a failure path.
    virtual auto restoreTerminal() noexcept -> void {}
};

} // namespace TS
