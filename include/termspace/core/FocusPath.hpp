#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

// Chain of component ids from the outermost container down to the focused
// component. Rendered as a "."-joined string.
class FocusPath {
public:
    FocusPath() = default;
    explicit FocusPath(std::vector<std::string> segments) : parts(std::move(segments)) {}

    [[nodiscard]] static auto fromString(std::string_view joined) -> FocusPath;

    [[nodiscard]] auto append(std::string id) const -> FocusPath;
    [[nodiscard]] auto parent() const -> FocusPath;
    // Innermost id, empty when the path is empty.
    [[nodiscard]] auto current() const -> std::string;

    auto push(std::string id) -> void;
    auto pop() -> std::optional<std::string>;

    [[nodiscard]] auto empty() const -> bool { return this->parts.empty(); }
    [[nodiscard]] auto size() const -> std::size_t { return this->parts.size(); }
    [[nodiscard]] auto segments() const -> std::vector<std::string> const& { return this->parts; }
    [[nodiscard]] auto toString() const -> std::string;

    auto operator==(FocusPath const&) const -> bool = default;

private:
    std::vector<std::string> parts;
};

} // namespace TS
