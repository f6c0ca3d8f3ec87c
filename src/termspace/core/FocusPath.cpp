#include <termspace/core/FocusPath.hpp>

namespace TS {

auto FocusPath::fromString(std::string_view joined) -> FocusPath {
    FocusPath path;
    if (joined.empty())
        return path;
    std::size_t start = 0;
    while (true) {
        auto dot = joined.find('.', start);
        auto part = joined.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
        if (!part.empty())
            path.parts.emplace_back(part);
        if (dot == std::string_view::npos)
            break;
        start = dot + 1;
    }
    return path;
}

auto FocusPath::append(std::string id) const -> FocusPath {
    auto copy = *this;
    copy.parts.push_back(std::move(id));
    return copy;
}

auto FocusPath::parent() const -> FocusPath {
    if (this->parts.empty())
        return {};
    return FocusPath{std::vector<std::string>(this->parts.begin(), this->parts.end() - 1)};
}

auto FocusPath::current() const -> std::string {
    return this->parts.empty() ? std::string{} : this->parts.back();
}

auto FocusPath::push(std::string id) -> void {
    this->parts.push_back(std::move(id));
}

auto FocusPath::pop() -> std::optional<std::string> {
    if (this->parts.empty())
        return std::nullopt;
    auto last = std::move(this->parts.back());
    this->parts.pop_back();
    return last;
}

auto FocusPath::toString() const -> std::string {
    std::string out;
    for (std::size_t i = 0; i < this->parts.size(); ++i) {
        if (i > 0)
            out.push_back('.');
        out.append(this->parts[i]);
    }
    return out;
}

} // namespace TS
