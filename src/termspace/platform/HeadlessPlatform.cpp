#include <termspace/platform/HeadlessPlatform.hpp>

#include <algorithm>
#include <cstring>
#include <utility>

namespace TS {

HeadlessPlatform::HeadlessPlatform(Size size)
    : current(size) {}

auto HeadlessPlatform::init() -> Expected<void> {
    std::lock_guard lock(this->mutex);
    this->open = true;
    return {};
}

auto HeadlessPlatform::close() -> Expected<void> {
    {
        std::lock_guard lock(this->mutex);
        this->open = false;
    }
    this->inputReady.notify_all();
    return {};
}

auto HeadlessPlatform::size() const -> Size {
    std::lock_guard lock(this->mutex);
    return this->current;
}

auto HeadlessPlatform::readInput(std::span<char> buffer, std::chrono::milliseconds timeout) -> Expected<std::size_t> {
    std::unique_lock lock(this->mutex);
    this->inputReady.wait_for(lock, timeout, [&] { return !this->scripted.empty() || !this->open; });
    if (this->scripted.empty() || buffer.empty())
        return std::size_t{0};

    auto&       front = this->scripted.front();
    std::size_t n     = std::min(buffer.size(), front.size());
    std::memcpy(buffer.data(), front.data(), n);
    if (n == front.size())
        this->scripted.pop_front();
    else
        front.erase(0, n);
    return n;
}

auto HeadlessPlatform::writeString(std::string_view text) -> Expected<void> {
    std::lock_guard lock(this->mutex);
    if (!this->open)
        return std::unexpected(Error{Error::Code::NotAllowed, "platform not initialized"});
    this->captured.append(text);
    return {};
}

auto HeadlessPlatform::clear() -> Expected<void> {
    std::lock_guard lock(this->mutex);
    this->captured.clear();
    ++this->clears;
    return {};
}

auto HeadlessPlatform::takeResize() -> std::optional<Size> {
    std::lock_guard lock(this->mutex);
    return std::exchange(this->pendingResize, std::nullopt);
}

auto HeadlessPlatform::restoreTerminal() noexcept -> void {
    std::lock_guard lock(this->mutex);
    ++this->restores;
}

auto HeadlessPlatform::script(std::string bytes) -> void {
    {
        std::lock_guard lock(this->mutex);
        this->scripted.push_back(std::move(bytes));
    }
    this->inputReady.notify_all();
}

auto HeadlessPlatform::resize(Size size) -> void {
    std::lock_guard lock(this->mutex);
    this->current       = size;
    this->pendingResize = size;
}

auto HeadlessPlatform::output() const -> std::string {
    std::lock_guard lock(this->mutex);
    return this->captured;
}

auto HeadlessPlatform::clearOutput() -> void {
    std::lock_guard lock(this->mutex);
    this->captured.clear();
}

auto HeadlessPlatform::initialized() const -> bool {
    std::lock_guard lock(this->mutex);
    return this->open;
}

auto HeadlessPlatform::clearCount() const -> int {
    std::lock_guard lock(this->mutex);
    return this->clears;
}

auto HeadlessPlatform::restoreCount() const -> int {
    std::lock_guard lock(this->mutex);
    return this->restores;
}

auto HeadlessPlatform::pendingInput() const -> std::size_t {
    std::lock_guard lock(this->mutex);
    std::size_t total = 0;
    for (auto const& chunk : this->scripted)
        total += chunk.size();
    return total;
}

} // namespace TS
