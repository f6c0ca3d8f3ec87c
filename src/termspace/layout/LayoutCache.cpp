#include "LayoutCache.hpp"

#include <algorithm>
#include <utility>

namespace TS {

LayoutCache::LayoutCache(std::size_t capacity) : capacity(capacity == 0 ? 1 : capacity) {}

auto LayoutCache::signature(std::vector<LayoutNode*> const& roots, Constraints const& constraints) -> std::string {
    std::string key = std::to_string(constraints.minWidth) + ',' + std::to_string(constraints.maxWidth) + ','
                      + std::to_string(constraints.minHeight) + ',' + std::to_string(constraints.maxHeight);
    for (auto* root : roots) {
        if (root == nullptr)
            continue;
        key.push_back('|');
        std::as_const(*root).visit([&key](LayoutNode const& node) {
            key.push_back('/');
            key.append(node.id());
            key.push_back(':');
            key.push_back(static_cast<char>('0' + static_cast<int>(node.kind())));
        });
    }
    return key;
}

auto LayoutCache::get(std::string const& key) -> std::optional<LayoutResult> {
    std::lock_guard<std::mutex> lock(this->mutex);
    auto                        it = this->entries.find(key);
    if (it == this->entries.end())
        return std::nullopt;
    return it->second;
}

auto LayoutCache::put(std::string key, LayoutResult result) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (auto it = this->entries.find(key); it != this->entries.end()) {
        it->second = std::move(result);
        return;
    }
    while (this->entries.size() >= this->capacity && !this->order.empty()) {
        this->entries.erase(this->order.front());
        this->order.pop_front();
    }
    this->order.push_back(key);
    this->entries.emplace(std::move(key), std::move(result));
}

auto LayoutCache::clear() -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->entries.clear();
    this->order.clear();
}

auto LayoutCache::erase(std::string_view nodeId) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    for (auto it = this->order.begin(); it != this->order.end();) {
        auto entry = this->entries.find(*it);
        if (entry != this->entries.end() && entry->second.findBox(nodeId) == nullptr) {
            ++it;
            continue;
        }
        if (entry != this->entries.end())
            this->entries.erase(entry);
        it = this->order.erase(it);
    }
}

auto LayoutCache::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->entries.size();
}

} // namespace TS
