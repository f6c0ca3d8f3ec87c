#include <termspace/action/Target.hpp>

namespace TS {

FunctionTarget::FunctionTarget(std::string id, Handler handler)
    : targetId(std::move(id)), handler(std::move(handler)) {}

auto FunctionTarget::handleAction(Action const& action) -> bool {
    if (!this->handler)
        return false;
    return this->handler(action);
}

TargetChain::TargetChain(std::string id) : chainId(std::move(id)) {}

auto TargetChain::addTarget(std::shared_ptr<Target> target) -> void {
    if (!target)
        return;
    std::lock_guard<std::mutex> lock(this->mutex);
    this->targets.push_back(std::move(target));
}

auto TargetChain::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->targets.size();
}

auto TargetChain::handleAction(Action const& action) -> bool {
    std::vector<std::shared_ptr<Target>> members;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        members = this->targets;
    }
    for (auto const& member : members) {
        if (member->handleAction(action))
            return true;
    }
    return false;
}

} // namespace TS
