#pragma once
#include <termspace/action/Action.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace TS {

// Anything that can receive a routed Action. handleAction returns true when
// the action was consumed.
class Target {
public:
    virtual ~Target() = default;

    [[nodiscard]] virtual auto id() const -> std::string       = 0;
    virtual auto handleAction(Action const& action) -> bool = 0;
};

class FunctionTarget final : public Target {
public:
    using Handler = std::function<bool(Action const&)>;

    FunctionTarget(std::string id, Handler handler);

    [[nodiscard]] auto id() const -> std::string override { return this->targetId; }
    auto handleAction(Action const& action) -> bool override;

private:
    std::string targetId;
    Handler     handler;
};

// Offers an action to each member in order until one handles it.
class TargetChain final : public Target {
public:
    explicit TargetChain(std::string id);

    auto addTarget(std::shared_ptr<Target> target) -> void;
    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto id() const -> std::string override { return this->chainId; }
    auto handleAction(Action const& action) -> bool override;

private:
    std::string                          chainId;
    mutable std::mutex                   mutex;
    std::vector<std::shared_ptr<Target>> targets;
};

class NoOpTarget final : public Target {
public:
    explicit NoOpTarget(std::string id) : targetId(std::move(id)) {}

    [[nodiscard]] auto id() const -> std::string override { return this->targetId; }
    auto handleAction(Action const&) -> bool override { return false; }

private:
    std::string targetId;
};

} // namespace TS
