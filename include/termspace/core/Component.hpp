#pragma once
#include <string>

namespace TS {

/**
 * Base of every widget that can be attached to a layout node.
 *
 * Behaviour is opted into through the capability interfaces a widget also
 * derives from: Measurable (layout), Focusable (focus), Paintable (paint),
 * Inspectable (state snapshots) and Target (action routing). Subsystems query
 * a capability once per node per pass with dynamic_cast.
 */
class Component {
public:
    virtual ~Component() = default;

    [[nodiscard]] virtual auto id() const -> std::string   = 0;
    [[nodiscard]] virtual auto type() const -> std::string = 0;
};

template <typename Capability>
[[nodiscard]] auto capability(Component* component) -> Capability* {
    return dynamic_cast<Capability*>(component);
}

template <typename Capability>
[[nodiscard]] auto capability(Component const* component) -> Capability const* {
    return dynamic_cast<Capability const*>(component);
}

} // namespace TS
