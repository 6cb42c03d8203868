#include "SharedTrayState.hpp"
#include "CompiledMenu.hpp"
#include <mutex>
#include <utility>

namespace tray_icon {

class SharedTrayState::Private {
public:
    mutable std::mutex mutex;
    std::shared_ptr<const CompiledMenu> menu;
    std::optional<std::string> tooltip;
};

SharedTrayState::SharedTrayState(std::shared_ptr<const CompiledMenu> menu,
                                 std::optional<std::string> tooltip)
    : d(std::make_unique<Private>()) {
    d->menu = std::move(menu);
    d->tooltip = std::move(tooltip);
}

SharedTrayState::~SharedTrayState() = default;

std::shared_ptr<const CompiledMenu> SharedTrayState::menu() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->menu;
}

void SharedTrayState::replaceMenu(std::shared_ptr<const CompiledMenu> menu) {
    std::shared_ptr<const CompiledMenu> previous;
    {
        std::lock_guard<std::mutex> lock(d->mutex);
        previous = std::exchange(d->menu, std::move(menu));
    }
    // previous is released here, outside the lock
}

std::optional<std::string> SharedTrayState::tooltip() const {
    std::lock_guard<std::mutex> lock(d->mutex);
    return d->tooltip;
}

void SharedTrayState::setTooltip(std::optional<std::string> tooltip) {
    std::lock_guard<std::mutex> lock(d->mutex);
    d->tooltip = std::move(tooltip);
}

std::optional<std::any> SharedTrayState::lookupSignal(std::uint32_t id) const {
    std::lock_guard<std::mutex> lock(d->mutex);
    if (!d->menu) {
        return std::nullopt;
    }
    const std::any* signal = d->menu->find(id);
    if (!signal) {
        return std::nullopt;
    }
    return *signal;
}

}
