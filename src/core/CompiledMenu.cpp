#include "CompiledMenu.hpp"
#include "NativeTraySurface.hpp"

namespace tray_icon {

CompiledMenu::CompiledMenu(std::unique_ptr<NativeMenu> nativeMenu, SignalTable table)
    : nativeMenu_(std::move(nativeMenu))
    , table_(std::move(table)) {
}

CompiledMenu::~CompiledMenu() = default;

NativeMenu& CompiledMenu::nativeMenu() const {
    return *nativeMenu_;
}

const std::any* CompiledMenu::find(std::uint32_t id) const {
    auto it = table_.find(id);
    if (it == table_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool CompiledMenu::contains(std::uint32_t id) const {
    return table_.count(id) != 0;
}

std::vector<std::uint32_t> CompiledMenu::ids() const {
    std::vector<std::uint32_t> result;
    result.reserve(table_.size());
    for (const auto& [id, _] : table_) {
        result.push_back(id);
    }
    return result;
}

size_t CompiledMenu::size() const {
    return table_.size();
}

}
