#pragma once
#include <tray-icon/Types.hpp>
#include <cstdint>
#include <memory>
#include <optional>

namespace tray_icon {

class ErasedCallback;
class NativeTraySurface;
class SharedTrayState;
struct NativeMessage;

std::optional<ClickType> decodeClick(std::uint32_t rawCode);

/*
 * Non-generic receiver of the native messages of one tray surface.
 *
 * Owns the erased user callback and a reference to the shared tray state
 * until the surface reports ResourceDestroyed; both are released exactly
 * once at that point and every later message is ignored. Surfaces never
 * deliver ResourceDestroyed from within another delivery.
 */
class TrayEventHook {
public:
    TrayEventHook(std::uint32_t trayId,
                  std::shared_ptr<SharedTrayState> state,
                  std::unique_ptr<ErasedCallback> callback);
    ~TrayEventHook();

    TrayEventHook(const TrayEventHook&) = delete;
    TrayEventHook& operator=(const TrayEventHook&) = delete;

    void handleMessage(NativeTraySurface& surface, const NativeMessage& message);

    bool isFinalized() const { return finalized_; }
    std::uint32_t trayId() const { return trayId_; }

private:
    void handleClick(NativeTraySurface& surface, std::uint32_t rawCode);
    void handleCommand(std::uint32_t id);
    void release();

    std::uint32_t trayId_;
    std::shared_ptr<SharedTrayState> state_;
    std::unique_ptr<ErasedCallback> callback_;
    bool finalized_{false};
};

}
