#include "TrayError.hpp"

namespace tray_icon {

TrayError::TrayError(ErrorKind kind, const std::string& message, int nativeCode)
    : std::runtime_error(toString(kind) + ": " + message)
    , kind_(kind)
    , nativeCode_(nativeCode) {
}

TrayError TrayError::resourceAllocationFailed(const std::string& what) {
    return TrayError(ErrorKind::ResourceAllocationFailed, what);
}

TrayError TrayError::hookRegistrationFailed(const std::string& what) {
    return TrayError(ErrorKind::HookRegistrationFailed, what);
}

TrayError TrayError::nativeApiError(const std::string& what, int code) {
    return TrayError(ErrorKind::NativeApiError,
                     what + " (code " + std::to_string(code) + ")", code);
}

}
