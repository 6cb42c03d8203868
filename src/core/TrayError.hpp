#pragma once
#include <tray-icon/Types.hpp>
#include <stdexcept>
#include <string>

namespace tray_icon {

class TrayError : public std::runtime_error {
public:
    TrayError(ErrorKind kind, const std::string& message, int nativeCode = 0);

    ErrorKind kind() const noexcept { return kind_; }

    // Underlying platform code, only meaningful for ErrorKind::NativeApiError
    int nativeCode() const noexcept { return nativeCode_; }

    static TrayError resourceAllocationFailed(const std::string& what);
    static TrayError hookRegistrationFailed(const std::string& what);
    static TrayError nativeApiError(const std::string& what, int code);

private:
    ErrorKind kind_;
    int nativeCode_;
};

}
