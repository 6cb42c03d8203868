#pragma once
#include "Logger.hpp"
#include <tray-icon/Types.hpp>
#include <any>
#include <cstdlib>
#include <functional>
#include <typeinfo>
#include <utility>

namespace tray_icon {

// Event form seen by the native hook: menu signals are still type-erased.
using ErasedEvent = TrayEvent<std::reference_wrapper<const std::any>>;

class ErasedCallback {
public:
    virtual ~ErasedCallback() = default;
    virtual void invoke(const ErasedEvent& event) = 0;
};

/*
 * Binds a user callback to the Signal type it was built for.
 *
 * Every std::any handed to invoke() comes from a CompiledMenu produced by
 * the same TrayIconBuilder<Signal>::build call that created this wrapper,
 * so the any_cast below cannot fail unless construction itself is broken.
 * That case aborts the process instead of surfacing an error.
 */
template <typename Signal, typename Callback>
class TypedCallback final : public ErasedCallback {
public:
    explicit TypedCallback(Callback callback)
        : callback_(std::move(callback)) {
    }

    void invoke(const ErasedEvent& event) override {
        if (event.isTray()) {
            callback_(TrayEvent<Signal>::tray(event.click()));
            return;
        }

        const Signal* signal = std::any_cast<Signal>(&event.signal().get());
        if (!signal) {
            TRAY_LOG_CRITICAL(std::string("Menu signal has the wrong type: expected ") +
                              typeid(Signal).name() + ", got " +
                              event.signal().get().type().name());
            std::abort();
        }
        callback_(TrayEvent<Signal>::menu(*signal));
    }

private:
    Callback callback_;
};

}
