#pragma once

#include <windowspace/platform/Platform.hpp>

#include <memory>
#include <mutex>
#include <optional>

namespace WS {

/**
 * Shared slot holding the platform window of an open window. Empty until the
 * dispatcher has created the window, and emptied again when the registry
 * removes it, so handles never resolve a window that no longer exists.
 */
class OpenedWindow {
public:
    OpenedWindow();

    [[nodiscard]] auto get() const -> std::shared_ptr<PlatformWindow>;
    [[nodiscard]] auto id() const -> std::optional<WindowId>;

    auto set(std::shared_ptr<PlatformWindow> window) const -> void;
    auto clear() const -> std::shared_ptr<PlatformWindow>;

    auto operator==(OpenedWindow const& other) const -> bool { return cell_ == other.cell_; }

private:
    struct Cell {
        mutable std::mutex              mutex;
        std::shared_ptr<PlatformWindow> window;
    };

    std::shared_ptr<Cell> cell_;
};

} // namespace WS
