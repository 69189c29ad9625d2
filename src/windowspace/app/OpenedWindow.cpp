#include <windowspace/app/OpenedWindow.hpp>

#include <utility>

namespace WS {

OpenedWindow::OpenedWindow()
    : cell_(std::make_shared<Cell>()) {}

auto OpenedWindow::get() const -> std::shared_ptr<PlatformWindow> {
    std::lock_guard<std::mutex> lock(cell_->mutex);
    return cell_->window;
}

auto OpenedWindow::id() const -> std::optional<WindowId> {
    std::lock_guard<std::mutex> lock(cell_->mutex);
    if (!cell_->window) {
        return std::nullopt;
    }
    return cell_->window->id();
}

auto OpenedWindow::set(std::shared_ptr<PlatformWindow> window) const -> void {
    std::lock_guard<std::mutex> lock(cell_->mutex);
    cell_->window = std::move(window);
}

auto OpenedWindow::clear() const -> std::shared_ptr<PlatformWindow> {
    std::lock_guard<std::mutex> lock(cell_->mutex);
    return std::exchange(cell_->window, nullptr);
}

} // namespace WS
