#include <windowspace/platform/HeadlessPlatform.hpp>
#include <windowspace/log/TaggedLogger.hpp>

#include <algorithm>
#include <cmath>

namespace WS {

namespace {

struct WindowEventItem {
    WindowId    id;
    WindowEvent event;
};
struct RedrawItem {
    WindowId id;
};
struct WakeItem {};
struct SystemThemeItem {
    Theme theme;
};
struct ExitItem {
    int code;
};

using Item = std::variant<WindowEventItem, RedrawItem, WakeItem, SystemThemeItem, ExitItem>;

enum class LoopState {
    Idle,
    Running,
    Stopped,
};

} // namespace

struct HeadlessWindow::Shared {
    mutable std::mutex                              mutex;
    std::condition_variable                         cv;
    std::deque<Item>                                items;
    LoopState                                       state = LoopState::Idle;
    std::optional<int>                              exitCode;
    std::uint64_t                                   nextId = 1;
    std::map<WindowId, std::weak_ptr<HeadlessWindow>> windows;
    std::optional<std::string>                      failNextCreate;
    std::vector<MonitorInfo>                        monitors;

    auto push(Item item) -> bool {
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            if (this->state == LoopState::Stopped) {
                return false;
            }
            this->items.push_back(std::move(item));
        }
        this->cv.notify_one();
        return true;
    }
};

namespace {

class HeadlessProxy final : public LoopProxy {
public:
    explicit HeadlessProxy(std::shared_ptr<HeadlessWindow::Shared> shared)
        : shared_(std::move(shared)) {}

    auto wake() -> bool override {
        return shared_->push(WakeItem{});
    }

private:
    std::shared_ptr<HeadlessWindow::Shared> shared_;
};

auto decorated_outer(WindowSize inner, bool decorations) -> WindowSize {
    return WindowSize{inner.width, inner.height + (decorations ? HeadlessWindow::kTitleBarHeight : 0u)};
}

} // namespace

HeadlessWindow::HeadlessWindow(std::shared_ptr<Shared> shared, WindowId id, WindowAttributes const& attributes)
    : shared_(std::move(shared))
    , id_(id)
    , title_(attributes.title)
    , visible_(attributes.visible)
    , focused_(attributes.visible && attributes.active)
    , theme_(attributes.preferred_theme)
    , decorations_(attributes.decorations)
    , resizable_(attributes.resizable)
    , fullscreen_(attributes.fullscreen)
    , contentProtected_(attributes.content_protected)
    , level_(attributes.window_level)
    , minInnerSize_(attributes.min_inner_size)
    , maxInnerSize_(attributes.max_inner_size)
    , parent_(attributes.parent) {
    this->setInnerSizeLocked(this->clampToLimits(attributes.inner_size.value_or(WindowSize{800, 600})));
    this->setOuterPositionLocked(attributes.position.value_or(WindowPosition{0, 0}));
}

HeadlessWindow::~HeadlessWindow() {
    ws_log("HeadlessWindow destroyed " + to_string(id_), "Platform");
    if (!shared_->push(WindowEventItem{id_, Event::Destroyed{}})) {
        ws_log("Loop already stopped; Destroyed not queued for " + to_string(id_), "Platform");
    }
}

auto HeadlessWindow::id() const -> WindowId {
    return id_;
}

auto HeadlessWindow::title() const -> std::string {
    std::lock_guard<std::mutex> lock(mutex_);
    return title_;
}

auto HeadlessWindow::setTitle(std::string const& title) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    title_ = title;
}

auto HeadlessWindow::isVisible() const -> std::optional<bool> {
    std::lock_guard<std::mutex> lock(mutex_);
    return visible_;
}

auto HeadlessWindow::setVisible(bool visible) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    visible_ = visible;
}

auto HeadlessWindow::hasFocus() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return focused_;
}

auto HeadlessWindow::focusWindow() -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    focused_ = true;
}

auto HeadlessWindow::innerSize() const -> WindowSize {
    std::lock_guard<std::mutex> lock(mutex_);
    return innerSize_;
}

auto HeadlessWindow::outerSize() const -> WindowSize {
    std::lock_guard<std::mutex> lock(mutex_);
    return outerSize_;
}

auto HeadlessWindow::requestInnerSize(WindowSize size) -> std::optional<WindowSize> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!resizable_ || fullscreen_) {
        return std::nullopt;
    }
    this->setInnerSizeLocked(this->clampToLimits(size));
    return innerSize_;
}

auto HeadlessWindow::setMinInnerSize(std::optional<WindowSize> size) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    minInnerSize_ = size;
}

auto HeadlessWindow::setMaxInnerSize(std::optional<WindowSize> size) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    maxInnerSize_ = size;
}

auto HeadlessWindow::innerPosition() const -> std::optional<WindowPosition> {
    std::lock_guard<std::mutex> lock(mutex_);
    return innerPosition_;
}

auto HeadlessWindow::outerPosition() const -> std::optional<WindowPosition> {
    std::lock_guard<std::mutex> lock(mutex_);
    return outerPosition_;
}

auto HeadlessWindow::setOuterPosition(WindowPosition position) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    this->setOuterPositionLocked(position);
}

auto HeadlessWindow::scaleFactor() const -> double {
    std::lock_guard<std::mutex> lock(mutex_);
    return scale_;
}

auto HeadlessWindow::theme() const -> std::optional<Theme> {
    std::lock_guard<std::mutex> lock(mutex_);
    return theme_;
}

auto HeadlessWindow::setTheme(std::optional<Theme> theme) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    theme_ = theme;
}

auto HeadlessWindow::setDecorations(bool decorations) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    decorations_ = decorations;
    outerSize_   = decorated_outer(innerSize_, decorations_);
    this->setOuterPositionLocked(outerPosition_);
}

auto HeadlessWindow::setResizable(bool resizable) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    resizable_ = resizable;
}

auto HeadlessWindow::setFullscreen(std::optional<Fullscreen> fullscreen) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    fullscreen_ = fullscreen;
}

auto HeadlessWindow::setContentProtected(bool enabled) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    contentProtected_ = enabled;
}

auto HeadlessWindow::setWindowLevel(WindowLevel level) -> void {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

auto HeadlessWindow::requestRedraw() -> void {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++redrawRequests_;
    }
    if (!shared_->push(RedrawItem{id_})) {
        ws_log("Redraw for " + to_string(id_) + " after the loop stopped", "Platform");
    }
}

auto HeadlessWindow::decorations() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return decorations_;
}

auto HeadlessWindow::resizable() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return resizable_;
}

auto HeadlessWindow::fullscreen() const -> std::optional<Fullscreen> {
    std::lock_guard<std::mutex> lock(mutex_);
    return fullscreen_;
}

auto HeadlessWindow::contentProtected() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return contentProtected_;
}

auto HeadlessWindow::windowLevel() const -> WindowLevel {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

auto HeadlessWindow::minInnerSize() const -> std::optional<WindowSize> {
    std::lock_guard<std::mutex> lock(mutex_);
    return minInnerSize_;
}

auto HeadlessWindow::maxInnerSize() const -> std::optional<WindowSize> {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxInnerSize_;
}

auto HeadlessWindow::parent() const -> std::optional<WindowId> {
    return parent_;
}

auto HeadlessWindow::redrawRequests() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return redrawRequests_;
}

auto HeadlessWindow::clampToLimits(WindowSize size) const -> WindowSize {
    if (minInnerSize_) {
        size.width  = std::max(size.width, minInnerSize_->width);
        size.height = std::max(size.height, minInnerSize_->height);
    }
    if (maxInnerSize_) {
        size.width  = std::min(size.width, maxInnerSize_->width);
        size.height = std::min(size.height, maxInnerSize_->height);
    }
    return size;
}

auto HeadlessWindow::setInnerSizeLocked(WindowSize size) -> void {
    innerSize_ = size;
    outerSize_ = decorated_outer(size, decorations_);
}

auto HeadlessWindow::setOuterPositionLocked(WindowPosition position) -> void {
    outerPosition_ = position;
    innerPosition_ = WindowPosition{position.x,
                                    position.y + static_cast<std::int32_t>(decorations_ ? kTitleBarHeight : 0u)};
}

HeadlessPlatform::HeadlessPlatform()
    : shared_(std::make_shared<HeadlessWindow::Shared>()) {
    shared_->monitors.push_back(MonitorInfo{.name = "Headless-1",
                                            .position = WindowPosition{0, 0},
                                            .size = WindowSize{1920, 1080},
                                            .scale_factor = 1.0,
                                            .refresh_rate_millihertz = 60000});
}

HeadlessPlatform::~HeadlessPlatform() {
    std::deque<Item> discarded;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->state = LoopState::Stopped;
        discarded.swap(shared_->items);
    }
}

auto HeadlessPlatform::run(LoopHandler& handler) -> int {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->state = LoopState::Running;
        shared_->exitCode.reset();
    }
    ws_log("HeadlessPlatform loop starting", "Platform");
    handler.resumed(*this);

    while (true) {
        Item item;
        {
            std::unique_lock<std::mutex> lock(shared_->mutex);
            shared_->cv.wait(lock, [this] { return shared_->exitCode.has_value() || !shared_->items.empty(); });
            if (shared_->exitCode) {
                break;
            }
            item = std::move(shared_->items.front());
            shared_->items.pop_front();
        }

        std::visit(
            [&](auto& entry) {
                using T = std::decay_t<decltype(entry)>;
                if constexpr (std::is_same_v<T, WindowEventItem>) {
                    handler.windowEvent(*this, entry.id, std::move(entry.event));
                } else if constexpr (std::is_same_v<T, RedrawItem>) {
                    handler.redrawRequested(*this, entry.id);
                } else if constexpr (std::is_same_v<T, WakeItem>) {
                    handler.wakeUp(*this);
                } else if constexpr (std::is_same_v<T, SystemThemeItem>) {
                    handler.systemThemeChanged(*this, entry.theme);
                } else {
                    this->exit(entry.code);
                }
            },
            item);
    }

    handler.exiting(*this);

    int              code = 0;
    std::deque<Item> discarded;
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        shared_->state = LoopState::Stopped;
        code           = shared_->exitCode.value_or(0);
        discarded.swap(shared_->items);
    }
    ws_log("HeadlessPlatform loop stopped with code " + std::to_string(code), "Platform");
    return code;
}

auto HeadlessPlatform::proxy() -> std::shared_ptr<LoopProxy> {
    return std::make_shared<HeadlessProxy>(shared_);
}

auto HeadlessPlatform::createWindow(WindowAttributes const& attributes) -> Expected<std::shared_ptr<PlatformWindow>> {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->failNextCreate) {
        auto message = std::move(*shared_->failNextCreate);
        shared_->failNextCreate.reset();
        return std::unexpected(Error{Error::Code::PlatformError, std::move(message)});
    }
    if (attributes.parent && shared_->windows.find(*attributes.parent) == shared_->windows.end()) {
        return std::unexpected(Error{Error::Code::InvalidParent, "unknown parent " + to_string(*attributes.parent)});
    }
    auto id     = WindowId{shared_->nextId++};
    auto window = std::shared_ptr<HeadlessWindow>(new HeadlessWindow(shared_, id, attributes));
    shared_->windows.emplace(id, window);
    return std::static_pointer_cast<PlatformWindow>(window);
}

auto HeadlessPlatform::monitors() const -> std::vector<MonitorInfo> {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->monitors;
}

auto HeadlessPlatform::primaryMonitor() const -> std::optional<MonitorInfo> {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    if (shared_->monitors.empty()) {
        return std::nullopt;
    }
    return shared_->monitors.front();
}

auto HeadlessPlatform::exit(int code) -> void {
    {
        std::lock_guard<std::mutex> lock(shared_->mutex);
        if (!shared_->exitCode) {
            shared_->exitCode = code;
        }
    }
    shared_->cv.notify_all();
}

auto HeadlessPlatform::requestExit(int code) -> void {
    if (!shared_->push(ExitItem{code})) {
        ws_log("Exit requested after the loop stopped", "Platform");
    }
}

auto HeadlessPlatform::setMonitors(std::vector<MonitorInfo> monitors) -> void {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->monitors = std::move(monitors);
}

auto HeadlessPlatform::failNextCreate(std::string message) -> void {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->failNextCreate = std::move(message);
}

auto HeadlessPlatform::window(WindowId id) const -> std::shared_ptr<HeadlessWindow> {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    auto it = shared_->windows.find(id);
    if (it == shared_->windows.end()) {
        return nullptr;
    }
    return it->second.lock();
}

auto HeadlessPlatform::createdWindows() const -> std::vector<WindowId> {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    std::vector<WindowId> ids;
    ids.reserve(shared_->windows.size());
    for (auto const& [id, _] : shared_->windows) {
        ids.push_back(id);
    }
    return ids;
}

auto HeadlessPlatform::isRunning() const -> bool {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    return shared_->state == LoopState::Running;
}

auto HeadlessPlatform::simulateEvent(WindowId id, WindowEvent event) -> void {
    if (!shared_->push(WindowEventItem{id, std::move(event)})) {
        ws_log("Event for " + to_string(id) + " after the loop stopped", "Platform");
    }
}

auto HeadlessPlatform::simulateResize(WindowId id, WindowSize size) -> void {
    if (auto target = this->window(id)) {
        {
            std::lock_guard<std::mutex> lock(target->mutex_);
            target->setInnerSizeLocked(size);
        }
        this->simulateEvent(id, Event::Resized{size});
    }
}

auto HeadlessPlatform::simulateMove(WindowId id, WindowPosition outerPosition) -> void {
    if (auto target = this->window(id)) {
        {
            std::lock_guard<std::mutex> lock(target->mutex_);
            target->setOuterPositionLocked(outerPosition);
        }
        this->simulateEvent(id, Event::Moved{outerPosition});
    }
}

auto HeadlessPlatform::simulateScaleFactor(WindowId id, double scale) -> void {
    if (auto target = this->window(id)) {
        {
            std::lock_guard<std::mutex> lock(target->mutex_);
            auto const ratio = scale / target->scale_;
            auto const inner = WindowSize{static_cast<std::uint32_t>(std::lround(target->innerSize_.width * ratio)),
                                          static_cast<std::uint32_t>(std::lround(target->innerSize_.height * ratio))};
            target->scale_ = scale;
            target->setInnerSizeLocked(inner);
        }
        this->simulateEvent(id, Event::ScaleFactorChanged{scale});
    }
}

auto HeadlessPlatform::simulateFocus(WindowId id, bool focused) -> void {
    if (auto target = this->window(id)) {
        {
            std::lock_guard<std::mutex> lock(target->mutex_);
            target->focused_ = focused;
        }
        this->simulateEvent(id, Event::Focused{focused});
    }
}

auto HeadlessPlatform::simulateOcclusion(WindowId id, bool occluded) -> void {
    this->simulateEvent(id, Event::Occluded{occluded});
}

auto HeadlessPlatform::simulateTheme(WindowId id, Theme theme) -> void {
    if (auto target = this->window(id)) {
        {
            std::lock_guard<std::mutex> lock(target->mutex_);
            target->theme_ = theme;
        }
        this->simulateEvent(id, Event::ThemeChanged{theme});
    }
}

auto HeadlessPlatform::simulateCloseRequest(WindowId id) -> void {
    this->simulateEvent(id, Event::CloseRequested{});
}

auto HeadlessPlatform::simulateRedraw(WindowId id) -> void {
    if (!shared_->push(RedrawItem{id})) {
        ws_log("Redraw for " + to_string(id) + " after the loop stopped", "Platform");
    }
}

auto HeadlessPlatform::simulateSystemTheme(Theme theme) -> void {
    if (!shared_->push(SystemThemeItem{theme})) {
        ws_log("Theme change after the loop stopped", "Platform");
    }
}

} // namespace WS
