#include <AWindowProcedure>

#include <IWindowSystem.h>
#include <iostream>

APaintScope::APaintScope(IWindowSystem& system, AWindowHandle window)
    : system_(system), window_(window) {
    context_ = system_.beginPaint(window_, session_);
}

APaintScope::~APaintScope() {
    if (context_) {
        system_.endPaint(window_, session_);
    }
}

bool APaintScope::isAcquired() const {
    return context_.isValid();
}

ADeviceContext APaintScope::getContext() const {
    return context_;
}

const ARect& APaintScope::getRegion() const {
    return session_.region;
}

AWindowProcedure::AWindowProcedure(IWindowSystem& system, APaintToggle& toggle)
    : system_(system), toggle_(toggle) {}

intptr_t AWindowProcedure::handle(const AMessage& message) {
    switch (message.kind) {
    case EMessageKind::Close:
        return onClose(message);
    case EMessageKind::Destroy:
        return onDestroy(message);
    case EMessageKind::Paint:
        return onPaint(message);
    default:
        return system_.defaultProcedure(message.window, message.id, message.wParam, message.lParam);
    }
}

const APaintToggle& AWindowProcedure::getPaintToggle() const {
    return toggle_;
}

const AWindowError& AWindowProcedure::lastError() const {
    return error_;
}

intptr_t AWindowProcedure::onClose(const AMessage& message) {
    // Destroy arrives later as its own message.
    if (!system_.destroyWindow(message.window)) {
        std::cerr << "[Window] failed to destroy window: " << system_.lastErrorCode() << std::endl;
    }
    return 0;
}

intptr_t AWindowProcedure::onDestroy(const AMessage&) {
    system_.postQuit(0);
    return 0;
}

intptr_t AWindowProcedure::onPaint(const AMessage& message) {
    APaintScope paint(system_, message.window);
    if (!paint.isAcquired()) {
        error_ = {EWindowError::PaintAcquisitionFailed, system_.lastErrorCode()};
        std::cerr << "[Paint] failed to begin paint: no display device context available" << std::endl;
        return 0;
    }

    const ARect& region = paint.getRegion();
#ifndef NDEBUG
    const glm::ivec2 origin = region.origin();
    const glm::ivec2 extent = region.extent();
    std::cout << "[Paint] x: " << origin.x << ", y: " << origin.y
              << ", width: " << extent.x << ", height: " << extent.y << std::endl;
#endif

    if (!system_.fillPattern(paint.getContext(), region, toggle_.current())) {
        std::cerr << "[Paint] failed to fill region with " << toString(toggle_.current())
                  << ": " << system_.lastErrorCode() << std::endl;
    }

    toggle_.flip();
    return 0;
}
