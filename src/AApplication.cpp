#include <AApplication>

#include <IWindowSystem.h>
#include <iostream>
#include <utility>

AApplication::AApplication(IWindowSystem& system, AShellConfig config)
    : system_(system)
    , config_(std::move(config))
    , toggle_(config_.initialPattern)
    , procedure_(system_, toggle_)
    , windowClass_(system_)
    , window_(system_)
    , loop_(system_) {}

int AApplication::run(AInstanceHandle instance) {
    // A cursor on the class resets the shape every time the pointer enters.
    const ACursorHandle cursor = system_.loadArrowCursor();

    if (!windowClass_.registerClass(instance, &procedure_, cursor, config_.className)) {
        error_ = windowClass_.lastError();
        std::cerr << "[App] startup aborted: " << toString(error_.kind) << std::endl;
        return 0;
    }

    if (!window_.create(windowClass_.getId(), config_.title, instance)) {
        error_ = window_.lastError();
        std::cerr << "[App] startup aborted: " << toString(error_.kind) << std::endl;
        return 0;
    }

    if (loop_.run() == ELoopExit::RetrievalFailed) {
        error_ = loop_.lastError();
        std::cerr << "[App] message loop aborted: " << toString(error_.kind) << std::endl;
        return 0;
    }

    std::cout << "[App] shutdown after " << toggle_.paintCount() << " paints" << std::endl;
    return 0;
}

const AShellConfig& AApplication::getConfig() const {
    return config_;
}

const APaintToggle& AApplication::getPaintToggle() const {
    return toggle_;
}

const AWindowClass& AApplication::getWindowClass() const {
    return windowClass_;
}

const AWindow& AApplication::getWindow() const {
    return window_;
}

const AMessageLoop& AApplication::getMessageLoop() const {
    return loop_;
}

const AWindowError& AApplication::lastError() const {
    return error_;
}
