#include <AWindow>

#include <IWindowSystem.h>
#include <iostream>

AWindow::AWindow(IWindowSystem& system) : system_(system) {}

bool AWindow::create(AWindowClassId classId, const std::string& title, AInstanceHandle instance) {
    desc_ = AWindowCreateDesc{};
    desc_.classId = classId;
    desc_.title = title;
    desc_.instance = instance;
    error_ = {};

    handle_ = system_.createWindow(desc_);
    if (!handle_) {
        error_ = {EWindowError::WindowCreationFailed, system_.lastErrorCode()};
        std::cerr << "[Window] failed to create window: " << error_.osCode << std::endl;
        return false;
    }

    return true;
}

bool AWindow::isCreated() const {
    return handle_.isValid();
}

AWindowHandle AWindow::getNativeHandle() const {
    return handle_;
}

const AWindowCreateDesc& AWindow::getDesc() const {
    return desc_;
}

const AWindowError& AWindow::lastError() const {
    return error_;
}
