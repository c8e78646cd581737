#include <AWindowClass>

#include <IWindowSystem.h>
#include <iostream>

AWindowClass::AWindowClass(IWindowSystem& system) : system_(system) {}

AWindowClassDesc AWindowClass::describe(AInstanceHandle instance, AWindowProcedure* procedure,
                                        ACursorHandle cursor, const std::string& className) {
    AWindowClassDesc desc;
    desc.style = EClassStyle::HorizontalRedraw | EClassStyle::VerticalRedraw | EClassStyle::OwnDeviceContext;
    desc.procedure = procedure;
    desc.instance = instance;
    desc.cursor = cursor;
    desc.className = className;
    return desc;
}

bool AWindowClass::registerClass(AInstanceHandle instance, AWindowProcedure* procedure,
                                 ACursorHandle cursor, const std::string& className) {
    desc_ = describe(instance, procedure, cursor, className);
    id_ = AWindowClassId{};
    error_ = {};

    // The OS would call through a null procedure on the first message.
    if (!desc_.procedure) {
        error_ = {EWindowError::ClassRegistrationFailed, 0};
        std::cerr << "[Window] failed to register window class '" << className
                  << "': no window procedure" << std::endl;
        return false;
    }

    id_ = system_.registerClass(desc_);
    if (!id_) {
        error_ = {EWindowError::ClassRegistrationFailed, system_.lastErrorCode()};
        std::cerr << "[Window] failed to register window class '" << className
                  << "': " << error_.osCode << std::endl;
        return false;
    }

    return true;
}

bool AWindowClass::isRegistered() const {
    return id_.isValid();
}

AWindowClassId AWindowClass::getId() const {
    return id_;
}

const AWindowClassDesc& AWindowClass::getDesc() const {
    return desc_;
}

const AWindowError& AWindowClass::lastError() const {
    return error_;
}
