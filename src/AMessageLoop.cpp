#include <AMessageLoop>

#include <IWindowSystem.h>
#include <iostream>

AMessageLoop::AMessageLoop(IWindowSystem& system) : system_(system) {}

ELoopExit AMessageLoop::run() {
    while (state_ == ELoopState::Running) {
        AMessage message;
        const EGetMessageResult result = system_.getMessage(message);

        switch (result) {
        case EGetMessageResult::Error:
            state_ = ELoopState::Stopped;
            exit_ = ELoopExit::RetrievalFailed;
            error_ = {EWindowError::EventRetrievalFailed, system_.lastErrorCode()};
            std::cerr << "[Loop] failed to get message: " << error_.osCode << std::endl;
            break;
        case EGetMessageResult::Quit:
            state_ = ELoopState::Stopped;
            exit_ = ELoopExit::Quit;
            exitCode_ = static_cast<int>(message.wParam);
            break;
        case EGetMessageResult::Message:
            system_.translateMessage(message);
            // Returns only once the procedure has handled the message.
            system_.dispatchMessage(message);
            ++dispatched_;
            break;
        }
    }

    return exit_;
}

ELoopState AMessageLoop::state() const {
    return state_;
}

ELoopExit AMessageLoop::exitReason() const {
    return exit_;
}

int AMessageLoop::exitCode() const {
    return exitCode_;
}

uint64_t AMessageLoop::dispatchedCount() const {
    return dispatched_;
}

const AWindowError& AMessageLoop::lastError() const {
    return error_;
}
