#pragma once

#include <AMessage>
#include <ANativeHandle>
#include <APaintToggle>
#include <cstdint>

struct AWindowClassDesc;
struct AWindowCreateDesc;

enum class EGetMessageResult {
    Message,
    Quit,
    Error
};

// Host windowing services. Every call happens on the thread that owns the
// window and runs the message loop.
class IWindowSystem {
public:
    virtual ~IWindowSystem() = default;

    virtual ACursorHandle loadArrowCursor() = 0;
    virtual AWindowClassId registerClass(const AWindowClassDesc& desc) = 0;

    virtual AWindowHandle createWindow(const AWindowCreateDesc& desc) = 0;
    virtual bool destroyWindow(AWindowHandle window) = 0;

    // Blocks until a message or the quit sentinel is available.
    virtual EGetMessageResult getMessage(AMessage& message) = 0;
    virtual void translateMessage(const AMessage& message) = 0;
    virtual intptr_t dispatchMessage(const AMessage& message) = 0;
    virtual intptr_t defaultProcedure(AWindowHandle window, uint32_t id, uintptr_t wParam, intptr_t lParam) = 0;
    virtual void postQuit(int exitCode) = 0;

    virtual ADeviceContext beginPaint(AWindowHandle window, APaintSession& session) = 0;
    virtual void endPaint(AWindowHandle window, const APaintSession& session) = 0;
    virtual bool fillPattern(ADeviceContext context, const ARect& rect, EPaintPattern pattern) = 0;

    virtual uint32_t lastErrorCode() const = 0;
};
