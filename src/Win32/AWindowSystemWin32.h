#pragma once

#include <IWindowSystem.h>
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <unordered_map>

class AWindowProcedure;

class AWindowSystemWin32 : public IWindowSystem {
public:
    AWindowSystemWin32() = default;
    ~AWindowSystemWin32() override = default;

    AWindowSystemWin32(const AWindowSystemWin32&) = delete;
    AWindowSystemWin32& operator=(const AWindowSystemWin32&) = delete;

    ACursorHandle loadArrowCursor() override;
    AWindowClassId registerClass(const AWindowClassDesc& desc) override;

    AWindowHandle createWindow(const AWindowCreateDesc& desc) override;
    bool destroyWindow(AWindowHandle window) override;

    EGetMessageResult getMessage(AMessage& message) override;
    void translateMessage(const AMessage& message) override;
    intptr_t dispatchMessage(const AMessage& message) override;
    intptr_t defaultProcedure(AWindowHandle window, uint32_t id, uintptr_t wParam, intptr_t lParam) override;
    void postQuit(int exitCode) override;

    ADeviceContext beginPaint(AWindowHandle window, APaintSession& session) override;
    void endPaint(AWindowHandle window, const APaintSession& session) override;
    bool fillPattern(ADeviceContext context, const ARect& rect, EPaintPattern pattern) override;

    uint32_t lastErrorCode() const override;

private:
    static LRESULT CALLBACK WndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam);

    std::unordered_map<ATOM, AWindowProcedure*> procedures_;
};
