#include "AWindowSystemWin32.h"

#include <AWindow>
#include <AWindowClass>
#include <AWindowProcedure>
#include <new>
#include <string>

namespace {

static_assert(sizeof(PAINTSTRUCT) <= sizeof(APaintSession::native), "PAINTSTRUCT does not fit the paint session");

HWND toHwnd(AWindowHandle window) {
    return static_cast<HWND>(window.get());
}

std::wstring widen(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    const int length = MultiByteToWideChar(CP_UTF8, 0, text.c_str(), static_cast<int>(text.size()), nullptr, 0);
    std::wstring wide(static_cast<size_t>(length), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.c_str(), static_cast<int>(text.size()), wide.data(), length);
    return wide;
}

EMessageKind classifyMessage(UINT msg) {
    switch (msg) {
    case WM_CLOSE: return EMessageKind::Close;
    case WM_DESTROY: return EMessageKind::Destroy;
    case WM_PAINT: return EMessageKind::Paint;
    default: return EMessageKind::Other;
    }
}

UINT toClassStyle(EClassStyle style) {
    UINT result = 0;
    if (hasStyle(style, EClassStyle::HorizontalRedraw)) result |= CS_HREDRAW;
    if (hasStyle(style, EClassStyle::VerticalRedraw)) result |= CS_VREDRAW;
    if (hasStyle(style, EClassStyle::OwnDeviceContext)) result |= CS_OWNDC;
    return result;
}

DWORD toWindowStyle(EWindowStyle style) {
    DWORD result = 0;
    if (hasStyle(style, EWindowStyle::OverlappedWindow)) result |= WS_OVERLAPPEDWINDOW;
    if (hasStyle(style, EWindowStyle::Visible)) result |= WS_VISIBLE;
    return result;
}

int toCoordinate(int value) {
    return value == AWindowCreateDesc::kUseDefault ? CW_USEDEFAULT : value;
}

MSG toMsg(const AMessage& message) {
    MSG msg{};
    msg.hwnd = toHwnd(message.window);
    msg.message = message.id;
    msg.wParam = static_cast<WPARAM>(message.wParam);
    msg.lParam = static_cast<LPARAM>(message.lParam);
    msg.time = message.time;
    msg.pt.x = static_cast<LONG>(message.cursor.x);
    msg.pt.y = static_cast<LONG>(message.cursor.y);
    return msg;
}

AMessage fromMsg(const MSG& msg) {
    AMessage message;
    message.window = AWindowHandle{msg.hwnd};
    message.kind = classifyMessage(msg.message);
    message.id = msg.message;
    message.wParam = static_cast<uintptr_t>(msg.wParam);
    message.lParam = static_cast<intptr_t>(msg.lParam);
    message.time = msg.time;
    message.cursor = glm::ivec2(static_cast<int>(msg.pt.x), static_cast<int>(msg.pt.y));
    return message;
}

} // namespace

ACursorHandle AWindowSystemWin32::loadArrowCursor() {
    return ACursorHandle{LoadCursorW(nullptr, IDC_ARROW)};
}

AWindowClassId AWindowSystemWin32::registerClass(const AWindowClassDesc& desc) {
    const std::wstring className = widen(desc.className);

    WNDCLASSW wc{};
    wc.style = toClassStyle(desc.style);
    wc.lpfnWndProc = &AWindowSystemWin32::WndProc;
    wc.hInstance = static_cast<HINSTANCE>(desc.instance.get());
    wc.hCursor = static_cast<HCURSOR>(desc.cursor.get());
    wc.lpszClassName = className.c_str();

    const ATOM atom = RegisterClassW(&wc);
    if (atom == 0) {
        return AWindowClassId{};
    }
    procedures_[atom] = desc.procedure;
    return AWindowClassId{atom};
}

AWindowHandle AWindowSystemWin32::createWindow(const AWindowCreateDesc& desc) {
    AWindowProcedure* procedure = nullptr;
    const auto it = procedures_.find(desc.classId.get());
    if (it != procedures_.end()) {
        procedure = it->second;
    }

    const std::wstring title = widen(desc.title);
    HWND hwnd = CreateWindowExW(
        0,
        MAKEINTATOM(desc.classId.get()),
        title.c_str(),
        toWindowStyle(desc.style),
        toCoordinate(desc.x), toCoordinate(desc.y),
        toCoordinate(desc.width), toCoordinate(desc.height),
        nullptr,
        nullptr,
        static_cast<HINSTANCE>(desc.instance.get()),
        procedure);

    return AWindowHandle{hwnd};
}

bool AWindowSystemWin32::destroyWindow(AWindowHandle window) {
    return DestroyWindow(toHwnd(window)) != FALSE;
}

EGetMessageResult AWindowSystemWin32::getMessage(AMessage& message) {
    MSG msg{};
    const BOOL result = GetMessageW(&msg, nullptr, 0, 0);
    if (result == -1) {
        return EGetMessageResult::Error;
    }
    message = fromMsg(msg);
    return result == 0 ? EGetMessageResult::Quit : EGetMessageResult::Message;
}

void AWindowSystemWin32::translateMessage(const AMessage& message) {
    const MSG msg = toMsg(message);
    TranslateMessage(&msg);
}

intptr_t AWindowSystemWin32::dispatchMessage(const AMessage& message) {
    const MSG msg = toMsg(message);
    return static_cast<intptr_t>(DispatchMessageW(&msg));
}

intptr_t AWindowSystemWin32::defaultProcedure(AWindowHandle window, uint32_t id, uintptr_t wParam, intptr_t lParam) {
    return static_cast<intptr_t>(DefWindowProcW(toHwnd(window), id, static_cast<WPARAM>(wParam), static_cast<LPARAM>(lParam)));
}

void AWindowSystemWin32::postQuit(int exitCode) {
    PostQuitMessage(exitCode);
}

ADeviceContext AWindowSystemWin32::beginPaint(AWindowHandle window, APaintSession& session) {
    auto* paint = new (session.native) PAINTSTRUCT{};
    HDC hdc = BeginPaint(toHwnd(window), paint);
    if (!hdc) {
        return ADeviceContext{};
    }
    const RECT& rc = paint->rcPaint;
    session.region = {static_cast<int>(rc.left), static_cast<int>(rc.top), static_cast<int>(rc.right), static_cast<int>(rc.bottom)};
    session.eraseBackground = paint->fErase != FALSE;
    return ADeviceContext{hdc};
}

void AWindowSystemWin32::endPaint(AWindowHandle window, const APaintSession& session) {
    EndPaint(toHwnd(window), reinterpret_cast<const PAINTSTRUCT*>(session.native));
}

bool AWindowSystemWin32::fillPattern(ADeviceContext context, const ARect& rect, EPaintPattern pattern) {
    const DWORD operation = pattern == EPaintPattern::White ? WHITENESS : BLACKNESS;
    const glm::ivec2 origin = rect.origin();
    const glm::ivec2 extent = rect.extent();
    return PatBlt(static_cast<HDC>(context.get()), origin.x, origin.y, extent.x, extent.y, operation) != FALSE;
}

uint32_t AWindowSystemWin32::lastErrorCode() const {
    return static_cast<uint32_t>(GetLastError());
}

LRESULT CALLBACK AWindowSystemWin32::WndProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam) {
    auto* procedure = reinterpret_cast<AWindowProcedure*>(GetWindowLongPtrW(hwnd, GWLP_USERDATA));

    if (msg == WM_NCCREATE) {
        auto createStruct = reinterpret_cast<CREATESTRUCTW*>(lParam);
        procedure = reinterpret_cast<AWindowProcedure*>(createStruct->lpCreateParams);
        SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(procedure));
    }

    // Messages sent during CreateWindowExW ahead of WM_NCCREATE.
    if (!procedure) {
        return DefWindowProcW(hwnd, msg, wParam, lParam);
    }

    AMessage message;
    message.window = AWindowHandle{hwnd};
    message.kind = classifyMessage(msg);
    message.id = msg;
    message.wParam = static_cast<uintptr_t>(wParam);
    message.lParam = static_cast<intptr_t>(lParam);
    return static_cast<LRESULT>(procedure->handle(message));
}
