#define WIN32_LEAN_AND_MEAN
#include <windows.h>

#include <AApplication>
#include <Win32/AWindowSystemWin32.h>

// wWinMain: entry point for Win32 GUI applications
int APIENTRY wWinMain(HINSTANCE hInstance,
                      HINSTANCE hPrevInstance,
                      LPWSTR    lpCmdLine,
                      int       nCmdShow)
{
    // No command-line options; the window is created visible, so nCmdShow is unused too.
    (void)hPrevInstance;
    (void)lpCmdLine;
    (void)nCmdShow;

    AWindowSystemWin32 windowSystem;
    AApplication application(windowSystem);
    return application.run(AInstanceHandle{hInstance});
}

// Built as a console program so log lines reach the terminal.
int main(int argc, char* argv[])
{
    (void)argc;
    (void)argv;

    // Get the HINSTANCE for this module (same as the one passed to wWinMain normally)
    HINSTANCE hInstance = GetModuleHandleW(nullptr);

    // Get the command line as a single string (equivalent of lpCmdLine)
    LPWSTR lpCmdLine = GetCommandLineW();

    // hPrevInstance is always nullptr on modern Windows
    return wWinMain(hInstance, nullptr, lpCmdLine, SW_SHOWDEFAULT);
}
