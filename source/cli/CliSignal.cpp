#include "CliSignal.h"

#include <QtGlobal>
#include <atomic>

#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <csignal>
#endif

/**
 * @file CliSignal.cpp
 * @brief Implementation of CLI interrupt handling.
 *
 * @see CliSignal.h for API documentation
 */

namespace Cli {

// Set from the signal handler, polled by the command loop
static std::atomic<bool> g_cancelled(false);

#ifdef Q_OS_WIN

static BOOL WINAPI consoleCtrlHandler(DWORD ctrlType)
{
    switch (ctrlType) {
        case CTRL_C_EVENT:
        case CTRL_BREAK_EVENT:
            g_cancelled = true;
            // Handled: keep the process alive until playback has stopped
            return TRUE;

        default:
            return FALSE;
    }
}

void installSignalHandlers()
{
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
}

#else // Unix/Linux

// Async-signal-safe: only touches the atomic flag
static void interruptHandler(int signal)
{
    (void)signal;
    g_cancelled = true;
}

void installSignalHandlers()
{
    struct sigaction sa;
    sa.sa_handler = interruptHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

#endif

bool wasCancelled()
{
    return g_cancelled.load();
}

} // namespace Cli
