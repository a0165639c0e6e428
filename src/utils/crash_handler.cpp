#include "crash_handler.h"
#include <csignal>
#include <execinfo.h>
#include <unistd.h>
#include <cstdio>
#include <new>
#include <exception>
#include <stdexcept>
#include <cstdlib>

namespace {

volatile sig_atomic_t g_interrupted = 0;

void fatalSignalHandler(int sig) {
    void* frames[128];
    int n = backtrace(frames, 128);

    const char* name = "UNKNOWN";
    switch (sig) {
        case SIGSEGV: name = "SIGSEGV"; break;
        case SIGABRT: name = "SIGABRT"; break;
        case SIGILL:  name = "SIGILL";  break;
        case SIGFPE:  name = "SIGFPE";  break;
        case SIGBUS:  name = "SIGBUS";  break;
        case SIGXFSZ: name = "SIGXFSZ"; break;
    }

    dprintf(STDERR_FILENO, "[ERROR] Caught signal %d (%s). Backtrace (%d frames):\n", sig, name, n);
    backtrace_symbols_fd(frames, n, STDERR_FILENO);

    if (sig == SIGXFSZ) {
        dprintf(STDERR_FILENO, "[ERROR] File size limit exceeded while writing an artifact.\n");
    }

    _exit(128 + sig);
}

void interruptHandler(int sig) {
    if (g_interrupted) {
        // Second signal: stop waiting for workers to wind down
        _exit(128 + sig);
    }
    g_interrupted = 1;
    const char msg[] = "[WARNING] Interrupt received, cancelling export (press again to force quit)\n";
    ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
    (void)ignored;
}

// Handler for unhandled C++ exceptions
void terminateHandler() {
    void* frames[128];
    int n = backtrace(frames, 128);

    dprintf(STDERR_FILENO, "[ERROR] Unhandled C++ exception. Backtrace (%d frames):\n", n);
    backtrace_symbols_fd(frames, n, STDERR_FILENO);

    auto current_exception = std::current_exception();
    if (current_exception) {
        try {
            std::rethrow_exception(current_exception);
        } catch (const std::bad_alloc& e) {
            dprintf(STDERR_FILENO, "[ERROR] Out of memory: std::bad_alloc caught: %s\n", e.what());
            dprintf(STDERR_FILENO, "[ERROR] Try fewer render workers or a smaller resolution.\n");
        } catch (const std::exception& e) {
            dprintf(STDERR_FILENO, "[ERROR] Exception: %s\n", e.what());
        } catch (...) {
            dprintf(STDERR_FILENO, "[ERROR] Unknown exception type\n");
        }
    } else {
        dprintf(STDERR_FILENO, "[ERROR] No active exception (std::terminate called directly)\n");
    }

    std::abort();
}

} // namespace

void installCrashHandlers() {
    std::signal(SIGSEGV, fatalSignalHandler);
    std::signal(SIGABRT, fatalSignalHandler);
    std::signal(SIGILL,  fatalSignalHandler);
    std::signal(SIGFPE,  fatalSignalHandler);
    std::signal(SIGBUS,  fatalSignalHandler);
    std::signal(SIGXFSZ, fatalSignalHandler);
}

void installExceptionHandlers() {
    std::set_terminate(terminateHandler);
}

void installInterruptHandler() {
    std::signal(SIGINT, interruptHandler);
    std::signal(SIGTERM, interruptHandler);
}

bool interruptRequested() {
    return g_interrupted != 0;
}
