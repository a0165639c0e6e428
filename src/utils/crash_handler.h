#ifndef CRASH_HANDLER_H
#define CRASH_HANDLER_H

// Install crash handlers for fatal signals (SIGSEGV, SIGABRT, SIGILL, SIGFPE, SIGBUS, SIGXFSZ)
void installCrashHandlers();

// Install a std::terminate handler that reports the active exception
void installExceptionHandlers();

// Route SIGINT/SIGTERM to a flag that callers poll; a second signal exits immediately
void installInterruptHandler();
bool interruptRequested();

#endif // CRASH_HANDLER_H
