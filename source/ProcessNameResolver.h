#ifndef PROCESSNAMERESOLVER_H
#define PROCESSNAMERESOLVER_H

#include <QString>
#include <stdexcept>

// Thrown when the foreground process cannot be determined right now
// (access denied, process exited mid-query, no display, ...).
class ProcessLookupError : public std::runtime_error {
public:
    explicit ProcessLookupError(const QString &message)
        : std::runtime_error(message.toStdString()) {}
};

class ProcessNameResolver {
public:
    virtual ~ProcessNameResolver() = default;

    // Executable file name (no directory) of the process owning the
    // input-focused top-level window. Throws ProcessLookupError.
    virtual QString foregroundProcessName() = 0;
};

// Win32 on Windows, xdotool + /proc elsewhere
class SystemProcessNameResolver : public ProcessNameResolver {
public:
    QString foregroundProcessName() override;
};

#endif // PROCESSNAMERESOLVER_H
