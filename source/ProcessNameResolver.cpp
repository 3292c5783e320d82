#include "ProcessNameResolver.h"
#include <QFileInfo>
#ifdef Q_OS_WIN
#include <windows.h>
#else
#include <QProcess>
#endif

#ifdef Q_OS_WIN

QString SystemProcessNameResolver::foregroundProcessName() {
    HWND hwnd = GetForegroundWindow();
    if (!hwnd) {
        throw ProcessLookupError(QStringLiteral("no foreground window"));
    }

    DWORD pid = 0;
    GetWindowThreadProcessId(hwnd, &pid);
    if (pid == 0) {
        throw ProcessLookupError(QStringLiteral("foreground window has no owning process"));
    }

    HANDLE process = OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid);
    if (!process) {
        throw ProcessLookupError(QStringLiteral("cannot open process %1 (error %2)").arg(pid).arg(GetLastError()));
    }

    wchar_t path[MAX_PATH];
    DWORD size = MAX_PATH;
    const BOOL ok = QueryFullProcessImageNameW(process, 0, path, &size);
    const DWORD error = GetLastError();
    CloseHandle(process);

    if (!ok || size == 0) {
        throw ProcessLookupError(QStringLiteral("cannot query image of process %1 (error %2)").arg(pid).arg(error));
    }

    return QFileInfo(QString::fromWCharArray(path, static_cast<int>(size))).fileName();
}

#else

QString SystemProcessNameResolver::foregroundProcessName() {
    // X11 only: ask xdotool for the active window's pid, then resolve the
    // executable through /proc.
    QProcess xdotool;
    xdotool.start(QStringLiteral("xdotool"), { QStringLiteral("getactivewindow"), QStringLiteral("getwindowpid") });
    if (!xdotool.waitForFinished(1000)) {
        xdotool.kill();
        xdotool.waitForFinished(100);
        throw ProcessLookupError(QStringLiteral("xdotool did not answer: %1").arg(xdotool.errorString()));
    }
    if (xdotool.exitStatus() != QProcess::NormalExit || xdotool.exitCode() != 0) {
        throw ProcessLookupError(QStringLiteral("xdotool failed: %1")
                                     .arg(QString::fromLocal8Bit(xdotool.readAllStandardError()).trimmed()));
    }

    bool ok = false;
    const qint64 pid = QString::fromLatin1(xdotool.readAllStandardOutput()).trimmed().toLongLong(&ok);
    if (!ok || pid <= 0) {
        throw ProcessLookupError(QStringLiteral("xdotool returned no pid"));
    }

    const QString exe = QFileInfo(QStringLiteral("/proc/%1/exe").arg(pid)).symLinkTarget();
    if (exe.isEmpty()) {
        throw ProcessLookupError(QStringLiteral("cannot resolve executable of process %1").arg(pid));
    }
    return QFileInfo(exe).fileName();
}

#endif
