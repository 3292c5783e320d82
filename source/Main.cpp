#include <QAction>
#include <QApplication>
#include <QDebug>
#include <QMenu>
#include <QStyle>
#include <QSystemTrayIcon>
#include "AppSettings.h"
#include "NotesController.h"

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName("OverlayNotes");
    QCoreApplication::setApplicationName("App");

    // Notes are tool windows; the tray icon keeps the process alive
    app.setQuitOnLastWindowClosed(false);

    AppSettings settings;
    NotesController controller(&settings);

    controller.load();
    controller.showAll();
    controller.startWatcher();

    QMenu trayMenu;

    QAction *newNoteAction = trayMenu.addAction(QObject::tr("New note"));
    QObject::connect(newNoteAction, &QAction::triggered, &controller, [&controller]() {
        controller.addNote();
    });

    QAction *showNotesAction = trayMenu.addAction(QObject::tr("Show notes"));
    QObject::connect(showNotesAction, &QAction::triggered, &controller, [&controller]() {
        controller.showAll();
    });

    QAction *hideNotesAction = trayMenu.addAction(QObject::tr("Hide notes"));
    QObject::connect(hideNotesAction, &QAction::triggered, &controller, [&controller]() {
        controller.closeAll();
    });

    trayMenu.addSeparator();

    QAction *hideWhenAbsentAction = trayMenu.addAction(QObject::tr("Hide when game is not focused"));
    hideWhenAbsentAction->setCheckable(true);
    hideWhenAbsentAction->setChecked(settings.hideWhenTargetAbsent());
    QObject::connect(hideWhenAbsentAction, &QAction::toggled, &settings, &AppSettings::setHideWhenTargetAbsent);

    trayMenu.addSeparator();

    QAction *quitAction = trayMenu.addAction(QObject::tr("Quit"));
    QObject::connect(quitAction, &QAction::triggered, &app, &QApplication::quit);

    QSystemTrayIcon trayIcon(app.style()->standardIcon(QStyle::SP_FileDialogDetailedView));
    trayIcon.setToolTip(QObject::tr("Overlay Notes"));
    trayIcon.setContextMenu(&trayMenu);
    if (QSystemTrayIcon::isSystemTrayAvailable()) {
        trayIcon.show();
    } else {
        qWarning() << "No system tray available, notes can only be managed from their windows";
    }

    // ✅ Persist before the event loop goes away; window edits may still be
    // waiting for their debounced save. Windows close with the controller.
    QObject::connect(&app, &QCoreApplication::aboutToQuit, &controller, [&controller]() {
        controller.stopWatcher();
        QString error;
        if (!controller.save(&error)) {
            qWarning() << "Saving notes on exit failed:" << error;
        }
    });

    return app.exec();
}
