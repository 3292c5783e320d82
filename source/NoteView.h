#ifndef NOTEVIEW_H
#define NOTEVIEW_H

#include <QRect>
#include <QString>
#include <functional>
#include "Note.h"

// An on-screen window showing one note. Only touched from the UI thread.
class NoteView {
public:
    virtual ~NoteView() = default;

    virtual QString noteId() const = 0;
    virtual Note note() const = 0;
    virtual void bindNote(const Note &note) = 0;

    virtual void showView() = 0;
    // Closes the window and schedules its destruction. The caller must not
    // use the pointer afterwards.
    virtual void closeView() = 0;

    virtual void setViewVisible(bool visible) = 0;
    virtual bool isViewVisible() const = 0;

    virtual QRect viewGeometry() const = 0;
    virtual void setViewGeometry(const QRect &rect) = 0;
    virtual void centerOnScreen() = 0;
};

using NoteViewFactory = std::function<NoteView *(const Note &note)>;

#endif // NOTEVIEW_H
