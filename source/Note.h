#ifndef NOTE_H
#define NOTE_H

#include <QString>
#include <QRect>
#include <QMetaType>

// A single sticky note. The store owns notes by value; windows keep a copy
// and are matched back to the store by id.
struct Note {
    QString id;
    double x = 0.0;
    double y = 0.0;
    double w = 200.0;
    double h = 200.0;
    QString text;
    bool isDefault = false;

    // Style, templated from the default note
    QString fontFamily;
    int fontSize = 12;
    QString foreColor;
    QString backColor;
    double opacity = 1.0;

    static constexpr double DefaultNoteSize = 200.0;

    // Fresh non-default note. Style is copied from styleTemplate when given.
    static Note createNew(const Note *styleTemplate = nullptr);

    // Fresh default note carrying the built-in style
    static Note defaultNoteStyle();

    static QString generateId();

    QRect rect() const;
    void setRect(const QRect &rect);
    void copyStyleFrom(const Note &other);

    bool operator==(const Note &other) const;
    bool operator!=(const Note &other) const { return !(*this == other); }
};

Q_DECLARE_METATYPE(Note)

#endif // NOTE_H
