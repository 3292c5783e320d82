#include "Note.h"
#include <QUuid>
#include <QtMath>

namespace {
const char *const BuiltinFontFamily = "Segoe UI";
const int BuiltinFontSize = 12;
const char *const BuiltinForeColor = "#ff202020";
const char *const BuiltinBackColor = "#e6fff8b0";
}

Note Note::createNew(const Note *styleTemplate) {
    Note note = defaultNoteStyle();
    note.isDefault = false;
    if (styleTemplate) {
        note.copyStyleFrom(*styleTemplate);
    }
    note.w = DefaultNoteSize;
    note.h = DefaultNoteSize;
    return note;
}

Note Note::defaultNoteStyle() {
    Note note;
    note.id = generateId();
    note.isDefault = true;
    note.w = DefaultNoteSize;
    note.h = DefaultNoteSize;
    note.fontFamily = QString::fromLatin1(BuiltinFontFamily);
    note.fontSize = BuiltinFontSize;
    note.foreColor = QString::fromLatin1(BuiltinForeColor);
    note.backColor = QString::fromLatin1(BuiltinBackColor);
    note.opacity = 1.0;
    return note;
}

QString Note::generateId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

QRect Note::rect() const {
    return QRect(qRound(x), qRound(y), qRound(w), qRound(h));
}

void Note::setRect(const QRect &rect) {
    x = rect.x();
    y = rect.y();
    w = rect.width();
    h = rect.height();
}

void Note::copyStyleFrom(const Note &other) {
    fontFamily = other.fontFamily;
    fontSize = other.fontSize;
    foreColor = other.foreColor;
    backColor = other.backColor;
    opacity = other.opacity;
}

bool Note::operator==(const Note &other) const {
    return id == other.id
        && qFuzzyCompare(1.0 + x, 1.0 + other.x)
        && qFuzzyCompare(1.0 + y, 1.0 + other.y)
        && qFuzzyCompare(1.0 + w, 1.0 + other.w)
        && qFuzzyCompare(1.0 + h, 1.0 + other.h)
        && text == other.text
        && isDefault == other.isDefault
        && fontFamily == other.fontFamily
        && fontSize == other.fontSize
        && foreColor == other.foreColor
        && backColor == other.backColor
        && qFuzzyCompare(opacity, other.opacity);
}
