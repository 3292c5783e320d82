#include "NoteStore.h"
#include <QBuffer>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

namespace {

const char *const FileExtension = ".xml";
const char *const XmlDeclaration = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";

double readDouble(QXmlStreamReader &xml, double fallback) {
    bool ok = false;
    double value = xml.readElementText().trimmed().toDouble(&ok);
    return ok ? value : fallback;
}

bool readBool(QXmlStreamReader &xml) {
    const QString value = xml.readElementText().trimmed();
    return value.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0 || value == QLatin1String("1");
}

Note readNote(QXmlStreamReader &xml) {
    // Missing elements keep the built-in style
    Note note = Note::createNew();
    note.id.clear();

    while (xml.readNextStartElement()) {
        const QStringView name = xml.name();
        if (name == QLatin1String("ID")) {
            note.id = xml.readElementText().trimmed();
        } else if (name == QLatin1String("X")) {
            note.x = readDouble(xml, note.x);
        } else if (name == QLatin1String("Y")) {
            note.y = readDouble(xml, note.y);
        } else if (name == QLatin1String("W")) {
            note.w = readDouble(xml, note.w);
        } else if (name == QLatin1String("H")) {
            note.h = readDouble(xml, note.h);
        } else if (name == QLatin1String("Text")) {
            note.text = xml.readElementText();
        } else if (name == QLatin1String("IsDefault")) {
            note.isDefault = readBool(xml);
        } else if (name == QLatin1String("FontFamily")) {
            note.fontFamily = xml.readElementText();
        } else if (name == QLatin1String("FontSize")) {
            note.fontSize = qRound(readDouble(xml, note.fontSize));
        } else if (name == QLatin1String("ForeColor")) {
            note.foreColor = xml.readElementText().trimmed();
        } else if (name == QLatin1String("BackColor")) {
            note.backColor = xml.readElementText().trimmed();
        } else if (name == QLatin1String("Opacity")) {
            note.opacity = qBound(0.1, readDouble(xml, note.opacity), 1.0);
        } else {
            xml.skipCurrentElement();
        }
    }

    if (note.id.isEmpty()) {
        note.id = Note::generateId();
    }
    return note;
}

bool isXmlChar(char32_t c) {
    return c == 0x9 || c == 0xA || c == 0xD
        || (c >= 0x20 && c <= 0xD7FF)
        || (c >= 0xE000 && c <= 0xFFFD)
        || (c >= 0x10000 && c <= 0x10FFFF);
}

// Drops what XML 1.0 cannot carry (control characters, lone surrogates),
// otherwise the file could not be read back
QString xmlSafe(const QString &value) {
    QString cleaned;
    cleaned.reserve(value.size());
    for (int i = 0; i < value.size(); ++i) {
        const QChar c = value.at(i);
        if (c.isHighSurrogate() && i + 1 < value.size() && value.at(i + 1).isLowSurrogate()) {
            cleaned.append(c);
            cleaned.append(value.at(++i));
        } else if (!c.isSurrogate() && isXmlChar(c.unicode())) {
            cleaned.append(c);
        }
    }
    return cleaned;
}

void writeNote(QXmlStreamWriter &xml, const Note &note) {
    xml.writeStartElement(QStringLiteral("note"));
    xml.writeTextElement(QStringLiteral("ID"), xmlSafe(note.id));
    xml.writeTextElement(QStringLiteral("X"), QString::number(note.x));
    xml.writeTextElement(QStringLiteral("Y"), QString::number(note.y));
    xml.writeTextElement(QStringLiteral("W"), QString::number(note.w));
    xml.writeTextElement(QStringLiteral("H"), QString::number(note.h));
    xml.writeTextElement(QStringLiteral("Text"), xmlSafe(note.text));
    xml.writeTextElement(QStringLiteral("IsDefault"), note.isDefault ? QStringLiteral("true") : QStringLiteral("false"));
    xml.writeTextElement(QStringLiteral("FontFamily"), xmlSafe(note.fontFamily));
    xml.writeTextElement(QStringLiteral("FontSize"), QString::number(note.fontSize));
    xml.writeTextElement(QStringLiteral("ForeColor"), xmlSafe(note.foreColor));
    xml.writeTextElement(QStringLiteral("BackColor"), xmlSafe(note.backColor));
    xml.writeTextElement(QStringLiteral("Opacity"), QString::number(note.opacity));
    xml.writeEndElement();
}

} // namespace

NoteStore::NoteStore(QObject *parent)
    : QObject(parent), storePath(defaultFilePath())
{
}

QString NoteStore::defaultFilePath() {
    QFileInfo program(QCoreApplication::applicationFilePath());
    return program.absoluteDir().filePath(program.completeBaseName() + QLatin1String(FileExtension));
}

QString NoteStore::filePath() const {
    QMutexLocker locker(&mutex);
    return storePath;
}

void NoteStore::setFilePath(const QString &path) {
    QMutexLocker locker(&mutex);
    storePath = path;
}

void NoteStore::load() {
    load(filePath());
}

void NoteStore::load(const QString &path) {
    QMutexLocker locker(&mutex);

    const int countBefore = noteList.size();
    loadLocked(path);

    // ✅ Restore the invariant on every path, including a failed parse
    ensureDefaultLocked();

    const bool changed = noteList.size() != countBefore;
    const bool inBatch = batchDepth > 0;
    if (changed && inBatch) {
        batchDirty = true;
    }
    locker.unlock();

    if (changed && !inBatch) {
        emit notesReset();
    }
}

void NoteStore::loadLocked(const QString &path) {
    QFileInfo info(path);
    if (!info.exists() || info.size() <= 0) {
        return;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "NoteStore: cannot open" << path << ":" << file.errorString();
        return;
    }

    QList<Note> loaded;
    QString error;
    if (!parseNotes(&file, loaded, &error)) {
        qWarning() << "NoteStore: ignoring unreadable notes file" << path << ":" << error;
        return;
    }

    for (const Note &note : loaded) {
        if (!insertLocked(note)) {
            qDebug() << "NoteStore: skipped note" << note.id << "while loading" << path;
        }
    }
}

bool NoteStore::save(QString *errorMessage) {
    return save(filePath(), errorMessage);
}

bool NoteStore::save(const QString &path, QString *errorMessage) {
    QString error;
    bool ok;
    {
        QMutexLocker locker(&mutex);
        ok = saveLocked(path, &error);
    }

    if (!ok) {
        qWarning() << "NoteStore: save failed:" << error;
        if (errorMessage) {
            *errorMessage = error;
        }
        emit saveFailed(error);
    }
    return ok;
}

bool NoteStore::saveLocked(const QString &path, QString *errorMessage) {
    const QString dir = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dir)) {
        *errorMessage = QStringLiteral("cannot create directory %1").arg(dir);
        return false;
    }

    const QByteArray data = serializeNotes(noteList, errorMessage);
    if (data.isEmpty()) {
        return false;
    }

    // Whole-file replace, last writer wins
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        *errorMessage = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        return false;
    }
    if (file.write(data) != data.size()) {
        *errorMessage = QStringLiteral("cannot write %1: %2").arg(path, file.errorString());
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        *errorMessage = QStringLiteral("cannot commit %1: %2").arg(path, file.errorString());
        return false;
    }
    return true;
}

QByteArray NoteStore::serializeNotes(const QList<Note> &notes, QString *errorMessage) {
    QByteArray body;
    QBuffer buffer(&body);
    buffer.open(QIODevice::WriteOnly);

    // No writeStartDocument(): the declaration is always written as UTF-8
    // below, and no namespace is ever declared.
    QXmlStreamWriter xml(&buffer);
    xml.setAutoFormatting(true);
    xml.setAutoFormattingIndent(4);
    xml.writeStartElement(QStringLiteral("notes"));
    for (const Note &note : notes) {
        writeNote(xml, note);
    }
    xml.writeEndElement();
    buffer.close();

    if (xml.hasError()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot encode notes as XML");
        }
        return QByteArray();
    }

    QByteArray data(XmlDeclaration);
    data += body.trimmed();
    data += '\n';
    return data;
}

bool NoteStore::parseNotes(QIODevice *device, QList<Note> &out, QString *errorMessage) {
    QXmlStreamReader xml(device);
    QList<Note> parsed;

    if (!xml.readNextStartElement()) {
        if (errorMessage) {
            *errorMessage = xml.hasError() ? xml.errorString() : QStringLiteral("no root element");
        }
        return false;
    }
    if (xml.name() != QLatin1String("notes")) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("unexpected root element <%1>").arg(xml.name().toString());
        }
        return false;
    }

    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("note")) {
            parsed.append(readNote(xml));
        } else {
            xml.skipCurrentElement();
        }
    }

    if (xml.hasError()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("line %1: %2").arg(xml.lineNumber()).arg(xml.errorString());
        }
        return false;
    }

    out = parsed;
    return true;
}

QList<Note> NoteStore::notes() const {
    QMutexLocker locker(&mutex);
    return noteList;
}

int NoteStore::count() const {
    QMutexLocker locker(&mutex);
    return noteList.size();
}

bool NoteStore::contains(const QString &id) const {
    QMutexLocker locker(&mutex);
    return indexOfLocked(id) >= 0;
}

std::optional<Note> NoteStore::note(const QString &id) const {
    QMutexLocker locker(&mutex);
    const int index = indexOfLocked(id);
    if (index < 0) {
        return std::nullopt;
    }
    return noteList.at(index);
}

std::optional<Note> NoteStore::defaultNote() const {
    QMutexLocker locker(&mutex);
    for (const Note &note : noteList) {
        if (note.isDefault) {
            return note;
        }
    }
    qWarning() << "NoteStore: no default note present";
    return std::nullopt;
}

bool NoteStore::addNote(const Note &note) {
    QMutexLocker locker(&mutex);
    if (!insertLocked(note)) {
        return false;
    }
    const bool inBatch = batchDepth > 0;
    if (inBatch) {
        batchDirty = true;
    }
    locker.unlock();

    if (!inBatch) {
        emit noteAdded(note);
    }
    return true;
}

int NoteStore::addNotes(const QList<Note> &notes) {
    beginBatch();
    int added = 0;
    {
        QMutexLocker locker(&mutex);
        for (const Note &note : notes) {
            if (insertLocked(note)) {
                ++added;
            }
        }
        if (added > 0) {
            batchDirty = true;
        }
    }
    endBatch();
    return added;
}

bool NoteStore::updateNote(const Note &note) {
    QMutexLocker locker(&mutex);
    const int index = indexOfLocked(note.id);
    if (index < 0) {
        return false;
    }

    Note updated = note;
    updated.isDefault = noteList.at(index).isDefault;
    if (noteList.at(index) == updated) {
        return true;
    }
    noteList[index] = updated;

    const bool inBatch = batchDepth > 0;
    if (inBatch) {
        batchDirty = true;
    }
    locker.unlock();

    if (!inBatch) {
        emit noteUpdated(updated);
    }
    return true;
}

bool NoteStore::removeNote(const QString &id) {
    QMutexLocker locker(&mutex);
    const int index = indexOfLocked(id);
    if (index < 0) {
        return false;
    }
    if (noteList.at(index).isDefault) {
        qWarning() << "NoteStore: refusing to remove the default note" << id;
        return false;
    }
    noteList.removeAt(index);

    const bool inBatch = batchDepth > 0;
    if (inBatch) {
        batchDirty = true;
    }
    locker.unlock();

    if (!inBatch) {
        emit noteRemoved(id);
    }
    return true;
}

void NoteStore::beginBatch() {
    QMutexLocker locker(&mutex);
    ++batchDepth;
}

void NoteStore::endBatch() {
    QMutexLocker locker(&mutex);
    if (batchDepth == 0) {
        qWarning() << "NoteStore: endBatch() without beginBatch()";
        return;
    }
    --batchDepth;
    const bool fire = batchDepth == 0 && batchDirty;
    if (fire) {
        batchDirty = false;
    }
    locker.unlock();

    if (fire) {
        emit notesReset();
    }
}

bool NoteStore::insertLocked(const Note &note) {
    if (note.id.isEmpty() || indexOfLocked(note.id) >= 0) {
        return false;
    }
    // Only one default note may ever exist
    if (note.isDefault && hasDefaultLocked()) {
        return false;
    }
    noteList.append(note);
    return true;
}

bool NoteStore::ensureDefaultLocked() {
    if (hasDefaultLocked()) {
        return false;
    }
    noteList.append(Note::defaultNoteStyle());
    return true;
}

int NoteStore::indexOfLocked(const QString &id) const {
    for (int i = 0; i < noteList.size(); ++i) {
        if (noteList.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

bool NoteStore::hasDefaultLocked() const {
    for (const Note &note : noteList) {
        if (note.isDefault) {
            return true;
        }
    }
    return false;
}
