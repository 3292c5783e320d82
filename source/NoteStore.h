#ifndef NOTESTORE_H
#define NOTESTORE_H

#include <QObject>
#include <QList>
#include <QMutex>
#include <QString>
#include <optional>
#include "Note.h"

class QIODevice;

// Ordered, duplicate-free collection of notes persisted as one XML file.
// After every load() exactly one note has isDefault set. All access goes
// through a single mutex, so the store can be saved from worker threads
// while the UI thread keeps editing.
class NoteStore : public QObject {
    Q_OBJECT

public:
    explicit NoteStore(QObject *parent = nullptr);

    // <program dir>/<program base name>.xml
    static QString defaultFilePath();

    QString filePath() const;
    void setFilePath(const QString &path);

    // Persistence. load() never fails from the caller's point of view: a
    // missing, empty or corrupt file leaves the store with just a default note.
    void load();
    void load(const QString &path);
    bool save(QString *errorMessage = nullptr);
    bool save(const QString &path, QString *errorMessage = nullptr);

    // Queries
    QList<Note> notes() const;
    int count() const;
    bool contains(const QString &id) const;
    std::optional<Note> note(const QString &id) const;
    std::optional<Note> defaultNote() const;

    // Mutation
    bool addNote(const Note &note);
    int addNotes(const QList<Note> &notes); // one notesReset() instead of N noteAdded()
    bool updateNote(const Note &note);      // in place, id and default flag are kept
    bool removeNote(const QString &id);     // the default note cannot be removed

    // Suspend per-item notifications; endBatch() emits notesReset() once if
    // anything changed in between.
    void beginBatch();
    void endBatch();

    // Exposed for tests and for tools that want the file format
    // Empty result when the writer failed
    static QByteArray serializeNotes(const QList<Note> &notes, QString *errorMessage = nullptr);
    static bool parseNotes(QIODevice *device, QList<Note> &out, QString *errorMessage = nullptr);

signals:
    void noteAdded(const Note &note);
    void noteRemoved(const QString &id);
    void noteUpdated(const Note &note);
    void notesReset();
    // May be emitted from a worker thread
    void saveFailed(const QString &message);

private:
    bool insertLocked(const Note &note);
    bool ensureDefaultLocked();
    int indexOfLocked(const QString &id) const;
    bool hasDefaultLocked() const;
    void loadLocked(const QString &path);
    bool saveLocked(const QString &path, QString *errorMessage);

    mutable QMutex mutex;
    QList<Note> noteList;
    QString storePath;

    int batchDepth = 0;
    bool batchDirty = false;
};

#endif // NOTESTORE_H
