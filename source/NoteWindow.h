#ifndef NOTEWINDOW_H
#define NOTEWINDOW_H

#include <QWidget>
#include <QRect>
#include <QString>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QPushButton>
#include <QMouseEvent>
#include <QResizeEvent>
#include "NoteView.h"

class QPlainTextEdit;

// Frameless, always-on-top sticky note window
class NoteWindow : public QWidget, public NoteView {
    Q_OBJECT

public:
    explicit NoteWindow(const Note &note, QWidget *parent = nullptr);
    ~NoteWindow();

    // NoteView
    QString noteId() const override;
    Note note() const override;
    void bindNote(const Note &note) override;
    void showView() override;
    void closeView() override;
    void setViewVisible(bool visible) override;
    bool isViewVisible() const override;
    QRect viewGeometry() const override;
    void setViewGeometry(const QRect &rect) override;
    void centerOnScreen() override;

signals:
    void addRequested(const QString &parentId);
    void deleteRequested(const QString &id);
    // Text, position or size changed by the user
    void noteEdited(const Note &note);

protected:
    void mousePressEvent(QMouseEvent *event) override;
    void mouseMoveEvent(QMouseEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;
    void paintEvent(QPaintEvent *event) override;

private slots:
    void onTextChanged();

private:
    enum ResizeHandle {
        None,
        TopLeft,
        TopRight,
        BottomLeft,
        BottomRight,
        Top,
        Bottom,
        Left,
        Right
    };

    Note boundNote;

    QPlainTextEdit *editor;
    QPushButton *addButton;
    QPushButton *deleteButton;
    QVBoxLayout *mainLayout;
    QHBoxLayout *headerLayout;

    // Dragging
    bool dragging = false;
    QPoint dragStartPosition;
    QPoint windowStartPosition;

    // Resizing
    bool resizing = false;
    QPoint resizeStartPosition;
    QRect resizeStartRect;
    ResizeHandle currentResizeHandle = None;

    bool isBinding = false;

    static constexpr int HeaderHeight = 22;
    static constexpr int HandleSize = 8;

    ResizeHandle getResizeHandle(const QPoint &pos) const;
    void updateCursor(const QPoint &pos);
    void setupUI();
    void applyStyle();
    void syncGeometryToNote();
};

#endif // NOTEWINDOW_H
