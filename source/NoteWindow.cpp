#include "NoteWindow.h"
#include <QColor>
#include <QFont>
#include <QGuiApplication>
#include <QPainter>
#include <QPaintEvent>
#include <QPlainTextEdit>
#include <QScreen>

NoteWindow::NoteWindow(const Note &note, QWidget *parent)
    : QWidget(parent)
{
    // Top-level overlay: no taskbar entry, no frame, above the game window
    setWindowFlags(Qt::Tool | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint);
    setAttribute(Qt::WA_DeleteOnClose, false); // closeView() handles deletion
    setMouseTracking(true);
    setMinimumSize(80, 60);

    setupUI();
    bindNote(note);
}

NoteWindow::~NoteWindow() = default;

void NoteWindow::setupUI() {
    mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(4, 2, 4, 4);
    mainLayout->setSpacing(0);

    headerLayout = new QHBoxLayout();
    headerLayout->setContentsMargins(2, 0, 0, 0);
    headerLayout->setSpacing(2);

    addButton = new QPushButton("+", this);
    addButton->setFixedSize(16, 16);
    addButton->setToolTip(tr("New note"));
    deleteButton = new QPushButton("×", this);
    deleteButton->setFixedSize(16, 16);
    deleteButton->setToolTip(tr("Delete note"));

    connect(addButton, &QPushButton::clicked, this, [this]() {
        emit addRequested(boundNote.id);
    });
    connect(deleteButton, &QPushButton::clicked, this, [this]() {
        emit deleteRequested(boundNote.id);
    });

    headerLayout->addStretch();
    headerLayout->addWidget(addButton);
    headerLayout->addWidget(deleteButton);

    editor = new QPlainTextEdit(this);
    editor->setFrameShape(QFrame::NoFrame);
    connect(editor, &QPlainTextEdit::textChanged, this, &NoteWindow::onTextChanged);

    mainLayout->addLayout(headerLayout);
    mainLayout->addWidget(editor);
}

void NoteWindow::applyStyle() {
    QColor back(boundNote.backColor);
    QColor fore(boundNote.foreColor);
    if (!back.isValid()) back = QColor(255, 248, 176);
    if (!fore.isValid()) fore = QColor(32, 32, 32);

    setStyleSheet(QString(R"(
        NoteWindow {
            background-color: %1;
        }
        QPlainTextEdit {
            background-color: transparent;
            color: %2;
            border: none;
        }
        QPushButton {
            background-color: transparent;
            color: %2;
            border: none;
            font-weight: bold;
        }
        QPushButton:hover {
            background-color: rgba(0, 0, 0, 0.15);
        }
    )").arg(back.name(QColor::HexArgb), fore.name(QColor::HexArgb)));
    setAttribute(Qt::WA_StyledBackground, true);

    QFont font = editor->font();
    if (!boundNote.fontFamily.isEmpty()) {
        font.setFamily(boundNote.fontFamily);
    }
    if (boundNote.fontSize > 0) {
        font.setPointSize(boundNote.fontSize);
    }
    editor->setFont(font);

    setWindowOpacity(qBound(0.1, boundNote.opacity, 1.0));
}

QString NoteWindow::noteId() const {
    return boundNote.id;
}

Note NoteWindow::note() const {
    return boundNote;
}

void NoteWindow::bindNote(const Note &note) {
    isBinding = true;
    boundNote = note;
    if (editor->toPlainText() != note.text) {
        editor->setPlainText(note.text);
    }
    applyStyle();
    setGeometry(note.rect());
    isBinding = false;
}

void NoteWindow::showView() {
    show();
    syncGeometryToNote();
}

void NoteWindow::closeView() {
    close();
    deleteLater();
}

void NoteWindow::setViewVisible(bool visible) {
    setVisible(visible);
}

bool NoteWindow::isViewVisible() const {
    return isVisible();
}

QRect NoteWindow::viewGeometry() const {
    return geometry();
}

void NoteWindow::setViewGeometry(const QRect &rect) {
    setGeometry(rect);
    syncGeometryToNote();
}

void NoteWindow::centerOnScreen() {
    QScreen *target = screen() ? screen() : QGuiApplication::primaryScreen();
    if (!target) return;

    QRect frame = geometry();
    frame.moveCenter(target->availableGeometry().center());
    move(frame.topLeft());
    syncGeometryToNote();
}

void NoteWindow::syncGeometryToNote() {
    boundNote.setRect(geometry());
}

void NoteWindow::onTextChanged() {
    if (isBinding) return;
    boundNote.text = editor->toPlainText();
    emit noteEdited(boundNote);
}

void NoteWindow::mousePressEvent(QMouseEvent *event) {
    if (event->button() == Qt::LeftButton) {
        ResizeHandle handle = getResizeHandle(event->pos());

        if (handle != None) {
            resizing = true;
            currentResizeHandle = handle;
            resizeStartPosition = event->globalPosition().toPoint();
            resizeStartRect = geometry();
        } else if (event->pos().y() < HeaderHeight) {
            dragging = true;
            dragStartPosition = event->globalPosition().toPoint();
            windowStartPosition = pos();
        }
    }

    QWidget::mousePressEvent(event);
}

void NoteWindow::mouseMoveEvent(QMouseEvent *event) {
    if (resizing) {
        QPoint delta = event->globalPosition().toPoint() - resizeStartPosition;
        QRect newRect = resizeStartRect;

        switch (currentResizeHandle) {
            case TopLeft:
                newRect.setTopLeft(newRect.topLeft() + delta);
                break;
            case TopRight:
                newRect.setTopRight(newRect.topRight() + delta);
                break;
            case BottomLeft:
                newRect.setBottomLeft(newRect.bottomLeft() + delta);
                break;
            case BottomRight:
                newRect.setBottomRight(newRect.bottomRight() + delta);
                break;
            case Top:
                newRect.setTop(newRect.top() + delta.y());
                break;
            case Bottom:
                newRect.setBottom(newRect.bottom() + delta.y());
                break;
            case Left:
                newRect.setLeft(newRect.left() + delta.x());
                break;
            case Right:
                newRect.setRight(newRect.right() + delta.x());
                break;
            default:
                break;
        }

        newRect.setSize(newRect.size().expandedTo(minimumSize()));
        setGeometry(newRect);
    } else if (dragging) {
        QPoint delta = event->globalPosition().toPoint() - dragStartPosition;
        move(windowStartPosition + delta);
    } else {
        updateCursor(event->pos());
    }

    QWidget::mouseMoveEvent(event);
}

void NoteWindow::mouseReleaseEvent(QMouseEvent *event) {
    if (event->button() == Qt::LeftButton && (resizing || dragging)) {
        resizing = false;
        dragging = false;
        currentResizeHandle = None;

        // One edit per gesture instead of one per pixel
        if (boundNote.rect() != geometry()) {
            syncGeometryToNote();
            emit noteEdited(boundNote);
        }
    }

    QWidget::mouseReleaseEvent(event);
}

void NoteWindow::paintEvent(QPaintEvent *event) {
    QWidget::paintEvent(event);

    // Grip in the bottom-right corner
    QPainter painter(this);
    QColor fore(boundNote.foreColor);
    if (!fore.isValid()) fore = Qt::darkGray;
    fore.setAlpha(90);
    painter.setPen(QPen(fore, 1));
    for (int i = 3; i <= HandleSize; i += 3) {
        painter.drawLine(width() - i, height() - 1, width() - 1, height() - i);
    }
}

NoteWindow::ResizeHandle NoteWindow::getResizeHandle(const QPoint &pos) const {
    const QRect rect = this->rect();

    if (QRect(0, 0, HandleSize, HandleSize).contains(pos))
        return TopLeft;
    if (QRect(rect.width() - HandleSize, 0, HandleSize, HandleSize).contains(pos))
        return TopRight;
    if (QRect(0, rect.height() - HandleSize, HandleSize, HandleSize).contains(pos))
        return BottomLeft;
    if (QRect(rect.width() - HandleSize, rect.height() - HandleSize, HandleSize, HandleSize).contains(pos))
        return BottomRight;

    if (QRect(0, 0, rect.width(), HandleSize / 2).contains(pos))
        return Top;
    if (QRect(0, rect.height() - HandleSize / 2, rect.width(), HandleSize / 2).contains(pos))
        return Bottom;
    if (QRect(0, 0, HandleSize / 2, rect.height()).contains(pos))
        return Left;
    if (QRect(rect.width() - HandleSize / 2, 0, HandleSize / 2, rect.height()).contains(pos))
        return Right;

    return None;
}

void NoteWindow::updateCursor(const QPoint &pos) {
    switch (getResizeHandle(pos)) {
        case TopLeft:
        case BottomRight:
            setCursor(Qt::SizeFDiagCursor);
            break;
        case TopRight:
        case BottomLeft:
            setCursor(Qt::SizeBDiagCursor);
            break;
        case Top:
        case Bottom:
            setCursor(Qt::SizeVerCursor);
            break;
        case Left:
        case Right:
            setCursor(Qt::SizeHorCursor);
            break;
        default:
            if (pos.y() < HeaderHeight) {
                setCursor(Qt::SizeAllCursor);
            } else {
                setCursor(Qt::ArrowCursor);
            }
            break;
    }
}
