#pragma once

#include "core/drag_reparent.hpp"

#include <QObject>

namespace pagetree::ui {

enum class TreeAddMode {
    Branch = 0,
    Insert = 1
};

/**
 * TreeSettings - persisted tree editor preferences.
 *
 * Values are read from QSettings on every access so several instances stay
 * consistent. Out-of-range stored values fall back to the defaults.
 */
class TreeSettings : public QObject {
    Q_OBJECT

    Q_PROPERTY(int addMode READ addModeValue WRITE setAddModeValue NOTIFY addModeChanged)
    Q_PROPERTY(int dragMode READ dragModeValue WRITE setDragModeValue NOTIFY dragModeChanged)
    Q_PROPERTY(bool buttonDropMovesSubtree READ buttonDropMovesSubtree WRITE setButtonDropMovesSubtree
                   NOTIFY buttonDropMovesSubtreeChanged)
    Q_PROPERTY(bool embedOnSave READ embedOnSave WRITE setEmbedOnSave NOTIFY embedOnSaveChanged)
    Q_PROPERTY(int undoLimit READ undoLimit WRITE setUndoLimit NOTIFY undoLimitChanged)

public:
    static constexpr int kDefaultUndoLimit = 200;
    static constexpr int kMaxUndoLimit = 10000;

    explicit TreeSettings(QObject* parent = nullptr) : QObject(parent) {}

    [[nodiscard]] TreeAddMode addMode() const;
    void setAddMode(TreeAddMode mode);

    [[nodiscard]] DragMode dragMode() const;
    void setDragMode(DragMode mode);

    [[nodiscard]] bool buttonDropMovesSubtree() const;
    void setButtonDropMovesSubtree(bool enabled);

    /** Whether saved page lists carry the tree marker. */
    [[nodiscard]] bool embedOnSave() const;
    void setEmbedOnSave(bool enabled);

    /** Maximum undo depth; 0 means unlimited. */
    [[nodiscard]] int undoLimit() const;
    void setUndoLimit(int limit);

    [[nodiscard]] int addModeValue() const { return static_cast<int>(addMode()); }
    void setAddModeValue(int mode);
    [[nodiscard]] int dragModeValue() const { return static_cast<int>(dragMode()); }
    void setDragModeValue(int mode);

signals:
    void addModeChanged();
    void dragModeChanged();
    void buttonDropMovesSubtreeChanged();
    void embedOnSaveChanged();
    void undoLimitChanged();
};

} // namespace pagetree::ui
