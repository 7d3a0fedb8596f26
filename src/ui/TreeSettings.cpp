#include "ui/TreeSettings.hpp"

#include <QSettings>

namespace pagetree::ui {
namespace {

constexpr auto kSettingsAddMode = "tree/add_mode";
constexpr auto kSettingsDragMode = "tree/drag_mode";
constexpr auto kSettingsButtonDropMovesSubtree = "tree/button_drop_moves_subtree";
constexpr auto kSettingsEmbedOnSave = "tree/embed_on_save";
constexpr auto kSettingsUndoLimit = "history/undo_limit";

TreeAddMode normalize_add_mode(int mode) {
    return (mode == 1) ? TreeAddMode::Insert : TreeAddMode::Branch;
}

DragMode normalize_drag_mode(int mode) {
    switch (mode) {
        case static_cast<int>(DragMode::Reorder): return DragMode::Reorder;
        case static_cast<int>(DragMode::AttachBranch): return DragMode::AttachBranch;
        default: return DragMode::AttachSingle;
    }
}

int normalize_undo_limit(int limit) {
    if (limit < 0) return TreeSettings::kDefaultUndoLimit;
    if (limit > TreeSettings::kMaxUndoLimit) return TreeSettings::kMaxUndoLimit;
    return limit;
}

QVariant stored(const char* key, const QVariant& fallback) {
    QSettings settings;
    return settings.value(QString::fromLatin1(key), fallback);
}

// Returns true when the stored value changed.
bool store(const char* key, const QVariant& value) {
    QSettings settings;
    const auto k = QString::fromLatin1(key);
    if (settings.contains(k) && settings.value(k) == value) return false;
    settings.setValue(k, value);
    return true;
}

} // namespace

TreeAddMode TreeSettings::addMode() const {
    return normalize_add_mode(stored(kSettingsAddMode, 0).toInt());
}

void TreeSettings::setAddMode(TreeAddMode mode) {
    if (store(kSettingsAddMode, static_cast<int>(mode))) emit addModeChanged();
}

void TreeSettings::setAddModeValue(int mode) {
    setAddMode(normalize_add_mode(mode));
}

DragMode TreeSettings::dragMode() const {
    return normalize_drag_mode(stored(kSettingsDragMode, static_cast<int>(DragMode::AttachSingle)).toInt());
}

void TreeSettings::setDragMode(DragMode mode) {
    if (store(kSettingsDragMode, static_cast<int>(mode))) emit dragModeChanged();
}

void TreeSettings::setDragModeValue(int mode) {
    setDragMode(normalize_drag_mode(mode));
}

bool TreeSettings::buttonDropMovesSubtree() const {
    return stored(kSettingsButtonDropMovesSubtree, false).toBool();
}

void TreeSettings::setButtonDropMovesSubtree(bool enabled) {
    if (store(kSettingsButtonDropMovesSubtree, enabled)) emit buttonDropMovesSubtreeChanged();
}

bool TreeSettings::embedOnSave() const {
    return stored(kSettingsEmbedOnSave, true).toBool();
}

void TreeSettings::setEmbedOnSave(bool enabled) {
    if (store(kSettingsEmbedOnSave, enabled)) emit embedOnSaveChanged();
}

int TreeSettings::undoLimit() const {
    return normalize_undo_limit(stored(kSettingsUndoLimit, kDefaultUndoLimit).toInt());
}

void TreeSettings::setUndoLimit(int limit) {
    if (store(kSettingsUndoLimit, normalize_undo_limit(limit))) emit undoLimitChanged();
}

} // namespace pagetree::ui
