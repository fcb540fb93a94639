#include "svgcore/selection/selection_manager.h"
#include "svgcore/state/document_store.h"
#include "svgcore/core/logging.h"

#include <algorithm>
#include <unordered_set>

namespace svgcore {

SelectionManager::SelectionManager(DocumentStore& store) : store_(store) {
    subscription_ = store_.subscribe(fieldMask(StoreField::Selection), [this](const StoreChange& change) {
        onStoreChange(change);
    });
}

SelectionManager::~SelectionManager() {
    store_.unsubscribe(subscription_);
}

std::vector<IdentityToken> SelectionManager::resolve(const std::vector<std::string>& ids) const {
    std::vector<IdentityToken> tokens;
    tokens.reserve(ids.size());
    for (const auto& id : ids) {
        IdentityToken t;
        if (!store_.registry().tokenForId(id, t)) {
            SVGCORE_LOG_DEBUG("selection: unknown id '%s' ignored", id.c_str());
            continue;
        }
        tokens.push_back(t);
    }
    return tokens;
}

void SelectionManager::select(const std::vector<std::string>& ids) {
    setSelection(ids, Mode::Replace);
}

void SelectionManager::addToSelection(const std::vector<std::string>& ids) {
    setSelection(ids, Mode::Add);
}

void SelectionManager::removeFromSelection(const std::vector<std::string>& ids) {
    setSelection(ids, Mode::Remove);
}

void SelectionManager::toggleSelection(std::string_view id) {
    setSelection({std::string(id)}, Mode::Toggle);
}

void SelectionManager::clearSelection() {
    if (!store_.hasSelection()) return;
    store_.setSelection({});
}

void SelectionManager::setSelection(const std::vector<std::string>& ids, Mode mode) {
    selectTokens(resolve(ids), mode);
}

void SelectionManager::selectTokens(const std::vector<IdentityToken>& tokens, Mode mode) {
    const std::vector<IdentityToken>& current = store_.selection();
    std::unordered_set<IdentityToken, IdentityTokenHash> set(current.begin(), current.end());
    std::vector<IdentityToken> next;

    if (mode == Mode::Replace) {
        set.clear();
    } else {
        next = current;
    }

    auto applyInsert = [&](const IdentityToken& t) {
        if (set.insert(t).second) next.push_back(t);
    };
    auto applyErase = [&](const IdentityToken& t) {
        if (set.erase(t) == 0) return;
        next.erase(std::remove(next.begin(), next.end(), t), next.end());
    };

    for (const auto& t : tokens) {
        if (!store_.registry().contains(t)) continue;
        switch (mode) {
            case Mode::Replace:
            case Mode::Add:
                applyInsert(t);
                break;
            case Mode::Remove:
                applyErase(t);
                break;
            case Mode::Toggle:
                if (set.find(t) != set.end()) {
                    applyErase(t);
                } else {
                    applyInsert(t);
                }
                break;
        }
    }

    // The store dedups, orders by document position and skips no-op writes.
    store_.setSelection(next);
}

void SelectionManager::setHovered(std::string_view id) {
    IdentityToken t;
    if (id.empty() || !store_.registry().tokenForId(id, t)) t = IdentityToken{};
    store_.setHoveredToken(t);
}

std::vector<std::string> SelectionManager::getSelectedIds() const {
    return store_.selectedIds();
}

bool SelectionManager::hasSelection() const noexcept {
    return store_.hasSelection();
}

std::size_t SelectionManager::getSelectionCount() const noexcept {
    return store_.selectionCount();
}

bool SelectionManager::isSelected(const IdentityToken& token) const noexcept {
    return store_.isSelected(token);
}

void SelectionManager::registerSyncCallbacks(SelectionSyncCallbacks hooks) {
    hooks_ = std::move(hooks);
}

void SelectionManager::onStoreChange(const StoreChange&) {
    generation_++;

    SelectionChangeEvent ev;
    ev.selectedIds = store_.selectedIds();
    ev.tokens = store_.selection();
    ev.generation = generation_;

    if (hooks_.onCanvasSync) hooks_.onCanvasSync(ev);
    if (hooks_.onHierarchySync) hooks_.onHierarchySync(ev);
    if (hooks_.onRawTextSync) hooks_.onRawTextSync(ev);
    if (hooks_.onInspectorSync) hooks_.onInspectorSync(ev);
}

} // namespace svgcore
