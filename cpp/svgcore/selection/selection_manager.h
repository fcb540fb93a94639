#pragma once

#include "svgcore/document/identity_token.h"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace svgcore {

class DocumentStore;
struct StoreChange;

struct SelectionChangeEvent {
    std::vector<std::string> selectedIds;
    std::vector<IdentityToken> tokens;
    std::uint32_t generation = 0;
};

using SelectionSyncHook = std::function<void(const SelectionChangeEvent&)>;

// View side channels. Any hook may be left empty.
struct SelectionSyncCallbacks {
    SelectionSyncHook onCanvasSync;
    SelectionSyncHook onHierarchySync;
    SelectionSyncHook onRawTextSync;
    SelectionSyncHook onInspectorSync;
};

class SelectionManager {
public:
    enum class Mode : std::uint32_t { Replace = 0, Add = 1, Remove = 2, Toggle = 3 };

    explicit SelectionManager(DocumentStore& store);
    ~SelectionManager();

    SelectionManager(const SelectionManager&) = delete;
    SelectionManager& operator=(const SelectionManager&) = delete;

    // Ids may be internal, original or author-visible; unknown ids are skipped.
    void select(const std::vector<std::string>& ids);
    void addToSelection(const std::vector<std::string>& ids);
    void removeFromSelection(const std::vector<std::string>& ids);
    void toggleSelection(std::string_view id);
    void clearSelection();

    void setSelection(const std::vector<std::string>& ids, Mode mode);
    void selectTokens(const std::vector<IdentityToken>& tokens, Mode mode = Mode::Replace);

    // Empty or unknown id clears the hover.
    void setHovered(std::string_view id);

    std::vector<std::string> getSelectedIds() const;
    bool hasSelection() const noexcept;
    std::size_t getSelectionCount() const noexcept;
    bool isSelected(const IdentityToken& token) const noexcept;
    std::uint32_t getGeneration() const noexcept { return generation_; }

    void registerSyncCallbacks(SelectionSyncCallbacks hooks);

private:
    std::vector<IdentityToken> resolve(const std::vector<std::string>& ids) const;
    void onStoreChange(const StoreChange& change);

    DocumentStore& store_;
    SelectionSyncCallbacks hooks_;
    std::uint32_t subscription_ = 0;
    std::uint32_t generation_ = 0;
};

} // namespace svgcore
