#include <gtest/gtest.h>
#include "svgcore/selection/selection_manager.h"
#include "tests/test_common.h"

using namespace svgcore;

using SelectionManagerTest = EditorTest;

TEST_F(SelectionManagerTest, SelectResolvesAnyIdForm) {
    SelectionManager& sel = editor().selection();
    sel.select({"grp", "r1", "svg-node-3"});
    EXPECT_EQ(sel.getSelectedIds(), (std::vector<std::string>{"svg-node-2", "svg-node-3", "svg-node-4"}));
    EXPECT_EQ(sel.getSelectionCount(), 3u);
}

TEST_F(SelectionManagerTest, UnknownIdsAreIgnored) {
    SelectionManager& sel = editor().selection();
    sel.select({"nope", "r1"});
    EXPECT_EQ(sel.getSelectedIds(), (std::vector<std::string>{"svg-node-2"}));

    sel.select({"nope"});
    EXPECT_FALSE(sel.hasSelection());
}

TEST_F(SelectionManagerTest, AddRemoveToggle) {
    SelectionManager& sel = editor().selection();
    sel.select({"r1"});
    sel.addToSelection({"svg-node-5", "r1"});
    EXPECT_EQ(sel.getSelectedIds(), (std::vector<std::string>{"svg-node-2", "svg-node-5"}));

    sel.removeFromSelection({"r1", "grp"});
    EXPECT_EQ(sel.getSelectedIds(), (std::vector<std::string>{"svg-node-5"}));

    sel.toggleSelection("r1");
    sel.toggleSelection("svg-node-5");
    EXPECT_EQ(sel.getSelectedIds(), (std::vector<std::string>{"svg-node-2"}));

    sel.setSelection({"grp"}, SelectionManager::Mode::Replace);
    EXPECT_EQ(sel.getSelectedIds(), (std::vector<std::string>{"svg-node-4"}));

    sel.clearSelection();
    EXPECT_FALSE(sel.hasSelection());
}

TEST_F(SelectionManagerTest, SyncCallbacksFireOncePerChange) {
    SelectionManager& sel = editor().selection();
    int canvas = 0;
    int hierarchy = 0;
    int raw = 0;
    int inspector = 0;
    std::vector<std::string> lastIds;

    SelectionSyncCallbacks hooks;
    hooks.onCanvasSync = [&](const SelectionChangeEvent& ev) {
        canvas++;
        lastIds = ev.selectedIds;
    };
    hooks.onHierarchySync = [&](const SelectionChangeEvent&) { hierarchy++; };
    hooks.onRawTextSync = [&](const SelectionChangeEvent&) { raw++; };
    hooks.onInspectorSync = [&](const SelectionChangeEvent& ev) {
        inspector++;
        EXPECT_EQ(ev.tokens.size(), ev.selectedIds.size());
    };
    sel.registerSyncCallbacks(std::move(hooks));

    const std::uint32_t gen = sel.getGeneration();
    sel.select({"r1"});
    EXPECT_EQ(canvas, 1);
    EXPECT_EQ(hierarchy, 1);
    EXPECT_EQ(raw, 1);
    EXPECT_EQ(inspector, 1);
    EXPECT_EQ(lastIds, (std::vector<std::string>{"svg-node-2"}));
    EXPECT_EQ(sel.getGeneration(), gen + 1);

    // No-op write is not a change.
    sel.select({"r1"});
    EXPECT_EQ(canvas, 1);
    EXPECT_EQ(sel.getGeneration(), gen + 1);
}

TEST_F(SelectionManagerTest, PartialHooksAreAllowed) {
    SelectionManager& sel = editor().selection();
    int canvas = 0;
    SelectionSyncCallbacks hooks;
    hooks.onCanvasSync = [&](const SelectionChangeEvent&) { canvas++; };
    sel.registerSyncCallbacks(std::move(hooks));

    sel.select({"grp"});
    sel.clearSelection();
    EXPECT_EQ(canvas, 2);
}

TEST_F(SelectionManagerTest, SelectionSurvivesUnrelatedEdit) {
    SelectionManager& sel = editor().selection();
    sel.select({"r1", "grp"});
    ASSERT_EQ(editor().setAttribute("svg-node-3", "fill", "red"), EditorError::Ok);
    EXPECT_EQ(sel.getSelectedIds(), (std::vector<std::string>{"svg-node-2", "svg-node-4"}));
}

TEST_F(SelectionManagerTest, SelectionIsPrunedWhenElementsDisappear) {
    SelectionManager& sel = editor().selection();
    sel.select({"r1", "grp"});
    ASSERT_EQ(editor().loadText("<svg><rect id=\"r1\"/></svg>"), EditorError::Ok);
    EXPECT_FALSE(sel.hasSelection());
}

TEST_F(SelectionManagerTest, HoverFollowsIds) {
    SelectionManager& sel = editor().selection();
    sel.setHovered("r1");
    IdentityToken rect;
    ASSERT_TRUE(editor().store().registry().tokenForId("r1", rect));
    EXPECT_EQ(editor().store().hoveredToken(), rect);

    sel.setHovered("");
    EXPECT_TRUE(editor().store().hoveredToken().isNull());

    sel.setHovered("r1");
    sel.setHovered("missing");
    EXPECT_TRUE(editor().store().hoveredToken().isNull());
}
