#include <gtest/gtest.h>
#include "tests/test_common.h"

using namespace svgcore;
using svgcore_test::attributeOf;

using GestureTest = EditorTest;

TEST_F(GestureTest, DragCommitsOneMove) {
    const std::uint64_t before = editor().getDocumentDigest();
    GestureEngine& gestures = editor().gestures();

    ASSERT_TRUE(editor().pointerDown("r1", 100, 100));
    EXPECT_EQ(gestures.getState(), GestureState::Armed);
    editor().pointerMove(105, 105);
    EXPECT_EQ(gestures.getState(), GestureState::Live);
    editor().pointerMove(110, 115);

    // Live feedback is visible in place, without history.
    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "20");
    EXPECT_EQ(attributeOf(editor(), "r1", "y"), "35");
    EXPECT_EQ(editor().history().getHistorySize(), 0u);

    EXPECT_EQ(editor().pointerUp(), GestureOutcome::Committed);
    EXPECT_EQ(gestures.getState(), GestureState::Idle);
    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "20");
    EXPECT_EQ(attributeOf(editor(), "r1", "y"), "35");
    ASSERT_EQ(editor().history().getHistorySize(), 1u);
    EXPECT_EQ(editor().history().peekUndoLabel(), "Move element");

    ASSERT_EQ(editor().undo(), EditorError::Ok);
    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "10");
    EXPECT_EQ(editor().getDocumentDigest(), before);

    ASSERT_EQ(editor().redo(), EditorError::Ok);
    EXPECT_EQ(attributeOf(editor(), "r1", "y"), "35");
}

TEST_F(GestureTest, PressWithoutMoveIsAClick) {
    const std::uint64_t before = editor().getDocumentDigest();
    ASSERT_TRUE(editor().pointerDown("r1", 0, 0));
    EXPECT_EQ(editor().pointerUp(), GestureOutcome::Click);
    EXPECT_EQ(editor().getDocumentDigest(), before);
    EXPECT_EQ(editor().history().getHistorySize(), 0u);
}

TEST_F(GestureTest, MovementBelowEpsilonIsAClick) {
    const std::uint64_t before = editor().getDocumentDigest();
    ASSERT_TRUE(editor().pointerDown("svg-node-3", 0, 0));
    editor().pointerMove(0.001, 0.002);
    EXPECT_EQ(editor().pointerUp(), GestureOutcome::Click);
    EXPECT_EQ(editor().getDocumentDigest(), before);
    EXPECT_EQ(attributeOf(editor(), "svg-node-3", "cx"), "50");
    EXPECT_EQ(editor().history().getHistorySize(), 0u);
}

TEST_F(GestureTest, PointerLeaveCancelsLiveDrag) {
    const std::uint64_t before = editor().getDocumentDigest();
    ASSERT_TRUE(editor().pointerDown("svg-node-3", 0, 0));
    editor().pointerMove(30, 30);
    EXPECT_EQ(attributeOf(editor(), "svg-node-3", "cx"), "80");

    EXPECT_EQ(editor().pointerLeave(), GestureOutcome::Cancelled);
    EXPECT_EQ(attributeOf(editor(), "svg-node-3", "cx"), "50");
    EXPECT_EQ(editor().getDocumentDigest(), before);
    EXPECT_EQ(editor().history().getHistorySize(), 0u);
    EXPECT_EQ(editor().pointerUp(), GestureOutcome::None);
}

TEST_F(GestureTest, LeaveWhileArmedIsNotACancel) {
    ASSERT_TRUE(editor().pointerDown("r1", 0, 0));
    EXPECT_EQ(editor().pointerLeave(), GestureOutcome::None);
    EXPECT_FALSE(editor().gestures().isGestureActive());
}

TEST_F(GestureTest, SelectedElementsMoveTogether) {
    editor().select({"r1", "svg-node-3"});
    ASSERT_TRUE(editor().pointerDown("svg-node-3", 0, 0));
    EXPECT_EQ(editor().gestures().getMovingTokens().size(), 2u);
    editor().pointerMove(5, -5);
    EXPECT_EQ(editor().pointerUp(), GestureOutcome::Committed);

    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "15");
    EXPECT_EQ(attributeOf(editor(), "r1", "y"), "15");
    EXPECT_EQ(attributeOf(editor(), "svg-node-3", "cx"), "55");
    EXPECT_EQ(editor().history().peekUndoLabel(), "Move elements");
    EXPECT_EQ(editor().getSelectedIds(), (std::vector<std::string>{"svg-node-2", "svg-node-3"}));

    ASSERT_EQ(editor().undo(), EditorError::Ok);
    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "10");
    EXPECT_EQ(attributeOf(editor(), "svg-node-3", "cx"), "50");
}

TEST_F(GestureTest, UnselectedTargetMovesAlone) {
    editor().select({"r1"});
    ASSERT_TRUE(editor().pointerDown("svg-node-3", 0, 0));
    EXPECT_EQ(editor().gestures().getMovingTokens().size(), 1u);
    editor().pointerMove(1, 1);
    EXPECT_EQ(editor().pointerUp(), GestureOutcome::Committed);
    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "10");
    EXPECT_EQ(attributeOf(editor(), "svg-node-3", "cx"), "51");
    EXPECT_EQ(editor().getSelectedIds(), (std::vector<std::string>{"svg-node-2"}));
}

TEST_F(GestureTest, GroupMovesThroughTransform) {
    editor().select({"grp", "svg-node-5"});
    ASSERT_TRUE(editor().pointerDown("grp", 0, 0));
    // The line moves with its group; moving it again would double the offset.
    EXPECT_EQ(editor().gestures().getMovingTokens().size(), 1u);
    editor().pointerMove(7, 8);
    EXPECT_EQ(editor().pointerUp(), GestureOutcome::Committed);

    EXPECT_EQ(attributeOf(editor(), "grp", "transform"), "translate(7, 8)");
    EXPECT_EQ(attributeOf(editor(), "svg-node-5", "x1"), "0");

    ASSERT_EQ(editor().undo(), EditorError::Ok);
    EXPECT_EQ(attributeOf(editor(), "grp", "transform"), "<absent>");
}

TEST_F(GestureTest, RootAndUnknownIdsDoNotArm) {
    EXPECT_FALSE(editor().pointerDown("svg-node-1", 0, 0));
    EXPECT_FALSE(editor().pointerDown("missing", 0, 0));
    EXPECT_FALSE(editor().gestures().isGestureActive());
}

TEST_F(GestureTest, OutlineFollowsMovingElements) {
    ASSERT_TRUE(editor().pointerDown("r1", 0, 0));
    editor().pointerMove(10, 0);
    const std::vector<Bounds> outline = editor().gestures().getSelectionOutline();
    ASSERT_EQ(outline.size(), 1u);
    EXPECT_DOUBLE_EQ(outline[0].minX, 20.0);
    EXPECT_DOUBLE_EQ(outline[0].maxX, 50.0);
    const Point2 delta = editor().gestures().getTotalDelta();
    EXPECT_DOUBLE_EQ(delta.x, 10.0);
    editor().gestures().cancel();
    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "10");
}

TEST_F(GestureTest, DocumentReplacedMidGestureDropsIt) {
    ASSERT_TRUE(editor().pointerDown("r1", 0, 0));
    editor().pointerMove(10, 0);
    ASSERT_EQ(editor().loadText(svgcore_test::kSampleSvg), EditorError::Ok);
    editor().pointerMove(20, 0);
    EXPECT_EQ(editor().pointerUp(), GestureOutcome::None);
    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "10");
    EXPECT_EQ(editor().history().getHistorySize(), 0u);
}

TEST_F(GestureTest, EachDragIsOneUndoStep) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(editor().pointerDown("r1", 0, 0));
        for (int step = 1; step <= 10; ++step) editor().pointerMove(step, 0);
        ASSERT_EQ(editor().pointerUp(), GestureOutcome::Committed);
    }
    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "40");
    EXPECT_EQ(editor().history().getHistorySize(), 3u);
    ASSERT_EQ(editor().undo(), EditorError::Ok);
    EXPECT_EQ(attributeOf(editor(), "r1", "x"), "30");
}

TEST(GestureRestoreTest, UndoRestoresPositionsVerbatim) {
    EditorContext editor(svgcore_test::seededConfig());
    ASSERT_EQ(editor.loadText(
        "<svg xmlns=\"http://www.w3.org/2000/svg\">"
        "<rect id=\"a\" width=\"5\" height=\"5\" y=\"2.50\"/>"
        "<path id=\"p\" transform=\"translate(10)\" d=\"M 0 0 L 1 1\"/>"
        "</svg>"), EditorError::Ok);
    const std::uint64_t before = editor.getDocumentDigest();
    const std::string exportedBefore = editor.exportText();

    ASSERT_TRUE(editor.pointerDown("a", 0, 0));
    editor.pointerMove(3, 4);
    ASSERT_EQ(editor.pointerUp(), GestureOutcome::Committed);
    ASSERT_TRUE(editor.pointerDown("p", 0, 0));
    editor.pointerMove(3, 4);
    ASSERT_EQ(editor.pointerUp(), GestureOutcome::Committed);

    EXPECT_EQ(attributeOf(editor, "a", "x"), "3");
    EXPECT_EQ(attributeOf(editor, "a", "y"), "6.5");
    EXPECT_EQ(attributeOf(editor, "p", "transform"), "translate(13, 4)");
    const std::uint64_t after = editor.getDocumentDigest();

    ASSERT_EQ(editor.undo(), EditorError::Ok);
    ASSERT_EQ(editor.undo(), EditorError::Ok);
    EXPECT_EQ(attributeOf(editor, "a", "x"), "<absent>");
    EXPECT_EQ(attributeOf(editor, "a", "y"), "2.50");
    EXPECT_EQ(attributeOf(editor, "p", "transform"), "translate(10)");
    EXPECT_EQ(editor.exportText(), exportedBefore);
    EXPECT_EQ(editor.getDocumentDigest(), before);

    ASSERT_EQ(editor.redo(), EditorError::Ok);
    ASSERT_EQ(editor.redo(), EditorError::Ok);
    EXPECT_EQ(editor.getDocumentDigest(), after);
}

TEST(GestureRestoreTest, TransformDroppedMidDragComesBackInPlace) {
    EditorContext editor(svgcore_test::seededConfig());
    ASSERT_EQ(editor.loadText(
        "<svg xmlns=\"http://www.w3.org/2000/svg\">"
        "<g id=\"g\" transform=\"translate(5, 5)\" fill=\"red\"/>"
        "</svg>"), EditorError::Ok);
    const std::string exportedBefore = editor.exportText();

    ASSERT_TRUE(editor.pointerDown("g", 0, 0));
    editor.pointerMove(-5, -5);
    EXPECT_EQ(attributeOf(editor, "g", "transform"), "<absent>");
    editor.pointerMove(1, 1);
    ASSERT_EQ(editor.pointerUp(), GestureOutcome::Committed);

    ASSERT_EQ(editor.undo(), EditorError::Ok);
    EXPECT_EQ(editor.exportText(), exportedBefore);
}

TEST_F(GestureTest, DirectMoveCommitRecordsPositions) {
    IdentityToken rect;
    ASSERT_TRUE(editor().store().registry().tokenForId("r1", rect));
    const std::uint64_t before = editor().getDocumentDigest();

    ASSERT_EQ(editor().commitOperation(makeMoveOperation({rect}, 0.1, 0.2)), EditorError::Ok);
    ASSERT_NE(editor().history().peekUndo(), nullptr);
    EXPECT_EQ(editor().history().peekUndo()->positions.size(), 1u);

    ASSERT_EQ(editor().undo(), EditorError::Ok);
    EXPECT_EQ(editor().getDocumentDigest(), before);
}
