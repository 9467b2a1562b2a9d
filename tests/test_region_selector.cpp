// Copyright 2026 The snapreel Authors
// Tests for: RegionSelector state machine, ComputeInputMode

#include <memory>

#include "core/region_selector.h"
#include "fakes.h"
#include "gtest/gtest.h"

using snapreel::fakes::MakeGradient;
using namespace snapreel::internal;  // NOLINT

// ===========================================================================
// ComputeInputMode
// ===========================================================================

TEST(InputModeTest, StillModesCaptureOnlyWithBackdrop) {
  for (auto mode : {kSnapReelModeClipboard, kSnapReelModeFile}) {
    for (bool hovering : {false, true}) {
      EXPECT_EQ(ComputeInputMode(mode, false, true, hovering),
                InputMode::kCapture);
      EXPECT_EQ(ComputeInputMode(mode, false, false, hovering),
                InputMode::kPassThrough);
    }
  }
}

TEST(InputModeTest, RecordModeBeforeRecordingCaptures) {
  EXPECT_EQ(ComputeInputMode(kSnapReelModeRecord, false, false, false),
            InputMode::kCapture);
  EXPECT_EQ(ComputeInputMode(kSnapReelModeRecord, false, true, true),
            InputMode::kCapture);
}

TEST(InputModeTest, RecordingPassesThroughUnlessOverControls) {
  for (bool backdrop : {false, true}) {
    EXPECT_EQ(ComputeInputMode(kSnapReelModeRecord, true, backdrop, false),
              InputMode::kPassThrough);
    EXPECT_EQ(ComputeInputMode(kSnapReelModeRecord, true, backdrop, true),
              InputMode::kCapture);
  }
}

// ===========================================================================
// RegionSelector
// ===========================================================================

class RegionSelectorTest : public ::testing::Test {
 protected:
  RegionSelector selector_;
};

TEST_F(RegionSelectorTest, HiddenIgnoresInput) {
  EXPECT_FALSE(selector_.visible());
  auto fx = selector_.PointerDown(PointerButton::kPrimary, Point{1, 1});
  EXPECT_EQ(fx.action, SelectorAction::kNone);
  EXPECT_EQ(selector_.state(), SelectorState::kIdle);
}

TEST_F(RegionSelectorTest, ClipboardDragCapturesOnRelease) {
  selector_.Show(kSnapReelModeClipboard, BackdropStyle::kLive);
  selector_.PointerDown(PointerButton::kPrimary, Point{300, 250});
  EXPECT_EQ(selector_.state(), SelectorState::kSelecting);
  selector_.PointerMove(Point{200, 200});
  SelectionRect live = selector_.current_rect();
  EXPECT_EQ(live, (SelectionRect{200, 200, 100, 50}));

  auto fx = selector_.PointerUp(PointerButton::kPrimary, Point{100, 100});
  EXPECT_EQ(fx.action, SelectorAction::kCaptureStill);
  EXPECT_EQ(fx.selection, (SelectionRect{100, 100, 200, 150}));
  EXPECT_EQ(selector_.state(), SelectorState::kSelected);
}

TEST_F(RegionSelectorTest, TinySelectionIsDiscarded) {
  selector_.Show(kSnapReelModeFile, BackdropStyle::kLive);
  selector_.PointerDown(PointerButton::kPrimary, Point{10, 10});
  auto fx = selector_.PointerUp(PointerButton::kPrimary, Point{14, 40});
  EXPECT_EQ(fx.action, SelectorAction::kNone);
  EXPECT_EQ(selector_.state(), SelectorState::kIdle);
  EXPECT_FALSE(selector_.interaction().has_selection);
  EXPECT_EQ(selector_.current_rect(), SelectionRect());
}

TEST_F(RegionSelectorTest, StillModeIgnoresSecondDragAfterCapture) {
  selector_.Show(kSnapReelModeClipboard, BackdropStyle::kLive);
  selector_.PointerDown(PointerButton::kPrimary, Point{0, 0});
  selector_.PointerUp(PointerButton::kPrimary, Point{50, 50});
  auto fx = selector_.PointerDown(PointerButton::kPrimary, Point{60, 60});
  EXPECT_EQ(fx.action, SelectorAction::kNone);
  EXPECT_EQ(selector_.state(), SelectorState::kSelected);
}

TEST_F(RegionSelectorTest, SecondaryButtonCancels) {
  selector_.Show(kSnapReelModeClipboard, BackdropStyle::kLive);
  selector_.PointerDown(PointerButton::kPrimary, Point{0, 0});
  auto fx = selector_.PointerDown(PointerButton::kSecondary, Point{5, 5});
  EXPECT_EQ(fx.action, SelectorAction::kCancel);
  EXPECT_EQ(selector_.state(), SelectorState::kIdle);
  EXPECT_FALSE(selector_.interaction().selecting);
}

TEST_F(RegionSelectorTest, EscapeCancels) {
  selector_.Show(kSnapReelModeRecord, BackdropStyle::kLive);
  auto fx = selector_.KeyEscape();
  EXPECT_EQ(fx.action, SelectorAction::kCancel);
}

TEST_F(RegionSelectorTest, RecordModeNeedsConfirmation) {
  selector_.Show(kSnapReelModeRecord, BackdropStyle::kLive);
  EXPECT_EQ(selector_.ConfirmRecording().action, SelectorAction::kNone);

  selector_.PointerDown(PointerButton::kPrimary, Point{10, 10});
  auto up = selector_.PointerUp(PointerButton::kPrimary, Point{110, 60});
  EXPECT_EQ(up.action, SelectorAction::kNone);
  EXPECT_EQ(selector_.state(), SelectorState::kSelected);

  auto fx = selector_.ConfirmRecording();
  EXPECT_EQ(fx.action, SelectorAction::kStartRecording);
  EXPECT_EQ(fx.selection, (SelectionRect{10, 10, 100, 50}));
  EXPECT_EQ(selector_.state(), SelectorState::kConfirmed);
  // Confirmed selection cannot be redrawn.
  selector_.PointerDown(PointerButton::kPrimary, Point{0, 0});
  EXPECT_EQ(selector_.state(), SelectorState::kConfirmed);
}

TEST_F(RegionSelectorTest, RecordModeAllowsReselect) {
  selector_.Show(kSnapReelModeRecord, BackdropStyle::kLive);
  selector_.PointerDown(PointerButton::kPrimary, Point{10, 10});
  selector_.PointerUp(PointerButton::kPrimary, Point{110, 60});
  selector_.PointerDown(PointerButton::kPrimary, Point{20, 20});
  EXPECT_EQ(selector_.state(), SelectorState::kSelecting);
  EXPECT_FALSE(selector_.interaction().has_selection);
}

TEST_F(RegionSelectorTest, RecordModeForcesLiveBackdrop) {
  selector_.Show(kSnapReelModeRecord, BackdropStyle::kFrozen);
  EXPECT_EQ(selector_.style(), BackdropStyle::kLive);
  selector_.SetBackdrop(MakeGradient(8, 8));
  EXPECT_EQ(selector_.backdrop(), nullptr);
}

TEST_F(RegionSelectorTest, FrozenBackdropControlsInputMode) {
  auto fx = selector_.Show(kSnapReelModeClipboard, BackdropStyle::kFrozen);
  EXPECT_EQ(fx.input_mode, InputMode::kPassThrough);
  EXPECT_FALSE(selector_.interaction().has_backdrop);

  fx = selector_.SetBackdrop(MakeGradient(8, 8));
  EXPECT_EQ(fx.input_mode, InputMode::kCapture);
  EXPECT_NE(selector_.backdrop(), nullptr);

  fx = selector_.ClearBackdrop();
  EXPECT_EQ(fx.input_mode, InputMode::kPassThrough);
  EXPECT_EQ(selector_.backdrop(), nullptr);
}

TEST_F(RegionSelectorTest, ShowReleasesPreviousBackdrop) {
  selector_.Show(kSnapReelModeFile, BackdropStyle::kFrozen);
  std::shared_ptr<const snapreel::internal::Image> still = MakeGradient(8, 8);
  selector_.SetBackdrop(still);
  EXPECT_EQ(still.use_count(), 2);
  selector_.Show(kSnapReelModeFile, BackdropStyle::kFrozen);
  EXPECT_EQ(still.use_count(), 1);
  selector_.SetBackdrop(still);
  selector_.Hide();
  EXPECT_EQ(still.use_count(), 1);
  EXPECT_FALSE(selector_.visible());
}

TEST_F(RegionSelectorTest, RecordingHoverTogglesPassThrough) {
  selector_.Show(kSnapReelModeRecord, BackdropStyle::kLive);
  auto fx = selector_.SetRecordingActive(true);
  EXPECT_EQ(fx.input_mode, InputMode::kPassThrough);
  EXPECT_TRUE(fx.forward_pointer);

  fx = selector_.SetHoveringControl(true);
  EXPECT_EQ(fx.input_mode, InputMode::kCapture);
  EXPECT_TRUE(fx.redraw);
  EXPECT_FALSE(selector_.SetHoveringControl(true).redraw);

  fx = selector_.SetRecordingActive(false);
  EXPECT_EQ(fx.input_mode, InputMode::kCapture);
}

TEST(SelectorStateNameTest, Names) {
  EXPECT_STREQ(SelectorStateName(SelectorState::kIdle), "idle");
  EXPECT_STREQ(SelectorStateName(SelectorState::kConfirmed), "confirmed");
}
