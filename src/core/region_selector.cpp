// Copyright 2026 The snapreel Authors

#include "core/region_selector.h"

#include <utility>

#include "core/logger.h"

namespace snapreel {
namespace internal {

InputMode ComputeInputMode(SnapReelCaptureMode mode, bool recording_active,
                           bool has_backdrop, bool hovering_control) {
  if (mode == kSnapReelModeRecord) {
    if (!recording_active) return InputMode::kCapture;
    return hovering_control ? InputMode::kCapture : InputMode::kPassThrough;
  }
  return has_backdrop ? InputMode::kCapture : InputMode::kPassThrough;
}

const char* SelectorStateName(SelectorState state) {
  switch (state) {
    case SelectorState::kIdle:      return "idle";
    case SelectorState::kSelecting: return "selecting";
    case SelectorState::kSelected:  return "selected";
    case SelectorState::kConfirmed: return "confirmed";
  }
  return "unknown";
}

SelectionRect RegionSelector::current_rect() const {
  if (interaction_.selecting) {
    return RectFromDrag(interaction_.start_point, current_point_);
  }
  if (interaction_.has_selection) return interaction_.selection;
  return SelectionRect();
}

InputMode RegionSelector::input_mode() const {
  return ComputeInputMode(mode_, interaction_.recording_active,
                          interaction_.has_backdrop,
                          interaction_.hovering_control);
}

SelectorEffects RegionSelector::MakeEffects(SelectorAction action,
                                            bool redraw) const {
  SelectorEffects fx;
  fx.action = action;
  fx.input_mode = input_mode();
  fx.forward_pointer = fx.input_mode == InputMode::kPassThrough;
  fx.redraw = redraw;
  if (interaction_.has_selection) fx.selection = interaction_.selection;
  return fx;
}

void RegionSelector::ResetInteraction() {
  interaction_ = OverlayInteractionState();
  current_point_ = Point();
  state_ = SelectorState::kIdle;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

SelectorEffects RegionSelector::Show(SnapReelCaptureMode mode,
                                     BackdropStyle style) {
  backdrop_.reset();
  ResetInteraction();
  visible_ = true;
  mode_ = mode;
  style_ = mode == kSnapReelModeRecord ? BackdropStyle::kLive : style;
  // The live desktop is its own backdrop.
  interaction_.has_backdrop = style_ == BackdropStyle::kLive;
  SNAPREEL_LOG_DEBUG("RegionSelector: show mode={} frozen={}",
                     static_cast<int>(mode_), style_ == BackdropStyle::kFrozen);
  return MakeEffects(SelectorAction::kNone, true);
}

SelectorEffects RegionSelector::Hide() {
  backdrop_.reset();
  ResetInteraction();
  visible_ = false;
  return MakeEffects(SelectorAction::kNone, false);
}

SelectorEffects RegionSelector::SetBackdrop(std::shared_ptr<const Image> still) {
  if (!visible_ || style_ != BackdropStyle::kFrozen) {
    SNAPREEL_LOG_DEBUG("RegionSelector: backdrop ignored (not frozen)");
    return MakeEffects(SelectorAction::kNone, false);
  }
  backdrop_ = std::move(still);
  interaction_.has_backdrop = static_cast<bool>(backdrop_);
  return MakeEffects(SelectorAction::kNone, true);
}

SelectorEffects RegionSelector::ClearBackdrop() {
  backdrop_.reset();
  if (style_ == BackdropStyle::kFrozen) interaction_.has_backdrop = false;
  return MakeEffects(SelectorAction::kNone, true);
}

// ---------------------------------------------------------------------------
// Pointer / keyboard
// ---------------------------------------------------------------------------

SelectorEffects RegionSelector::PointerDown(PointerButton button,
                                            const Point& p) {
  if (!visible_) return MakeEffects(SelectorAction::kNone, false);

  if (button == PointerButton::kSecondary) return KeyEscape();
  if (button != PointerButton::kPrimary) {
    return MakeEffects(SelectorAction::kNone, false);
  }
  // Terminal or recording: the control bar handles clicks.
  if (state_ == SelectorState::kConfirmed ||
      (state_ == SelectorState::kSelected && mode_ != kSnapReelModeRecord)) {
    return MakeEffects(SelectorAction::kNone, false);
  }

  interaction_.selecting = true;
  interaction_.start_point = p;
  interaction_.has_selection = false;
  interaction_.selection = SelectionRect();
  current_point_ = p;
  state_ = SelectorState::kSelecting;
  return MakeEffects(SelectorAction::kNone, true);
}

SelectorEffects RegionSelector::PointerMove(const Point& p) {
  if (!visible_ || state_ != SelectorState::kSelecting) {
    return MakeEffects(SelectorAction::kNone, false);
  }
  current_point_ = p;
  return MakeEffects(SelectorAction::kNone, true);
}

SelectorEffects RegionSelector::PointerUp(PointerButton button,
                                          const Point& p) {
  if (!visible_ || button != PointerButton::kPrimary ||
      state_ != SelectorState::kSelecting) {
    return MakeEffects(SelectorAction::kNone, false);
  }
  current_point_ = p;
  SelectionRect rect = RectFromDrag(interaction_.start_point, p);
  interaction_.selecting = false;

  if (!IsUsableSelection(rect)) {
    state_ = SelectorState::kIdle;
    return MakeEffects(SelectorAction::kNone, true);
  }

  interaction_.has_selection = true;
  interaction_.selection = rect;
  state_ = SelectorState::kSelected;
  SNAPREEL_LOG_DEBUG("RegionSelector: selected [{},{} {}x{}]", rect.x, rect.y,
                     rect.width, rect.height);

  if (mode_ == kSnapReelModeRecord) {
    return MakeEffects(SelectorAction::kNone, true);
  }
  return MakeEffects(SelectorAction::kCaptureStill, true);
}

SelectorEffects RegionSelector::KeyEscape() {
  if (!visible_) return MakeEffects(SelectorAction::kNone, false);
  interaction_.selecting = false;
  interaction_.has_selection = false;
  interaction_.selection = SelectionRect();
  state_ = SelectorState::kIdle;
  return MakeEffects(SelectorAction::kCancel, true);
}

SelectorEffects RegionSelector::ConfirmRecording() {
  if (!visible_ || mode_ != kSnapReelModeRecord ||
      state_ != SelectorState::kSelected) {
    return MakeEffects(SelectorAction::kNone, false);
  }
  state_ = SelectorState::kConfirmed;
  return MakeEffects(SelectorAction::kStartRecording, true);
}

SelectorEffects RegionSelector::SetRecordingActive(bool active) {
  interaction_.recording_active = active;
  return MakeEffects(SelectorAction::kNone, true);
}

SelectorEffects RegionSelector::SetHoveringControl(bool hovering) {
  bool changed = interaction_.hovering_control != hovering;
  interaction_.hovering_control = hovering;
  return MakeEffects(SelectorAction::kNone, changed);
}

}  // namespace internal
}  // namespace snapreel
