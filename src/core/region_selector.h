// Copyright 2026 The snapreel Authors

#ifndef SNAPREEL_CORE_REGION_SELECTOR_H_
#define SNAPREEL_CORE_REGION_SELECTOR_H_

#include <memory>

#include "core/geometry.h"
#include "core/image.h"
#include "core/platform_services.h"
#include "snapreel/snapreel.h"

namespace snapreel {
namespace internal {

enum class SelectorState {
  kIdle,       // Visible, nothing being dragged
  kSelecting,  // Primary button held
  kSelected,   // Usable rect released
  kConfirmed,  // Record mode: recording requested
};

/// Whether the overlay consumes pointer input or lets it reach the windows
/// underneath.
enum class InputMode {
  kCapture,
  kPassThrough,
};

enum class SelectorAction {
  kNone,
  kCaptureStill,    // Still modes: selection released
  kStartRecording,  // Record mode: selection confirmed
  kCancel,          // Escape or secondary button
};

enum class PointerButton {
  kPrimary,
  kSecondary,
  kOther,
};

/// Side effects a transition requires. The host applies input_mode
/// synchronously before handling the next event.
struct SelectorEffects {
  SelectorAction action = SelectorAction::kNone;
  InputMode input_mode = InputMode::kCapture;
  bool forward_pointer = false;   // Deliver motion to overlay controls while
                                  // passing clicks through
  bool redraw = false;
  SelectionRect selection;        // Valid for kCaptureStill/kStartRecording
};

/// Per-show interaction state. Reset on show and hide.
struct OverlayInteractionState {
  bool selecting = false;
  Point start_point;
  bool has_selection = false;
  SelectionRect selection;
  bool recording_active = false;
  bool has_backdrop = false;
  bool hovering_control = false;
};

/// The click-through rule, as a pure function:
///
///   still modes:  backdrop present -> capture, otherwise pass through
///   record mode:  not recording -> capture
///                 recording -> capture only while over the control bar
InputMode ComputeInputMode(SnapReelCaptureMode mode, bool recording_active,
                           bool has_backdrop, bool hovering_control);

/// Drag-to-select state machine hosted by the overlay window. Holds no OS
/// resources apart from the frozen backdrop image.
class RegionSelector {
 public:
  RegionSelector() = default;

  RegionSelector(const RegionSelector&) = delete;
  RegionSelector& operator=(const RegionSelector&) = delete;

  /// Start a fresh interaction. Releases any backdrop from the previous use.
  SelectorEffects Show(SnapReelCaptureMode mode, BackdropStyle style);

  /// End the interaction and release the backdrop.
  SelectorEffects Hide();

  /// Frozen style: the still to paint behind the selection.
  SelectorEffects SetBackdrop(std::shared_ptr<const Image> still);
  SelectorEffects ClearBackdrop();

  SelectorEffects PointerDown(PointerButton button, const Point& p);
  SelectorEffects PointerMove(const Point& p);
  SelectorEffects PointerUp(PointerButton button, const Point& p);
  SelectorEffects KeyEscape();

  /// Record mode: accept the current selection.
  SelectorEffects ConfirmRecording();

  SelectorEffects SetRecordingActive(bool active);
  SelectorEffects SetHoveringControl(bool hovering);

  bool visible() const { return visible_; }
  SelectorState state() const { return state_; }
  SnapReelCaptureMode mode() const { return mode_; }
  BackdropStyle style() const { return style_; }
  const OverlayInteractionState& interaction() const { return interaction_; }
  const std::shared_ptr<const Image>& backdrop() const { return backdrop_; }

  /// Rect being dragged or the committed selection; empty when neither.
  SelectionRect current_rect() const;

  InputMode input_mode() const;

 private:
  SelectorEffects MakeEffects(SelectorAction action, bool redraw) const;
  void ResetInteraction();

  bool visible_ = false;
  SelectorState state_ = SelectorState::kIdle;
  SnapReelCaptureMode mode_ = kSnapReelModeClipboard;
  BackdropStyle style_ = BackdropStyle::kLive;
  OverlayInteractionState interaction_;
  Point current_point_;
  std::shared_ptr<const Image> backdrop_;
};

const char* SelectorStateName(SelectorState state);

}  // namespace internal
}  // namespace snapreel

#endif  // SNAPREEL_CORE_REGION_SELECTOR_H_
