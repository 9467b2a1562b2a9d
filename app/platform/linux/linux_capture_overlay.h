// Copyright 2026 The snapreel Authors
// Full-screen selection overlay and recording controls (GTK3 + Cairo).

#ifndef SNAPREEL_APP_PLATFORM_LINUX_LINUX_CAPTURE_OVERLAY_H_
#define SNAPREEL_APP_PLATFORM_LINUX_LINUX_CAPTURE_OVERLAY_H_

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <memory>

#include <gtk/gtk.h>

#include "core/image.h"
#include "core/orchestrator.h"
#include "core/platform_services.h"
#include "core/region_selector.h"
#include "core/subscription.h"

/// Hosts a RegionSelector in a borderless full-screen window. Selector
/// effects are applied here and their actions forwarded to the Orchestrator.
class CaptureOverlay : public snapreel::internal::IOverlayHost {
 public:
  CaptureOverlay() = default;
  ~CaptureOverlay() override;

  /// Route actions to |orchestrator| and follow its screenshot channels.
  void Bind(snapreel::internal::Orchestrator* orchestrator);
  void Unbind();

  // IOverlayHost
  void ShowSelector(SnapReelCaptureMode mode,
                    snapreel::internal::BackdropStyle style) override;
  void ShowRecordingControls(
      const snapreel::internal::SelectionRect& rect) override;
  void Close() override;
  bool IsVisible() const override { return window_ != nullptr; }

 private:
  struct BtnRect { int x, y, w, h; };

  enum class Button { kNone, kStart, kCancel, kStop };

  // GTK callbacks
  static gboolean OnDraw(GtkWidget* widget, cairo_t* cr, gpointer data);
  static gboolean OnKeyPress(GtkWidget* widget, GdkEventKey* ev,
                             gpointer data);
  static gboolean OnButtonPress(GtkWidget* widget, GdkEventButton* ev,
                                gpointer data);
  static gboolean OnButtonRelease(GtkWidget* widget, GdkEventButton* ev,
                                  gpointer data);
  static gboolean OnMotion(GtkWidget* widget, GdkEventMotion* ev,
                           gpointer data);
  static gboolean OnElapsedTick(gpointer data);

  void CreateWindow();
  void DestroyWindow();
  void SetBackdrop(std::shared_ptr<const snapreel::internal::Image> still);
  void ClearBackdrop();

  /// Apply input mode and redraw, then dispatch the action. The window may
  /// be gone when this returns.
  void Apply(const snapreel::internal::SelectorEffects& effects);
  void ApplyInputMode(snapreel::internal::InputMode mode);
  void SetCursor(const char* name);

  bool ControlBarVisible() const;
  snapreel::internal::SelectionRect ControlRect() const;
  BtnRect ControlBarRect() const;
  BtnRect ButtonRect(int index) const;
  int ButtonCount() const;
  Button ButtonAt(int index) const;
  Button HitTest(int x, int y) const;

  void DrawOverlay(cairo_t* cr, int win_w, int win_h);
  void DrawSelection(cairo_t* cr, const snapreel::internal::SelectionRect& r);
  void DrawHint(cairo_t* cr, int win_w);
  void DrawControlBar(cairo_t* cr);

  snapreel::internal::Orchestrator* orchestrator_ = nullptr;
  snapreel::internal::Subscription init_sub_;
  snapreel::internal::Subscription clear_sub_;

  snapreel::internal::RegionSelector selector_;
  GtkWidget* window_ = nullptr;
  cairo_surface_t* bg_surface_ = nullptr;

  bool recording_controls_ = false;
  snapreel::internal::SelectionRect recording_rect_;
  gint64 record_start_us_ = 0;
  guint elapsed_timer_ = 0;

  snapreel::internal::Point last_pointer_;
};

#endif  // __linux__
#endif  // SNAPREEL_APP_PLATFORM_LINUX_LINUX_CAPTURE_OVERLAY_H_
