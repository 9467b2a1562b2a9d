// Copyright 2026 The snapreel Authors
// Full-screen selection overlay and recording controls (GTK3 + Cairo).

#include "platform/linux/linux_capture_overlay.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>

#include "core/logger.h"

using snapreel::internal::BackdropStyle;
using snapreel::internal::Image;
using snapreel::internal::InputMode;
using snapreel::internal::Point;
using snapreel::internal::PointerButton;
using snapreel::internal::SelectionRect;
using snapreel::internal::SelectorAction;
using snapreel::internal::SelectorEffects;
using snapreel::internal::SelectorState;

static constexpr int kTBBtnW = 64;
static constexpr int kTBBtnH = 28;
static constexpr int kTBGap  = 4;
static constexpr int kTBPad  = 8;
static constexpr int kTBBarH = kTBBtnH + kTBPad * 2;
static constexpr int kElapsedW = 96;

// Gap between the recorded rect and its border / the control bar.
static constexpr int kBorderGap = 3;
static constexpr int kHandleSize = 6;
static constexpr guint kElapsedTickMs = 500;

static void RoundedRect(cairo_t* cr, double x, double y, double w, double h,
                        double r) {
  cairo_new_sub_path(cr);
  cairo_arc(cr, x + w - r, y + r, r, -M_PI / 2, 0);
  cairo_arc(cr, x + w - r, y + h - r, r, 0, M_PI / 2);
  cairo_arc(cr, x + r, y + h - r, r, M_PI / 2, M_PI);
  cairo_arc(cr, x + r, y + r, r, M_PI, 3 * M_PI / 2);
  cairo_close_path(cr);
}

static PointerButton ToPointerButton(guint button) {
  if (button == 1) return PointerButton::kPrimary;
  if (button == 3) return PointerButton::kSecondary;
  return PointerButton::kOther;
}

// -----------------------------------------------------------------------
// Binding
// -----------------------------------------------------------------------

CaptureOverlay::~CaptureOverlay() {
  Unbind();
  Close();
}

void CaptureOverlay::Bind(snapreel::internal::Orchestrator* orchestrator) {
  orchestrator_ = orchestrator;
  init_sub_ = orchestrator->init_screenshot().Subscribe(
      [this](const std::shared_ptr<const Image>& still) {
        SetBackdrop(still);
      });
  clear_sub_ =
      orchestrator->clear_screenshot().Subscribe([this]() { ClearBackdrop(); });
}

void CaptureOverlay::Unbind() {
  init_sub_.Unsubscribe();
  clear_sub_.Unsubscribe();
  orchestrator_ = nullptr;
}

// -----------------------------------------------------------------------
// IOverlayHost
// -----------------------------------------------------------------------

void CaptureOverlay::ShowSelector(SnapReelCaptureMode mode,
                                  BackdropStyle style) {
  Close();
  SelectorEffects fx = selector_.Show(mode, style);
  CreateWindow();
  SetCursor("crosshair");
  Apply(fx);
}

void CaptureOverlay::ShowRecordingControls(const SelectionRect& rect) {
  if (!window_) CreateWindow();
  recording_controls_ = true;
  recording_rect_ = rect;
  record_start_us_ = g_get_monotonic_time();
  if (!elapsed_timer_) {
    elapsed_timer_ = g_timeout_add(kElapsedTickMs, OnElapsedTick, this);
  }
  SetCursor(nullptr);
  Apply(selector_.SetRecordingActive(true));
}

void CaptureOverlay::Close() {
  if (elapsed_timer_) {
    g_source_remove(elapsed_timer_);
    elapsed_timer_ = 0;
  }
  recording_controls_ = false;
  if (selector_.visible()) selector_.Hide();
  ClearBackdrop();
  DestroyWindow();
}

// -----------------------------------------------------------------------
// Window
// -----------------------------------------------------------------------

void CaptureOverlay::CreateWindow() {
  if (window_) return;

  window_ = gtk_window_new(GTK_WINDOW_TOPLEVEL);
  gtk_window_set_decorated(GTK_WINDOW(window_), FALSE);
  gtk_window_set_skip_taskbar_hint(GTK_WINDOW(window_), TRUE);
  gtk_window_set_skip_pager_hint(GTK_WINDOW(window_), TRUE);
  gtk_window_set_keep_above(GTK_WINDOW(window_), TRUE);
  gtk_window_fullscreen(GTK_WINDOW(window_));
  gtk_widget_set_app_paintable(window_, TRUE);

  // Per-pixel alpha so the live desktop shows through.
  GdkScreen* screen = gtk_widget_get_screen(window_);
  GdkVisual* visual = gdk_screen_get_rgba_visual(screen);
  if (visual) {
    gtk_widget_set_visual(window_, visual);
  } else {
    SNAPREEL_LOG_WARN("No RGBA visual; overlay will be opaque");
  }

  gtk_widget_add_events(window_,
                        GDK_KEY_PRESS_MASK | GDK_BUTTON_PRESS_MASK |
                        GDK_BUTTON_RELEASE_MASK | GDK_POINTER_MOTION_MASK);

  g_signal_connect(window_, "draw", G_CALLBACK(OnDraw), this);
  g_signal_connect(window_, "key-press-event", G_CALLBACK(OnKeyPress), this);
  g_signal_connect(window_, "button-press-event",
                   G_CALLBACK(OnButtonPress), this);
  g_signal_connect(window_, "button-release-event",
                   G_CALLBACK(OnButtonRelease), this);
  g_signal_connect(window_, "motion-notify-event",
                   G_CALLBACK(OnMotion), this);

  gtk_widget_show_all(window_);
  gtk_window_present(GTK_WINDOW(window_));
}

void CaptureOverlay::DestroyWindow() {
  if (window_) {
    gtk_widget_destroy(window_);
    window_ = nullptr;
  }
}

void CaptureOverlay::SetCursor(const char* name) {
  if (!window_) return;
  GdkWindow* gdk_win = gtk_widget_get_window(window_);
  if (!gdk_win) return;
  if (!name) {
    gdk_window_set_cursor(gdk_win, nullptr);
    return;
  }
  GdkCursor* cursor =
      gdk_cursor_new_from_name(gdk_window_get_display(gdk_win), name);
  gdk_window_set_cursor(gdk_win, cursor);
  if (cursor) g_object_unref(cursor);
}

void CaptureOverlay::SetBackdrop(std::shared_ptr<const Image> still) {
  SelectorEffects fx = selector_.SetBackdrop(std::move(still));
  const auto& image = selector_.backdrop();
  if (image) {
    if (bg_surface_) cairo_surface_destroy(bg_surface_);
    // BGRA8 is cairo ARGB32 on little-endian; copy to honour cairo's stride.
    bg_surface_ = cairo_image_surface_create(CAIRO_FORMAT_ARGB32,
                                             image->width(), image->height());
    cairo_surface_flush(bg_surface_);
    unsigned char* dst = cairo_image_surface_get_data(bg_surface_);
    const int dst_stride = cairo_image_surface_get_stride(bg_surface_);
    const size_t row_bytes = static_cast<size_t>(image->width()) * 4;
    for (int row = 0; row < image->height(); ++row) {
      std::memcpy(dst + row * dst_stride, image->data() + row * image->stride(),
                  row_bytes);
    }
    cairo_surface_mark_dirty(bg_surface_);
  }
  Apply(fx);
}

void CaptureOverlay::ClearBackdrop() {
  if (bg_surface_) {
    cairo_surface_destroy(bg_surface_);
    bg_surface_ = nullptr;
  }
  if (selector_.visible() && selector_.backdrop()) {
    Apply(selector_.ClearBackdrop());
  }
}

// -----------------------------------------------------------------------
// Effects
// -----------------------------------------------------------------------

void CaptureOverlay::Apply(const SelectorEffects& effects) {
  ApplyInputMode(effects.input_mode);
  if (effects.redraw && window_) gtk_widget_queue_draw(window_);

  if (!orchestrator_) return;
  switch (effects.action) {
    case SelectorAction::kNone:
      break;
    case SelectorAction::kCaptureStill: {
      Point origin = last_pointer_;
      orchestrator_->CaptureRegion(effects.selection, selector_.mode(),
                                   &origin, nullptr);
      break;
    }
    case SelectorAction::kStartRecording: {
      SnapReelError err = orchestrator_->StartRecording(effects.selection);
      if (err != kSnapReelOk && err != kSnapReelErrorNoCaptureSource) {
        SNAPREEL_LOG_WARN("Recording not started: {}",
                          snapreel_error_string(err));
        orchestrator_->CancelSelection();
      }
      break;
    }
    case SelectorAction::kCancel:
      orchestrator_->CancelSelection();
      break;
  }
}

void CaptureOverlay::ApplyInputMode(InputMode mode) {
  if (!window_) return;
  GdkWindow* gdk_win = gtk_widget_get_window(window_);
  if (!gdk_win) return;

  if (mode == InputMode::kCapture) {
    gdk_window_input_shape_combine_region(gdk_win, nullptr, 0, 0);
    return;
  }
  // Pass through everywhere except the control bar, so hovering it still
  // reaches us.
  cairo_region_t* region = cairo_region_create();
  if (ControlBarVisible()) {
    BtnRect bar = ControlBarRect();
    cairo_rectangle_int_t r = {bar.x, bar.y, bar.w, bar.h};
    cairo_region_union_rectangle(region, &r);
  }
  gdk_window_input_shape_combine_region(gdk_win, region, 0, 0);
  cairo_region_destroy(region);
}

// -----------------------------------------------------------------------
// Control bar layout
// -----------------------------------------------------------------------

bool CaptureOverlay::ControlBarVisible() const {
  if (recording_controls_) return true;
  return selector_.mode() == kSnapReelModeRecord &&
         selector_.state() == SelectorState::kSelected;
}

SelectionRect CaptureOverlay::ControlRect() const {
  return recording_controls_ ? recording_rect_ : selector_.current_rect();
}

int CaptureOverlay::ButtonCount() const { return recording_controls_ ? 1 : 2; }

CaptureOverlay::Button CaptureOverlay::ButtonAt(int index) const {
  if (recording_controls_) return index == 0 ? Button::kStop : Button::kNone;
  if (index == 0) return Button::kStart;
  if (index == 1) return Button::kCancel;
  return Button::kNone;
}

CaptureOverlay::BtnRect CaptureOverlay::ControlBarRect() const {
  const SelectionRect r = ControlRect();
  const int count = ButtonCount();
  int total_w = count * kTBBtnW + (count - 1) * kTBGap + kTBPad * 2;
  if (recording_controls_) total_w += kElapsedW;

  int bar_x = r.x + r.width - total_w;
  if (bar_x < 0) bar_x = r.x;

  // Below the selection, or inside its bottom edge when there is no room.
  int win_h = window_ ? gtk_widget_get_allocated_height(window_) : 0;
  int bar_y = r.y + r.height + kBorderGap + 6;
  if (win_h > 0 && bar_y + kTBBarH > win_h) {
    bar_y = r.y + r.height - kTBBarH - 6;
  }
  return {bar_x, bar_y, total_w, kTBBarH};
}

CaptureOverlay::BtnRect CaptureOverlay::ButtonRect(int index) const {
  BtnRect bar = ControlBarRect();
  return {bar.x + kTBPad + index * (kTBBtnW + kTBGap), bar.y + kTBPad,
          kTBBtnW, kTBBtnH};
}

CaptureOverlay::Button CaptureOverlay::HitTest(int x, int y) const {
  if (!ControlBarVisible()) return Button::kNone;
  for (int i = 0; i < ButtonCount(); ++i) {
    BtnRect br = ButtonRect(i);
    if (x >= br.x && x < br.x + br.w && y >= br.y && y < br.y + br.h) {
      return ButtonAt(i);
    }
  }
  return Button::kNone;
}

// -----------------------------------------------------------------------
// Drawing
// -----------------------------------------------------------------------

gboolean CaptureOverlay::OnDraw(GtkWidget* widget, cairo_t* cr,
                                gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  self->DrawOverlay(cr, gtk_widget_get_allocated_width(widget),
                    gtk_widget_get_allocated_height(widget));
  return FALSE;
}

void CaptureOverlay::DrawOverlay(cairo_t* cr, int win_w, int win_h) {
  // Start fully transparent.
  cairo_set_operator(cr, CAIRO_OPERATOR_SOURCE);
  cairo_set_source_rgba(cr, 0, 0, 0, 0);
  cairo_paint(cr);
  cairo_set_operator(cr, CAIRO_OPERATOR_OVER);

  if (recording_controls_) {
    // Border outside the recorded rect so it never lands in the video.
    const SelectionRect& r = recording_rect_;
    cairo_set_source_rgba(cr, 0.9, 0.15, 0.15, 0.9);
    cairo_set_line_width(cr, 2.0);
    cairo_rectangle(cr, r.x - kBorderGap + 0.5, r.y - kBorderGap + 0.5,
                    r.width + 2 * kBorderGap - 1, r.height + 2 * kBorderGap - 1);
    cairo_stroke(cr);
    DrawControlBar(cr);
    return;
  }

  // Frozen still, scaled from physical pixels to the logical window.
  if (bg_surface_) {
    int img_w = cairo_image_surface_get_width(bg_surface_);
    int img_h = cairo_image_surface_get_height(bg_surface_);
    if (img_w > 0 && img_h > 0) {
      cairo_save(cr);
      cairo_scale(cr, static_cast<double>(win_w) / img_w,
                  static_cast<double>(win_h) / img_h);
      cairo_set_source_surface(cr, bg_surface_, 0, 0);
      cairo_paint(cr);
      cairo_restore(cr);
    }
  }

  // Dim everything except the selection.
  SelectionRect sel = selector_.current_rect();
  bool has_rect = sel.width > 0 && sel.height > 0;
  cairo_set_source_rgba(cr, 0, 0, 0, 0.4);
  cairo_rectangle(cr, 0, 0, win_w, win_h);
  if (has_rect) {
    cairo_rectangle(cr, sel.x, sel.y, sel.width, sel.height);
    cairo_set_fill_rule(cr, CAIRO_FILL_RULE_EVEN_ODD);
    cairo_fill(cr);
    cairo_set_fill_rule(cr, CAIRO_FILL_RULE_WINDING);
    DrawSelection(cr, sel);
  } else {
    cairo_fill(cr);
    if (selector_.state() == SelectorState::kIdle) DrawHint(cr, win_w);
  }

  if (ControlBarVisible()) DrawControlBar(cr);
}

void CaptureOverlay::DrawSelection(cairo_t* cr, const SelectionRect& r) {
  // Selection border (dashed).
  cairo_set_source_rgba(cr, 0.2, 0.6, 1.0, 0.9);
  cairo_set_line_width(cr, 2.0);
  double dashes[] = {6.0, 3.0};
  cairo_set_dash(cr, dashes, 2, 0);
  cairo_rectangle(cr, r.x + 0.5, r.y + 0.5, r.width - 1, r.height - 1);
  cairo_stroke(cr);
  cairo_set_dash(cr, nullptr, 0, 0);

  // Corner handles.
  const double hs = kHandleSize;
  const double xs[] = {static_cast<double>(r.x),
                       static_cast<double>(r.x + r.width)};
  const double ys[] = {static_cast<double>(r.y),
                       static_cast<double>(r.y + r.height)};
  for (double hx : xs) {
    for (double hy : ys) {
      cairo_rectangle(cr, hx - hs / 2, hy - hs / 2, hs, hs);
    }
  }
  cairo_fill(cr);

  // Size label.
  char label[64];
  std::snprintf(label, sizeof(label), "%d \xC3\x97 %d", r.width, r.height);
  cairo_select_font_face(cr, "Sans", CAIRO_FONT_SLANT_NORMAL,
                         CAIRO_FONT_WEIGHT_BOLD);
  cairo_set_font_size(cr, 13);
  int lx = r.x;
  int ly = r.y - 8;
  if (ly < 16) ly = r.y + r.height + 18;
  cairo_move_to(cr, lx, ly);
  cairo_show_text(cr, label);
}

void CaptureOverlay::DrawHint(cairo_t* cr, int win_w) {
  const char* what = "copy";
  if (selector_.mode() == kSnapReelModeFile) what = "save";
  if (selector_.mode() == kSnapReelModeRecord) what = "record";
  std::string text = std::string("Drag to select an area to ") + what +
                     "  \xC2\xB7  Esc to cancel";

  cairo_select_font_face(cr, "Sans", CAIRO_FONT_SLANT_NORMAL,
                         CAIRO_FONT_WEIGHT_NORMAL);
  cairo_set_font_size(cr, 15);
  cairo_text_extents_t ext;
  cairo_text_extents(cr, text.c_str(), &ext);

  double bw = ext.width + 32;
  double bh = 36;
  double bx = (win_w - bw) / 2;
  double by = 48;
  cairo_set_source_rgba(cr, 0.15, 0.15, 0.15, 0.85);
  RoundedRect(cr, bx, by, bw, bh, 8.0);
  cairo_fill(cr);

  cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
  cairo_move_to(cr, bx + 16 - ext.x_bearing,
                by + (bh - ext.height) / 2 - ext.y_bearing);
  cairo_show_text(cr, text.c_str());
}

void CaptureOverlay::DrawControlBar(cairo_t* cr) {
  BtnRect bar = ControlBarRect();

  cairo_set_source_rgba(cr, 0.15, 0.15, 0.15, 0.92);
  RoundedRect(cr, bar.x, bar.y, bar.w, bar.h, 6.0);
  cairo_fill(cr);

  cairo_select_font_face(cr, "Sans", CAIRO_FONT_SLANT_NORMAL,
                         CAIRO_FONT_WEIGHT_NORMAL);
  cairo_set_font_size(cr, 12);

  for (int i = 0; i < ButtonCount(); ++i) {
    BtnRect br = ButtonRect(i);
    Button b = ButtonAt(i);
    const char* text = b == Button::kStart ? "Start"
                       : b == Button::kStop ? "Stop"
                                            : "Cancel";
    if (b == Button::kStart)
      cairo_set_source_rgba(cr, 0.25, 0.55, 0.85, 0.9);
    else
      cairo_set_source_rgba(cr, 0.6, 0.15, 0.15, 0.9);
    RoundedRect(cr, br.x, br.y, br.w, br.h, 4.0);
    cairo_fill(cr);

    cairo_text_extents_t ext;
    cairo_text_extents(cr, text, &ext);
    cairo_set_source_rgb(cr, 1.0, 1.0, 1.0);
    cairo_move_to(cr, br.x + (br.w - ext.width) / 2 - ext.x_bearing,
                  br.y + (br.h - ext.height) / 2 - ext.y_bearing);
    cairo_show_text(cr, text);
  }

  if (recording_controls_) {
    gint64 elapsed_s = (g_get_monotonic_time() - record_start_us_) / 1000000;
    char label[32];
    std::snprintf(label, sizeof(label), "\xE2\x97\x8F %02d:%02d",
                  static_cast<int>(elapsed_s / 60),
                  static_cast<int>(elapsed_s % 60));
    BtnRect last = ButtonRect(ButtonCount() - 1);
    cairo_text_extents_t ext;
    cairo_text_extents(cr, label, &ext);
    cairo_set_source_rgb(cr, 1.0, 0.35, 0.35);
    cairo_move_to(cr, last.x + last.w + 12 - ext.x_bearing,
                  last.y + (last.h - ext.height) / 2 - ext.y_bearing);
    cairo_show_text(cr, label);
  }
}

gboolean CaptureOverlay::OnElapsedTick(gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  if (self->window_) gtk_widget_queue_draw(self->window_);
  return G_SOURCE_CONTINUE;
}

// -----------------------------------------------------------------------
// Input events
// -----------------------------------------------------------------------

gboolean CaptureOverlay::OnKeyPress(GtkWidget* /*widget*/, GdkEventKey* ev,
                                    gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  if (ev->keyval == GDK_KEY_Escape) {
    self->Apply(self->selector_.KeyEscape());
    return TRUE;
  }
  if ((ev->keyval == GDK_KEY_Return || ev->keyval == GDK_KEY_KP_Enter) &&
      self->selector_.mode() == kSnapReelModeRecord &&
      self->selector_.state() == SelectorState::kSelected) {
    self->Apply(self->selector_.ConfirmRecording());
    return TRUE;
  }
  return FALSE;
}

gboolean CaptureOverlay::OnButtonPress(GtkWidget* /*widget*/,
                                       GdkEventButton* ev, gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  self->last_pointer_ = {static_cast<int>(ev->x_root),
                         static_cast<int>(ev->y_root)};
  int x = static_cast<int>(ev->x);
  int y = static_cast<int>(ev->y);

  if (ev->button == 1) {
    switch (self->HitTest(x, y)) {
      case Button::kStart:
        self->Apply(self->selector_.ConfirmRecording());
        return TRUE;
      case Button::kCancel:
        self->Apply(self->selector_.KeyEscape());
        return TRUE;
      case Button::kStop:
        if (self->orchestrator_) self->orchestrator_->StopRecording();
        return TRUE;
      case Button::kNone:
        break;
    }
  }
  if (self->recording_controls_) return FALSE;

  self->Apply(
      self->selector_.PointerDown(ToPointerButton(ev->button), Point{x, y}));
  return TRUE;
}

gboolean CaptureOverlay::OnButtonRelease(GtkWidget* /*widget*/,
                                         GdkEventButton* ev, gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  if (self->recording_controls_) return FALSE;
  self->last_pointer_ = {static_cast<int>(ev->x_root),
                         static_cast<int>(ev->y_root)};
  self->Apply(self->selector_.PointerUp(
      ToPointerButton(ev->button),
      Point{static_cast<int>(ev->x), static_cast<int>(ev->y)}));
  return TRUE;
}

gboolean CaptureOverlay::OnMotion(GtkWidget* /*widget*/, GdkEventMotion* ev,
                                  gpointer data) {
  auto* self = static_cast<CaptureOverlay*>(data);
  int x = static_cast<int>(ev->x);
  int y = static_cast<int>(ev->y);
  self->last_pointer_ = {static_cast<int>(ev->x_root),
                         static_cast<int>(ev->y_root)};

  if (self->recording_controls_) {
    bool hovering = self->HitTest(x, y) != Button::kNone;
    if (hovering != self->selector_.interaction().hovering_control) {
      self->Apply(self->selector_.SetHoveringControl(hovering));
    }
    return FALSE;
  }
  self->Apply(self->selector_.PointerMove(Point{x, y}));
  return TRUE;
}

#endif  // __linux__
