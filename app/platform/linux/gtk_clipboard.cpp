// Copyright 2026 The snapreel Authors

#include "platform/linux/gtk_clipboard.h"

#if defined(__linux__) || (defined(__unix__) && !defined(__APPLE__))

#include <gtk/gtk.h>

#include "core/logger.h"

bool GtkClipboardWriter::WriteImage(const snapreel::internal::Image& image) {
  const int w = image.width();
  const int h = image.height();
  if (w <= 0 || h <= 0) return false;

  GdkPixbuf* pb = gdk_pixbuf_new(GDK_COLORSPACE_RGB, TRUE, 8, w, h);
  if (!pb) {
    SNAPREEL_LOG_ERROR("gdk_pixbuf_new({}x{}) failed", w, h);
    return false;
  }

  // BGRA -> RGBA for GdkPixbuf.
  const int pb_stride = gdk_pixbuf_get_rowstride(pb);
  guchar* pb_pixels = gdk_pixbuf_get_pixels(pb);
  const bool rgba_source = image.format() == kSnapReelFormatRgba8;
  for (int row = 0; row < h; ++row) {
    const uint8_t* src = image.data() + row * image.stride();
    guchar* dst = pb_pixels + row * pb_stride;
    for (int col = 0; col < w; ++col) {
      dst[col * 4 + 0] = src[col * 4 + (rgba_source ? 0 : 2)];  // R
      dst[col * 4 + 1] = src[col * 4 + 1];                      // G
      dst[col * 4 + 2] = src[col * 4 + (rgba_source ? 2 : 0)];  // B
      dst[col * 4 + 3] = src[col * 4 + 3];                      // A
    }
  }

  GtkClipboard* clipboard = gtk_clipboard_get(GDK_SELECTION_CLIPBOARD);
  gtk_clipboard_set_image(clipboard, pb);
  gtk_clipboard_store(clipboard);
  g_object_unref(pb);
  return true;
}

#endif  // __linux__
