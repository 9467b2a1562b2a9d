// Copyright 2026 The snapreel Authors

#include "core/orchestrator.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <utility>

#include "core/logger.h"
#include "core/output_naming.h"

namespace snapreel {
namespace internal {

namespace {

constexpr SnapReelShortcutAction kAllActions[] = {
    kSnapReelActionCopyRegion,
    kSnapReelActionSaveRegion,
    kSnapReelActionToggleRecord,
};

constexpr int kStillJpegQuality = 90;

int HotkeyIdFor(SnapReelShortcutAction action) {
  return static_cast<int>(action) + 1;
}

int KeyCodeFor(SnapReelShortcutAction action) {
  switch (action) {
    case kSnapReelActionCopyRegion:   return kKeyF1;
    case kSnapReelActionSaveRegion:   return kKeyF2;
    case kSnapReelActionToggleRecord: return kKeyF3;
  }
  return kKeyF1;
}

bool WriteBufferToFile(const std::string& path,
                       const std::vector<uint8_t>& data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) return false;
  f.write(reinterpret_cast<const char*>(data.data()),
          static_cast<std::streamsize>(data.size()));
  f.close();
  return !f.fail();
}

std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

}  // namespace

Orchestrator::Orchestrator(const OrchestratorServices& services,
                           const PlatformCapabilities& caps,
                           const AppSettings& settings)
    : services_(services),
      caps_(caps),
      settings_(settings),
      alive_(std::make_shared<bool>(true)) {}

Orchestrator::~Orchestrator() {
  Shutdown();
  *alive_ = false;
}

bool Orchestrator::Initialize() {
  if (!services_.capture || !services_.overlay || !services_.notifier ||
      !services_.scheduler) {
    SNAPREEL_LOG_ERROR("Orchestrator: required service missing");
    return false;
  }
  if (!IsSupportedFrameRate(settings_.frame_rate)) settings_.frame_rate = 30;
  if (settings_.audio_source == kSnapReelAudioSystem &&
      !caps_.system_audio_loopback) {
    SNAPREEL_LOG_WARN("System audio not supported here, defaulting to none");
    settings_.audio_source = kSnapReelAudioNone;
  }
  if (services_.hotkey) {
    std::weak_ptr<bool> alive = alive_;
    services_.hotkey->SetHandler([this, alive](int hotkey_id) {
      if (alive.expired()) return;
      HandleHotkey(hotkey_id);
    });
    RegisterShortcuts();
  }
  SNAPREEL_LOG_INFO("Orchestrator ready (save path: {})", settings_.save_path);
  return true;
}

void Orchestrator::Shutdown() {
  started_sub_.Unsubscribe();
  finished_sub_.Unsubscribe();
  if (services_.hotkey) {
    services_.hotkey->UnregisterAll();
    services_.hotkey->SetHandler(nullptr);
  }
}

void Orchestrator::AttachRecorder(RecorderWorker* worker) {
  worker->Attach(&start_recording_, &stop_recording_);

  std::weak_ptr<bool> alive = alive_;
  IScheduler* scheduler = services_.scheduler;
  started_sub_ = worker->session_started().Subscribe(
      [this, alive, scheduler](const SelectionRect&) {
        scheduler->Post([this, alive]() {
          if (!alive.expired()) OnSessionStarted();
        });
      });
  finished_sub_ = worker->recording_finished().Subscribe(
      [this, alive, scheduler](const SessionResult& result) {
        scheduler->Post([this, alive, result]() {
          if (!alive.expired()) OnRecordingFinished(result);
        });
      });
}

void Orchestrator::Notify(const std::string& message, const Point* origin) {
  SNAPREEL_LOG_INFO("Notice: {}", message);
  if (services_.notifier) services_.notifier->Notify(message, origin);
}

std::chrono::system_clock::time_point Orchestrator::Now() const {
  return services_.clock ? services_.clock()
                         : std::chrono::system_clock::now();
}

// ---------------------------------------------------------------------------
// Shortcuts
// ---------------------------------------------------------------------------

std::string Orchestrator::AcceleratorName(SnapReelShortcutAction action,
                                          SnapReelShortcutMode mode) {
  std::string key = "F" + std::to_string(KeyCodeFor(action) - kKeyF1 + 1);
  return mode == kSnapReelShortcutAlternative ? "Alt+" + key : key;
}

int Orchestrator::RegisterShortcuts() {
  if (!services_.hotkey) return 0;
  services_.hotkey->UnregisterAll();

  const int modifiers = settings_.shortcut_mode == kSnapReelShortcutAlternative
                            ? kModAlt
                            : kModNone;
  int registered = 0;
  for (SnapReelShortcutAction action : kAllActions) {
    std::string accel = AcceleratorName(action, settings_.shortcut_mode);
    if (services_.hotkey->Register(HotkeyIdFor(action), KeyCodeFor(action),
                                   modifiers)) {
      SNAPREEL_LOG_INFO("Global shortcut registered: {}", accel);
      ++registered;
    } else {
      SNAPREEL_LOG_ERROR("Global shortcut registration failed: {}", accel);
      Notify("Registration failed: " + accel + " is taken");
    }
  }
  return registered;
}

void Orchestrator::SetShortcutMode(SnapReelShortcutMode mode) {
  settings_.shortcut_mode = mode;
  if (services_.settings_store) {
    services_.settings_store->SetString(kKeyShortcutMode,
                                        ShortcutModeName(mode));
  }
  RegisterShortcuts();
  Notify(mode == kSnapReelShortcutStandard
             ? "Shortcut mode: standard (F1/F2/F3)"
             : "Shortcut mode: alternative (Alt+F1/Alt+F2/Alt+F3)");
}

void Orchestrator::HandleShortcut(SnapReelShortcutAction action) {
  switch (action) {
    case kSnapReelActionCopyRegion:
      OpenSelector(kSnapReelModeClipboard);
      break;
    case kSnapReelActionSaveRegion:
      OpenSelector(kSnapReelModeFile);
      break;
    case kSnapReelActionToggleRecord:
      if (registry_.is_idle()) {
        Notify("Preparing to record...");
        OpenSelector(kSnapReelModeRecord);
      } else {
        Notify("Stopping recording...");
        StopRecording();
      }
      break;
  }
}

void Orchestrator::HandleHotkey(int hotkey_id) {
  for (SnapReelShortcutAction action : kAllActions) {
    if (HotkeyIdFor(action) == hotkey_id) {
      HandleShortcut(action);
      return;
    }
  }
  SNAPREEL_LOG_WARN("Unknown hotkey id {}", hotkey_id);
}

// ---------------------------------------------------------------------------
// Selection / stills
// ---------------------------------------------------------------------------

SnapReelError Orchestrator::GrabFullStill(std::unique_ptr<Image>* out_still,
                                          DisplayInfo* out_info) {
  auto sources = services_.capture->ListScreenSources();
  if (sources.empty()) {
    SNAPREEL_LOG_ERROR("No screen source");
    return kSnapReelErrorNoCaptureSource;
  }
  const std::string& id = sources.front().id;
  auto still = services_.capture->GetStillFrame(id, PixelRect());
  if (!still) return kSnapReelErrorAcquisitionFailed;

  DisplayInfo info;
  if (!services_.capture->GetDisplayInfo(id, &info) ||
      info.logical_width <= 0 || info.logical_height <= 0) {
    SNAPREEL_LOG_WARN("Display info unavailable, assuming scale 1.0");
    info = DisplayInfo();
    info.logical_width = info.physical_width = still->width();
    info.logical_height = info.physical_height = still->height();
  }
  if (out_info) *out_info = info;
  *out_still = std::move(still);
  return kSnapReelOk;
}

SnapReelError Orchestrator::OpenSelector(SnapReelCaptureMode mode) {
  if (registry_.is_busy()) {
    SNAPREEL_LOG_WARN("Selector refused: recording {}",
                      RecordPhaseName(registry_.phase()));
    Notify("Recording in progress");
    return kSnapReelErrorRecordInProgress;
  }

  services_.overlay->Close();
  clear_screenshot_.Emit();
  // A record selector left open is superseded.
  if (registry_.phase() == RecordPhase::kSelecting) registry_.Reset();

  std::shared_ptr<const Image> still;
  BackdropStyle style = BackdropStyle::kLive;
  if (mode != kSnapReelModeRecord && settings_.freeze_still) {
    std::unique_ptr<Image> frame;
    SnapReelError err = GrabFullStill(&frame, nullptr);
    if (err == kSnapReelOk) {
      still = std::move(frame);
      style = BackdropStyle::kFrozen;
    } else {
      SNAPREEL_LOG_WARN("Frozen backdrop unavailable ({}), using live",
                        snapreel_error_string(err));
    }
  }

  if (mode == kSnapReelModeRecord) registry_.BeginSelecting();
  services_.overlay->ShowSelector(mode, style);
  if (still) init_screenshot_.Emit(still);
  return kSnapReelOk;
}

SnapReelError Orchestrator::CaptureRegion(const SelectionRect& rect,
                                          SnapReelCaptureMode mode,
                                          const Point* pointer_origin,
                                          CaptureDoneCallback done) {
  if (mode == kSnapReelModeRecord || !IsUsableSelection(rect)) {
    SNAPREEL_LOG_WARN("CaptureRegion: invalid request ({}x{}, mode {})",
                      rect.width, rect.height, static_cast<int>(mode));
    return kSnapReelErrorInvalidParam;
  }

  services_.overlay->Close();
  clear_screenshot_.Emit();

  const AppSettings snapshot = settings_;
  const bool has_origin = pointer_origin != nullptr;
  const Point origin = has_origin ? *pointer_origin : Point();
  std::weak_ptr<bool> alive = alive_;

  // Let the compositor drop the overlay before grabbing the screen.
  services_.scheduler->PostDelayed(
      kCaptureSettleMs,
      [this, alive, rect, mode, snapshot, has_origin, origin, done]() {
        if (alive.expired()) return;
        std::string path;
        SnapReelError err = CaptureStillNow(rect, mode, snapshot, &path);
        const Point* where = has_origin ? &origin : nullptr;
        if (err == kSnapReelOk) {
          Notify(mode == kSnapReelModeClipboard ? "Copied" : "Saved", where);
        } else {
          Notify(std::string("Screenshot failed: ") +
                     snapreel_error_string(err),
                 where);
        }
        if (done) done(err, path);
      });
  return kSnapReelOk;
}

SnapReelError Orchestrator::CaptureStillNow(const SelectionRect& rect,
                                            SnapReelCaptureMode mode,
                                            const AppSettings& settings,
                                            std::string* out_path) {
  std::unique_ptr<Image> still;
  DisplayInfo info;
  SnapReelError err = GrabFullStill(&still, &info);
  if (err != kSnapReelOk) return err;

  // The still is at native resolution; the rect is logical.
  double scale_x = static_cast<double>(still->width()) / info.logical_width;
  double scale_y = static_cast<double>(still->height()) / info.logical_height;
  PixelRect crop = ScaleToPhysical(rect, scale_x, scale_y);
  auto cropped = still->Crop(crop);
  if (!cropped) {
    SNAPREEL_LOG_ERROR("Crop [{},{} {}x{}] outside {}x{} still", crop.x,
                       crop.y, crop.width, crop.height, still->width(),
                       still->height());
    return kSnapReelErrorInvalidParam;
  }

  if (mode == kSnapReelModeClipboard) {
    if (!services_.clipboard || !services_.clipboard->WriteImage(*cropped)) {
      return kSnapReelErrorClipboardFailed;
    }
    SNAPREEL_LOG_INFO("Copied {}x{} to clipboard", cropped->width(),
                      cropped->height());
    return kSnapReelOk;
  }

  if (!EnsureDirectory(settings.save_path)) {
    SNAPREEL_LOG_ERROR("Save path unavailable: {}", settings.save_path);
    return kSnapReelErrorWriteFailed;
  }
  std::string path = JoinPath(
      settings.save_path,
      OutputFileName("screenshot", Now(), ImageExtension(settings.image_format)));
  if (!WriteImageFile(*cropped, path, settings.image_format,
                      kStillJpegQuality)) {
    return kSnapReelErrorWriteFailed;
  }
  SNAPREEL_LOG_INFO("Saved {}", path);
  if (out_path) *out_path = path;
  return kSnapReelOk;
}

void Orchestrator::CancelSelection() {
  if (registry_.phase() == RecordPhase::kStarting ||
      registry_.phase() == RecordPhase::kRecording) {
    StopRecording();
    return;
  }
  if (registry_.phase() == RecordPhase::kSelecting) registry_.Reset();
  services_.overlay->Close();
  clear_screenshot_.Emit();
}

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------

SnapReelError Orchestrator::StartRecording(const SelectionRect& rect) {
  if (registry_.is_busy()) {
    SNAPREEL_LOG_WARN("StartRecording refused: {}",
                      RecordPhaseName(registry_.phase()));
    return kSnapReelErrorRecordInProgress;
  }
  if (!IsUsableSelection(rect)) return kSnapReelErrorInvalidParam;
  if (start_recording_.subscriber_count() == 0) {
    SNAPREEL_LOG_ERROR("StartRecording: no recorder attached");
    return kSnapReelErrorNotInitialized;
  }

  SelectionRect attached = rect;
  attached.scale_factor = 1.0;
  auto sources = services_.capture->ListScreenSources();
  if (sources.empty()) {
    registry_.Reset();
    services_.overlay->Close();
    Notify(std::string("Recording failed: ") +
           snapreel_error_string(kSnapReelErrorNoCaptureSource));
    return kSnapReelErrorNoCaptureSource;
  }
  DisplayInfo info;
  if (services_.capture->GetDisplayInfo(sources.front().id, &info) &&
      info.scale_factor > 0.0) {
    attached.scale_factor = info.scale_factor;
  }

  AppSettings snapshot = settings_;
  if (snapshot.audio_source == kSnapReelAudioSystem &&
      !caps_.system_audio_loopback) {
    SNAPREEL_LOG_WARN("System audio unsupported, recording without audio");
    snapshot.audio_source = kSnapReelAudioNone;
  }

  registry_.BeginStarting();
  services_.overlay->ShowRecordingControls(attached);
  start_recording_.Emit(attached, snapshot);
  return kSnapReelOk;
}

bool Orchestrator::StopRecording() {
  switch (registry_.phase()) {
    case RecordPhase::kIdle:
      SNAPREEL_LOG_WARN("StopRecording: nothing to stop");
      return false;
    case RecordPhase::kSelecting:
      CancelSelection();
      return true;
    case RecordPhase::kStarting:
    case RecordPhase::kRecording:
      registry_.BeginFinalizing();
      stop_recording_.Emit();
      return true;
    case RecordPhase::kFinalizing:
      SNAPREEL_LOG_DEBUG("StopRecording: already finalizing");
      return false;
  }
  return false;
}

void Orchestrator::OnSessionStarted() {
  // A stop may already be pending; the registry refuses the step then.
  if (registry_.phase() == RecordPhase::kStarting) registry_.MarkRecording();
}

void Orchestrator::OnRecordingFinished(const SessionResult& result) {
  services_.overlay->Close();
  SaveRecording(result);
}

RecordingOutput Orchestrator::SaveRecording(const SessionResult& result) {
  registry_.Reset();

  RecordingOutput out;
  if (result.error != kSnapReelOk && result.error != kSnapReelErrorEmptyOutput) {
    out.error = result.error;
    Notify(std::string("Recording failed: ") +
           snapreel_error_string(result.error));
    return out;
  }
  if (result.data.empty()) {
    out.error = kSnapReelErrorEmptyOutput;
    Notify("Recording failed: empty data");
    return out;
  }

  const AppSettings snapshot = settings_;
  const std::string native_ext =
      result.extension.empty() ? caps_.native_container : result.extension;
  if (!EnsureDirectory(snapshot.save_path)) {
    out.error = kSnapReelErrorWriteFailed;
    Notify("Save failed: cannot create " + snapshot.save_path);
    return out;
  }
  const std::string native_path = JoinPath(
      snapshot.save_path, OutputFileName("recording", Now(), native_ext));
  if (!WriteBufferToFile(native_path, result.data)) {
    SNAPREEL_LOG_ERROR("Failed to write {}", native_path);
    out.error = kSnapReelErrorWriteFailed;
    Notify("Save failed: could not write file");
    return out;
  }
  SNAPREEL_LOG_INFO("Recording written: {} ({} bytes)", native_path,
                    result.data.size());
  out.native_path = native_path;
  out.final_path = native_path;

  const std::string target_ext = VideoFormatName(snapshot.video_format);
  if (target_ext == native_ext) {
    Notify("Saved (" + Upper(native_ext) + ")");
    return out;
  }

  const std::string target_path = ReplaceExtension(native_path, target_ext);
  bool started = false;
  if (services_.transcoder) {
    std::weak_ptr<bool> alive = alive_;
    IScheduler* scheduler = services_.scheduler;
    started = services_.transcoder->TranscodeAsync(
        native_path, target_path, snapshot.video_format,
        [this, alive, scheduler, native_path, target_path](
            bool ok, const std::string& error) {
          scheduler->Post([this, alive, ok, error, native_path,
                           target_path]() {
            if (!alive.expired()) {
              OnTranscodeDone(ok, error, native_path, target_path);
            }
          });
        });
  }
  if (!started) {
    SNAPREEL_LOG_WARN("Transcoder unavailable, keeping {}", native_path);
    out.error = kSnapReelErrorTranscodeFailed;
    Notify("Conversion failed, " + Upper(native_ext) + " kept");
    return out;
  }

  Notify("Saving: converting...");
  out.final_path = target_path;
  out.transcode_pending = true;
  return out;
}

void Orchestrator::OnTranscodeDone(bool ok, const std::string& error,
                                   const std::string& native_path,
                                   const std::string& target_path) {
  std::string native_ext = native_path.substr(native_path.find_last_of('.') + 1);
  std::string target_ext = target_path.substr(target_path.find_last_of('.') + 1);
  if (ok) {
    SNAPREEL_LOG_INFO("Transcoded {} -> {}", native_path, target_path);
    Notify("Saved (" + Upper(target_ext) + "+" + Upper(native_ext) + ")");
    return;
  }
  SNAPREEL_LOG_WARN("Conversion failed: {}", error);
  // A partial target is useless; the native file is the deliverable.
  std::remove(target_path.c_str());
  Notify("Conversion failed, " + Upper(native_ext) + " kept");
}

// ---------------------------------------------------------------------------
// Misc
// ---------------------------------------------------------------------------

void Orchestrator::OnSecondInstance() {
  Notify("Already running in background");
}

void Orchestrator::UpdateSettings(const AppSettings& settings) {
  bool keymap_changed = settings.shortcut_mode != settings_.shortcut_mode;
  settings_ = settings;
  if (!IsSupportedFrameRate(settings_.frame_rate)) settings_.frame_rate = 30;
  if (services_.settings_store) {
    SaveAppSettings(settings_, services_.settings_store);
  }
  if (keymap_changed) SetShortcutMode(settings_.shortcut_mode);
}

}  // namespace internal
}  // namespace snapreel
