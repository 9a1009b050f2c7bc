#pragma once
#include <cstddef>
#include <cstdint>

#include "EpdError.h"

// Compile-time defaults, override with -D in the build
#ifndef EPD_DEFAULT_BUSY_POLL_LIMIT
#define EPD_DEFAULT_BUSY_POLL_LIMIT 30000
#endif
#ifndef EPD_DEFAULT_BUSY_POLL_INTERVAL_MS
#define EPD_DEFAULT_BUSY_POLL_INTERVAL_MS 1
#endif

// Panel geometry in physical (native) orientation
struct EpdDimensions {
  uint16_t rows = 0;  // Gate lines, at most EpdConfig::MAX_GATE_OUTPUTS
  uint16_t cols = 0;  // Source lines, multiple of 8, at most EpdConfig::MAX_SOURCE_OUTPUTS
};

// Logical rotation relative to the native orientation
enum class EpdRotation : uint8_t { Rotate0, Rotate90, Rotate180, Rotate270 };

// Display update control 2 option byte used for a refresh
enum class EpdUpdateMode : uint8_t {
  Fast = 0xFF,  // Quick, may leave ghosting
  Slow = 0xF7   // Full waveform, clean result
};

const char* epdRotationName(EpdRotation rotation);

class EpdConfigBuilder;

// Immutable display configuration.
// Only EpdConfigBuilder::build() produces a valid one; a default constructed
// config has zero dimensions and is rejected by EpdDisplay::create().
class EpdConfig {
 public:
  static constexpr uint16_t MAX_GATE_OUTPUTS = 680;
  static constexpr uint16_t MAX_SOURCE_OUTPUTS = 960;

  EpdConfig() = default;

  const EpdDimensions& dimensions() const { return _dimensions; }
  uint16_t rows() const { return _dimensions.rows; }
  uint16_t cols() const { return _dimensions.cols; }
  EpdRotation rotation() const { return _rotation; }
  bool autoUpdate() const { return _autoUpdate; }
  EpdUpdateMode updateMode() const { return _updateMode; }
  uint32_t busyPollLimit() const { return _busyPollLimit; }
  uint32_t busyPollIntervalMs() const { return _busyPollIntervalMs; }

  // Framebuffer length in bytes, one bit per pixel
  size_t bufferSize() const { return static_cast<size_t>(_dimensions.rows) * _dimensions.cols / 8; }

  // Logical size seen by drawing code, axes swap for 90/270
  uint16_t width() const;
  uint16_t height() const;

  bool isValid() const;

 private:
  friend class EpdConfigBuilder;

  EpdDimensions _dimensions;
  EpdRotation _rotation = EpdRotation::Rotate0;
  bool _autoUpdate = false;
  EpdUpdateMode _updateMode = EpdUpdateMode::Fast;
  uint32_t _busyPollLimit = EPD_DEFAULT_BUSY_POLL_LIMIT;
  uint32_t _busyPollIntervalMs = EPD_DEFAULT_BUSY_POLL_INTERVAL_MS;
};

class EpdConfigBuilder {
 public:
  EpdConfigBuilder() = default;

  // Required, there is no default panel size
  EpdConfigBuilder& dimensions(EpdDimensions dimensions);
  EpdConfigBuilder& dimensions(uint16_t rows, uint16_t cols);
  EpdConfigBuilder& rotation(EpdRotation rotation);
  // Refresh the panel after every drawing call instead of waiting for update()
  EpdConfigBuilder& autoUpdate(bool enabled);
  EpdConfigBuilder& updateMode(EpdUpdateMode mode);
  // Busy wait budget: at most `limit` polls, `intervalMs` apart
  EpdConfigBuilder& busyPollLimit(uint32_t limit);
  EpdConfigBuilder& busyPollIntervalMs(uint32_t intervalMs);

  // Validates the options; `config` is only written on success
  EpdError build(EpdConfig& config) const;

 private:
  EpdConfig _pending;
  bool _dimensionsSet = false;
};
