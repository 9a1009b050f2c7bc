#include "EpdConfig.h"

#include <Arduino.h>

const char* epdRotationName(const EpdRotation rotation) {
  switch (rotation) {
    case EpdRotation::Rotate0:
      return "Rotate0";
    case EpdRotation::Rotate90:
      return "Rotate90";
    case EpdRotation::Rotate180:
      return "Rotate180";
    case EpdRotation::Rotate270:
      return "Rotate270";
  }
  return "Unknown";
}

uint16_t EpdConfig::width() const {
  return (_rotation == EpdRotation::Rotate90 || _rotation == EpdRotation::Rotate270) ? _dimensions.rows
                                                                                     : _dimensions.cols;
}

uint16_t EpdConfig::height() const {
  return (_rotation == EpdRotation::Rotate90 || _rotation == EpdRotation::Rotate270) ? _dimensions.cols
                                                                                     : _dimensions.rows;
}

bool EpdConfig::isValid() const {
  return _dimensions.rows > 0 && _dimensions.cols > 0 && _dimensions.cols % 8 == 0 &&
         _dimensions.rows <= MAX_GATE_OUTPUTS && _dimensions.cols <= MAX_SOURCE_OUTPUTS && _busyPollLimit > 0 &&
         _busyPollIntervalMs > 0;
}

EpdConfigBuilder& EpdConfigBuilder::dimensions(const EpdDimensions dimensions) {
  _pending._dimensions = dimensions;
  _dimensionsSet = true;
  return *this;
}

EpdConfigBuilder& EpdConfigBuilder::dimensions(const uint16_t rows, const uint16_t cols) {
  EpdDimensions d;
  d.rows = rows;
  d.cols = cols;
  return dimensions(d);
}

EpdConfigBuilder& EpdConfigBuilder::rotation(const EpdRotation rotation) {
  _pending._rotation = rotation;
  return *this;
}

EpdConfigBuilder& EpdConfigBuilder::autoUpdate(const bool enabled) {
  _pending._autoUpdate = enabled;
  return *this;
}

EpdConfigBuilder& EpdConfigBuilder::updateMode(const EpdUpdateMode mode) {
  _pending._updateMode = mode;
  return *this;
}

EpdConfigBuilder& EpdConfigBuilder::busyPollLimit(const uint32_t limit) {
  _pending._busyPollLimit = limit;
  return *this;
}

EpdConfigBuilder& EpdConfigBuilder::busyPollIntervalMs(const uint32_t intervalMs) {
  _pending._busyPollIntervalMs = intervalMs;
  return *this;
}

EpdError EpdConfigBuilder::build(EpdConfig& config) const {
  const EpdDimensions& d = _pending._dimensions;
  const char* reason = nullptr;

  if (!_dimensionsSet) {
    reason = "dimensions not set";
  } else if (d.rows == 0 || d.cols == 0) {
    reason = "rows and cols must be non-zero";
  } else if (d.cols % 8 != 0) {
    reason = "cols must be a multiple of 8";
  } else if (d.rows > EpdConfig::MAX_GATE_OUTPUTS) {
    reason = "rows exceed gate outputs";
  } else if (d.cols > EpdConfig::MAX_SOURCE_OUTPUTS) {
    reason = "cols exceed source outputs";
  } else if (_pending._busyPollLimit == 0) {
    reason = "busy poll limit must be non-zero";
  } else if (_pending._busyPollIntervalMs == 0) {
    reason = "busy poll interval must be non-zero";
  }

  if (reason) {
    if (Serial) Serial.printf("[%lu]   EpdConfig: rejected %ux%u: %s\n", millis(), d.rows, d.cols, reason);
    return EpdError::ConfigError;
  }

  config = _pending;
  return EpdError::None;
}
