#pragma once
#include <cstdint>

// Status returned by every fallible driver operation
enum class EpdError : uint8_t {
  None = 0,
  ConfigError,     // Invalid dimensions, options or framebuffer length
  BusyTimeout,     // BUSY line did not clear within the poll budget
  TransportError,  // Bus transfer failed during an update
  InitFailed,      // Bus transfer failed during reset/initialization
  NotReady,        // Operation requires a successful reset first
  OutOfBounds      // Pixel coordinate outside the logical panel
};

const char* epdErrorName(EpdError error);
