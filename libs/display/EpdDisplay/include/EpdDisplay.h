#pragma once
#include <Arduino.h>

#include <cstddef>
#include <cstdint>
#include <memory>

#include "EpdAddressing.h"
#include "EpdCommands.h"
#include "EpdConfig.h"
#include "EpdError.h"
#include "EpdInterface.h"

// Monochrome pixel value: black clears the RAM bit, white sets it
enum class EpdColor : uint8_t { Black = 0, White = 1 };

enum class EpdState : uint8_t { Uninitialized, Resetting, Initializing, Ready, Faulted };

struct EpdPixel {
  uint32_t x;
  uint32_t y;
  EpdColor color;
};

const char* epdStateName(EpdState state);

// SSD1677 driver over a caller owned 1bpp framebuffer: create() -> reset() -> draw -> update().
// Drawing and update() need the Ready state; a failure moves the display to Faulted until reset().
class EpdDisplay {
 public:
  // Owns `interface`, borrows `frameBuffer` (exactly config.bufferSize() bytes, must outlive the display).
  // Returns nullptr and sets `*error` to ConfigError when anything is missing or mismatched.
  static std::unique_ptr<EpdDisplay> create(std::unique_ptr<EpdInterface> interface, uint8_t* frameBuffer,
                                            size_t frameBufferSize, const EpdConfig& config,
                                            EpdError* error = nullptr);

  EpdDisplay(const EpdDisplay&) = delete;
  EpdDisplay& operator=(const EpdDisplay&) = delete;
  ~EpdDisplay() = default;

  // Hardware reset, software reset and controller initialization. Also wakes from deep sleep.
  EpdError reset();

  // Set one logical pixel; rejects out-of-bounds coordinates with OutOfBounds.
  // With auto update enabled every call also runs a full update().
  EpdError setPixel(uint32_t x, uint32_t y, EpdColor color);

  // Batch entry point for drawing libraries: clips out-of-bounds pixels and
  // runs at most one update() with auto update enabled.
  EpdError drawPixels(const EpdPixel* pixels, size_t count);

  // Fill the framebuffer; auto update uses a slow (clean) refresh
  EpdError clear(EpdColor color);

  // Stream the framebuffer to BW RAM and refresh the panel
  EpdError update();
  EpdError update(EpdUpdateMode mode);

  // Enter deep sleep keeping RAM; the display is Uninitialized until the next reset()
  EpdError deepSleep();

  uint16_t getRows() const { return config.rows(); }
  uint16_t getCols() const { return config.cols(); }
  // Logical size after rotation
  uint16_t getWidth() const { return config.width(); }
  uint16_t getHeight() const { return config.height(); }
  EpdRotation getRotation() const { return config.rotation(); }
  const EpdConfig& getConfig() const { return config; }
  EpdState getState() const { return state; }
  bool isReady() const { return state == EpdState::Ready; }
  // Most recent non-zero status reported by the interface
  int getLastBusError() const { return lastBusError; }
  uint32_t getRefreshCount() const { return refreshCount; }

  const uint8_t* getFrameBuffer() const { return frameBuffer; }
  size_t getBufferSize() const { return config.bufferSize(); }

  // Save the logical image to a binary PBM file (desktop/test builds only)
  bool saveFrameBufferAsPBM(const char* filename) const;

 private:
  EpdDisplay(std::unique_ptr<EpdInterface> interface, uint8_t* frameBuffer, const EpdConfig& config);

  // Low-level display control
  void resetDisplay();
  EpdError waitWhileBusy(const char* comment);
  EpdError initDisplayController();
  EpdError writeFrameAndRefresh(EpdUpdateMode mode);
  EpdError fault(EpdError error, int busStatus, const char* step);
  bool checkReady(const char* operation) const;
  void writePixel(const EpdPixelAddress& address, EpdColor color);

  std::unique_ptr<EpdInterface> interface;
  EpdCommands commands;
  uint8_t* frameBuffer;
  EpdConfig config;

  EpdState state = EpdState::Uninitialized;
  bool interfaceStarted = false;
  int lastBusError = EPD_BUS_OK;
  uint32_t refreshCount = 0;
};
