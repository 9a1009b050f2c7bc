#include "EpdDisplay.h"

#include <cstring>
#include <fstream>
#include <utility>
#include <vector>

// Reset pulse timing (ms)
#define RESET_SETTLE_MS 20
#define RESET_PULSE_MS 2

// Pattern used to blank both RAM planes during init
#define RAM_FILL_PATTERN 0xF7

const char* epdStateName(const EpdState state) {
  switch (state) {
    case EpdState::Uninitialized:
      return "Uninitialized";
    case EpdState::Resetting:
      return "Resetting";
    case EpdState::Initializing:
      return "Initializing";
    case EpdState::Ready:
      return "Ready";
    case EpdState::Faulted:
      return "Faulted";
  }
  return "Unknown";
}

std::unique_ptr<EpdDisplay> EpdDisplay::create(std::unique_ptr<EpdInterface> interface, uint8_t* frameBuffer,
                                               const size_t frameBufferSize, const EpdConfig& config,
                                               EpdError* error) {
  const char* reason = nullptr;
  if (!config.isValid()) {
    reason = "invalid configuration";
  } else if (!interface) {
    reason = "no interface";
  } else if (!frameBuffer) {
    reason = "no frame buffer";
  } else if (frameBufferSize != config.bufferSize()) {
    reason = "frame buffer size mismatch";
  }

  if (reason) {
    if (Serial)
      Serial.printf("[%lu] EpdDisplay: create failed: %s (%lu bytes, expected %lu)\n", millis(), reason,
                    static_cast<unsigned long>(frameBufferSize), static_cast<unsigned long>(config.bufferSize()));
    if (error) *error = EpdError::ConfigError;
    return nullptr;
  }

  if (error) *error = EpdError::None;
  return std::unique_ptr<EpdDisplay>(new EpdDisplay(std::move(interface), frameBuffer, config));
}

EpdDisplay::EpdDisplay(std::unique_ptr<EpdInterface> interface, uint8_t* frameBuffer, const EpdConfig& config)
    : interface(std::move(interface)), commands(*this->interface), frameBuffer(frameBuffer), config(config) {
  if (Serial)
    Serial.printf("[%lu] EpdDisplay: %ux%u panel, %s, auto update %s, %lu byte frame buffer\n", millis(),
                  config.cols(), config.rows(), epdRotationName(config.rotation()),
                  config.autoUpdate() ? "on" : "off", static_cast<unsigned long>(config.bufferSize()));
}

// ============================================================================
// Reset and initialization
// ============================================================================

EpdError EpdDisplay::reset() {
  if (Serial) Serial.printf("[%lu] EpdDisplay: reset() called in state %s\n", millis(), epdStateName(state));
  state = EpdState::Resetting;

  if (!interfaceStarted) {
    const int status = interface->begin();
    if (status != EPD_BUS_OK) {
      return fault(EpdError::InitFailed, status, "interface begin");
    }
    interfaceStarted = true;
  }

  resetDisplay();
  EpdError err = waitWhileBusy(" hardware reset");
  if (err != EpdError::None) {
    return fault(err, EPD_BUS_OK, "hardware reset");
  }

  const int status = commands.softReset();
  if (status != EPD_BUS_OK) {
    return fault(EpdError::InitFailed, status, "soft reset");
  }
  err = waitWhileBusy(" CMD_SOFT_RESET");
  if (err != EpdError::None) {
    return fault(err, EPD_BUS_OK, "soft reset");
  }

  state = EpdState::Initializing;
  err = initDisplayController();
  if (err != EpdError::None) {
    return err;
  }

  state = EpdState::Ready;
  if (Serial) Serial.printf("[%lu]   E-paper display ready\n", millis());
  return EpdError::None;
}

void EpdDisplay::resetDisplay() {
  if (Serial) Serial.printf("[%lu]   Resetting display...\n", millis());
  interface->setResetLine(true);
  interface->delayMs(RESET_SETTLE_MS);
  interface->setResetLine(false);
  interface->delayMs(RESET_PULSE_MS);
  interface->setResetLine(true);
  interface->delayMs(RESET_SETTLE_MS);
  if (Serial) Serial.printf("[%lu]   Display reset complete\n", millis());
}

EpdError EpdDisplay::waitWhileBusy(const char* comment) {
  const unsigned long start = millis();
  const uint32_t limit = config.busyPollLimit();

  for (uint32_t polls = 0; polls < limit; polls++) {
    if (!interface->readBusyLine()) {
      if (comment && Serial)
        Serial.printf("[%lu]   Wait complete:%s (%lu ms, %lu polls)\n", millis(), comment, millis() - start,
                      static_cast<unsigned long>(polls));
      return EpdError::None;
    }
    interface->delayMs(config.busyPollIntervalMs());
  }

  if (Serial)
    Serial.printf("[%lu]   ERROR: BUSY still high after %lu polls:%s\n", millis(), static_cast<unsigned long>(limit),
                  comment ? comment : "");
  return EpdError::BusyTimeout;
}

EpdError EpdDisplay::initDisplayController() {
  if (Serial) Serial.printf("[%lu]   Initializing SSD1677 controller...\n", millis());

  int status = commands.temperatureSensor(EpdTempSensor::Internal);
  if (status == EPD_BUS_OK) status = commands.boosterSoftStart(EpdBoosterInrush::Level1);
  // Gate count and scan direction
  if (status == EPD_BUS_OK) status = commands.driverOutputControl(config.rows());
  // Framebuffer is always native row-major; rotation is applied when addressing pixels
  if (status == EPD_BUS_OK)
    status = commands.dataEntryMode(EpdDataEntry::IncrementXIncrementY, EpdIncrementAxis::Horizontal);
  if (status == EPD_BUS_OK) status = commands.ramWindowForPanel(config.rows(), config.cols());
  if (status == EPD_BUS_OK)
    status = commands.borderWaveform(EpdVbdOption::Transition, EpdVbdFixedLevel::Vss, EpdVbdTransition::Lut1);
  if (status != EPD_BUS_OK) {
    return fault(EpdError::InitFailed, status, "controller setup");
  }

  if (Serial) Serial.printf("[%lu]   Clearing RAM buffers...\n", millis());
  status = commands.autoWriteBwRam(RAM_FILL_PATTERN);
  if (status != EPD_BUS_OK) {
    return fault(EpdError::InitFailed, status, "auto write BW RAM");
  }
  EpdError err = waitWhileBusy(" CMD_AUTO_WRITE_BW_RAM");
  if (err != EpdError::None) {
    return fault(err, EPD_BUS_OK, "auto write BW RAM");
  }

  status = commands.autoWriteRedRam(RAM_FILL_PATTERN);
  if (status != EPD_BUS_OK) {
    return fault(EpdError::InitFailed, status, "auto write RED RAM");
  }
  err = waitWhileBusy(" CMD_AUTO_WRITE_RED_RAM");
  if (err != EpdError::None) {
    return fault(err, EPD_BUS_OK, "auto write RED RAM");
  }

  // Load the waveform from OTP and run one refresh so the panel matches RAM
  status = commands.displayUpdateControl2(static_cast<uint8_t>(EpdUpdateMode::Fast));
  if (status == EPD_BUS_OK) status = commands.masterActivation();
  if (status != EPD_BUS_OK) {
    return fault(EpdError::InitFailed, status, "initial refresh");
  }
  err = waitWhileBusy(" initial refresh");
  if (err != EpdError::None) {
    return fault(err, EPD_BUS_OK, "initial refresh");
  }

  if (Serial) Serial.printf("[%lu]   SSD1677 controller initialized\n", millis());
  return EpdError::None;
}

EpdError EpdDisplay::fault(const EpdError error, const int busStatus, const char* step) {
  state = EpdState::Faulted;
  if (busStatus != EPD_BUS_OK) {
    lastBusError = busStatus;
  }
  if (Serial)
    Serial.printf("[%lu]   ERROR: %s during %s (bus status %d), display faulted\n", millis(), epdErrorName(error), step,
                  busStatus);
  return error;
}

bool EpdDisplay::checkReady(const char* operation) const {
  if (state == EpdState::Ready) {
    return true;
  }
  if (Serial) Serial.printf("[%lu]   ERROR: %s rejected, display is %s\n", millis(), operation, epdStateName(state));
  return false;
}

// ============================================================================
// Frame buffer operations
// ============================================================================

void EpdDisplay::writePixel(const EpdPixelAddress& address, const EpdColor color) {
  if (color == EpdColor::Black) {
    frameBuffer[address.byteOffset] &= static_cast<uint8_t>(~address.bitMask);  // Clear bit (black)
  } else {
    frameBuffer[address.byteOffset] |= address.bitMask;  // Set bit (white)
  }
}

EpdError EpdDisplay::setPixel(const uint32_t x, const uint32_t y, const EpdColor color) {
  if (!checkReady("setPixel")) {
    return EpdError::NotReady;
  }

  EpdPixelAddress address;
  if (!epdPixelAddress(x, y, config.dimensions(), config.rotation(), address)) {
    if (Serial)
      Serial.printf("[%lu]   ERROR: pixel (%lu, %lu) outside %ux%u\n", millis(), static_cast<unsigned long>(x),
                    static_cast<unsigned long>(y), getWidth(), getHeight());
    return EpdError::OutOfBounds;
  }

  writePixel(address, color);

  if (config.autoUpdate()) {
    return update();
  }
  return EpdError::None;
}

EpdError EpdDisplay::drawPixels(const EpdPixel* pixels, const size_t count) {
  if (!checkReady("drawPixels")) {
    return EpdError::NotReady;
  }

  EpdPixelAddress address;
  for (size_t i = 0; i < count; i++) {
    if (epdPixelAddress(pixels[i].x, pixels[i].y, config.dimensions(), config.rotation(), address)) {
      writePixel(address, pixels[i].color);
    }
  }

  if (config.autoUpdate()) {
    return update();
  }
  return EpdError::None;
}

EpdError EpdDisplay::clear(const EpdColor color) {
  if (!checkReady("clear")) {
    return EpdError::NotReady;
  }

  memset(frameBuffer, color == EpdColor::White ? 0xFF : 0x00, config.bufferSize());

  if (config.autoUpdate()) {
    return update(EpdUpdateMode::Slow);
  }
  return EpdError::None;
}

// ============================================================================
// Refresh and power
// ============================================================================

EpdError EpdDisplay::update() { return update(config.updateMode()); }

EpdError EpdDisplay::update(const EpdUpdateMode mode) {
  if (!checkReady("update")) {
    return EpdError::NotReady;
  }
  return writeFrameAndRefresh(mode);
}

EpdError EpdDisplay::writeFrameAndRefresh(const EpdUpdateMode mode) {
  const size_t size = config.bufferSize();
  const unsigned long startTime = millis();
  if (Serial)
    Serial.printf("[%lu]   Writing frame buffer to BW RAM (%lu bytes)...\n", startTime, static_cast<unsigned long>(size));

  // Rewind the address counters to the window origin before the RAM write
  int status = commands.ramXCounter(0);
  if (status == EPD_BUS_OK) status = commands.ramYCounter(0);
  if (status == EPD_BUS_OK) status = commands.writeRamBw(frameBuffer, size);
  if (status != EPD_BUS_OK) {
    return fault(EpdError::TransportError, status, "BW RAM write");
  }
  if (Serial) Serial.printf("[%lu]   BW RAM write complete (%lu ms)\n", millis(), millis() - startTime);

  const char* refreshType = (mode == EpdUpdateMode::Slow) ? "slow" : "fast";
  if (Serial)
    Serial.printf("[%lu]   Refreshing display 0x%02X (%s refresh)...\n", millis(), static_cast<unsigned>(mode),
                  refreshType);
  status = commands.displayUpdateControl2(static_cast<uint8_t>(mode));
  if (status == EPD_BUS_OK) status = commands.masterActivation();
  if (status != EPD_BUS_OK) {
    return fault(EpdError::TransportError, status, "refresh");
  }
  refreshCount++;

  const EpdError err = waitWhileBusy(mode == EpdUpdateMode::Slow ? " slow refresh" : " fast refresh");
  if (err != EpdError::None) {
    return fault(err, EPD_BUS_OK, "refresh");
  }
  return EpdError::None;
}

EpdError EpdDisplay::deepSleep() {
  if (!checkReady("deepSleep")) {
    return EpdError::NotReady;
  }

  if (Serial) Serial.printf("[%lu]   Entering deep sleep mode...\n", millis());
  const int status = commands.deepSleep(EpdDeepSleepMode::PreserveRam);
  if (status != EPD_BUS_OK) {
    return fault(EpdError::TransportError, status, "deep sleep");
  }

  // BUSY stays high in deep sleep, only a hardware reset wakes the controller
  state = EpdState::Uninitialized;
  return EpdError::None;
}

bool EpdDisplay::saveFrameBufferAsPBM(const char* filename) const {
#ifndef ARDUINO
  std::ofstream file(filename, std::ios::binary);
  if (!file) {
    if (Serial) Serial.printf("Failed to open %s for writing\n", filename);
    return false;
  }

  // Output the logical (rotated) image as seen by drawing code
  const uint32_t width = getWidth();
  const uint32_t height = getHeight();
  const uint32_t rowBytes = (width + 7) / 8;

  file << "P4\n";  // Binary PBM
  file << width << " " << height << "\n";

  std::vector<uint8_t> image(rowBytes * height, 0);
  EpdPixelAddress address;
  for (uint32_t y = 0; y < height; y++) {
    for (uint32_t x = 0; x < width; x++) {
      if (!epdPixelAddress(x, y, config.dimensions(), config.rotation(), address)) continue;
      const bool isWhite = (frameBuffer[address.byteOffset] & address.bitMask) != 0;
      if (!isWhite) {  // Invert: e-paper white=1 -> PBM black=1
        image[y * rowBytes + x / 8] |= static_cast<uint8_t>(0x80 >> (x % 8));
      }
    }
  }

  file.write(reinterpret_cast<const char*>(image.data()), image.size());
  file.close();
  if (Serial) Serial.printf("Saved framebuffer to %s\n", filename);
  return true;
#else
  (void)filename;
  if (Serial) Serial.println("saveFrameBufferAsPBM is not supported on Arduino builds.");
  return false;
#endif
}
