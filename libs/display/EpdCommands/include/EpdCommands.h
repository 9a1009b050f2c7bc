#pragma once
#include <cstddef>
#include <cstdint>

#include "EpdInterface.h"

// SSD1677 command definitions
// Initialization and reset
#define EPD_CMD_DRIVER_OUTPUT_CONTROL 0x01  // Driver output control
#define EPD_CMD_GATE_VOLTAGE 0x03           // Gate driving voltage
#define EPD_CMD_BOOSTER_SOFT_START 0x0C     // Booster soft-start control
#define EPD_CMD_DEEP_SLEEP 0x10             // Deep sleep mode
#define EPD_CMD_SOFT_RESET 0x12             // Soft reset
#define EPD_CMD_TEMP_SENSOR_CONTROL 0x18    // Temperature sensor control
#define EPD_CMD_BORDER_WAVEFORM 0x3C        // Border waveform control

// RAM and buffer management
#define EPD_CMD_DATA_ENTRY_MODE 0x11     // Data entry mode
#define EPD_CMD_WRITE_RAM_BW 0x24        // Write to BW RAM (current frame)
#define EPD_CMD_WRITE_RAM_RED 0x26       // Write to RED RAM
#define EPD_CMD_SET_RAM_X_RANGE 0x44     // Set RAM X address range
#define EPD_CMD_SET_RAM_Y_RANGE 0x45     // Set RAM Y address range
#define EPD_CMD_AUTO_WRITE_RED_RAM 0x46  // Auto write RED RAM, regular pattern
#define EPD_CMD_AUTO_WRITE_BW_RAM 0x47   // Auto write BW RAM, regular pattern
#define EPD_CMD_SET_RAM_X_COUNTER 0x4E   // Set RAM X address counter
#define EPD_CMD_SET_RAM_Y_COUNTER 0x4F   // Set RAM Y address counter
#define EPD_CMD_NOP 0x7F                 // Terminates a RAM write

// Display update and refresh
#define EPD_CMD_MASTER_ACTIVATION 0x20     // Master activation, BUSY high until done
#define EPD_CMD_DISPLAY_UPDATE_CTRL1 0x21  // RAM content options
#define EPD_CMD_DISPLAY_UPDATE_CTRL2 0x22  // Display update sequence option

enum class EpdDataEntry : uint8_t {
  DecrementXDecrementY = 0x00,
  IncrementXDecrementY = 0x01,
  DecrementXIncrementY = 0x02,
  IncrementXIncrementY = 0x03
};

// Counter that advances first after each data byte
enum class EpdIncrementAxis : uint8_t { Horizontal = 0x00, Vertical = 0x01 };

enum class EpdTempSensor : uint8_t { Internal = 0x80, External = 0x48 };

enum class EpdRamOption : uint8_t { Normal = 0x00, Bypass = 0x04, Invert = 0x08 };

enum class EpdDeepSleepMode : uint8_t { Normal = 0x00, PreserveRam = 0x01, DiscardRam = 0x03 };

enum class EpdBoosterInrush : uint8_t { Level1 = 0x40, Level2 = 0x80 };

// Border (VBD) waveform selection
enum class EpdVbdOption : uint8_t { Transition = 0x00, Fixed = 0x01, Vcom = 0x02, HiZ = 0x03 };
enum class EpdVbdFixedLevel : uint8_t { Vss = 0x00, Vsh1 = 0x01, Vsl = 0x02, Vsh2 = 0x03 };
enum class EpdVbdTransition : uint8_t { Lut0 = 0x00, Lut1 = 0x01, Lut2 = 0x02, Lut3 = 0x03 };

// SSD1677 command set issued over an EpdInterface.
// Every call sends the command byte then its payload and returns the first
// non-zero bus status, or EPD_BUS_OK.
class EpdCommands {
 public:
  explicit EpdCommands(EpdInterface& interface) : interface(interface) {}

  // Gate count is the panel row count; the controller takes rows - 1
  int driverOutputControl(uint16_t gateLines, uint8_t scanMode = 0x02);
  // 12 V to 20 V in 0.5 V steps, anything else selects the POR value
  int gateDrivingVoltage(float volts);
  int boosterSoftStart(EpdBoosterInrush inrush);
  int deepSleep(EpdDeepSleepMode mode);
  int dataEntryMode(EpdDataEntry mode, EpdIncrementAxis axis);
  int softReset();
  int temperatureSensor(EpdTempSensor sensor);
  int borderWaveform(EpdVbdOption option, EpdVbdFixedLevel fixedLevel, EpdVbdTransition transition);

  int ramXWindow(uint16_t start, uint16_t end);
  int ramYWindow(uint16_t start, uint16_t end);
  // Full panel window: X over the source lines, Y over the gate lines
  int ramWindowForPanel(uint16_t rows, uint16_t cols);
  int ramXCounter(uint16_t x);
  int ramYCounter(uint16_t y);
  int writeRamBw(const uint8_t* data, size_t length);
  int writeRamRed(const uint8_t* data, size_t length);
  int autoWriteBwRam(uint8_t pattern);
  int autoWriteRedRam(uint8_t pattern);
  int nop();

  int displayUpdateControl1(EpdRamOption bwOption, EpdRamOption redOption);
  int displayUpdateControl2(uint8_t option);
  int masterActivation();

  static uint8_t gateVoltageCode(float volts);

 private:
  int send(uint8_t command, const uint8_t* payload, size_t length);

  EpdInterface& interface;
};
