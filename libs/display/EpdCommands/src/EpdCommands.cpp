#include "EpdCommands.h"

namespace {
// Window and counter addresses are 10 bits wide
constexpr uint8_t ADDRESS_HIGH_MASK = 0x03;

inline uint8_t addrLow(const uint16_t v) { return static_cast<uint8_t>(v % 256); }
inline uint8_t addrHigh(const uint16_t v) { return static_cast<uint8_t>((v / 256) & ADDRESS_HIGH_MASK); }
}  // namespace

int EpdCommands::send(const uint8_t command, const uint8_t* payload, const size_t length) {
  int status = interface.sendCommand(command);
  if (status != EPD_BUS_OK || length == 0) {
    return status;
  }
  return interface.sendData(payload, length);
}

int EpdCommands::driverOutputControl(const uint16_t gateLines, const uint8_t scanMode) {
  const uint16_t mux = gateLines - 1;
  const uint8_t data[3] = {addrLow(mux), static_cast<uint8_t>(mux / 256), scanMode};
  return send(EPD_CMD_DRIVER_OUTPUT_CONTROL, data, sizeof(data));
}

uint8_t EpdCommands::gateVoltageCode(const float volts) {
  // Also rejects NaN
  if (!(volts >= 12.0f && volts <= 20.0f)) {
    return 0x00;  // POR value, also 20V
  }
  const float halfSteps = (volts - 12.0f) * 2.0f;
  const int steps = static_cast<int>(halfSteps);
  if (static_cast<float>(steps) != halfSteps) {
    return 0x00;
  }
  return static_cast<uint8_t>(0x07 + steps);
}

int EpdCommands::gateDrivingVoltage(const float volts) {
  const uint8_t code = gateVoltageCode(volts);
  return send(EPD_CMD_GATE_VOLTAGE, &code, 1);
}

int EpdCommands::boosterSoftStart(const EpdBoosterInrush inrush) {
  // First four bytes are fixed, the last selects the inrush current
  const uint8_t data[5] = {0xAE, 0xC7, 0xC3, 0xC0, static_cast<uint8_t>(inrush)};
  return send(EPD_CMD_BOOSTER_SOFT_START, data, sizeof(data));
}

int EpdCommands::deepSleep(const EpdDeepSleepMode mode) {
  const uint8_t data = static_cast<uint8_t>(mode);
  return send(EPD_CMD_DEEP_SLEEP, &data, 1);
}

int EpdCommands::dataEntryMode(const EpdDataEntry mode, const EpdIncrementAxis axis) {
  const uint8_t data = static_cast<uint8_t>((static_cast<uint8_t>(axis) << 2) | static_cast<uint8_t>(mode));
  return send(EPD_CMD_DATA_ENTRY_MODE, &data, 1);
}

int EpdCommands::softReset() { return send(EPD_CMD_SOFT_RESET, nullptr, 0); }

int EpdCommands::temperatureSensor(const EpdTempSensor sensor) {
  const uint8_t data = static_cast<uint8_t>(sensor);
  return send(EPD_CMD_TEMP_SENSOR_CONTROL, &data, 1);
}

int EpdCommands::borderWaveform(const EpdVbdOption option, const EpdVbdFixedLevel fixedLevel,
                                const EpdVbdTransition transition) {
  const uint8_t data = static_cast<uint8_t>((static_cast<uint8_t>(option) << 6) |
                                            (static_cast<uint8_t>(fixedLevel) << 4) |
                                            static_cast<uint8_t>(transition));
  return send(EPD_CMD_BORDER_WAVEFORM, &data, 1);
}

int EpdCommands::ramXWindow(const uint16_t start, const uint16_t end) {
  const uint8_t data[4] = {addrLow(start), addrHigh(start), addrLow(end), addrHigh(end)};
  return send(EPD_CMD_SET_RAM_X_RANGE, data, sizeof(data));
}

int EpdCommands::ramYWindow(const uint16_t start, const uint16_t end) {
  const uint8_t data[4] = {addrLow(start), addrHigh(start), addrLow(end), addrHigh(end)};
  return send(EPD_CMD_SET_RAM_Y_RANGE, data, sizeof(data));
}

int EpdCommands::ramWindowForPanel(const uint16_t rows, const uint16_t cols) {
  const int status = ramXWindow(0, cols - 1);
  if (status != EPD_BUS_OK) {
    return status;
  }
  return ramYWindow(0, rows - 1);
}

int EpdCommands::ramXCounter(const uint16_t x) {
  const uint8_t data[2] = {addrLow(x), addrHigh(x)};
  return send(EPD_CMD_SET_RAM_X_COUNTER, data, sizeof(data));
}

int EpdCommands::ramYCounter(const uint16_t y) {
  const uint8_t data[2] = {addrLow(y), addrHigh(y)};
  return send(EPD_CMD_SET_RAM_Y_COUNTER, data, sizeof(data));
}

int EpdCommands::writeRamBw(const uint8_t* data, const size_t length) {
  return send(EPD_CMD_WRITE_RAM_BW, data, length);
}

int EpdCommands::writeRamRed(const uint8_t* data, const size_t length) {
  return send(EPD_CMD_WRITE_RAM_RED, data, length);
}

int EpdCommands::autoWriteBwRam(const uint8_t pattern) { return send(EPD_CMD_AUTO_WRITE_BW_RAM, &pattern, 1); }

int EpdCommands::autoWriteRedRam(const uint8_t pattern) { return send(EPD_CMD_AUTO_WRITE_RED_RAM, &pattern, 1); }

int EpdCommands::nop() { return send(EPD_CMD_NOP, nullptr, 0); }

int EpdCommands::displayUpdateControl1(const EpdRamOption bwOption, const EpdRamOption redOption) {
  const uint8_t data =
      static_cast<uint8_t>(((static_cast<uint8_t>(redOption) & 0x0F) << 4) | (static_cast<uint8_t>(bwOption) & 0x0F));
  return send(EPD_CMD_DISPLAY_UPDATE_CTRL1, &data, 1);
}

int EpdCommands::displayUpdateControl2(const uint8_t option) { return send(EPD_CMD_DISPLAY_UPDATE_CTRL2, &option, 1); }

int EpdCommands::masterActivation() { return send(EPD_CMD_MASTER_ACTIVATION, nullptr, 0); }
