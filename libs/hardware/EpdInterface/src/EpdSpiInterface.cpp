#include "EpdSpiInterface.h"

EpdSpiInterface::EpdSpiInterface(int8_t sclk, int8_t mosi, int8_t cs, int8_t dc, int8_t rst, int8_t busy,
                                 uint32_t frequencyHz)
    : _sclk(sclk), _mosi(mosi), _cs(cs), _dc(dc), _rst(rst), _busy(busy), _frequencyHz(frequencyHz) {
  if (Serial) Serial.printf("[%lu] EpdSpiInterface: SCLK=%d, MOSI=%d, CS=%d, DC=%d, RST=%d, BUSY=%d\n", millis(), sclk,
                            mosi, cs, dc, rst, busy);
}

int EpdSpiInterface::begin() {
#if defined(ARDUINO_ARCH_ESP32)
  SPI.begin(_sclk, -1, _mosi, _cs);
#else
  SPI.begin();
#endif
  spiSettings = SPISettings(_frequencyHz, MSBFIRST, SPI_MODE0);
  if (Serial) Serial.printf("[%lu]   SPI initialized at %lu Hz, Mode 0\n", millis(), static_cast<unsigned long>(_frequencyHz));

  pinMode(_cs, OUTPUT);
  pinMode(_dc, OUTPUT);
  pinMode(_rst, OUTPUT);
  pinMode(_busy, INPUT);

  digitalWrite(_cs, HIGH);
  digitalWrite(_dc, HIGH);
  digitalWrite(_rst, HIGH);

  if (Serial) Serial.printf("[%lu]   GPIO pins configured\n", millis());
  started = true;
  return EPD_BUS_OK;
}

int EpdSpiInterface::sendCommand(const uint8_t command) {
  if (!started) return EPD_BUS_ERR_NOT_STARTED;

  SPI.beginTransaction(spiSettings);
  digitalWrite(_dc, LOW);  // Command mode
  digitalWrite(_cs, LOW);  // Select chip
  SPI.transfer(command);
  digitalWrite(_cs, HIGH);  // Deselect chip
  SPI.endTransaction();
  return EPD_BUS_OK;
}

size_t EpdSpiInterface::chunkLength(const size_t offset, const size_t length) {
  if (offset >= length) return 0;
  const size_t remaining = length - offset;
  return remaining < EPD_SPI_MAX_TRANSFER_BYTES ? remaining : EPD_SPI_MAX_TRANSFER_BYTES;
}

int EpdSpiInterface::sendData(const uint8_t* data, const size_t length) {
  if (!data && length > 0) return EPD_BUS_ERR_INVALID_ARG;
  if (!started) return EPD_BUS_ERR_NOT_STARTED;

  // Keep CS asserted across chunks so the controller sees one RAM write
  SPI.beginTransaction(spiSettings);
  digitalWrite(_dc, HIGH);  // Data mode
  digitalWrite(_cs, LOW);   // Select chip
  size_t offset = 0;
  for (size_t chunk = chunkLength(0, length); chunk > 0; chunk = chunkLength(offset, length)) {
    writeBytes(data + offset, chunk);
    offset += chunk;
  }
  digitalWrite(_cs, HIGH);  // Deselect chip
  SPI.endTransaction();
  return EPD_BUS_OK;
}

void EpdSpiInterface::writeBytes(const uint8_t* data, const size_t length) {
#if defined(ARDUINO_ARCH_ESP32)
  SPI.writeBytes(data, length);
#else
  for (size_t i = 0; i < length; i++) {
    SPI.transfer(data[i]);
  }
#endif
}

void EpdSpiInterface::setResetLine(const bool high) { digitalWrite(_rst, high ? HIGH : LOW); }

bool EpdSpiInterface::readBusyLine() { return digitalRead(_busy) == HIGH; }

void EpdSpiInterface::delayMs(const uint32_t ms) { delay(ms); }
