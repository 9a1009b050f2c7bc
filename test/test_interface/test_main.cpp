#include <Arduino.h>
#include <unity.h>

#include <cstdlib>

#include "Epd3WireInterface.h"
#include "EpdSpiInterface.h"

// Pins are never driven, begin() is not called in these tests
#define PIN_SCLK 8
#define PIN_MOSI 10
#define PIN_CS 21
#define PIN_DC 4
#define PIN_RST 5
#define PIN_BUSY 6

static void test_spi_rejects_transfers_before_begin() {
  EpdSpiInterface bus(PIN_SCLK, PIN_MOSI, PIN_CS, PIN_DC, PIN_RST, PIN_BUSY);
  const uint8_t data[] = {0x01, 0x02};

  TEST_ASSERT_EQUAL_INT(EPD_BUS_ERR_NOT_STARTED, bus.sendCommand(0x12));
  TEST_ASSERT_EQUAL_INT(EPD_BUS_ERR_NOT_STARTED, bus.sendData(data, sizeof(data)));
  TEST_ASSERT_EQUAL_INT(EPD_BUS_ERR_NOT_STARTED, bus.sendData(0x03));
  TEST_ASSERT_EQUAL_INT(EPD_BUS_ERR_NOT_STARTED, bus.sendData(nullptr, 0));
}

static void test_spi_rejects_null_payload() {
  EpdSpiInterface bus(PIN_SCLK, PIN_MOSI, PIN_CS, PIN_DC, PIN_RST, PIN_BUSY);
  TEST_ASSERT_EQUAL_INT(EPD_BUS_ERR_INVALID_ARG, bus.sendData(nullptr, 16));
}

static void test_spi_chunks_full_frame() {
  // 800x480 frame buffer
  const size_t length = 48000;
  size_t offset = 0;
  size_t chunks = 0;

  for (size_t chunk = EpdSpiInterface::chunkLength(0, length); chunk > 0;
       chunk = EpdSpiInterface::chunkLength(offset, length)) {
    TEST_ASSERT_TRUE(chunk <= EPD_SPI_MAX_TRANSFER_BYTES);
    if (offset + chunk < length) TEST_ASSERT_EQUAL_UINT32(EPD_SPI_MAX_TRANSFER_BYTES, chunk);
    offset += chunk;
    chunks++;
  }

  TEST_ASSERT_EQUAL_UINT32(length, offset);
  TEST_ASSERT_EQUAL_UINT32((length + EPD_SPI_MAX_TRANSFER_BYTES - 1) / EPD_SPI_MAX_TRANSFER_BYTES, chunks);
  TEST_ASSERT_EQUAL_UINT32(length % EPD_SPI_MAX_TRANSFER_BYTES,
                           EpdSpiInterface::chunkLength(length - length % EPD_SPI_MAX_TRANSFER_BYTES, length));
}

static void test_spi_chunk_edges() {
  TEST_ASSERT_EQUAL_UINT32(0, EpdSpiInterface::chunkLength(0, 0));
  TEST_ASSERT_EQUAL_UINT32(1, EpdSpiInterface::chunkLength(0, 1));
  TEST_ASSERT_EQUAL_UINT32(EPD_SPI_MAX_TRANSFER_BYTES,
                           EpdSpiInterface::chunkLength(0, EPD_SPI_MAX_TRANSFER_BYTES));
  TEST_ASSERT_EQUAL_UINT32(0, EpdSpiInterface::chunkLength(EPD_SPI_MAX_TRANSFER_BYTES, EPD_SPI_MAX_TRANSFER_BYTES));
  TEST_ASSERT_EQUAL_UINT32(1, EpdSpiInterface::chunkLength(EPD_SPI_MAX_TRANSFER_BYTES, EPD_SPI_MAX_TRANSFER_BYTES + 1));
  TEST_ASSERT_EQUAL_UINT32(0, EpdSpiInterface::chunkLength(10, 5));
}

static void test_3wire_rejects_transfers_before_begin() {
  Epd3WireInterface bus(PIN_SCLK, PIN_MOSI, PIN_CS, PIN_RST, PIN_BUSY);
  const uint8_t data[] = {0xAE, 0xC7};

  TEST_ASSERT_EQUAL_INT(EPD_BUS_ERR_NOT_STARTED, bus.sendCommand(0x0C));
  TEST_ASSERT_EQUAL_INT(EPD_BUS_ERR_NOT_STARTED, bus.sendData(data, sizeof(data)));
  TEST_ASSERT_EQUAL_INT(EPD_BUS_ERR_INVALID_ARG, bus.sendData(nullptr, 2));
}

static void test_3wire_word_layout() {
  // Command words start with a 0 bit, data words with a 1 bit
  TEST_ASSERT_EQUAL_HEX16(0x012, Epd3WireInterface::encodeWord(false, 0x12));
  TEST_ASSERT_EQUAL_HEX16(0x112, Epd3WireInterface::encodeWord(true, 0x12));
  TEST_ASSERT_EQUAL_HEX16(0x0FF, Epd3WireInterface::encodeWord(false, 0xFF));
  TEST_ASSERT_EQUAL_HEX16(0x100, Epd3WireInterface::encodeWord(true, 0x00));

  // Nothing above the 9th bit
  for (int value = 0; value < 256; value++) {
    TEST_ASSERT_TRUE(Epd3WireInterface::encodeWord(true, static_cast<uint8_t>(value)) < 0x200);
  }
}

void setUp(void) {}

void tearDown(void) {}

void setup() {
  delay(10);

  UNITY_BEGIN();
  RUN_TEST(test_spi_rejects_transfers_before_begin);
  RUN_TEST(test_spi_rejects_null_payload);
  RUN_TEST(test_spi_chunks_full_frame);
  RUN_TEST(test_spi_chunk_edges);
  RUN_TEST(test_3wire_rejects_transfers_before_begin);
  RUN_TEST(test_3wire_word_layout);
  exit(UNITY_END());
}

void loop() {}
