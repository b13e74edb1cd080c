#include <gtest/gtest.h>
#include "TestSupport.hpp"
#include "Core/Iec/Errors.hpp"
#include "Core/Iec/Identification.hpp"

TEST(Identification, BaudTable) {
    const std::string ids = "0123456789ABCDEF";
    const unsigned expected[16] = { 300, 600, 1200, 2400, 4800, 9600, 19200, 0, 0, 0,
        600, 1200, 2400, 4800, 9600, 19200 };
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(BaudRateForId(ids[i]), expected[i]) << "id " << ids[i];
    }
    EXPECT_EQ(BaudRateForId('c'), 2400u);
    EXPECT_THROW(BaudRateForId('G'), InvalidMessageError);
    EXPECT_THROW(BaudRateForId('Z'), InvalidMessageError);
}

TEST(Identification, ProtocolModes) {
    EXPECT_EQ(ProtocolModeFor('0', false), ProtocolMode::A);
    EXPECT_EQ(ProtocolModeFor('A', false), ProtocolMode::A);
    EXPECT_EQ(ProtocolModeFor('B', false), ProtocolMode::B);
    EXPECT_EQ(ProtocolModeFor('I', false), ProtocolMode::B);
    EXPECT_EQ(ProtocolModeFor('1', false), ProtocolMode::C);
    EXPECT_EQ(ProtocolModeFor('9', false), ProtocolMode::C);
    EXPECT_EQ(ProtocolModeFor('5', true), ProtocolMode::E);
    EXPECT_EQ(ProtocolModeFor('E', true), ProtocolMode::B);
    EXPECT_EQ(ProtocolModeChar(ProtocolMode::C), 'C');
}

TEST(Identification, ParsesModeC) {
    const auto msg = ParseIdentification(ToBytes("/XYZ5ABC123"));
    EXPECT_EQ(msg.manufacturerId, "XYZ");
    EXPECT_EQ(msg.baudId, '5');
    // gli ultimi due byte della riga non fanno parte dell'identificativo
    EXPECT_EQ(msg.identification, "ABC1");
    EXPECT_EQ(msg.protocolMode, ProtocolMode::C);
    EXPECT_EQ(msg.baudRate, 9600u);
}

TEST(Identification, ParsesModeB) {
    const auto msg = ParseIdentification(ToBytes("/LGZE2ZMD3104407"));
    EXPECT_EQ(msg.manufacturerId, "LGZ");
    EXPECT_EQ(msg.protocolMode, ProtocolMode::B);
    EXPECT_EQ(msg.baudRate, 9600u);
    EXPECT_EQ(msg.identification, "2ZMD31044");
}

TEST(Identification, ModeAWithLowestBaudId) {
    const auto msg = ParseIdentification(ToBytes("/ABC0METER"));
    EXPECT_EQ(msg.protocolMode, ProtocolMode::A);
    EXPECT_EQ(msg.baudRate, 300u);
}

TEST(Identification, EscapeSkipsEnhancedModeChar) {
    const auto msg = ParseIdentification(ToBytes("/ISK5\\2MT382-1000"));
    EXPECT_EQ(msg.manufacturerId, "ISK");
    EXPECT_EQ(msg.protocolMode, ProtocolMode::E);
    EXPECT_EQ(msg.baudRate, 9600u);
    EXPECT_EQ(msg.identification, "MT382-10");

    // 8 byte: lunghezza minima, identificativo vuoto
    EXPECT_TRUE(ParseIdentification(ToBytes("/ISK5\\2A")).identification.empty());
    EXPECT_EQ(ParseIdentification(ToBytes("/ISK5\\2ABC")).identification, "A");
    EXPECT_THROW(ParseIdentification(ToBytes("/ISK5\\2")), InvalidMessageError);
}

TEST(Identification, ShortestValidLine) {
    const auto msg = ParseIdentification(ToBytes("/XYZ5A"));
    EXPECT_EQ(msg.manufacturerId, "XYZ");
    EXPECT_TRUE(msg.identification.empty());
    EXPECT_EQ(ParseIdentification(ToBytes("/XYZ5ABC")).identification, "A");
}

TEST(Identification, ReservedBaudIdParsesWithZero) {
    const auto msg = ParseIdentification(ToBytes("/XYZ7METER"));
    EXPECT_EQ(msg.baudRate, 0u);
    EXPECT_EQ(msg.protocolMode, ProtocolMode::C);
}

TEST(Identification, Errors) {
    EXPECT_THROW(ParseIdentification(Bytes{}), TimeoutError);
    EXPECT_THROW(ParseIdentification(ToBytes("/AB1")), InvalidMessageError);
    EXPECT_THROW(ParseIdentification(ToBytes("/XYZ5")), InvalidMessageError);
    EXPECT_THROW(ParseIdentification(ToBytes("XYZ5ABC123")), InvalidMessageError);
    EXPECT_THROW(ParseIdentification(ToBytes("/XYZGABC")), InvalidMessageError);
}

TEST(Identification, ReaderReadsLineFromChannel) {
    ManualClock clock;
    ScriptedChannel ch(clock);
    LineReader lines(ch);
    ch.feed("/XYZ5ABC123\r\n");

    IdentificationReader reader(ch, lines);
    EXPECT_EQ(reader.read().identification, "ABC1");
}

TEST(Identification, ReaderDrainsOnMissingStartChar) {
    ManualClock clock;
    ScriptedChannel ch(clock);
    LineReader lines(ch);
    ch.feed("XYZ5ABC\r\nrumore");
    ch.feedTimeout();
    ch.feed("/dopo");

    IdentificationReader reader(ch, lines);
    EXPECT_THROW(reader.read(), InvalidMessageError);
    // consumato fino al primo silenzio, non oltre
    EXPECT_EQ(ch.rx.size(), 5u);
}

TEST(Identification, ReaderTimesOutOnSilence) {
    ManualClock clock;
    ScriptedChannel ch(clock);
    LineReader lines(ch);

    IdentificationReader reader(ch, lines);
    EXPECT_THROW(reader.read(), TimeoutError);
}
