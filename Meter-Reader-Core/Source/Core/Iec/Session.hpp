#pragma once
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Core/Iec/DataBlockReader.hpp"
#include "Core/Iec/DataSetParser.hpp"
#include "Core/Iec/Identification.hpp"
#include "Core/Iec/LineReader.hpp"
#include "Core/Iec/Timing.hpp"
#include "Core/Serial/ByteChannel.hpp"

struct SessionOptions {
    std::string deviceAddress;   // "/?<indirizzo>!"; vuoto = qualsiasi contatore
    bool verifyBcc = false;
    std::optional<std::chrono::milliseconds> blockIdleTimeout;
};

struct Readout {
    IdentificationMessage identification;
    std::vector<DataSetRecord> records;
};

class MeterSession;

// Sequenza pigra dei dataset: ogni next() legge e parsea una riga.
// Un errore interrompe la sequenza; non deve sopravvivere alla sessione.
class DataSetStream {
public:
    std::optional<DataSetRecord> next();
    [[nodiscard]] bool finished() const { return m_finished; }

private:
    friend class MeterSession;
    explicit DataSetStream(DataBlockReader& reader) : m_reader(&reader) {}

    DataBlockReader* m_reader;
    bool m_finished = false;
};

// Un ciclo di lettura IEC 62056-21 (modo lettura dati) su un canale.
// La sessione possiede la configurazione del canale per tutta la durata:
// 300 baud al sign-on, poi il baud negoziato.
class MeterSession {
public:
    explicit MeterSession(ByteChannel& channel, SessionOptions options = {});
    MeterSession(ByteChannel& channel, Clock& clock, SessionOptions options = {});

    // sign-on, identificazione, ack, cambio baud; poi il blocco dati
    // viene letto man mano dallo stream. Una sola volta per sessione.
    DataSetStream read();

    // read() + tutti i dataset
    Readout readAll();

    [[nodiscard]] const std::optional<IdentificationMessage>& identification() const { return m_ident; }
    [[nodiscard]] bool nonBlockingWrites() const { return m_timing.nonBlocking(); }

private:
    void signOn();
    void acknowledge(const IdentificationMessage& ident);

    ByteChannel& m_channel;
    Clock& m_clock;
    SessionOptions m_options;

    TimingController m_timing;
    LineReader m_lines;
    std::optional<IdentificationMessage> m_ident;
    std::unique_ptr<DataBlockReader> m_block;
    bool m_started = false;
};
