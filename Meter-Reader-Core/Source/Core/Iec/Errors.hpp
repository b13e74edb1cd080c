#pragma once
#include <stdexcept>
#include <string>

// Base comune per gli errori di protocollo IEC 62056-21.
class IecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Il contatore non ha prodotto byte quando ne serviva almeno uno.
class TimeoutError : public IecError {
public:
    TimeoutError() : IecError("timeout: nessuna risposta dal contatore") {}
    explicit TimeoutError(const std::string& what) : IecError(what) {}
};

// Byte ricevuti ma fuori formato (framing o grammatica).
class InvalidMessageError : public IecError {
public:
    using IecError::IecError;
};
