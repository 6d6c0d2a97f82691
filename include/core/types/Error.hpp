#pragma once
#include <stdexcept>
#include <string>

namespace core::types {

class PrintException : public std::runtime_error {
public:
    explicit PrintException(const std::string& msg)
        : std::runtime_error(msg) {}
};

/**
 * @brief Font or QR encoding failure while composing the raster.
 */
class RenderError : public PrintException {
public:
    explicit RenderError(const std::string& msg)
        : PrintException("Render failed: " + msg) {}
};

class DeviceNotFoundError : public PrintException {
public:
    explicit DeviceNotFoundError(const std::string& target)
        : PrintException("No BLE device found matching '" + target + "'") {}
};

class UnknownModelError : public PrintException {
public:
    explicit UnknownModelError(const std::string& hint)
        : PrintException("Unknown printer model for '" + hint + "'") {}
};

class ModelRequiredError : public PrintException {
public:
    ModelRequiredError() : PrintException("Serial printing requires an explicit printer model") {}
};

/**
 * @brief Link-level I/O fault during delivery, wraps the underlying cause.
 */
class TransportError : public PrintException {
public:
    explicit TransportError(const std::string& cause)
        : PrintException("Transport failure: " + cause) {}
};

class TimeoutError : public PrintException {
public:
    explicit TimeoutError(const std::string& where)
        : PrintException("Print job deadline exceeded during " + where) {}
};

}
