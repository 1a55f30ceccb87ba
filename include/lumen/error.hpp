#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lumen {

/// Base class for every error raised by the library.
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Socket creation, option or bind failure. Fatal when constructing a client.
class BindError : public Error {
  public:
    using Error::Error;
};

/// Transport failure on send, receive or socket option change.
class SocketError : public Error {
  public:
    using Error::Error;
};

/// A message could not be sent in full.
class SendError : public Error {
  public:
    using Error::Error;
};

/// A value has no wire representation.
class EncodeError : public Error {
  public:
    using Error::Error;
};

/// Malformed or truncated wire data.
class DecodeError : public Error {
  public:
    using Error::Error;
};

/// Payload type code that is not in the message catalog.
class UnrecognizedMessage : public DecodeError {
  public:
    explicit UnrecognizedMessage(uint16_t type)
        : DecodeError("unrecognized message type " + std::to_string(type)), type_(type) {}

    [[nodiscard]] uint16_t type() const { return type_; }

  private:
    uint16_t type_;
};

/// Invalid client configuration.
class ConfigError : public Error {
  public:
    using Error::Error;
};

} // namespace lumen
