#pragma once

#include <stdexcept>
#include <string>

namespace speedtest {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

// Buffer shorter than the fixed header of the message being decoded.
class MalformedMessage : public Error {
  public:
    explicit MalformedMessage(const std::string &msg) : Error(msg) {}
};

// Wrong magic cookie or message type; listeners drop these silently.
class UnexpectedMessage : public Error {
  public:
    explicit UnexpectedMessage(const std::string &msg) : Error(msg) {}
};

class NetworkError : public Error {
  public:
    explicit NetworkError(const std::string &msg) : Error(msg) {}
};

class ConnectError : public NetworkError {
  public:
    explicit ConnectError(const std::string &msg) : NetworkError(msg) {}
};

class SendError : public NetworkError {
  public:
    explicit SendError(const std::string &msg) : NetworkError(msg) {}
};

class RecvError : public NetworkError {
  public:
    explicit RecvError(const std::string &msg) : NetworkError(msg) {}
};

class BindError : public NetworkError {
  public:
    explicit BindError(const std::string &msg) : NetworkError(msg) {}
};

class PrematureClose : public NetworkError {
  public:
    explicit PrematureClose(const std::string &msg) : NetworkError(msg) {}
};

class Timeout : public NetworkError {
  public:
    explicit Timeout(const std::string &msg) : NetworkError(msg) {}
};

class Cancelled : public Error {
  public:
    Cancelled() : Error("cancelled") {}
};

class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg) : Error(msg) {}
};

} // namespace speedtest
