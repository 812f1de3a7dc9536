// core/error.hpp
// Exception taxonomy for sockclient
//
// All errors derive from std::runtime_error so callers that only care about
// "something failed" can catch that, while callers that need to react
// differently (reconnect vs. give up on one exchange) catch the subclasses:
//
//   ClientError
//   ├── ConnectionError      connect() / handshake failed
//   ├── InvalidState         operation outside its lifecycle state
//   └── ExchangeError        one send_request() failed
//       ├── TransportError   socket/TLS failure mid-session, or session closed
//       └── MalformedResponse  response head/body framing violation
//
// Namespace: sockclient

#pragma once

#include <stdexcept>
#include <string>

namespace sockclient {

struct ClientError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ConnectionError : ClientError {
    using ClientError::ClientError;
};

struct InvalidState : ClientError {
    using ClientError::ClientError;
};

struct ExchangeError : ClientError {
    using ClientError::ClientError;
};

struct TransportError : ExchangeError {
    using ExchangeError::ExchangeError;
};

struct MalformedResponse : ExchangeError {
    using ExchangeError::ExchangeError;
};

} // namespace sockclient
