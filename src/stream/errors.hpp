#pragma once

#include <stdexcept>
#include <string>

namespace edge_stream {

// Inbound or outbound transport failure mid-session.
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string &what, bool cancelled = false)
      : std::runtime_error(what), cancelled_(cancelled) {}

  // True when the peer cancelled (or the call deadline expired) rather than
  // the transport breaking.
  bool cancelled() const { return cancelled_; }

private:
  bool cancelled_;
};

// The client sent something the protocol does not accept.
class InvalidRequestError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// End of input reached without any ControlParameters part.
class MissingParametersError : public InvalidRequestError {
public:
  MissingParametersError()
      : InvalidRequestError("missing image processing parameters") {}
};

// The transform collaborator failed.
class ProcessingError : public std::runtime_error {
public:
  explicit ProcessingError(const std::string &cause)
      : std::runtime_error("image processing failed: " + cause) {}
};

} // namespace edge_stream
