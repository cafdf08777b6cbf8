#pragma once

#include <stdexcept>
#include <string>

// Bad tracker request. Thrown by the command parser, never crosses a
// connection: the tracker turns it into an error response.
class MalformedCommand : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Outbound connect/write/read failure, raised by transport.hpp.
class TransportError : public std::runtime_error {
public:
  TransportError(const std::string& what, bool timed_out)
    : std::runtime_error(what), timed_out_(timed_out) {}

  bool timed_out() const { return timed_out_; }

private:
  bool timed_out_;
};

// The tracker could not be reached or returned something that is not a
// response.
class TrackerUnreachable : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
