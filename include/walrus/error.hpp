#ifndef WALRUS_ERROR_HPP
#define WALRUS_ERROR_HPP

#include <stdexcept>
#include <string>

namespace walrus {

/*
    error hierarchy:
        ProtocolError     malformed frame on the wire. fatal to the connection - once a frame
                          fails to decode the stream position can no longer be trusted.
          ParseError      frame decoded fine but its elements don't fit the command. also fatal.
            EndOfStream   ran out of elements. callers catch this one to treat a trailing
                          argument as optional.
        CommandError      well formed command with an option or value we refuse. reported to the
                          peer as an error reply, connection stays open.
        ConnectionReset   peer hung up in the middle of a frame.

    "not enough bytes yet" is not an exception - FrameCodec::check returns nullopt for it.
*/

class ProtocolError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

class ParseError : public ProtocolError {
   public:
    using ProtocolError::ProtocolError;
};

class EndOfStream : public ParseError {
   public:
    EndOfStream() : ParseError("protocol error; unexpected end of stream") {}
};

class CommandError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

class ConnectionReset : public std::runtime_error {
   public:
    ConnectionReset() : std::runtime_error("connection reset by peer") {}
};

}  // namespace walrus

#endif
