#pragma once
#include <optional>
#include <string>
#include <string_view>

#include <simdjson.h>

#include "codec/events.hpp"

// Names the offending field ("$" for the payload root) and why it was refused.
struct DecodeError
{
    std::string field;
    std::string reason;
};

struct DecodeResult
{
    std::optional<Event> event;
    DecodeError error; // meaningful only when !event

    bool ok() const noexcept { return event.has_value(); }
    explicit operator bool() const noexcept { return ok(); }
};

// Wire codec for the JSON messages carried by the transport bridge.
//
// decode() is total: any byte string yields either an Event or a DecodeError,
// it never throws. encode() throws EncodingError only for an event that
// already violates its own invariants.
//
// Holds a reusable simdjson parser, so one instance per thread.
class MessageCodec {
public:
    MessageCodec() = default;

    static std::string encode(const Event& ev);

    DecodeResult decode(std::string_view raw);

private:
    simdjson::ondemand::parser parser_;
};
