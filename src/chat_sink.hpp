#pragma once
#include "model.hpp"
#include <string>

namespace rconbridge {

// Destination for outbound chat (the stream side).
class ChatSink {
public:
    virtual ~ChatSink() = default;

    virtual std::string sink_name() const = 0;

    // Deliver one message. False when the platform did not accept it.
    virtual bool send(const ChatPayload& payload) = 0;

    // True (once) when message_id belongs to a message this sink sent, so
    // the chat notification it triggers can be dropped instead of relayed
    // back into the game.
    virtual bool consume_own_message(const std::string& /*message_id*/) { return false; }
};

} // namespace rconbridge
