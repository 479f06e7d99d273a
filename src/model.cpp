#include "model.hpp"

namespace rconbridge {

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Chat:             return "chat";
        case EventKind::Cheer:            return "cheer";
        case EventKind::Subscribe:        return "subscribe";
        case EventKind::GiftSubscription: return "gift";
        case EventKind::Follow:           return "follow";
        case EventKind::Redemption:       return "redemption";
        case EventKind::Unknown:          break;
    }
    return "unknown";
}

EventKind event_kind_from_subscription(const std::string& type) {
    if (type == "channel.chat.message")                               return EventKind::Chat;
    if (type == "channel.cheer")                                      return EventKind::Cheer;
    if (type == "channel.subscribe")                                  return EventKind::Subscribe;
    if (type == "channel.subscription.gift")                          return EventKind::GiftSubscription;
    if (type == "channel.follow")                                     return EventKind::Follow;
    if (type == "channel.channel_points_custom_reward_redemption.add") return EventKind::Redemption;
    return EventKind::Unknown;
}

const char* outcome_name(RelayOutcome outcome) {
    switch (outcome) {
        case RelayOutcome::Relayed:             return "relayed";
        case RelayOutcome::Unauthenticated:     return "unauthenticated";
        case RelayOutcome::DuplicateEvent:      return "duplicate";
        case RelayOutcome::UnresolvedIdentity:  return "unresolved_identity";
        case RelayOutcome::TranslationNoop:     return "translation_noop";
        case RelayOutcome::ConsoleUnavailable:  return "console_unavailable";
        case RelayOutcome::ConsoleAuthRejected: return "console_auth_rejected";
        case RelayOutcome::QueueFull:           return "queue_full";
        case RelayOutcome::Filtered:            return "filtered";
        case RelayOutcome::Echo:                return "echo";
        case RelayOutcome::Malformed:           return "malformed";
        case RelayOutcome::DeliveryFailed:      return "delivery_failed";
    }
    return "unknown";
}

const char* console_state_name(ConsoleState state) {
    switch (state) {
        case ConsoleState::Disconnected:   return "disconnected";
        case ConsoleState::Connecting:     return "connecting";
        case ConsoleState::Authenticating: return "authenticating";
        case ConsoleState::Ready:          return "ready";
        case ConsoleState::AuthRejected:   return "auth_rejected";
    }
    return "unknown";
}

} // namespace rconbridge
