#include "identity_store.hpp"
#include "log.hpp"

namespace rconbridge {

std::optional<Identity> IdentityLinkStore::resolve(const std::string& platform,
                                                   const std::string& user_id,
                                                   const std::string& target_platform) {
    if (user_id.empty()) return std::nullopt;

    auto fwd = forward(platform, user_id);
    if (fwd && fwd->target_platform == target_platform) {
        return Identity{fwd->target_platform, fwd->target_user_id};
    }

    std::vector<IdentityLink> candidates;
    for (auto& link : reverse(platform, user_id)) {
        if (link.source_platform == target_platform) candidates.push_back(std::move(link));
    }

    if (candidates.size() == 1) {
        return Identity{candidates[0].source_platform, candidates[0].source_user_id};
    }
    if (candidates.size() > 1) {
        log_info("identity", platform + ":" + user_id + " is linked from " +
                             std::to_string(candidates.size()) + " " + target_platform +
                             " users, refusing to pick one");
    }
    return std::nullopt;
}

} // namespace rconbridge
