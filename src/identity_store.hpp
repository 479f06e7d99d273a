#pragma once
#include "model.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rconbridge {

// Directional user mapping between platforms. The relay only reads it;
// links are created by an external linking flow.
class IdentityLinkStore {
public:
    virtual ~IdentityLinkStore() = default;

    virtual std::string backend_name() const = 0;

    // Row keyed by (source_platform, source_user_id), if any.
    virtual std::optional<IdentityLink> forward(const std::string& source_platform,
                                                const std::string& source_user_id) = 0;

    // All rows pointing at (target_platform, target_user_id). May be several.
    virtual std::vector<IdentityLink> reverse(const std::string& target_platform,
                                              const std::string& target_user_id) = 0;

    // Resolve (platform, user_id) to its counterpart on target_platform.
    // The forward row wins when it points at target_platform. Otherwise the
    // reverse rows whose source is target_platform are consulted, and only a
    // single match resolves; zero or several mean "no unique mapping".
    std::optional<Identity> resolve(const std::string& platform,
                                    const std::string& user_id,
                                    const std::string& target_platform);
};

} // namespace rconbridge
