#include "wager/collaborators.hpp"

namespace wager {

NullIdentityRegistry& NullIdentityRegistry::instance() {
    static NullIdentityRegistry registry;
    return registry;
}

} // namespace wager
