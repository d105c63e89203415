#ifndef GASOPT_ACCESS_HPP
#define GASOPT_ACCESS_HPP

#include <shared_mutex>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace gasopt {

// =============================================================================
// AccessControl - Administrator set and the single keeper identity
// =============================================================================

// Every mutating call in the core passes its caller explicitly and is checked
// here. Rotation and admin changes take effect for the next call.
class AccessControl {
public:
    AccessControl(const Address& owner, const Address& keeper);
    ~AccessControl() = default;

    // Non-copyable
    AccessControl(const AccessControl&) = delete;
    AccessControl& operator=(const AccessControl&) = delete;

    bool is_admin(const Address& addr) const;
    bool is_keeper(const Address& addr) const;
    Address keeper() const;
    std::vector<Address> admins() const;

    int32_t add_admin(const Address& caller, const Address& admin);
    int32_t remove_admin(const Address& caller, const Address& admin);
    int32_t rotate_keeper(const Address& caller, const Address& new_keeper);

private:
    std::unordered_set<Address, AddressHash> admins_;
    Address keeper_;
    mutable std::shared_mutex mutex_;
};

} // namespace gasopt

#endif // GASOPT_ACCESS_HPP
