// =============================================================================
// access.cpp - AccessControl
// =============================================================================

#include "gasopt/access.hpp"
#include "gasopt/log.hpp"

namespace gasopt {

AccessControl::AccessControl(const Address& owner, const Address& keeper)
    : keeper_(keeper) {
    if (!is_zero(owner)) {
        admins_.insert(owner);
    }
}

bool AccessControl::is_admin(const Address& addr) const {
    std::shared_lock lock(mutex_);
    return admins_.find(addr) != admins_.end();
}

bool AccessControl::is_keeper(const Address& addr) const {
    std::shared_lock lock(mutex_);
    return !is_zero(addr) && addr == keeper_;
}

Address AccessControl::keeper() const {
    std::shared_lock lock(mutex_);
    return keeper_;
}

std::vector<Address> AccessControl::admins() const {
    std::shared_lock lock(mutex_);
    return std::vector<Address>(admins_.begin(), admins_.end());
}

int32_t AccessControl::add_admin(const Address& caller, const Address& admin) {
    std::unique_lock lock(mutex_);

    if (admins_.find(caller) == admins_.end()) {
        return errors::UNAUTHORIZED;
    }
    if (is_zero(admin)) {
        return errors::INVALID_USER;
    }

    admins_.insert(admin);
    log::get()->info("admin added: {}", address_to_hex(admin));
    return errors::OK;
}

int32_t AccessControl::remove_admin(const Address& caller, const Address& admin) {
    std::unique_lock lock(mutex_);

    if (admins_.find(caller) == admins_.end()) {
        return errors::UNAUTHORIZED;
    }
    if (admins_.find(admin) == admins_.end()) {
        return errors::INVALID_PARAMETER;
    }
    // Never leave the system without an administrator
    if (admins_.size() == 1) {
        return errors::INVALID_PARAMETER;
    }

    admins_.erase(admin);
    log::get()->info("admin removed: {}", address_to_hex(admin));
    return errors::OK;
}

int32_t AccessControl::rotate_keeper(const Address& caller, const Address& new_keeper) {
    std::unique_lock lock(mutex_);

    if (admins_.find(caller) == admins_.end()) {
        return errors::UNAUTHORIZED;
    }
    if (is_zero(new_keeper)) {
        return errors::INVALID_USER;
    }

    log::get()->info("keeper rotated: {} -> {}",
                     address_to_hex(keeper_), address_to_hex(new_keeper));
    keeper_ = new_keeper;
    return errors::OK;
}

} // namespace gasopt
