#pragma once

#include <stdexcept>
#include <string>

namespace coordguard {

class CoordGuardException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidConfigException : public CoordGuardException {
public:
    explicit InvalidConfigException(const std::string& setting, const std::string& reason)
        : CoordGuardException("Invalid configuration '" + setting + "': " + reason)
        , setting_(setting) {}

    const std::string& setting() const noexcept { return setting_; }

private:
    std::string setting_;
};

} // namespace coordguard
