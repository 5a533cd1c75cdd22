#ifndef PRSYNC_SRC_COMMON_ERRORS_H_
#define PRSYNC_SRC_COMMON_ERRORS_H_

#include <stdexcept>
#include <string>

namespace Prsync {

// Fatal errors. Raised before any bucket is dispatched and surfaced to the caller as-is.

// Invalid jobs / bucket size / source directory / bucket selection.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// The remote refused our credentials while opening the shared session.
class AuthError : public std::runtime_error {
public:
    explicit AuthError(const std::string& what) : std::runtime_error(what) {}
};

// The shared session could not be established for any other reason.
class ConnectError : public std::runtime_error {
public:
    explicit ConnectError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace Prsync

#endif // PRSYNC_SRC_COMMON_ERRORS_H_
