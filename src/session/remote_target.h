#ifndef PRSYNC_REMOTE_TARGET_H_
#define PRSYNC_REMOTE_TARGET_H_

#include <optional>
#include <string>

namespace Prsync {

/**
 * Destination of the form [user@]host:path.
 */
struct RemoteTarget {
	std::optional<std::string> user;
	std::string host;
	std::string path;

	/**
	 * Parses a destination string.
	 * @return The remote target, or std::nullopt when the destination is a local path
	 */
	static std::optional<RemoteTarget> Parse(const std::string& target);

	// user@host or host, as ssh takes it
	std::string Login() const;

	// Rebuilds [user@]host:path
	std::string str() const;
};

} // namespace Prsync

#endif // PRSYNC_REMOTE_TARGET_H_
