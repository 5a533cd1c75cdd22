#include "remote_target.h"

#include <regex>

namespace Prsync {

std::optional<RemoteTarget> RemoteTarget::Parse(const std::string& target) {
	// user part may not contain '@', host part may not contain ':', path is non-empty
	static const std::regex kPattern("^(?:([^@]+)@)?([^:/]+):(.+)$");
	std::smatch match;
	if (!std::regex_match(target, match, kPattern)) {
		return std::nullopt;
	}
	RemoteTarget remote;
	if (match[1].matched) {
		remote.user = match[1].str();
	}
	remote.host = match[2].str();
	remote.path = match[3].str();
	return remote;
}

std::string RemoteTarget::Login() const {
	if (user) {
		return *user + "@" + host;
	}
	return host;
}

std::string RemoteTarget::str() const {
	return Login() + ":" + path;
}

} // namespace Prsync
