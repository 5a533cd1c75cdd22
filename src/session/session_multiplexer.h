#ifndef PRSYNC_SESSION_MULTIPLEXER_H_
#define PRSYNC_SESSION_MULTIPLEXER_H_

#include <optional>
#include <string>
#include <vector>

#include "remote_target.h"
#include "transfer/command_runner.h"

namespace Prsync {

/**
 * Handle to the shared ssh control channel. Workers only read it.
 * A null descriptor (local destination) carries no control path and adds no
 * transport option to the transfer command.
 */
class TransportDescriptor {
	public:
		enum class State { kUnopened, kOpen, kClosed };

		TransportDescriptor() = default;

		bool IsNull() const { return control_path_.empty(); }
		State state() const { return state_; }
		const std::string& control_path() const { return control_path_; }
		const std::optional<RemoteTarget>& remote() const { return remote_; }

		/**
		 * Arguments that make a transfer command reuse the channel:
		 * {"-e", "<ssh> -o ControlPath=<path>"}, or nothing for a null descriptor.
		 */
		std::vector<std::string> TransportArgs() const;

		/**
		 * Prefix for running a command on the remote host over the channel:
		 * {<ssh>, "-o", "ControlPath=<path>", [-l user], host}.
		 */
		std::vector<std::string> RemoteCommandPrefix() const;

	private:
		friend class SessionMultiplexer;

		State state_ = State::kUnopened;
		std::string ssh_binary_;
		std::string control_dir_;
		std::string control_path_;
		std::optional<RemoteTarget> remote_;
};

/**
 * Owns the single authenticated ssh ControlMaster shared by all transfer workers.
 *
 * Open() blocks until the master is authenticated; Close() tears it down and is
 * idempotent. Destroying an open multiplexer closes it.
 */
class SessionMultiplexer {
	public:
		SessionMultiplexer(CommandRunner& runner, std::string ssh_binary = "ssh");
		~SessionMultiplexer();

		SessionMultiplexer(const SessionMultiplexer&) = delete;
		SessionMultiplexer& operator=(const SessionMultiplexer&) = delete;

		/**
		 * Establishes the control channel for a remote destination.
		 * For a local destination (std::nullopt) nothing is spawned and the returned
		 * descriptor is null but still Open. A multiplexer opens at most once.
		 * The master runs in our process group so it can prompt on the terminal.
		 * @param cancel Stops a master still waiting for authentication; an already
		 *     cancelled token makes Open refuse to start one.
		 * @throws AuthError if the remote rejected authentication
		 * @throws ConnectError if the channel could not be established otherwise
		 */
		const TransportDescriptor& Open(const std::optional<RemoteTarget>& destination,
				const CancellationToken* cancel = nullptr);

		/**
		 * Stops the control master and removes its socket directory.
		 * Safe to call more than once and on a never-opened multiplexer.
		 */
		void Close();

		const TransportDescriptor& descriptor() const { return descriptor_; }

		// Number of Open -> Closed transitions; never more than 1
		int GetCloseCount() const { return close_count_; }

	private:
		std::vector<std::string> MasterCommand() const;
		std::vector<std::string> ExitCommand() const;
		std::string ReadMasterLog() const;
		void RemoveControlDir();

		CommandRunner& runner_;
		TransportDescriptor descriptor_;
		int close_count_ = 0;
};

/**
 * Scoped acquisition of the shared session: opens in the constructor, closes in the
 * destructor, so every exit path of a run (success, failure, cancellation, exception)
 * releases the channel exactly once.
 */
class SessionGuard {
	public:
		SessionGuard(SessionMultiplexer& multiplexer, const std::optional<RemoteTarget>& destination,
				const CancellationToken* cancel = nullptr)
			: multiplexer_(multiplexer), descriptor_(multiplexer.Open(destination, cancel)) {}

		~SessionGuard() { multiplexer_.Close(); }

		SessionGuard(const SessionGuard&) = delete;
		SessionGuard& operator=(const SessionGuard&) = delete;

		const TransportDescriptor& descriptor() const { return descriptor_; }

	private:
		SessionMultiplexer& multiplexer_;
		const TransportDescriptor& descriptor_;
};

/**
 * True if an ssh diagnostic means the remote rejected our credentials rather than
 * the connection failing.
 */
bool IsAuthenticationFailure(const std::string& ssh_output);

} // namespace Prsync

#endif // PRSYNC_SESSION_MULTIPLEXER_H_
