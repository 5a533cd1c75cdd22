#include "session_multiplexer.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <glog/logging.h>

#include "common/errors.h"

namespace Prsync {

namespace {

constexpr char kMasterLogName[] = "master.log";

std::string TempRoot() {
	const char* tmpdir = std::getenv("TMPDIR");
	if (tmpdir && tmpdir[0]) return tmpdir;
	return "/tmp";
}

} // namespace

std::vector<std::string> TransportDescriptor::TransportArgs() const {
	if (IsNull()) return {};
	std::string option = "ControlPath=" + control_path_;
	// rsync splits -e on spaces but honors quotes
	if (option.find(' ') != std::string::npos) {
		option = "'" + option + "'";
	}
	return {"-e", ssh_binary_ + " -o " + option};
}

std::vector<std::string> TransportDescriptor::RemoteCommandPrefix() const {
	std::vector<std::string> prefix{ssh_binary_};
	if (!IsNull()) {
		prefix.push_back("-o");
		prefix.push_back("ControlPath=" + control_path_);
	}
	if (remote_) {
		if (remote_->user) {
			prefix.push_back("-l");
			prefix.push_back(*remote_->user);
		}
		prefix.push_back(remote_->host);
	}
	return prefix;
}

bool IsAuthenticationFailure(const std::string& ssh_output) {
	static const char* const kAuthMarkers[] = {
		"Permission denied",
		"Authentication failed",
		"Too many authentication failures",
		"No more authentication methods",
		"Host key verification failed",
	};
	for (const char* marker : kAuthMarkers) {
		if (ssh_output.find(marker) != std::string::npos) {
			return true;
		}
	}
	return false;
}

SessionMultiplexer::SessionMultiplexer(CommandRunner& runner, std::string ssh_binary)
	: runner_(runner) {
	descriptor_.ssh_binary_ = std::move(ssh_binary);
}

SessionMultiplexer::~SessionMultiplexer() {
	Close();
}

const TransportDescriptor& SessionMultiplexer::Open(const std::optional<RemoteTarget>& destination,
		const CancellationToken* cancel) {
	if (descriptor_.state_ != TransportDescriptor::State::kUnopened) {
		throw std::logic_error("shared session can only be opened once");
	}

	if (!destination) {
		VLOG(1) << "Local destination, no shared session needed";
		descriptor_.state_ = TransportDescriptor::State::kOpen;
		return descriptor_;
	}
	if (cancel && cancel->IsCancelled()) {
		throw ConnectError("run cancelled before the ssh session to " + destination->Login() +
				" was opened");
	}
	descriptor_.remote_ = destination;

	std::string dir_template = TempRoot() + "/prsync_ssh_XXXXXX";
	std::vector<char> dir_buf(dir_template.begin(), dir_template.end());
	dir_buf.push_back('\0');
	if (::mkdtemp(dir_buf.data()) == nullptr) {
		throw ConnectError("cannot create control socket directory under " + TempRoot() +
				": " + strerror(errno));
	}
	descriptor_.control_dir_ = dir_buf.data();
	descriptor_.control_path_ = descriptor_.control_dir_ + "/control_%h_%p_%r";

	LOG(INFO) << "Opening shared ssh session to " << destination->Login();
	RunOptions options;
	// The backgrounded master would keep a capture pipe open forever; its
	// diagnostics go to the -E log instead.
	options.capture_output = false;
	options.own_process_group = false;
	options.cancel = cancel;
	CommandResult result = runner_.Run(MasterCommand(), options);

	if (!result.Succeeded()) {
		std::string diagnostics = ReadMasterLog();
		RemoveControlDir();
		descriptor_.control_path_.clear();
		if (result.status == CommandResult::Status::kSpawnFailed) {
			throw ConnectError(result.error);
		}
		std::ostringstream msg;
		msg << "ssh to " << destination->Login() << " failed";
		if (result.status == CommandResult::Status::kExited) {
			msg << " with exit code " << result.exit_code;
		} else if (!result.error.empty()) {
			msg << ": " << result.error;
		}
		if (!diagnostics.empty()) {
			msg << ": " << diagnostics;
		}
		if (IsAuthenticationFailure(diagnostics)) {
			throw AuthError(msg.str());
		}
		throw ConnectError(msg.str());
	}

	descriptor_.state_ = TransportDescriptor::State::kOpen;
	LOG(INFO) << "Shared ssh session established (ControlPath=" << descriptor_.control_path_ << ")";
	return descriptor_;
}

void SessionMultiplexer::Close() {
	if (descriptor_.state_ != TransportDescriptor::State::kOpen) {
		return;
	}

	if (!descriptor_.IsNull()) {
		RunOptions options;
		options.own_process_group = false;
		options.on_line = [](const std::string& line) {
			VLOG(1) << "[ssh -O exit] " << line;
		};
		CommandResult result = runner_.Run(ExitCommand(), options);
		if (!result.Succeeded()) {
			LOG(WARNING) << "Failed to stop ssh control master"
			             << (result.error.empty() ? "" : ": " + result.error)
			             << " (exit code " << result.exit_code << ")";
		}
		RemoveControlDir();
		LOG(INFO) << "Shared ssh session closed";
	}

	descriptor_.state_ = TransportDescriptor::State::kClosed;
	close_count_++;
}

std::vector<std::string> SessionMultiplexer::MasterCommand() const {
	const RemoteTarget& remote = *descriptor_.remote_;
	std::vector<std::string> argv{descriptor_.ssh_binary_};
	if (remote.user) {
		argv.push_back("-l");
		argv.push_back(*remote.user);
	}
	argv.insert(argv.end(), {
			"-nNf",
			"-o", "ControlMaster=yes",
			"-o", "ControlPath=" + descriptor_.control_path_,
			"-o", "ControlPersist=yes",
			"-E", descriptor_.control_dir_ + "/" + kMasterLogName,
			remote.host});
	return argv;
}

std::vector<std::string> SessionMultiplexer::ExitCommand() const {
	const RemoteTarget& remote = *descriptor_.remote_;
	std::vector<std::string> argv{descriptor_.ssh_binary_};
	if (remote.user) {
		argv.push_back("-l");
		argv.push_back(*remote.user);
	}
	argv.insert(argv.end(), {
			"-O", "exit",
			"-o", "ControlPath=" + descriptor_.control_path_,
			remote.host});
	return argv;
}

std::string SessionMultiplexer::ReadMasterLog() const {
	std::ifstream log(descriptor_.control_dir_ + "/" + kMasterLogName);
	if (!log.is_open()) {
		return "";
	}
	std::stringstream content;
	content << log.rdbuf();
	std::string text = content.str();
	while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
		text.pop_back();
	}
	return text;
}

void SessionMultiplexer::RemoveControlDir() {
	if (descriptor_.control_dir_.empty()) return;
	std::error_code ec;
	std::filesystem::remove_all(descriptor_.control_dir_, ec);
	if (ec) {
		LOG(WARNING) << "Could not remove " << descriptor_.control_dir_ << ": " << ec.message();
	}
	descriptor_.control_dir_.clear();
}

} // namespace Prsync
