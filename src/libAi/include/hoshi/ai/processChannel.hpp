#pragma once

#include "hoshi/ai/engineChannel.hpp"

#include <asio.hpp>

#include <sys/types.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hoshi::ai {

//! Engine running as a child process. Talks to it through its stdin and stdout.
//! \note Must be owned by a std::shared_ptr. Pending reads keep the channel alive until the process is gone.
class ProcessChannel final : public IEngineChannel, public std::enable_shared_from_this<ProcessChannel> {
public:
	struct Command {
		std::string program;                //!< Looked up in PATH if not a path.
		std::vector<std::string> arguments; //!< Arguments after the program name.
	};

	ProcessChannel(asio::io_context& ioContext, Command command);
	~ProcessChannel() override;

	void open(Callbacks callbacks) override;
	bool write(const std::string& line) override;
	void close() override;
	bool isOpen() const override;

	pid_t pid() const; //!< Child process id. -1 when not running.

private:
	void startRead();       //!< Read stdout line by line.
	void startReadErrors(); //!< Drain stderr into the log.
	void onReadError(const asio::error_code& ec);
	void reap(); //!< Wait for the child, kill it if it does not exit on its own.

private:
	Command m_command;
	Callbacks m_callbacks;

	asio::posix::stream_descriptor m_stdin;
	asio::posix::stream_descriptor m_stdout;
	asio::posix::stream_descriptor m_stderr;
	asio::streambuf m_outBuffer;
	asio::streambuf m_errBuffer;

	std::atomic<pid_t> m_pid{-1};
	std::atomic<bool> m_open{false};
	std::mutex m_mutex; //!< Serializes writes and closing stdin.
};

} // namespace hoshi::ai
