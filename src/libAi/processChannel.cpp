#include "hoshi/ai/processChannel.hpp"

#include "Logging.hpp"

#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <format>
#include <istream>
#include <system_error>
#include <thread>

namespace hoshi::ai {

//! Writes to an engine that died must fail with EPIPE instead of terminating the server.
static void ignoreBrokenPipe() {
	static std::once_flag flag;
	std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

static void closePipe(int (&fds)[2]) {
	for (auto& fd: fds) {
		if (fd >= 0) {
			::close(fd);
			fd = -1;
		}
	}
}

static std::string readLine(asio::streambuf& buffer) {
	std::istream stream(&buffer);
	std::string line;
	std::getline(stream, line);
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
	return line;
}

ProcessChannel::ProcessChannel(asio::io_context& ioContext, Command command)
    : m_command(std::move(command)), m_stdin(ioContext), m_stdout(ioContext), m_stderr(ioContext) {
}

ProcessChannel::~ProcessChannel() {
	close();
}

void ProcessChannel::open(Callbacks callbacks) {
	if (m_open) {
		return;
	}
	ignoreBrokenPipe();
	m_callbacks = std::move(callbacks);

	std::vector<char*> argv;
	argv.push_back(m_command.program.data());
	for (auto& argument: m_command.arguments) {
		argv.push_back(argument.data());
	}
	argv.push_back(nullptr);

	// Create pipes: stdin, stdout, stderr and one reporting a failed exec.
	int toChild[2]{-1, -1}, fromChild[2]{-1, -1}, errChild[2]{-1, -1}, execCheck[2]{-1, -1};
	if (::pipe2(toChild, O_CLOEXEC) < 0 || ::pipe2(fromChild, O_CLOEXEC) < 0 || ::pipe2(errChild, O_CLOEXEC) < 0 || ::pipe2(execCheck, O_CLOEXEC) < 0) {
		const auto error = errno;
		closePipe(toChild);
		closePipe(fromChild);
		closePipe(errChild);
		closePipe(execCheck);
		throw std::system_error(error, std::generic_category(), "Failed to create engine pipes");
	}

	const pid_t pid = ::fork();
	if (pid < 0) {
		const auto error = errno;
		closePipe(toChild);
		closePipe(fromChild);
		closePipe(errChild);
		closePipe(execCheck);
		throw std::system_error(error, std::generic_category(), "Failed to fork engine process");
	}

	if (pid == 0) {
		// Child process
		::dup2(toChild[0], STDIN_FILENO);
		::dup2(fromChild[1], STDOUT_FILENO);
		::dup2(errChild[1], STDERR_FILENO);
		::execvp(argv[0], argv.data());

		const int error = errno;
		[[maybe_unused]] const auto written = ::write(execCheck[1], &error, sizeof(error));
		::_exit(127);
	}

	// Parent process
	::close(toChild[0]);
	::close(fromChild[1]);
	::close(errChild[1]);
	::close(execCheck[1]);

	int childError = 0;
	ssize_t received;
	do {
		received = ::read(execCheck[0], &childError, sizeof(childError));
	} while (received < 0 && errno == EINTR);
	::close(execCheck[0]);

	if (received > 0) {
		::waitpid(pid, nullptr, 0);
		::close(toChild[1]);
		::close(fromChild[0]);
		::close(errChild[0]);
		throw std::system_error(childError, std::generic_category(), std::format("Failed to start engine '{}'", m_command.program));
	}

	m_stdin.assign(toChild[1]);
	m_stdout.assign(fromChild[0]);
	m_stderr.assign(errChild[0]);
	m_pid  = pid;
	m_open = true;

	Logger().Log(Logging::LogLevel::Info, std::format("[ProcessChannel] Started engine '{}' with pid {}.", m_command.program, pid));

	startRead();
	startReadErrors();
}

bool ProcessChannel::write(const std::string& line) {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (!m_open) {
		return false;
	}

	const auto data = line + '\n';
	asio::error_code ec;
	asio::write(m_stdin, asio::buffer(data), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[ProcessChannel] Write to engine {} failed: {}", m_pid.load(), ec.message()));
		return false;
	}
	return true;
}

void ProcessChannel::close() {
	if (m_open.exchange(false)) {
		std::lock_guard<std::mutex> lock(m_mutex);

		// Ask politely first. Closing stdin signals EOF to engines that ignore quit.
		asio::error_code ec;
		asio::write(m_stdin, asio::buffer(std::string_view{"quit\n"}), ec);
		m_stdin.close(ec);
	}
	reap();
}

bool ProcessChannel::isOpen() const {
	return m_open;
}

pid_t ProcessChannel::pid() const {
	return m_pid;
}

void ProcessChannel::startRead() {
	asio::async_read_until(m_stdout, m_outBuffer, '\n', [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
		if (ec) {
			self->onReadError(ec);
			return;
		}

		const auto line = readLine(self->m_outBuffer);
		if (self->m_open && self->m_callbacks.onLine) {
			self->m_callbacks.onLine(line);
		}
		self->startRead();
	});
}

void ProcessChannel::startReadErrors() {
	asio::async_read_until(m_stderr, m_errBuffer, '\n', [self = shared_from_this()](const asio::error_code& ec, std::size_t) {
		if (ec) {
			return;
		}

		Logger().Log(Logging::LogLevel::Debug, std::format("[ProcessChannel] Engine {}: {}", self->m_pid.load(), readLine(self->m_errBuffer)));
		self->startReadErrors();
	});
}

void ProcessChannel::onReadError(const asio::error_code& ec) {
	if (!m_open.exchange(false)) {
		return; // Closed on purpose.
	}

	Logger().Log(Logging::LogLevel::Warning, std::format("[ProcessChannel] Engine {} output closed: {}", m_pid.load(), ec.message()));
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		asio::error_code ignored;
		m_stdin.close(ignored);
	}
	reap();

	if (m_callbacks.onClosed) {
		m_callbacks.onClosed(std::format("engine process exited ({})", ec.message()));
	}
}

void ProcessChannel::reap() {
	const pid_t pid = m_pid.exchange(-1);
	if (pid <= 0) {
		return;
	}

	int status = 0;
	auto result = ::waitpid(pid, &status, WNOHANG);
	if (result == 0) {
		// Child still running, give it 100ms then SIGKILL
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
		result = ::waitpid(pid, &status, WNOHANG);
		if (result == 0) {
			::kill(pid, SIGKILL);
			::waitpid(pid, &status, 0);
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[ProcessChannel] Engine {} stopped.", pid));
}

} // namespace hoshi::ai
