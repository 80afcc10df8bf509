#pragma once

#include "hoshi/ai/engineChannel.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hoshi::gtest {

//! In-process engine channel. Answers every written command synchronously through the responder.
class MockEngineChannel : public ai::IEngineChannel {
public:
	//! Returns the output lines for a command. Gets the command id and the command without id.
	using Responder = std::function<std::vector<std::string>(const std::string& id, const std::string& command)>;

	explicit MockEngineChannel(Responder responder) : m_responder(std::move(responder)) {
	}

	//! Successful response to a command.
	static std::vector<std::string> success(const std::string& id, const std::string& text = {}) {
		return {text.empty() ? "=" + id : "=" + id + " " + text, ""};
	}
	//! Error response to a command.
	static std::vector<std::string> failure(const std::string& id, const std::string& text) {
		return {"?" + id + " " + text, ""};
	}

	void open(Callbacks callbacks) override {
		m_callbacks = std::move(callbacks);
		m_open      = true;
	}

	bool write(const std::string& line) override {
		if (!m_open) {
			return false;
		}
		m_written.push_back(line);

		const auto space   = line.find(' ');
		const auto id      = line.substr(0, space);
		const auto command = space == std::string::npos ? std::string{} : line.substr(space + 1);

		if (crashOn && command.starts_with(*crashOn)) {
			crash("engine crashed");
			return true;
		}
		if (!m_responder) {
			return true;
		}
		for (const auto& output: m_responder(id, command)) {
			if (!m_open) {
				break;
			}
			m_callbacks.onLine(output);
		}
		return true;
	}

	void close() override {
		m_open = false;
	}

	bool isOpen() const override {
		return m_open;
	}

	//! Simulate the engine process dying.
	void crash(const std::string& reason) {
		m_open = false;
		if (m_callbacks.onClosed) {
			m_callbacks.onClosed(reason);
		}
	}

	//! Output lines the responder held back, for replies that arrive late.
	void deliver(const std::vector<std::string>& lines) {
		for (const auto& line: lines) {
			if (!m_open) {
				break;
			}
			m_callbacks.onLine(line);
		}
	}

	const std::vector<std::string>& written() const {
		return m_written;
	}

	std::optional<std::string> crashOn; //!< Commands starting with this kill the engine.

private:
	Responder m_responder;
	Callbacks m_callbacks;
	std::vector<std::string> m_written;
	bool m_open{false};
};

//! Answers every command with success and genmove with the scripted moves in order. "pass" once the script is used up.
inline MockEngineChannel::Responder scriptedEngine(std::shared_ptr<std::vector<std::string>> moves) {
	return [moves](const std::string& id, const std::string& command) {
		if (command.starts_with("genmove")) {
			if (moves->empty()) {
				return MockEngineChannel::success(id, "pass");
			}
			const auto move = moves->front();
			moves->erase(moves->begin());
			return MockEngineChannel::success(id, move);
		}
		return MockEngineChannel::success(id);
	};
}

} // namespace hoshi::gtest
