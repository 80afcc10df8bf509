#pragma once

#include <functional>
#include <string>

namespace hoshi::ai {

//! Line based duplex connection to an engine.
class IEngineChannel {
public:
	struct Callbacks {
		std::function<void(const std::string& line)> onLine;     //!< One line of engine output, without the line break.
		std::function<void(const std::string& reason)> onClosed; //!< The engine went away unexpectedly.
	};

	virtual ~IEngineChannel() = default;

	//! Start the engine and begin delivering lines.
	//! \throws std::system_error if the engine cannot be started.
	virtual void open(Callbacks callbacks) = 0;

	virtual bool write(const std::string& line) = 0; //!< Send one line. A line break is appended.
	virtual void close()                        = 0; //!< Stop the engine. No callbacks follow.
	virtual bool isOpen() const                 = 0;
};

} // namespace hoshi::ai
