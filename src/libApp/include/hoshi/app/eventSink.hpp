#pragma once

#include "hoshi/app/events.hpp"
#include "hoshi/app/types.hpp"

namespace hoshi::app {

//! Receiver of session events. Implemented by the transport.
//! \note Called while the emitting session is locked. Implementations must not call back into the session.
class IEventSink {
public:
	virtual ~IEventSink() = default;

	virtual void broadcast(SessionId sessionId, const ServerEvent& event) = 0;                      //!< To players and spectators of the session.
	virtual void sendTo(SessionId sessionId, const PlayerId& playerId, const ServerEvent& event) = 0; //!< To a single participant.
};

} // namespace hoshi::app
