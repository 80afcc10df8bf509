#include "hoshi/ai/engineSettings.hpp"
#include "hoshi/ai/gtpEngine.hpp"
#include "hoshi/ai/processChannel.hpp"

#include <gtest/gtest.h>

#include <asio.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace hoshi::gtest {

using namespace std::chrono_literals;
using ai::GtpEngine;

namespace {

//! IO context running on its own thread for the lifetime of the object.
struct IoThread {
	IoThread() : work(asio::make_work_guard(io)), thread([this] { io.run(); }) {
	}
	~IoThread() {
		work.reset();
		io.stop();
		thread.join();
	}

	asio::io_context io;
	asio::executor_work_guard<asio::io_context::executor_type> work;
	std::thread thread;
};

std::shared_ptr<GtpEngine> fakeEngine(asio::io_context& io) {
	return std::make_shared<GtpEngine>(io, [&io]() -> std::shared_ptr<ai::IEngineChannel> {
		return std::make_shared<ai::ProcessChannel>(io, ai::ProcessChannel::Command{.program = FAKE_GTP_ENGINE_PATH, .arguments = {}});
	});
}

} // namespace

TEST(ProcessChannel, Genmove) {
	IoThread ioThread;
	auto engine = fakeEngine(ioThread.io);
	ASSERT_TRUE(engine->start());
	EXPECT_TRUE(engine->isRunning());

	std::promise<GtpEngine::MoveReply> promise;
	auto future = promise.get_future();
	engine->genmove(Player::Black, [&promise](const GtpEngine::MoveReply& reply) { promise.set_value(reply); });

	ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
	const auto reply = future.get();
	ASSERT_TRUE(reply.move.has_value());
	EXPECT_EQ(reply.move->kind, ai::EngineMove::Kind::Place);
	EXPECT_EQ(reply.move->coord, (Coord{3u, 15u}));

	engine->shutdown();
	EXPECT_FALSE(engine->isRunning());
}

TEST(ProcessChannel, EngineExitIsReported) {
	IoThread ioThread;
	auto engine = fakeEngine(ioThread.io);
	ASSERT_TRUE(engine->start());

	std::promise<GtpEngine::Reply> promise;
	auto future = promise.get_future();
	engine->command("crash", {}, [&promise](const GtpEngine::Reply& reply) { promise.set_value(reply); });

	ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
	EXPECT_EQ(future.get().failure, GtpEngine::Failure::ChannelLost);
	EXPECT_FALSE(engine->isRunning());

	engine->shutdown();
}

TEST(ProcessChannel, MissingProgram) {
	IoThread ioThread;
	auto channel = std::make_shared<ai::ProcessChannel>(ioThread.io, ai::ProcessChannel::Command{.program = "/nonexistent/hoshi-engine", .arguments = {}});
	EXPECT_THROW(channel->open({}), std::system_error);
	EXPECT_FALSE(channel->isOpen());

	EXPECT_THROW(ai::launchEngine(ioThread.io, ai::EngineSettings{.program = "/nonexistent/hoshi-engine"}, ai::AiLevel::Easy, 9u), std::runtime_error);
}

} // namespace hoshi::gtest
