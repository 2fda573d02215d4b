/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

test_logger_thread_safety.cpp implementation.*/

#include "shared/logger.hpp"

#include <cassert>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {
	std::mutex g_sinkMutex;
	std::vector<std::string> g_printMessages;
	std::vector<std::string> g_errorMessages;

/*
=============
CollectPrint

Store a print sink message for verification.
=============
*/
	void CollectPrint(std::string_view message)
{
		std::scoped_lock lock(g_sinkMutex);
		g_printMessages.emplace_back(message);
	}

	void CollectError(std::string_view message)
{
		std::scoped_lock lock(g_sinkMutex);
		g_errorMessages.emplace_back(message);
	}

/*
=============
ToggleLevels

Repeatedly adjust the log level to exercise atomic coordination.
=============
*/
	void ToggleLevels()
{
		for (int i = 0; i < 200; ++i) {
			wager::SetLogLevel((i % 2) == 0 ? wager::LogLevel::Info : wager::LogLevel::Trace);
		}
	}

	void LogMessages()
{
		for (int i = 0; i < 200; ++i) {
			wager::Log(wager::LogLevel::Info, "concurrent-info");
			wager::Logf(wager::LogLevel::Error, "concurrent-error {}", i);
		}
	}
} // namespace

/*
=============
main

Verify concurrent logging preserves configuration integrity and that level
parsing accepts the documented spellings.
=============
*/
int main()
{
	assert(wager::ParseLogLevel("TRACE") == wager::LogLevel::Trace);
	assert(wager::ParseLogLevel("debug") == wager::LogLevel::Debug);
	assert(wager::ParseLogLevel("Warning") == wager::LogLevel::Warn);
	assert(wager::ParseLogLevel("error") == wager::LogLevel::Error);
	assert(wager::ParseLogLevel("nonsense") == wager::LogLevel::Info);

	wager::InitLogger("threaded", &CollectPrint, &CollectError);

	std::thread levelThread(&ToggleLevels);
	std::thread logThreadA(&LogMessages);
	std::thread logThreadB(&LogMessages);

	levelThread.join();
	logThreadA.join();
	logThreadB.join();

	{
		std::scoped_lock lock(g_sinkMutex);
		assert(!g_printMessages.empty());
		assert(g_errorMessages.size() == 400);

		const std::string prefix = "[WAGER][threaded]";
		for (const std::string& message : g_printMessages) {
			assert(message.rfind(prefix, 0) == 0);
			assert(message.back() == '\n');
		}
		for (const std::string& message : g_errorMessages) {
			assert(message.rfind(prefix, 0) == 0);
			assert(message.find("[ERROR]") != std::string::npos);
		}
	}

	// Below-threshold messages are dropped.
	wager::SetLogLevel(wager::LogLevel::Error);
	assert(wager::GetLogLevel() == wager::LogLevel::Error);
	const size_t before = g_printMessages.size();
	wager::Log(wager::LogLevel::Warn, "suppressed");
	assert(g_printMessages.size() == before);

	return 0;
}
