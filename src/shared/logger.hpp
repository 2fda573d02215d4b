#pragma once

#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace wager {
	enum class LogLevel {
	Trace = 0,
	Debug,
	Info,
	Warn,
	Error
	};

	using LogSink = std::function<void(std::string_view)>;

	/*
	=============
	ParseLogLevel

	Parse the provided environment or config value into a LogLevel.
	=============
	*/
	LogLevel ParseLogLevel(std::string_view value);

	/*
	=============
	ReadLogLevelFromEnv

	Retrieve the log level from WAGER_LOG_LEVEL or return the default.
	=============
	*/
	LogLevel ReadLogLevelFromEnv();

	/*
	=============
	FormatMessage

	Build a structured log message for output.
	=============
	*/
	std::string FormatMessage(LogLevel level, std::string_view module_name, std::string_view message);

	/*
	=============
	InitLogger

	Initialize the logger with module metadata and output sinks.
	=============
	*/
	void InitLogger(std::string_view module_name, LogSink print_sink, LogSink error_sink);

	void SetLogLevel(LogLevel level);
	LogLevel GetLogLevel();

	/*
	=============
	IsLogLevelEnabled

	Return whether the provided log level should emit output.
	=============
	*/
	bool IsLogLevelEnabled(LogLevel level);

	/*
	=============
	Log

	Log a pre-formatted message if the level is enabled. Error messages are
	mirrored to the error sink.
	=============
	*/
	void Log(LogLevel level, std::string_view message);

	/*
	=============
	Logf

	Format a message and log it if the level is enabled.
	=============
	*/
	template<typename... Args>
	inline void Logf(LogLevel level, std::format_string<Args...> format_str, Args &&... args)
	{
		if (!IsLogLevelEnabled(level))
			return;

		Log(level, std::format(format_str, std::forward<Args>(args)...));
	}

	const char* LogLevelLabel(LogLevel level);

} // namespace wager
