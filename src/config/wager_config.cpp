/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

wager_config.cpp implementation.*/

#include "wager_config.hpp"

#include <fstream>
#include <memory>
#include <optional>
#include <system_error>

#include <json/json.h>

namespace wager::config {
namespace {

std::optional<Pubkey> ReadKey(const Json::Value& root, const char* key, const std::filesystem::path& path) {
	if (!root.isMember(key))
		return std::nullopt;

	const Json::Value& value = root[key];
	if (value.isString()) {
		if (const auto parsed = Pubkey::FromHex(value.asString()))
			return parsed;
	}

	Logf(LogLevel::Warn, "{}: \"{}\" must be a 64 digit hex key, keeping default", path.string(), key);
	return std::nullopt;
}

} // namespace

bool LoadWagerConfig(const std::filesystem::path& path, WagerConfig& config) {
	std::ifstream in(path);
	if (!in.is_open()) {
		Logf(LogLevel::Warn, "failed to open config {}", path.string());
		return false;
	}

	Json::Value root;
	Json::CharReaderBuilder builder;
	std::string errs;
	if (!Json::parseFromStream(builder, in, &root, &errs) || !root.isObject()) {
		Logf(LogLevel::Warn, "parse error in {}: {}", path.string(), errs);
		return false;
	}

	if (const auto mint = ReadKey(root, "tokenMint", path))
		config.tokenMint = *mint;
	if (const auto program = ReadKey(root, "programId", path))
		config.programId = *program;

	if (root.isMember("logLevel")) {
		if (root["logLevel"].isString())
			config.logLevel = ParseLogLevel(root["logLevel"].asString());
		else
			Logf(LogLevel::Warn, "{}: \"logLevel\" must be a string", path.string());
	}

	if (root.isMember("snapshotPath")) {
		if (root["snapshotPath"].isString() && !root["snapshotPath"].asString().empty())
			config.snapshotPath = root["snapshotPath"].asString();
		else
			Logf(LogLevel::Warn, "{}: \"snapshotPath\" must be a non-empty string", path.string());
	}

	return true;
}

bool SaveWagerConfig(const std::filesystem::path& path, const WagerConfig& config) {
	Json::Value root(Json::objectValue);
	root["tokenMint"] = config.tokenMint.ToHex();
	root["programId"] = config.programId.ToHex();
	root["logLevel"] = LogLevelLabel(config.logLevel);
	root["snapshotPath"] = config.snapshotPath;

	std::error_code ec;
	if (path.has_parent_path())
		std::filesystem::create_directories(path.parent_path(), ec);
	if (ec) {
		Logf(LogLevel::Warn, "failed to create config directory {}: {}", path.parent_path().string(), ec.message());
		return false;
	}

	std::ofstream out(path);
	if (!out.is_open()) {
		Logf(LogLevel::Warn, "failed to write config {}", path.string());
		return false;
	}

	Json::StreamWriterBuilder builder;
	builder["indentation"] = "    ";
	std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
	writer->write(root, &out);
	return static_cast<bool>(out);
}

void ApplyLogLevel(const WagerConfig& config) {
	SetLogLevel(config.logLevel);
}

settlement::SessionRegistry MakeSessionRegistry(const WagerConfig& config) {
	settlement::SessionRegistry registry(config.programId, config.tokenMint);

	std::error_code ec;
	const std::filesystem::path snapshot(config.snapshotPath);
	if (!std::filesystem::exists(snapshot, ec)) {
		Logf(LogLevel::Info, "no snapshot at {}, starting with an empty registry", snapshot.string());
		return registry;
	}

	if (!registry.LoadSnapshot(snapshot))
		Logf(LogLevel::Warn, "could not restore {}, starting with an empty registry", snapshot.string());
	return registry;
}

} // namespace wager::config
