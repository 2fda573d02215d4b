#pragma once

#include "../shared/logger.hpp"
#include "../settlement/session_registry.hpp"
#include "../shared/pubkey.hpp"

#include <filesystem>
#include <string>

namespace wager::config {

struct WagerConfig {
	Pubkey tokenMint = Pubkey::FromSeed("wager-token-mint");
	Pubkey programId = Pubkey::FromSeed("wager-program");
	LogLevel logLevel = LogLevel::Info;
	std::string snapshotPath = "wager/sessions.json";
};

/*
=============
LoadWagerConfig

Reads a JSON configuration file into `config`. Fields that are missing or
malformed keep their current value and are reported as warnings. Returns
false only when the file cannot be opened or parsed.
=============
*/
bool LoadWagerConfig(const std::filesystem::path& path, WagerConfig& config);

bool SaveWagerConfig(const std::filesystem::path& path, const WagerConfig& config);

void ApplyLogLevel(const WagerConfig& config);

/*
=============
MakeSessionRegistry

Builds a registry for the configured program and mint. When the configured
snapshot file exists it is loaded; a snapshot that fails to load is
reported and the registry starts empty.
=============
*/
settlement::SessionRegistry MakeSessionRegistry(const WagerConfig& config);

} // namespace wager::config
