#pragma once

#include <filesystem>
#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace timekeep {

std::filesystem::path dataDirPath();
std::filesystem::path dataFilePath();
std::filesystem::path configFilePath();

QString daemonSocketPath();
bool isDaemonRunning();

// Sends one request to the running daemon and returns the parsed response
// object, or nullopt when the daemon is unreachable or answered garbage.
std::optional<nlohmann::json> sendDaemonRequest(const std::string &method,
                                                const nlohmann::json &params,
                                                int timeoutMs = 2000);

} // namespace timekeep
