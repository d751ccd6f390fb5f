#pragma once

#include <spdlog/spdlog.h>

// Installs the process-wide logger (stderr, colour, timestamped) at `level`.
void SetupLogging(spdlog::level::level_enum level);

// "trace".."critical"/"off"; unknown strings map to info.
spdlog::level::level_enum ParseLogLevel(const std::string& s);
