#pragma once
#include <memory>
#include <spdlog/spdlog.h>

namespace eph_log
{
// Creates the "eph" console logger once; later calls only change the level.
void init(spdlog::level::level_enum level = spdlog::level::info);
std::shared_ptr<spdlog::logger> get();
} // namespace eph_log
