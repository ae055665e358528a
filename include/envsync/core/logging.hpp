#pragma once

namespace envsync {

/**
 * @brief Configure the default spdlog logger for a sync run
 *
 * verbose == true enables debug output (per-item outcomes, git invocations).
 */
void configure_logging(bool verbose);

} // namespace envsync
