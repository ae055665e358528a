#include "envsync/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace envsync {

void configure_logging(bool verbose) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

} // namespace envsync
