#pragma once

// Logging goes through spdlog. The library never installs sinks nor changes levels:
// the host application owns the spdlog configuration.
// Ensure header-only usage is forced locally without exporting SPDLOG_HEADER_ONLY
// as a public compile definition.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace triemux {

namespace log = spdlog;

}  // namespace triemux
