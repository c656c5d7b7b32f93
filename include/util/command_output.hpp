#pragma once

#include "util/logger.hpp"

namespace stash {

enum class CommandOutput {
    Normal,
    Verbose,
    Quiet,
};

// Quiet takes precedence over verbose.
constexpr CommandOutput CommandOutputFromFlags(bool quiet, bool verbose) {
    if (quiet) return CommandOutput::Quiet;
    if (verbose) return CommandOutput::Verbose;
    return CommandOutput::Normal;
}

constexpr LogLevel LogLevelFor(CommandOutput output) {
    switch (output) {
        case CommandOutput::Quiet:   return LogLevel::Error;
        case CommandOutput::Verbose: return LogLevel::Debug;
        case CommandOutput::Normal:  return LogLevel::Info;
    }
    return LogLevel::Info;
}

} // namespace stash
