#pragma once

#include <optional>

namespace roadnet {

/// Returns true if stderr is a terminal (colored log output).
bool IsStderrTty();

/// Returns true if stdout is a terminal (colored summary tables).
bool IsStdoutTty();

/// Returns true if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Resolve the effective color mode: an explicit choice wins, then NO_COLOR,
/// then whether the stream is a terminal.
bool ResolveColor(std::optional<bool> explicit_choice, bool stream_is_tty);

} // namespace roadnet
