#pragma once

namespace ledger_service {

/// True if stderr is a terminal. Log colouring keys off this, since stdout
/// is the protocol channel and never a terminal in normal operation.
bool IsStderrTty();

/// True if the NO_COLOR environment variable is set (https://no-color.org/).
bool NoColorEnvSet();

/// Colour decision for log output: explicit flags win, then NO_COLOR, then
/// whether stderr is a terminal.
bool ResolveLogColor(bool force_color, bool force_no_color);

} // namespace ledger_service
