// Blocking child-process runner used by LedgerCli. POSIX only.

#pragma once

#include <ledger_service/core/result.hpp>

#include <string>
#include <vector>

namespace ledger_service {
namespace process {

struct ProcessOutput {
    int exit_code = -1;      // -1 when the child was killed by a signal
    std::string out;
    std::string err;
};

// Run argv[0] (looked up on PATH) with the given arguments, wait for it to
// exit and collect everything it wrote to stdout and stderr. Fails only when
// the process cannot be started or waited on; a non-zero exit status is
// reported through ProcessOutput::exit_code.
Result<ProcessOutput, Error> Run(const std::vector<std::string>& argv);

} // namespace process
} // namespace ledger_service
