#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ledger_service {

// Where the per-year ledger files live.
struct LedgerLocation {
    std::string base_path;
    std::string file_name = "experiment.ledger";

    [[nodiscard]] std::string PathFor(std::string_view year) const;
};

// "<base>/<year>/<file_name>". The year is used as given.
// TODO: reject years containing '/' or ".." once clients are known to send
// plain four-digit years only.
std::string ResolveLedgerPath(std::string_view base_path,
                              std::string_view year,
                              std::string_view file_name);

// Split text into lines on "\n" or "\r\n". A trailing line break does not
// produce an empty last entry; an empty input yields no lines.
std::vector<std::string> SplitLines(std::string_view text);

} // namespace ledger_service
