#pragma once

#include <ledger_service/core/result.hpp>

#include <string>
#include <string_view>

namespace ledger_service {

// ---------------------------------------------------------------------------
// Uri — the parts of "<scheme>://<authority><path>" this server cares about.
// Query and fragment are split off and kept only for completeness.
// ---------------------------------------------------------------------------
struct Uri {
    std::string scheme;
    std::string authority;
    std::string path;      // includes the leading '/', may be empty
    std::string query;
    std::string fragment;
};

// Split a URI. Fails (with a plain message) only when there is no
// "<scheme>:" prefix.
Result<Uri, std::string> ParseUri(std::string_view text);

} // namespace ledger_service
