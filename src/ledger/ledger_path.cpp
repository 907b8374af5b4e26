#include <ledger_service/ledger/ledger_path.hpp>

namespace ledger_service {

std::string ResolveLedgerPath(std::string_view base_path,
                              std::string_view year,
                              std::string_view file_name) {
    std::string path(base_path);
    path += '/';
    path += year;
    path += '/';
    path += file_name;
    return path;
}

std::string LedgerLocation::PathFor(std::string_view year) const {
    return ResolveLedgerPath(base_path, year, file_name);
}

std::vector<std::string> SplitLines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        auto line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

} // namespace ledger_service
