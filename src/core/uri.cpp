#include <ledger_service/core/uri.hpp>

#include <cctype>

namespace ledger_service {

namespace {

bool IsSchemeChar(char c, bool first) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) return true;
    if (first) return false;
    return std::isdigit(uc) || c == '+' || c == '-' || c == '.';
}

} // anonymous namespace

Result<Uri, std::string> ParseUri(std::string_view text) {
    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return Result<Uri, std::string>::Err(
            "URI has no scheme: " + std::string(text));
    }
    for (size_t i = 0; i < colon; ++i) {
        if (!IsSchemeChar(text[i], i == 0)) {
            return Result<Uri, std::string>::Err(
                "URI has an invalid scheme: " + std::string(text));
        }
    }

    Uri uri;
    uri.scheme = std::string(text.substr(0, colon));
    auto rest = text.substr(colon + 1);

    auto hash = rest.find('#');
    if (hash != std::string_view::npos) {
        uri.fragment = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    }
    auto question = rest.find('?');
    if (question != std::string_view::npos) {
        uri.query = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    }

    if (rest.substr(0, 2) == "//") {
        rest = rest.substr(2);
        auto slash = rest.find('/');
        if (slash == std::string_view::npos) {
            uri.authority = std::string(rest);
            return Result<Uri, std::string>::Ok(std::move(uri));
        }
        uri.authority = std::string(rest.substr(0, slash));
        rest = rest.substr(slash);
    }
    uri.path = std::string(rest);
    return Result<Uri, std::string>::Ok(std::move(uri));
}

} // namespace ledger_service
