#include "engine_log_classifier.hpp"

#include <regex>

namespace wordserve {
namespace logging {

namespace {

const std::regex &structured_line_regex() {
    static const std::regex re(
        R"((\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(?:\.\d+)?(?:Z|[+-]\d{2}:\d{2})?)?\s*(FATA|ERROR|WARN|INFO|DEBUG)\s+(.+))");
    return re;
}

std::string trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

EngineLogClassifier::EngineLogClassifier(LoggerPtr logger) : logger_(std::move(logger)) {}

std::optional<EngineLogClassifier::Classified> EngineLogClassifier::classify(const std::string &line) {
    const std::string text = trim(line);
    if (text.empty()) {
        return std::nullopt;
    }

    std::smatch match;
    if (std::regex_search(text, match, structured_line_regex())) {
        const std::string tag = match[2].str();
        std::string message = match[3].str();
        if (tag == "FATA") {
            return Classified{Level::LVL_ERROR, "FATAL " + message};
        }
        if (tag == "ERROR") return Classified{Level::LVL_ERROR, message};
        if (tag == "WARN") return Classified{Level::LVL_WARN, message};
        if (tag == "INFO") return Classified{Level::LVL_INFO, message};
        return Classified{Level::LVL_DEBUG, message};
    }

    if (text.find("Failed") != std::string::npos || text.find("Error") != std::string::npos ||
        text.find("error") != std::string::npos || text.find("panic") != std::string::npos) {
        return Classified{Level::LVL_ERROR, text};
    }

    return Classified{Level::LVL_DEBUG, text};
}

void EngineLogClassifier::classify_line(const std::string &line) {
    auto classified = classify(line);
    if (!classified) {
        return;
    }
    LOG_INTERNAL(*logger_, classified->level, "[engine] " << classified->message);
}

}  // namespace logging
}  // namespace wordserve
