#pragma once

#include <optional>
#include <string>

#include "logger.hpp"

namespace wordserve {
namespace logging {

// Receives the engine's stderr, one complete line at a time
class ILogClassifier {
public:
    virtual ~ILogClassifier() = default;
    virtual void classify_line(const std::string &line) = 0;
};

// Default classifier: recognises the engine's "<timestamp> LEVEL message" lines
// and re-logs them at the matching level with an [engine] tag. Unstructured
// lines mentioning errors become errors; everything else is debug output.
class EngineLogClassifier : public ILogClassifier {
public:
    explicit EngineLogClassifier(LoggerPtr logger);

    void classify_line(const std::string &line) override;

    struct Classified {
        Level level;
        std::string message;
    };

    // Pure classification, no logging. nullopt for blank lines.
    static std::optional<Classified> classify(const std::string &line);

private:
    LoggerPtr logger_;
};

}  // namespace logging
}  // namespace wordserve
