#pragma once

#include <string>

#include "logging/logger.hpp"

namespace wordserve {
namespace client {

struct InstallResult {
    bool success = false;
    std::string error;
};

// Makes the engine binary available before the first spawn
class IBinaryInstaller {
public:
    virtual ~IBinaryInstaller() = default;
    virtual InstallResult ensure_binary() = 0;
};

// Verifies that an already-installed binary exists and is executable
class LocalBinaryInstaller : public IBinaryInstaller {
public:
    LocalBinaryInstaller(std::string binary_path, logging::LoggerPtr logger);

    InstallResult ensure_binary() override;

private:
    std::string binary_path_;
    logging::LoggerPtr logger_;
};

}  // namespace client
}  // namespace wordserve
