#include "binary_installer.hpp"

#include <unistd.h>

#include <filesystem>
#include <system_error>

namespace wordserve {
namespace client {

LocalBinaryInstaller::LocalBinaryInstaller(std::string binary_path, logging::LoggerPtr logger)
    : binary_path_(std::move(binary_path)), logger_(std::move(logger)) {}

InstallResult LocalBinaryInstaller::ensure_binary() {
    InstallResult result;
    std::error_code ec;

    if (binary_path_.empty()) {
        result.error = "No engine binary configured";
    } else if (!std::filesystem::exists(binary_path_, ec)) {
        result.error = "Engine binary not found: " + binary_path_;
    } else if (!std::filesystem::is_regular_file(binary_path_, ec)) {
        result.error = "Engine binary is not a regular file: " + binary_path_;
    } else if (access(binary_path_.c_str(), X_OK) != 0) {
        result.error = "Engine binary is not executable: " + binary_path_;
    } else {
        result.success = true;
        LOG_DEBUG(*logger_, "[Installer] Engine binary present: " << binary_path_);
        return result;
    }

    LOG_ERROR(*logger_, "[Installer] " << result.error);
    return result;
}

}  // namespace client
}  // namespace wordserve
