#include "engine_config.hpp"

namespace wordserve {
namespace engine {

std::vector<std::string> build_engine_args(const EngineConfig &config) {
    std::vector<std::string> args;
    args.push_back("--data=" + config.data_dir);
    if (config.debug) {
        args.push_back("-d");
    }
    args.insert(args.end(), config.args.begin(), config.args.end());
    return args;
}

}  // namespace engine
}  // namespace wordserve
