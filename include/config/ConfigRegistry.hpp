#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace sm::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);

    // Seeds the registry with an already-built config (tests, --config-less runs).
    static void init(const Config& config);

    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace sm::config
