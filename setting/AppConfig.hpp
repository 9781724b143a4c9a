#pragma once
#include <string>

namespace AppConfig {
    static const std::string CONFIG_FILE = "../setting/netsync.json";
    static const std::string LOG_FILE = "";

    static constexpr int MAX_LP_PER_BRIDGED_LS = 64;
    static constexpr int MAX_LP_PER_OVERLAY_LS = 256;
    static constexpr int CONCURRENT_CONNECTIONS = 5;
    static constexpr int AUDIT_INTERVAL_SECONDS = 300;

    static constexpr int REQUEST_TIMEOUT_SECONDS = 30;
    static constexpr int HTTP_TIMEOUT_SECONDS = 10;
    static constexpr int RETRIES = 2;
    static constexpr int REDIRECTS = 2;
}
