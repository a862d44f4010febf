#pragma once

#include <optional>
#include <string>

namespace segue::daemon_app {

struct AppOverrides {
    std::optional<std::string> device;    // --device / SEGUE_ALSA_DEVICE
    std::optional<std::string> endpoint;  // --endpoint
};

// Runs the daemon until SIGINT/SIGTERM; SIGHUP rebuilds everything from a
// freshly loaded config.
class App {
   public:
    explicit App(std::string configFilePath);

    int run(const AppOverrides& overrides);

   private:
    std::string configFilePath_;
};

}  // namespace segue::daemon_app
