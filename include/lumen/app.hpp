#pragma once

#include "lumen/client/client.hpp"
#include "lumen/client/config.hpp"
#include "lumen/data/device_directory.hpp"
#include "lumen/data/traffic_queue.hpp"
#include "lumen/views/console.hpp"
#include "lumen/views/controls.hpp"
#include "lumen/views/device_table.hpp"

#include <memory>
#include <string>

namespace lumen {

/// Panel application entry point and lifecycle management.
/// Loads the client configuration, starts discovery and runs the Hello ImGui loop.
class App {
  public:
    App();
    ~App();

    /// Run the main application loop. argv[1], if present, is a JSON config path.
    /// Returns exit code (0 = success).
    int run(int argc, char *argv[]);

  private:
    /// Called each frame by Hello ImGui to pull data from the client threads.
    void process_traffic();
    void refresh_devices();

    /// UI rendering functions (called each frame).
    void render_status();
    void render_devices();
    void render_light();
    void render_traffic();

    void perform(views::LightAction action);

    client::ClientConfig config_;
    // Declared before client_ so the receive thread is joined before the queue goes away.
    std::unique_ptr<data::TrafficQueue> traffic_;
    std::unique_ptr<client::Client> client_;
    data::DeviceMap devices_;
    views::DeviceTable device_table_;
    views::LightControlState light_;
    views::TrafficLog traffic_log_;
    views::ConsoleView console_view_;
    std::string config_source_ = "defaults";
};

} // namespace lumen
