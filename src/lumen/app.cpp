#include "lumen/app.hpp"

#include "lumen/error.hpp"

#include <GLFW/glfw3.h>
#include <hello_imgui/hello_imgui.h>
#include <imgui.h>

#include <cstdio>

namespace lumen {

namespace {

constexpr size_t kTrafficQueueCapacity = 4096;

// Bounds the time spent draining the queue in one frame.
constexpr size_t kMaxTrafficPerFrame = 512;

} // namespace

App::App() = default;
App::~App() = default;

int App::run(int argc, char *argv[]) {
    glfwSetErrorCallback([](int error, const char *description) {
        std::fprintf(stderr, "[GLFW Error %d] %s\n", error, description);
    });

    if (argc > 1) {
        try {
            config_ = client::load_client_config(argv[1]);
            config_source_ = argv[1];
        } catch (const ConfigError &e) {
            std::fprintf(stderr, "[Lumen] %s\n", e.what());
            return 1;
        }
    }

    try {
        client_ = std::make_unique<client::Client>(config_);
    } catch (const BindError &e) {
        std::fprintf(stderr, "[Lumen] Cannot bind %s: %s\n", config_.bind.to_string().c_str(),
                     e.what());
        return 1;
    }

    // The receive thread is the only producer.
    traffic_ = std::make_unique<data::TrafficQueue>(kTrafficQueueCapacity);
    client_->set_message_callback([this](const protocol::Message &message,
                                         const net::Endpoint &from) {
        data::TrafficEvent event;
        event.from = from;
        event.target = message.target();
        event.type = message.header().type;
        event.sequence = message.header().sequence;
        event.summary = protocol::describe(message.payload());
        traffic_->try_push(std::move(event));
    });

    HelloImGui::RunnerParams runner_params;
    runner_params.appWindowParams.windowTitle = "Lumen";
    runner_params.appWindowParams.windowGeometry.size = {1280, 720};

    runner_params.imGuiWindowParams.defaultImGuiWindowType =
        HelloImGui::DefaultImGuiWindowType::ProvideFullScreenDockSpace;
    runner_params.imGuiWindowParams.showMenuBar = true;
    runner_params.imGuiWindowParams.showMenu_App = false;
    runner_params.imGuiWindowParams.showMenu_View = true;
    runner_params.imGuiWindowParams.showStatusBar = true;

    // Devices report in asynchronously; keep rendering without input.
    runner_params.fpsIdling.enableIdling = false;

    //  ___________________________________________
    //  |                          |               |
    //  |  Devices                 |  Light        |
    //  |  (MainDockSpace)         |  (right 30%)  |
    //  |--------------------------|               |
    //  |  Traffic (bottom 35%)    |               |
    //  -------------------------------------------
    HelloImGui::DockingSplit split_right;
    split_right.initialDock = "MainDockSpace";
    split_right.newDock = "LightSpace";
    split_right.direction = ImGuiDir_Right;
    split_right.ratio = 0.30f;

    HelloImGui::DockingSplit split_bottom;
    split_bottom.initialDock = "MainDockSpace";
    split_bottom.newDock = "TrafficSpace";
    split_bottom.direction = ImGuiDir_Down;
    split_bottom.ratio = 0.35f;
    runner_params.dockingParams.dockingSplits = {split_right, split_bottom};

    HelloImGui::DockableWindow devices_window;
    devices_window.label = "Devices";
    devices_window.dockSpaceName = "MainDockSpace";
    devices_window.GuiFunction = [this] { render_devices(); };

    HelloImGui::DockableWindow light_window;
    light_window.label = "Light";
    light_window.dockSpaceName = "LightSpace";
    light_window.GuiFunction = [this] { render_light(); };

    HelloImGui::DockableWindow traffic_window;
    traffic_window.label = "Traffic";
    traffic_window.dockSpaceName = "TrafficSpace";
    traffic_window.GuiFunction = [this] { render_traffic(); };

    runner_params.dockingParams.dockableWindows = {devices_window, light_window, traffic_window};

    runner_params.callbacks.ShowStatus = [this] { render_status(); };

    runner_params.callbacks.BeforeImGuiRender = [this] {
        process_traffic();
        refresh_devices();
    };

    runner_params.callbacks.PostInit = [this] {
        traffic_log_.add(views::TrafficEntryType::System,
                         "Listening on " + config_.bind.to_string() + " (config: " +
                             config_source_ + ")");
        client_->listen();
        client_->discover();
    };

    runner_params.callbacks.BeforeExit = [this] { client_->close(); };

    HelloImGui::Run(runner_params);

    return 0;
}

void App::process_traffic() {
    traffic_->drain([this](data::TrafficEvent event) { traffic_log_.add_inbound(event); },
                    kMaxTrafficPerFrame);
}

void App::refresh_devices() {
    devices_ = client_->devices();

    if (light_.target.has_value()) {
        const auto it = devices_.find(*light_.target);
        if (it != devices_.end()) {
            light_.power = it->second.power;
        }
    }
}

void App::perform(views::LightAction action) {
    if (!light_.target.has_value()) {
        return;
    }
    const uint64_t target = *light_.target;
    const auto it = devices_.find(target);
    if (it == devices_.end()) {
        traffic_log_.add(views::TrafficEntryType::Error,
                         "Device " + data::format_target(target) + " is no longer known");
        return;
    }

    const protocol::Payload payload = light_.payload_for(action);
    try {
        const uint8_t sequence = client_->send_to_device(target, payload);
        traffic_log_.add_outbound(payload, it->second.endpoint, target, sequence);
    } catch (const Error &e) {
        traffic_log_.add(views::TrafficEntryType::Error,
                         std::string(views::light_action_label(action)) + " failed: " + e.what());
    }
}

void App::render_status() {
    const size_t count = devices_.size();
    ImGui::TextColored(count > 0 ? ImVec4(0.0f, 0.8f, 0.0f, 1.0f) : ImVec4(0.6f, 0.6f, 0.6f, 1.0f),
                       "%zu device%s", count, count == 1 ? "" : "s");
    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();
    ImGui::Text("bind %s", config_.bind.to_string().c_str());
    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();
    ImGui::Text("source %u", static_cast<unsigned>(config_.source));

    if (traffic_->dropped() > 0) {
        ImGui::SameLine();
        ImGui::TextDisabled("|");
        ImGui::SameLine();
        ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.0f, 1.0f), "%llu dropped",
                           static_cast<unsigned long long>(traffic_->dropped()));
    }
}

void App::render_devices() {
    if (devices_.empty()) {
        ImGui::TextDisabled("Waiting for devices on %s...", config_.broadcast.to_string().c_str());
    }

    const auto clicked = device_table_.render(devices_);
    if (clicked.has_value()) {
        const auto it = devices_.find(*clicked);
        if (it != devices_.end()) {
            light_.load_from(it->second);
        }
    }
}

void App::render_light() {
    if (light_.target.has_value()) {
        const auto it = devices_.find(*light_.target);
        if (it != devices_.end()) {
            ImGui::TextUnformatted(it->second.to_string().c_str());
            ImGui::Separator();
        }
    }

    if (const auto action = views::render_light_controls(light_)) {
        perform(*action);
    }
}

void App::render_traffic() { console_view_.render(traffic_log_); }

} // namespace lumen
