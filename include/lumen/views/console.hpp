#pragma once

#include "lumen/data/traffic_queue.hpp"
#include "lumen/net/endpoint.hpp"
#include "lumen/protocol/payload.hpp"

#include <imgui.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

namespace lumen::views {

/// Types of traffic entries for filtering and coloring.
enum class TrafficEntryType {
    Inbound,
    Outbound,
    Error,
    System,
};

/// A single line in the traffic log.
struct TrafficEntry {
    TrafficEntryType type = TrafficEntryType::System;
    std::string message;
    std::string detail;
    double wall_time = 0.0;
};

/// Rolling log of LAN traffic and panel notices.
class TrafficLog {
  public:
    static constexpr size_t kDefaultMaxEntries = 2000;

    explicit TrafficLog(size_t max_entries = kDefaultMaxEntries);

    void add(TrafficEntryType type, const std::string &message, const std::string &detail = "");

    /// A message drained from the client's traffic queue.
    void add_inbound(const data::TrafficEvent &event);

    /// A message the panel just sent.
    void add_outbound(const protocol::Payload &payload, const net::Endpoint &to, uint64_t target,
                      uint8_t sequence);

    [[nodiscard]] const std::deque<TrafficEntry> &entries() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] size_t count(TrafficEntryType type) const;

    void clear();
    [[nodiscard]] double elapsed() const;

  private:
    size_t max_entries_ = kDefaultMaxEntries;
    std::deque<TrafficEntry> entries_;
    std::chrono::steady_clock::time_point start_time_;
};

/// Renders a scrollable traffic log with direction filters and a text filter.
class ConsoleView {
  public:
    void render(TrafficLog &log);
    void reset();

    // Exposed for testing the filter logic without an ImGui context.
    void set_filter_text(const std::string &text);
    void set_type_visible(TrafficEntryType type, bool visible);
    [[nodiscard]] bool passes_filter(const TrafficEntry &entry) const;

  private:
    void render_filter_bar(TrafficLog &log);
    void render_entry(const TrafficEntry &entry, size_t row_index);
    static ImVec4 entry_color(TrafficEntryType type);
    static const char *entry_prefix(TrafficEntryType type);

    bool show_inbound_ = true;
    bool show_outbound_ = true;
    bool show_errors_ = true;
    bool show_system_ = true;
    ImGuiTextFilter text_filter_;
    bool auto_scroll_ = true;
    size_t last_entry_count_ = 0;
};

} // namespace lumen::views
