#include "lumen/views/console.hpp"

#include "lumen/data/device_directory.hpp"

#include <algorithm>
#include <cstdio>
#include <vector>

namespace lumen::views {

namespace {

std::string sequence_detail(uint16_t type, uint8_t sequence, uint64_t target) {
    char buffer[96];
    std::snprintf(buffer, sizeof(buffer), "type=%u seq=%u target=%s", static_cast<unsigned>(type),
                  static_cast<unsigned>(sequence), data::format_target(target).c_str());
    return buffer;
}

} // namespace

TrafficLog::TrafficLog(size_t max_entries)
    : max_entries_(std::max<size_t>(max_entries, 1)),
      start_time_(std::chrono::steady_clock::now()) {}

void TrafficLog::add(TrafficEntryType type, const std::string &message,
                     const std::string &detail) {
    if (entries_.size() >= max_entries_) {
        entries_.pop_front();
    }

    entries_.push_back(TrafficEntry{
        .type = type,
        .message = message,
        .detail = detail,
        .wall_time = elapsed(),
    });

    // Traffic itself is already mirrored by the client when log_traffic is set.
    if (type == TrafficEntryType::Error) {
        std::fprintf(stderr, "[Lumen] %s\n", message.c_str());
    } else if (type == TrafficEntryType::System) {
        std::printf("[Lumen] %s\n", message.c_str());
    }
}

void TrafficLog::add_inbound(const data::TrafficEvent &event) {
    add(TrafficEntryType::Inbound, event.from.to_string() + "  " + event.summary,
        sequence_detail(event.type, event.sequence, event.target));
}

void TrafficLog::add_outbound(const protocol::Payload &payload, const net::Endpoint &to,
                              uint64_t target, uint8_t sequence) {
    add(TrafficEntryType::Outbound, to.to_string() + "  " + protocol::describe(payload),
        sequence_detail(payload.type_code(), sequence, target));
}

const std::deque<TrafficEntry> &TrafficLog::entries() const { return entries_; }

size_t TrafficLog::size() const { return entries_.size(); }

bool TrafficLog::empty() const { return entries_.empty(); }

size_t TrafficLog::count(TrafficEntryType type) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [type](const auto &e) { return e.type == type; }));
}

void TrafficLog::clear() { entries_.clear(); }

double TrafficLog::elapsed() const {
    const auto now = std::chrono::steady_clock::now();
    const auto delta = std::chrono::duration_cast<std::chrono::duration<double>>(now - start_time_);
    return delta.count();
}

void ConsoleView::render(TrafficLog &log) {
    render_filter_bar(log);
    ImGui::Separator();

    std::vector<const TrafficEntry *> visible_entries;
    visible_entries.reserve(log.size());
    for (const auto &entry : log.entries()) {
        if (passes_filter(entry)) {
            visible_entries.push_back(&entry);
        }
    }

    ImGui::BeginChild("TrafficScroll", ImVec2(0, 0), ImGuiChildFlags_None,
                      ImGuiWindowFlags_HorizontalScrollbar);

    ImGuiListClipper clipper;
    clipper.Begin(static_cast<int>(visible_entries.size()));
    while (clipper.Step()) {
        for (int i = clipper.DisplayStart; i < clipper.DisplayEnd; ++i) {
            render_entry(*visible_entries[static_cast<size_t>(i)], static_cast<size_t>(i));
        }
    }

    if (auto_scroll_ && log.size() > last_entry_count_) {
        ImGui::SetScrollHereY(1.0f);
    }
    last_entry_count_ = log.size();

    ImGui::EndChild();
}

void ConsoleView::reset() {
    show_inbound_ = true;
    show_outbound_ = true;
    show_errors_ = true;
    show_system_ = true;
    text_filter_.Clear();
    auto_scroll_ = true;
    last_entry_count_ = 0;
}

void ConsoleView::set_filter_text(const std::string &text) {
    std::snprintf(text_filter_.InputBuf, sizeof(text_filter_.InputBuf), "%s", text.c_str());
    text_filter_.Build();
}

void ConsoleView::set_type_visible(TrafficEntryType type, bool visible) {
    switch (type) {
    case TrafficEntryType::Inbound:
        show_inbound_ = visible;
        break;
    case TrafficEntryType::Outbound:
        show_outbound_ = visible;
        break;
    case TrafficEntryType::Error:
        show_errors_ = visible;
        break;
    case TrafficEntryType::System:
        show_system_ = visible;
        break;
    }
}

void ConsoleView::render_filter_bar(TrafficLog &log) {
    ImGui::Checkbox("In", &show_inbound_);
    ImGui::SameLine();
    ImGui::Checkbox("Out", &show_outbound_);
    ImGui::SameLine();
    ImGui::Checkbox("Errors", &show_errors_);
    ImGui::SameLine();
    ImGui::Checkbox("System", &show_system_);
    ImGui::SameLine();
    text_filter_.Draw("Filter##traffic", 220.0f);
    ImGui::SameLine();
    if (ImGui::SmallButton("Clear")) {
        log.clear();
        last_entry_count_ = 0;
    }
    ImGui::SameLine();
    ImGui::Checkbox("Auto-scroll", &auto_scroll_);
}

void ConsoleView::render_entry(const TrafficEntry &entry, size_t row_index) {
    ImGui::PushID(static_cast<int>(row_index));
    ImGui::TextDisabled("%7.2f", entry.wall_time);
    ImGui::SameLine();
    ImGui::TextColored(entry_color(entry.type), "%s", entry_prefix(entry.type));
    ImGui::SameLine();
    ImGui::TextUnformatted(entry.message.c_str());

    if (ImGui::IsItemHovered() && !entry.detail.empty()) {
        ImGui::BeginTooltip();
        ImGui::TextUnformatted(entry.detail.c_str());
        ImGui::EndTooltip();
    }

    if (ImGui::IsItemHovered() && ImGui::IsMouseReleased(ImGuiMouseButton_Right)) {
        ImGui::OpenPopup("entry_context");
    }
    if (ImGui::BeginPopup("entry_context")) {
        if (ImGui::MenuItem("Copy line")) {
            const std::string line = std::string(entry_prefix(entry.type)) + " " + entry.message;
            ImGui::SetClipboardText(line.c_str());
        }
        if (ImGui::MenuItem("Copy detail") && !entry.detail.empty()) {
            ImGui::SetClipboardText(entry.detail.c_str());
        }
        ImGui::EndPopup();
    }
    ImGui::PopID();
}

bool ConsoleView::passes_filter(const TrafficEntry &entry) const {
    const bool type_enabled = (entry.type == TrafficEntryType::Inbound && show_inbound_) ||
                              (entry.type == TrafficEntryType::Outbound && show_outbound_) ||
                              (entry.type == TrafficEntryType::Error && show_errors_) ||
                              (entry.type == TrafficEntryType::System && show_system_);
    if (!type_enabled) {
        return false;
    }

    if (text_filter_.IsActive()) {
        return text_filter_.PassFilter(entry.message.c_str()) ||
               (!entry.detail.empty() && text_filter_.PassFilter(entry.detail.c_str()));
    }
    return true;
}

ImVec4 ConsoleView::entry_color(TrafficEntryType type) {
    switch (type) {
    case TrafficEntryType::Inbound:
        return ImVec4(0.35f, 0.85f, 1.0f, 1.0f);
    case TrafficEntryType::Outbound:
        return ImVec4(1.0f, 0.90f, 0.35f, 1.0f);
    case TrafficEntryType::Error:
        return ImVec4(1.0f, 0.35f, 0.35f, 1.0f);
    case TrafficEntryType::System:
    default:
        return ImVec4(0.70f, 0.70f, 0.70f, 1.0f);
    }
}

const char *ConsoleView::entry_prefix(TrafficEntryType type) {
    switch (type) {
    case TrafficEntryType::Inbound:
        return "[<-]";
    case TrafficEntryType::Outbound:
        return "[->]";
    case TrafficEntryType::Error:
        return "[ERR]";
    case TrafficEntryType::System:
    default:
        return "[SYS]";
    }
}

} // namespace lumen::views
