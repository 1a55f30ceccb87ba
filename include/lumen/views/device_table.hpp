#pragma once

#include "lumen/data/device_directory.hpp"

#include <imgui.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lumen::views {

/// Sort column for the device table.
enum class DeviceSortColumn {
    Label,
    Target,
    Address,
    Power,
};

/// Renders a searchable, sortable table of discovered devices with single selection.
class DeviceTable {
  public:
    /// Returns the target the user clicked this frame, if any.
    std::optional<uint64_t> render(const data::DeviceMap &devices);

    void reset();

    // Exposed for testing the data-model logic without an ImGui context.
    void set_sort(DeviceSortColumn sort_column, bool ascending);
    void set_filter_text(const std::string &text);
    [[nodiscard]] std::vector<data::Bulb> visible_rows(const data::DeviceMap &devices) const;

    [[nodiscard]] std::optional<uint64_t> selected() const { return selected_; }
    void select(std::optional<uint64_t> target) { selected_ = target; }

  private:
    [[nodiscard]] bool passes_filter(const data::Bulb &bulb) const;

    ImGuiTextFilter text_filter_;
    DeviceSortColumn sort_column_ = DeviceSortColumn::Label;
    bool sort_ascending_ = true;
    std::optional<uint64_t> selected_;
};

} // namespace lumen::views
