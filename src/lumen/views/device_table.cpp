#include "lumen/views/device_table.hpp"

#include <algorithm>
#include <cstdio>

namespace lumen::views {

namespace {

// Devices that have not reported a value sort after those that have.
int compare_optional(const std::optional<std::string> &lhs, const std::optional<std::string> &rhs) {
    if (lhs.has_value() != rhs.has_value()) {
        return lhs.has_value() ? -1 : 1;
    }
    if (!lhs.has_value()) {
        return 0;
    }
    return lhs->compare(*rhs);
}

int power_rank(const std::optional<protocol::Power> &power) {
    if (!power.has_value()) {
        return 2;
    }
    return *power == protocol::Power::Max ? 0 : 1;
}

int compare_rows(const data::Bulb &lhs, const data::Bulb &rhs, DeviceSortColumn column) {
    switch (column) {
    case DeviceSortColumn::Label:
        return compare_optional(lhs.label, rhs.label);
    case DeviceSortColumn::Address:
        if (lhs.endpoint.address != rhs.endpoint.address) {
            return lhs.endpoint.address < rhs.endpoint.address ? -1 : 1;
        }
        return 0;
    case DeviceSortColumn::Power:
        return power_rank(lhs.power) - power_rank(rhs.power);
    case DeviceSortColumn::Target:
    default:
        return data::format_target(lhs.target).compare(data::format_target(rhs.target));
    }
}

} // namespace

std::optional<uint64_t> DeviceTable::render(const data::DeviceMap &devices) {
    std::optional<uint64_t> clicked;

    text_filter_.Draw("Filter##devices", 220.0f);
    ImGui::SameLine();
    ImGui::TextDisabled("%zu devices", devices.size());

    if (!ImGui::BeginTable("DeviceTable", 5,
                           ImGuiTableFlags_Sortable | ImGuiTableFlags_Resizable |
                               ImGuiTableFlags_BordersOuter | ImGuiTableFlags_BordersInnerV |
                               ImGuiTableFlags_ScrollY | ImGuiTableFlags_RowBg)) {
        return clicked;
    }

    ImGui::TableSetupScrollFreeze(0, 1);
    ImGui::TableSetupColumn("Label", ImGuiTableColumnFlags_DefaultSort);
    ImGui::TableSetupColumn("Target");
    ImGui::TableSetupColumn("Address");
    ImGui::TableSetupColumn("Power");
    ImGui::TableSetupColumn("Location", ImGuiTableColumnFlags_NoSort);
    ImGui::TableHeadersRow();

    if (ImGuiTableSortSpecs *sort_specs = ImGui::TableGetSortSpecs()) {
        if (sort_specs->Specs != nullptr && sort_specs->SpecsCount > 0 && sort_specs->SpecsDirty) {
            const ImGuiTableColumnSortSpecs &spec = sort_specs->Specs[0];
            switch (spec.ColumnIndex) {
            case 0:
                sort_column_ = DeviceSortColumn::Label;
                break;
            case 1:
                sort_column_ = DeviceSortColumn::Target;
                break;
            case 2:
                sort_column_ = DeviceSortColumn::Address;
                break;
            case 3:
                sort_column_ = DeviceSortColumn::Power;
                break;
            default:
                break;
            }
            sort_ascending_ = spec.SortDirection != ImGuiSortDirection_Descending;
            sort_specs->SpecsDirty = false;
        }
    }

    const auto rows = visible_rows(devices);
    for (const auto &bulb : rows) {
        const std::string target = data::format_target(bulb.target);
        ImGui::PushID(target.c_str());
        ImGui::TableNextRow();

        ImGui::TableNextColumn();
        const bool is_selected = selected_ == bulb.target;
        const std::string label = bulb.label.value_or("<unnamed>");
        if (ImGui::Selectable(label.c_str(), is_selected, ImGuiSelectableFlags_SpanAllColumns)) {
            selected_ = bulb.target;
            clicked = bulb.target;
        }

        ImGui::TableNextColumn();
        ImGui::TextUnformatted(target.c_str());

        ImGui::TableNextColumn();
        ImGui::TextUnformatted(bulb.endpoint.to_string().c_str());

        ImGui::TableNextColumn();
        if (bulb.power.has_value()) {
            const bool on = *bulb.power == protocol::Power::Max;
            ImGui::TextColored(on ? ImVec4(0.4f, 1.0f, 0.4f, 1.0f) : ImVec4(0.6f, 0.6f, 0.6f, 1.0f),
                               "%s", protocol::power_label(*bulb.power));
        } else {
            ImGui::TextDisabled("--");
        }

        ImGui::TableNextColumn();
        if (bulb.location.has_value()) {
            ImGui::Text("%s / %s", bulb.location->c_str(), bulb.group.value_or("-").c_str());
        } else {
            ImGui::TextDisabled("--");
        }
        ImGui::PopID();
    }

    ImGui::EndTable();
    return clicked;
}

void DeviceTable::reset() {
    set_filter_text("");
    sort_column_ = DeviceSortColumn::Label;
    sort_ascending_ = true;
    selected_.reset();
}

void DeviceTable::set_sort(DeviceSortColumn sort_column, bool ascending) {
    sort_column_ = sort_column;
    sort_ascending_ = ascending;
}

void DeviceTable::set_filter_text(const std::string &text) {
    std::snprintf(text_filter_.InputBuf, sizeof(text_filter_.InputBuf), "%s", text.c_str());
    text_filter_.Build();
}

std::vector<data::Bulb> DeviceTable::visible_rows(const data::DeviceMap &devices) const {
    std::vector<data::Bulb> rows;
    rows.reserve(devices.size());
    for (const auto &[target, bulb] : devices) {
        if (passes_filter(bulb)) {
            rows.push_back(bulb);
        }
    }

    std::sort(rows.begin(), rows.end(), [this](const data::Bulb &lhs, const data::Bulb &rhs) {
        int ordering = compare_rows(lhs, rhs, sort_column_);
        if (ordering == 0) {
            ordering = data::format_target(lhs.target).compare(data::format_target(rhs.target));
        }
        return sort_ascending_ ? ordering < 0 : ordering > 0;
    });
    return rows;
}

bool DeviceTable::passes_filter(const data::Bulb &bulb) const {
    if (!text_filter_.IsActive()) {
        return true;
    }
    return (bulb.label.has_value() && text_filter_.PassFilter(bulb.label->c_str())) ||
           text_filter_.PassFilter(data::format_target(bulb.target).c_str()) ||
           text_filter_.PassFilter(bulb.endpoint.address_string().c_str()) ||
           (bulb.group.has_value() && text_filter_.PassFilter(bulb.group->c_str()));
}

} // namespace lumen::views
