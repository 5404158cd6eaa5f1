#include <roadnet/cli/output_formatter.hpp>
#include <roadnet/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace roadnet {

namespace {

using namespace roadnet::ansi;

constexpr const char* kBranch = "├── ";
constexpr const char* kLastBranch = "└── ";

struct TreeLine {
    std::string key;
    std::string value;
    bool is_header = false;
    bool is_child = false;
    bool is_last = false;
};

// Flatten sections into tree lines; root-level and child "last" markers
// decide the branch glyph.
std::vector<TreeLine> FlattenSections(const std::vector<DetailSection>& sections) {
    std::vector<TreeLine> lines;
    for (const auto& section : sections) {
        if (section.entries.empty()) continue;
        if (section.title.empty()) {
            for (const auto& [key, value] : section.entries) {
                lines.push_back({key, value, false, false, false});
            }
            continue;
        }
        lines.push_back({section.title, "", true, false, false});
        for (std::size_t i = 0; i < section.entries.size(); ++i) {
            lines.push_back({section.entries[i].first, section.entries[i].second, false, true,
                             i + 1 == section.entries.size()});
        }
    }
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (!it->is_child) {
            it->is_last = true;
            break;
        }
    }
    return lines;
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        nlohmann::json j = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (std::size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            j.push_back(std::move(obj));
        }
        out_ << j.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    // Plain table: compute column widths.
    std::vector<std::size_t> widths(headers.size(), 0);
    for (std::size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& cells) {
        for (std::size_t c = 0; c < headers.size() && c < cells.size(); ++c) {
            if (c > 0) out_ << "  ";
            // No padding after the last column.
            if (c + 1 == headers.size()) {
                out_ << cells[c];
            } else {
                out_ << std::left << std::setw(static_cast<int>(widths[c])) << cells[c];
            }
        }
        out_ << "\n";
    };

    print_row(headers);
    for (std::size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<DetailSection>& sections) const {

    const auto lines = FlattenSections(sections);

    if (color_mode_) {
        out_ << kBold << title << kReset << "\n";
        for (const auto& line : lines) {
            if (line.is_child) {
                out_ << kDim << "    " << (line.is_last ? kLastBranch : kBranch) << kReset
                     << line.key << ": " << line.value << "\n";
            } else if (line.is_header) {
                out_ << kDim << (line.is_last ? kLastBranch : kBranch) << kReset
                     << kBold << line.key << kReset << "\n";
            } else {
                out_ << kDim << (line.is_last ? kLastBranch : kBranch) << kReset
                     << line.key << ": " << line.value << "\n";
            }
        }
        return;
    }

    out_ << title << "\n";
    for (const auto& line : lines) {
        if (line.is_child) {
            out_ << (line.is_last ? "    +-- " : "    |-- ") << line.key << ": " << line.value
                 << "\n";
        } else if (line.is_header) {
            out_ << (line.is_last ? "+-- " : "|-- ") << line.key << "\n";
        } else {
            out_ << (line.is_last ? "+-- " : "|-- ") << line.key << ": " << line.value << "\n";
        }
    }
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        err_ << kDim << " (" << error.CategoryName() << ")" << kReset << "\n";
        err_ << "  " << error.message << "\n";
        if (!error.context.empty()) {
            err_ << "  " << kDim << "At: " << kReset << error.context << "\n";
        }
        if (error.hint.has_value() && !error.hint->empty()) {
            err_ << "  " << kYellow << "Hint: " << kReset << error.hint.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation << " (" << error.CategoryName() << ")\n";
    err_ << "  " << error.message << "\n";
    if (!error.context.empty()) {
        err_ << "  At: " << error.context << "\n";
    }
    if (error.hint.has_value() && !error.hint->empty()) {
        err_ << "  Hint: " << error.hint.value() << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::json j;
        j["success"] = true;
        j["message"] = message;
        out_ << j.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace roadnet
