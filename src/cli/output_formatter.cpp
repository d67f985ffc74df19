#include <querygraph/cli/output_formatter.hpp>
#include <querygraph/core/terminal.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace querygraph {

namespace {

using namespace querygraph::style;

const char* StatusColor(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Valid:   return kSuccess;
        case ValidationStatus::Invalid: return kFailure;
        case ValidationStatus::Pending: return kWarning;
        case ValidationStatus::Empty:   return kMuted;
    }
    return kReset;
}

nlohmann::json ValidationObject(const ValidationResult& validation) {
    return {{"status", ValidationStatusName(validation.status)},
            {"message", validation.message}};
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto arr = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            arr.push_back(std::move(obj));
        }
        out_ << arr.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            // FTXUI wants rectangular data.
            auto padded = row;
            padded.resize(headers.size());
            table_data.push_back(std::move(padded));
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

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c])) << headers[c];
    }
    out_ << "\n";

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";

    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<DetailSection>& sections) const {

    std::vector<const DetailSection*> visible;
    for (const auto& sec : sections) {
        if (!sec.entries.empty()) {
            visible.push_back(&sec);
        }
    }

    const char* dim = color_mode_ ? kMuted : "";
    const char* bold = color_mode_ ? kHeading : "";
    const char* reset = color_mode_ ? kReset : "";
    const char* branch = color_mode_ ? "├── " : "|-- ";
    const char* last_branch = color_mode_ ? "└── " : "+-- ";

    out_ << bold << title << reset << "\n";
    for (size_t si = 0; si < visible.size(); ++si) {
        const auto& sec = *visible[si];
        const bool last_section = si + 1 == visible.size();

        if (sec.title.empty()) {
            for (size_t ei = 0; ei < sec.entries.size(); ++ei) {
                const bool last = last_section && ei + 1 == sec.entries.size();
                out_ << dim << (last ? last_branch : branch) << reset
                     << sec.entries[ei].first << ": " << sec.entries[ei].second << "\n";
            }
            continue;
        }

        out_ << dim << (last_section ? last_branch : branch) << reset
             << bold << sec.title << reset << "\n";
        for (size_t ei = 0; ei < sec.entries.size(); ++ei) {
            const bool last = ei + 1 == sec.entries.size();
            out_ << dim << "    " << (last ? last_branch : branch) << reset
                 << sec.entries[ei].first << ": " << sec.entries[ei].second << "\n";
        }
    }
}

void OutputFormatter::PrintSql(const GeneratedSql& sql,
                               const ValidationResult& validation) const {
    if (json_mode_) {
        nlohmann::json obj = {
            {"sql", sql.text},
            {"diagnostic", sql.diagnostic},
            {"validation", ValidationObject(validation)},
        };
        out_ << obj.dump() << "\n";
        return;
    }

    if (color_mode_ && sql.diagnostic) {
        out_ << kMuted << sql.text << kReset << "\n";
    } else {
        out_ << sql.text << "\n";
    }
    PrintValidation(validation);
}

void OutputFormatter::PrintValidation(const ValidationResult& validation) const {
    if (json_mode_) {
        out_ << ValidationObject(validation).dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << "\n" << StatusColor(validation.status) << "["
             << ValidationStatusName(validation.status) << "]" << kReset << " "
             << validation.message << "\n";
        return;
    }

    out_ << "\n[" << ValidationStatusName(validation.status) << "] "
         << validation.message << "\n";
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
        err_ << kFailure << "Error: " << kReset;
        err_ << kHeading << error.operation << kReset;
        if (!error.subject.empty()) {
            err_ << kMuted << " (" << error.subject << ")" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        err_ << "  " << kMuted << "category: " << error.CategoryName() << kReset << "\n";
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.subject.empty()) {
        err_ << " (" << error.subject << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    err_ << "  category: " << error.CategoryName() << "\n";
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"success", true}, {"message", message}}.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kSuccess << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace querygraph
