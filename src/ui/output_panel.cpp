#include "ui/output_panel.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/component/event.hpp>
#include <deque>
#include <mutex>
#include <fstream>
#include <ctime>
#include <iomanip>
#include <sstream>

using namespace ftxui;

struct OutputPanel::Impl {
    std::deque<OutputEntry> lines;
    mutable std::mutex mutex;

    bool warnings_only = false;
    bool frozen = false;
    std::string status_message;

    void push(OutputEntry entry) {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(std::move(entry));
        while ((int)lines.size() > kMaxLines) {
            lines.pop_front();
        }
    }

    bool matches_filter(const OutputEntry& entry) const {
        if (!warnings_only) return true;
        return entry.level >= spdlog::level::warn;
    }

    static Color level_color(spdlog::level::level_enum level) {
        switch (level) {
            case spdlog::level::warn:     return Color::Yellow;
            case spdlog::level::err:
            case spdlog::level::critical: return Color::Red;
            case spdlog::level::debug:
            case spdlog::level::trace:    return Color::GrayDark;
            default:                      return Color::White;
        }
    }

    bool export_to(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex);
        std::ofstream out(path);
        if (!out.is_open()) return false;
        for (const auto& entry : lines) {
            if (matches_filter(entry)) {
                out << entry.text << "\n";
            }
        }
        return out.good();
    }

    static std::string export_file_name() {
        auto t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);
        std::ostringstream oss;
        oss << "engine-output-" << std::put_time(&tm, "%Y%m%d-%H%M%S") << ".log";
        return oss.str();
    }
};

OutputPanel::OutputPanel() : impl_(std::make_unique<Impl>()) {}
OutputPanel::~OutputPanel() = default;

void OutputPanel::push(OutputEntry entry) { impl_->push(std::move(entry)); }

std::vector<OutputEntry> OutputPanel::entries() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return std::vector<OutputEntry>(impl_->lines.begin(), impl_->lines.end());
}

bool OutputPanel::export_to(const std::string& path) const {
    return impl_->export_to(path);
}

Component OutputPanel::component() {
    auto self = impl_.get();

    return Renderer([self](bool /*focused*/) -> Element {
        std::lock_guard<std::mutex> lock(self->mutex);

        // Header with filter info
        Elements header_items;
        auto filter_item = [&](const std::string& label, bool active) {
            auto el = text(" " + label + " ");
            header_items.push_back(active ? el | bold | inverted : el | dim);
        };
        filter_item("1:ALL", !self->warnings_only);
        filter_item("2:WARNINGS", self->warnings_only);
        header_items.push_back(filler());
        if (!self->status_message.empty()) {
            header_items.push_back(text(" " + self->status_message + " ") | dim);
        }
        header_items.push_back(
            self->frozen
                ? text(" [F] frozen ") | color(Color::Yellow)
                : text(" [F] freeze ") | dim
        );
        header_items.push_back(text(" [X] export ") | dim);

        auto header = hbox(std::move(header_items));

        // Output lines
        Elements lines;
        for (const auto& entry : self->lines) {
            if (!self->matches_filter(entry)) continue;
            lines.push_back(text(entry.text) | color(Impl::level_color(entry.level)));
        }

        if (lines.empty()) {
            lines.push_back(text("  (no output yet)") | dim);
        }

        auto view = vbox(std::move(lines));
        if (!self->frozen) {
            view = view | focusPositionRelative(0, 1); // auto-scroll to bottom
        }

        return vbox({
            header,
            separator(),
            view | vscroll_indicator | frame | flex,
        }) | border;
    }) | CatchEvent([self](Event event) -> bool {
        if (!event.is_character()) return false;

        if (event.character() == "1") { self->warnings_only = false; return true; }
        if (event.character() == "2") { self->warnings_only = true; return true; }

        // F: toggle freeze
        if (event.character() == "f" || event.character() == "F") {
            std::lock_guard<std::mutex> lock(self->mutex);
            self->frozen = !self->frozen;
            return true;
        }

        // X: export
        if (event.character() == "x" || event.character() == "X") {
            std::string name = Impl::export_file_name();
            bool ok = self->export_to(name);
            std::lock_guard<std::mutex> lock(self->mutex);
            self->status_message = ok ? "saved " + name : "export failed";
            return true;
        }

        return false;
    });
}
