#pragma once

#include <ftxui/component/component.hpp>
#include <spdlog/common.h>
#include <memory>
#include <string>
#include <vector>

struct OutputEntry {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string text;
};

/// Scrolling view of the engine log (engine output and supervisor events)
class OutputPanel {
public:
    static constexpr int kMaxLines = 1000;

    OutputPanel();
    ~OutputPanel();

    // Push an entry (thread-safe)
    void push(OutputEntry entry);

    /// Snapshot of the retained entries, oldest first
    std::vector<OutputEntry> entries() const;

    /// Write the visible entries to path; false if the file cannot be written
    bool export_to(const std::string& path) const;

    ftxui::Component component();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
