#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// DebugPanel — provider registry for the read-only metrics overlay.
//
// Stored as a World resource. Two kinds of rows:
//   watch(section, label, fn)   one fixed row, value re-read every frame
//   watch_list(section, fn)     a variable number of (label, value) rows,
//                               e.g. one per live watch packet
// DebugSystem calls every provider each render frame.
//
// Zero engine dependencies — safe to include in any target.
// ---------------------------------------------------------------------------

struct DebugPanel {
    using Provider     = std::function<std::string()>;
    using Entry        = std::pair<std::string, std::string>;
    using ListProvider = std::function<std::vector<Entry>()>;

    struct Row {
        std::string label;
        Provider    fn;
    };

    struct Section {
        std::string               title;
        std::vector<Row>          rows;
        std::vector<ListProvider> lists;

        // Fixed rows first, then list rows, in registration order.
        std::vector<Entry> collect() const {
            std::vector<Entry> out;
            for (const auto& r : rows) out.emplace_back(r.label, r.fn());
            for (const auto& l : lists) {
                auto extra = l();
                out.insert(out.end(), extra.begin(), extra.end());
            }
            return out;
        }
    };

    bool visible = true;

    void watch(const std::string& section, const std::string& label, Provider fn) {
        section_for(section).rows.push_back({label, std::move(fn)});
    }

    void watch_list(const std::string& section, ListProvider fn) {
        section_for(section).lists.push_back(std::move(fn));
    }

    const std::vector<Section>& sections() const { return sections_; }

private:
    Section& section_for(const std::string& title) {
        for (auto& s : sections_)
            if (s.title == title) return s;
        sections_.push_back({title, {}, {}});
        return sections_.back();
    }

    std::vector<Section> sections_;
};
