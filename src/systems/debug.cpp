#include "debug.hpp"
#include "../debug_panel.hpp"
#include <raylib.h>
#include <string>
#include <utility>
#include <vector>

static constexpr int   PAD      = 8;
static constexpr int   PANEL_W  = 300;
static constexpr int   ROW_H    = 15;
static constexpr int   FONT_SM  = 10;
static constexpr int   FONT_MD  = 11;
static constexpr int   LABEL_W  = 132;  // pixels from content-left to value column
static constexpr Color BG       = {20,  20,  20,  210};
static constexpr Color DIVIDER  = {80,  80,  80,  200};
static constexpr Color C_TITLE  = {160, 160, 160, 255};
static constexpr Color C_HEADER = {210, 190, 80,  255};
static constexpr Color C_LABEL  = {180, 180, 180, 255};
static constexpr Color C_VALUE  = {255, 255, 255, 255};

void DebugSystem::Update(ecs::World& world, float /*dt*/) {
    auto* panel = world.try_resource<DebugPanel>();
    if (!panel) return;

    if (IsKeyPressed(KEY_F3)) panel->visible = !panel->visible;
    if (!panel->visible) return;

    // Providers run once per frame; list sections can change length between
    // frames, so the height is measured from this frame's rows.
    std::vector<std::pair<std::string, std::vector<DebugPanel::Entry>>> frame;
    int rows_total = 0;
    for (const auto& s : panel->sections()) {
        frame.emplace_back(s.title, s.collect());
        rows_total += 1 + static_cast<int>(frame.back().second.size()); // header + data rows
    }

    const int title_area = ROW_H + PAD;
    const int content_h  = rows_total * ROW_H + static_cast<int>(frame.size()) * 4;
    const int panel_h    = PAD + title_area + content_h + PAD;

    const int ox = 10, oy = 10;
    DrawRectangle(ox, oy, PANEL_W, panel_h, BG);
    DrawRectangleLines(ox, oy, PANEL_W, panel_h, DIVIDER);

    int cy = oy + PAD;
    DrawText("FRAME WATCH", ox + PAD, cy, FONT_MD, C_TITLE);
    DrawText("[F3]", ox + PANEL_W - PAD - MeasureText("[F3]", FONT_SM) - 2, cy + 1, FONT_SM, DIVIDER);
    cy += ROW_H + PAD;

    for (const auto& [title, entries] : frame) {
        DrawLine(ox + PAD, cy, ox + PANEL_W - PAD, cy, DIVIDER);
        cy += 4;
        DrawText(title.c_str(), ox + PAD, cy, FONT_MD, C_HEADER);
        cy += ROW_H;

        for (const auto& [label, value] : entries) {
            DrawText(label.c_str(), ox + PAD + 4,           cy, FONT_SM, C_LABEL);
            DrawText(value.c_str(), ox + PAD + 4 + LABEL_W, cy, FONT_SM, C_VALUE);
            cy += ROW_H;
        }
    }
}
