#ifndef GRAPH_DRAWING_UTILS_H
#define GRAPH_DRAWING_UTILS_H

#include <imgui.h>

#include <string>

namespace wsm {
namespace GraphDraw {

// Longest prefix of `text` that fits `max_width` at `font_size`, with "..."
// appended when truncated. Returns "" when not even the ellipsis fits.
std::string EllipsizeText(ImFont* font, float font_size, const std::string& text, float max_width);

// Draws `text` centered on `center`, ellipsized to `max_width`.
void AddCenteredText(ImDrawList* draw_list, ImFont* font, float font_size, const ImVec2& center, ImU32 col,
                     const std::string& text, float max_width);

} // namespace GraphDraw
} // namespace wsm

#endif // GRAPH_DRAWING_UTILS_H
