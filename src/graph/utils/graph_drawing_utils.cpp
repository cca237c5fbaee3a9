#include <graph/utils/graph_drawing_utils.h>

#include <cfloat> // For FLT_MAX

namespace wsm {
namespace GraphDraw {

std::string EllipsizeText(ImFont* font, float font_size, const std::string& text, float max_width) {
    if (text.empty() || font == nullptr || font_size <= 0.0f || max_width <= 0.0f)
        return "";

    const char* begin = text.c_str();
    const char* end = begin + text.size();
    if (font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, begin, end).x <= max_width)
        return text;

    const char* ellipsis = "...";
    float ellipsis_width = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, ellipsis).x;
    if (ellipsis_width > max_width)
        return "";

    // Package names are ASCII; shrink one byte at a time.
    std::string prefix = text;
    while (!prefix.empty()) {
        prefix.pop_back();
        float width = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, prefix.c_str(), prefix.c_str() + prefix.size()).x;
        if (width + ellipsis_width <= max_width)
            break;
    }
    return prefix + ellipsis;
}

void AddCenteredText(ImDrawList* draw_list, ImFont* font, float font_size, const ImVec2& center, ImU32 col,
                     const std::string& text, float max_width) {
    std::string shown = EllipsizeText(font, font_size, text, max_width);
    if (shown.empty())
        return;

    ImVec2 size = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, shown.c_str(), shown.c_str() + shown.size());
    ImVec2 pos(center.x - size.x * 0.5f, center.y - size.y * 0.5f);
    draw_list->AddText(font, font_size, pos, col, shown.c_str(), shown.c_str() + shown.size());
}

} // namespace GraphDraw
} // namespace wsm
