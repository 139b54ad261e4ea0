#pragma once
#include <verso/paint/display_list.h>

namespace verso::layout { struct LayoutBox; }

namespace verso::css { struct Color; }

namespace verso::paint {

class Painter {
public:
    // Walks a laid out tree and emits its paint commands. Pure: the same
    // tree always yields the same list.
    DisplayList paint(const verso::layout::LayoutBox& root);

private:
    void paint_box(const verso::layout::LayoutBox& box, DisplayList& list, int depth);
    void paint_background(const verso::layout::LayoutBox& box, DisplayList& list);
    void paint_borders(const verso::layout::LayoutBox& box, DisplayList& list);
    void paint_text(const verso::layout::LayoutBox& box, DisplayList& list);
    void paint_list_marker(const verso::layout::LayoutBox& box, DisplayList& list);
    void paint_replaced_placeholder(const verso::layout::LayoutBox& box, DisplayList& list);
    void paint_children(const verso::layout::LayoutBox& box, DisplayList& list, int depth);
};

Color to_paint_color(const verso::css::Color& color);

} // namespace verso::paint
