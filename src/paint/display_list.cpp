#include <verso/paint/display_list.h>
#include <iomanip>
#include <sstream>

namespace verso::paint {

void DisplayList::fill_rect(const Rect& rect, const Color& color) {
    PaintCommand cmd;
    cmd.type = PaintCommand::FillRect;
    cmd.bounds = rect;
    cmd.color = color;
    commands_.push_back(std::move(cmd));
}

void DisplayList::draw_border(const Rect& rect, const float widths[4], const Color colors[4],
                              const StrokeStyle styles[4]) {
    PaintCommand cmd;
    cmd.type = PaintCommand::DrawBorder;
    cmd.bounds = rect;
    cmd.color = colors[0];
    for (int i = 0; i < 4; ++i) {
        cmd.border_widths[i] = widths[i];
        cmd.border_colors[i] = colors[i];
        cmd.border_styles[i] = styles[i];
    }
    commands_.push_back(std::move(cmd));
}

void DisplayList::draw_text(const std::string& text, const Rect& bounds, float baseline,
                            float font_size, const Color& color, const std::string& font_family,
                            int font_weight, bool font_italic) {
    PaintCommand cmd;
    cmd.type = PaintCommand::DrawText;
    cmd.bounds = bounds;
    cmd.color = color;
    cmd.text = text;
    cmd.baseline = baseline;
    cmd.font_size = font_size;
    cmd.font_family = font_family;
    cmd.font_weight = font_weight;
    cmd.font_italic = font_italic;
    commands_.push_back(std::move(cmd));
}

void DisplayList::draw_placeholder(const Rect& rect, const std::string& label, const Color& color) {
    PaintCommand cmd;
    cmd.type = PaintCommand::DrawPlaceholder;
    cmd.bounds = rect;
    cmd.color = color;
    cmd.label = label;
    commands_.push_back(std::move(cmd));
}

std::vector<const PaintCommand*> DisplayList::commands_of(PaintCommand::Type type) const {
    std::vector<const PaintCommand*> result;
    for (const auto& cmd : commands_) {
        if (cmd.type == type) result.push_back(&cmd);
    }
    return result;
}

const char* command_type_name(PaintCommand::Type type) {
    switch (type) {
        case PaintCommand::FillRect: return "FillRect";
        case PaintCommand::DrawBorder: return "DrawBorder";
        case PaintCommand::DrawText: return "DrawText";
        case PaintCommand::DrawPlaceholder: return "DrawPlaceholder";
    }
    return "Unknown";
}

std::string serialize_display_list(const DisplayList& list) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    for (const auto& cmd : list.commands()) {
        out << command_type_name(cmd.type) << " x=" << cmd.bounds.x << " y=" << cmd.bounds.y
            << " w=" << cmd.bounds.width << " h=" << cmd.bounds.height
            << " color=#" << std::hex << std::setw(8) << std::setfill('0') << cmd.color.to_argb()
            << std::dec << std::setfill(' ');
        switch (cmd.type) {
            case PaintCommand::DrawText:
                out << " text=\"" << cmd.text << "\" size=" << cmd.font_size
                    << " baseline=" << cmd.baseline;
                break;
            case PaintCommand::DrawBorder:
                out << " widths=" << cmd.border_widths[0] << ',' << cmd.border_widths[1] << ','
                    << cmd.border_widths[2] << ',' << cmd.border_widths[3];
                break;
            case PaintCommand::DrawPlaceholder:
                out << " label=" << cmd.label;
                break;
            case PaintCommand::FillRect:
                break;
        }
        out << '\n';
    }
    return out.str();
}

} // namespace verso::paint
