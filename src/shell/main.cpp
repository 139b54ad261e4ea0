#include <verso/core/config.h>
#include <verso/core/diagnostics.h>
#include <verso/dom/document.h>
#include <verso/engine/render_pipeline.h>
#include <verso/layout/layout_engine.h>
#include <verso/paint/software_renderer.h>

#include <charconv>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr const char kProgramName[] = "verso_shell";

constexpr const char kSampleStyles[] =
    "body { margin: 8px; color: #222 }"
    "h1 { color: navy; border-bottom: 2px solid navy; margin-bottom: 12px }"
    "p { margin: 8px 0 }"
    ".note { background-color: #ffe; border: 1px dashed #cc9; padding: 6px }"
    ".badge { display: inline-block; padding: 2px 6px; background-color: teal; color: white }";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " [--size=WIDTHxHEIGHT] [--scale=N] [--css=FILE] [--ppm=FILE]"
            " [--dump-layout] [--dump-display-list]\n";
}

bool is_help_flag(const char* input) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  return text == "-h" || text == "--help";
}

bool is_version_flag(const char* input) {
  if (input == nullptr) {
    return false;
  }

  const std::string_view text(input);
  return text == "-V" || text == "--version";
}

bool parse_positive_int(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }

  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
    return false;
  }

  value = parsed;
  return true;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_size_value(std::string_view dimensions, int& width, int& height) {
  const std::size_t separator = dimensions.find('x');
  if (separator == std::string_view::npos || separator == 0 || separator + 1 >= dimensions.size()) {
    return false;
  }
  if (dimensions.find('x', separator + 1) != std::string_view::npos) {
    return false;
  }

  int parsed_width = 0;
  int parsed_height = 0;
  if (!parse_positive_int(dimensions.substr(0, separator), parsed_width) ||
      !parse_positive_int(dimensions.substr(separator + 1), parsed_height)) {
    return false;
  }

  width = parsed_width;
  height = parsed_height;
  return true;
}

bool read_file(const std::string& path, std::string& contents) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  contents = buffer.str();
  return !in.bad();
}

void print_diagnostic(const verso::core::DiagnosticEvent& event) {
  std::cerr << verso::core::format_diagnostic(event) << "\n";
}

// Small document exercising blocks, inline formatting, lists and replaced
// content.
void build_sample_document(verso::dom::Document& doc) {
  using verso::dom::NodeId;

  const NodeId html = doc.append_element(doc.root(), "html");
  const NodeId head = doc.append_element(html, "head");
  const NodeId title = doc.append_element(head, "title");
  doc.append_text(title, "verso sample");

  const NodeId body = doc.append_element(html, "body");
  const NodeId h1 = doc.append_element(body, "h1");
  doc.append_text(h1, "Style, layout and paint");

  const NodeId intro = doc.append_element(body, "p");
  doc.append_text(intro, "Text is broken into lines at spaces, with ");
  const NodeId em = doc.append_element(intro, "em");
  doc.append_text(em, "inline elements");
  doc.append_text(intro, " flowing through the same line boxes as the surrounding words.");

  const NodeId list = doc.append_element(body, "ul");
  for (const char* item : {"Selector matching and the cascade", "Block and inline layout",
                           "Display list painting"}) {
    const NodeId li = doc.append_element(list, "li");
    doc.append_text(li, item);
  }

  const NodeId note = doc.append_element(body, "div", {{"class", "note"}});
  doc.append_text(note, "Atomic inlines sit on the baseline: ");
  const NodeId badge = doc.append_element(note, "span", {{"class", "badge"}});
  doc.append_text(badge, "new");
  doc.append_text(note, " and images keep their intrinsic size ");
  doc.append_element(note, "img", {{"width", "48"}, {"height", "24"}, {"alt", "logo"}});
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << verso::core::config::kVersionString << "\n";
    return 0;
  }

  int width = static_cast<int>(verso::core::config::kDefaultViewportWidth);
  int height = static_cast<int>(verso::core::config::kDefaultViewportHeight);
  int scale = 1;
  std::string css_path;
  std::string ppm_path;
  bool dump_layout = false;
  bool dump_display_list = false;

  bool has_size_flag = false;
  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (argument == "--size" || starts_with(argument, "--size=")) {
      if (has_size_flag) {
        std::cerr << "Invalid --size: duplicate flag '" << argument << "'\n";
        print_usage(std::cerr);
        return 1;
      }
      if (!starts_with(argument, "--size=") ||
          !parse_size_value(argument.substr(7), width, height)) {
        std::cerr << "Invalid --size: '" << argument
                  << "' (expected --size=WIDTHxHEIGHT with positive integers)\n";
        print_usage(std::cerr);
        return 1;
      }
      has_size_flag = true;
    } else if (starts_with(argument, "--scale=")) {
      if (!parse_positive_int(argument.substr(8), scale)) {
        std::cerr << "Invalid --scale: '" << argument << "'\n";
        print_usage(std::cerr);
        return 1;
      }
    } else if (starts_with(argument, "--css=") && argument.size() > 6) {
      css_path = std::string(argument.substr(6));
    } else if (starts_with(argument, "--ppm=") && argument.size() > 6) {
      ppm_path = std::string(argument.substr(6));
    } else if (argument == "--dump-layout") {
      dump_layout = true;
    } else if (argument == "--dump-display-list") {
      dump_display_list = true;
    } else {
      std::cerr << "Unknown argument: " << argument << "\n";
      print_usage(std::cerr);
      return 1;
    }
  }

  verso::core::DiagnosticEmitter parse_diagnostics;
  parse_diagnostics.add_observer(print_diagnostic);
  std::vector<verso::css::StyleSheet> stylesheets;
  stylesheets.push_back(verso::css::parse_stylesheet(kSampleStyles, &parse_diagnostics));
  if (!css_path.empty()) {
    std::string css;
    if (!read_file(css_path, css)) {
      std::cerr << "Cannot read stylesheet: " << css_path << "\n";
      return 1;
    }
    stylesheets.push_back(verso::css::parse_stylesheet(css, &parse_diagnostics));
  }

  verso::dom::Document doc;
  build_sample_document(doc);

  verso::engine::PipelineInput input;
  input.document = &doc;
  input.stylesheets = std::move(stylesheets);
  input.viewport_width = static_cast<float>(width);
  input.viewport_height = static_cast<float>(height);

  const verso::engine::PipelineOutput output =
      verso::engine::run_pipeline(input, [](const std::string& stage) {
        std::cerr << "[stage] " << stage << "\n";
      });
  if (!output.ok) {
    std::cerr << output.message << "\n";
    return 1;
  }

  for (const auto& event : output.diagnostics.events()) {
    print_diagnostic(event);
  }

  if (dump_layout) {
    std::cout << verso::layout::serialize_layout(*output.layout);
  }
  if (dump_display_list) {
    std::cout << verso::paint::serialize_display_list(output.display_list);
  }

  if (!ppm_path.empty()) {
    verso::paint::SoftwareRenderer renderer(width * scale, height * scale,
                                            static_cast<float>(scale));
    renderer.render(output.display_list);
    if (!renderer.save_ppm(ppm_path)) {
      std::cerr << "Cannot write image: " << ppm_path << "\n";
      return 1;
    }
    std::cout << "Wrote " << ppm_path << " (" << renderer.width() << "x"
              << renderer.height() << ")\n";
  }

  return 0;
}
