#include "ui.hpp"
#include "converter.hpp"
#include "generator.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <stdexcept>
#include <string>

using namespace ftxui;

namespace ui {

struct AppState {
  std::string input_number;
  std::string file_out = "result.txt";
  std::string random_digits_str = "12";
  std::string fraction_digits_str = "0";

  std::string status_msg;
  bool status_is_error = false;
};

static unsigned int parse_digits(const std::string &s, unsigned int fallback) {
  try {
    unsigned long v = std::stoul(s);
    return v > 0 && v <= 999 ? static_cast<unsigned int>(v) : fallback;
  } catch (const std::exception &) {
    return fallback;
  }
}

static void set_status(AppState &st, const std::string &msg, bool is_error) {
  st.status_msg = msg;
  st.status_is_error = is_error;
}

void run(ScreenInteractive &screen) {
  AppState st;

  InputOption single_line;
  single_line.multiline = false;

  auto input_num_comp =
      Input(&st.input_number, "Enter a number...", single_line);
  auto input_out = Input(&st.file_out, "result.txt", single_line);

  auto digits_only = CatchEvent([](Event e) {
    return e.is_character() &&
           !(e.character()[0] >= '0' && e.character()[0] <= '9');
  });
  auto input_random = Input(&st.random_digits_str, "1-999", single_line) |
                      digits_only;
  auto input_fraction =
      Input(&st.fraction_digits_str, "0-999", single_line) | digits_only;

  auto random_btn = Button(
      "  Random  ",
      [&] {
        unsigned int digits = parse_digits(st.random_digits_str, 12);
        unsigned int fraction = parse_digits(st.fraction_digits_str, 0);
        try {
          st.input_number = generator::random_number(digits, fraction);
          set_status(st, "Generated " + std::to_string(digits) + "-digit number",
                     false);
        } catch (const std::exception &ex) {
          set_status(st, std::string("Error: ") + ex.what(), true);
        }
      },
      ButtonOption::Ascii());

  auto save_btn = Button(
      "  Save  ",
      [&] {
        try {
          std::string words = converter::to_english(st.input_number);
          generator::save_to_file(st.file_out,
                                  st.input_number + "\n" + words + "\n");
          set_status(st, "Saved to " + st.file_out, false);
        } catch (const std::exception &ex) {
          set_status(st, std::string("Error: ") + ex.what(), true);
        }
      },
      ButtonOption::Ascii());

  auto quit_btn =
      Button("  Quit  ", screen.ExitLoopClosure(), ButtonOption::Ascii());

  auto all = Container::Vertical({
      input_num_comp,
      Container::Horizontal({input_random, input_fraction, random_btn}),
      Container::Horizontal({input_out, save_btn}),
      quit_btn,
  });

  auto renderer = Renderer(all, [&] {
    std::string result_str;
    std::string error_str;
    Color output_color = Color::GreenLight;

    if (st.input_number.empty()) {
      result_str = "(waiting for input)";
      output_color = Color::GrayDark;
    } else {
      try {
        result_str = converter::to_english(st.input_number);
      } catch (const converter::unsupported_format &ex) {
        error_str = std::string("Unsupported: ") + ex.what();
        output_color = Color::Yellow;
      } catch (const std::exception &ex) {
        error_str = ex.what();
        output_color = Color::RedLight;
      }
    }

    auto title = hbox({
        text(" Number to English words ") | bold | color(Color::Cyan),
    });

    auto result_elem =
        error_str.empty()
            ? vbox({
                  text("  In words          : ") | color(Color::Yellow),
                  paragraph(result_str) | color(output_color) | bold,
              })
            : text("  " + error_str) | color(output_color);

    Element status_bar = text("");
    if (!st.status_msg.empty()) {
      status_bar = hbox({
                       text(" "),
                       text(st.status_msg) |
                           color(st.status_is_error ? Color::RedLight
                                                    : Color::GreenLight) |
                           bold,
                       text(" "),
                   }) |
                   border;
    }

    return vbox({
               separatorEmpty(),
               title | hcenter,
               separatorEmpty(),
               separator(),
               separatorEmpty(),
               hbox({text("  Number            :") | color(Color::Yellow) |
                         size(WIDTH, EQUAL, 22),
                     input_num_comp->Render(), text("  ")}),
               separatorEmpty(),
               hbox({
                   text("  Random digits     : ") | color(Color::Yellow) |
                       size(WIDTH, EQUAL, 22),
                   input_random->Render() | size(WIDTH, EQUAL, 5),
                   text(" . ") | color(Color::GrayDark),
                   input_fraction->Render() | size(WIDTH, EQUAL, 5),
                   random_btn->Render(),
               }),
               separatorEmpty(),
               hbox({
                   text("  Output file       : ") | color(Color::Yellow) |
                       size(WIDTH, EQUAL, 22),
                   input_out->Render() | size(WIDTH, EQUAL, 20),
                   save_btn->Render(),
               }),
               separatorEmpty(),
               separator(),
               separatorEmpty(),
               result_elem,
               separatorEmpty(),
               separator(),
               status_bar,
               separatorEmpty(),
               quit_btn->Render() | hcenter,
               separatorEmpty(),
           }) |
           border | size(WIDTH, EQUAL, 80);
  });

  screen.Loop(renderer);
}

} // namespace ui
