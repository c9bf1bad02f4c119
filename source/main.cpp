#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string_view>
#include <vector>

#include <fmt/color.h>
#include <fmt/format.h>

#include "app.hpp"
#include "auxiliary/log.hpp"

namespace
{
// only the signal handler reads this; everything else gets the flag injected
aux::CancellationFlag* g_cancellation = nullptr;

extern "C" void on_stop_signal(int)
{
  if (g_cancellation != nullptr) {
    g_cancellation->request();
  }
}
}  // namespace

auto main(int argc, char** argv) -> int
{
  auto command_line =
      parse_command_line(std::vector<std::string_view>(argv + 1, argv + argc));

  if (!command_line) {
    fmt::print(stderr, fg(fmt::color::red), "{}\n", command_line.error());
    fmt::print(stderr, "{}\n", usage());
    return EXIT_FAILURE;
  }

  aux::set_log_level(command_line->settings.log_level);

  auto cancellation = std::make_shared<aux::CancellationFlag>();
  g_cancellation = cancellation.get();

  std::signal(SIGINT, on_stop_signal);
  std::signal(SIGTERM, on_stop_signal);

  int exit_code = EXIT_FAILURE;

  try {
    auto app = App {command_line->settings, cancellation};
    exit_code = app.run(command_line->torrent_file_path);
  } catch (std::exception& ex) {
    fmt::print(stderr, fg(fmt::color::red), "Error: {}\n", ex.what());
  }

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_cancellation = nullptr;

  return exit_code;
}
