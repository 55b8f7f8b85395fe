#include <cpptrace/cpptrace.hpp>

#include <filesystem>
#include <string>
#include <vector>

#include "command_line_parser.hpp"
#include "copy_engine.hpp"
#include "copy_types.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  const std::string process_name = (argc > 0 && argv && argv[0])
    ? std::filesystem::path(argv[0]).filename().string()
    : "parcopy";
  CommandLineParser parser(process_name);
  try {
    auto settings = std::make_shared<SettingsManager>();
    std::vector<std::string> paths;
    try {
      paths = parser.parse(argc, argv, *settings);
    } catch(const UsageError& e) {
      init(false);
      print_err(nullptr, "{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }
    init(settings->get<bool>("verbose"), settings->get<bool>("color"));
    if(paths.size() < 2) {
      print_err(nullptr, "Expected at least one source and a destination");
      parser.usage();
      return 1;
    }

    std::vector<std::filesystem::path> sources(paths.begin(), paths.end() - 1);
    const std::filesystem::path destination = paths.back();

    CopyEngine engine(settings);
    try {
      auto summary = engine.run(sources, destination);
      return engine.exit_code(summary);
    } catch(const CopyError& e) {
      engine.logger()->error("{}: {}", to_string(e.kind()), e.what());
      if(e.kind() == CopyError::Kind::Usage) parser.usage();
      return 1;
    }
  } catch(std::exception& e) {
    init(false);
    Logger logger(process_name);
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
