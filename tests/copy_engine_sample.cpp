#include "settings_manager.hpp"
#include "copy_engine.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

int main() {
  namespace fs = std::filesystem;

  auto base = fs::temp_directory_path() / "copy_engine_sample";
  std::error_code ec;
  fs::remove_all(base, ec);
  fs::create_directories(base / "source" / "nested", ec);

  for(int i = 0; i < 12; ++i) {
    const auto dir = (i % 3 == 0) ? base / "source" / "nested" : base / "source";
    std::ofstream out(dir / ("sample_" + std::to_string(i) + ".bin"), std::ios::binary);
    out << std::string(static_cast<std::size_t>(i + 1) * 256 * 1024, static_cast<char>('a' + i));
  }

  auto settings = std::make_shared<SettingsManager>();
  auto configure = [](const std::shared_ptr<SettingsManager>& settings,
                      const std::string& key,
                      const nlohmann::json& value){
    std::string error;
    if(!settings->set_from_json(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure(settings, "jobs", 3);
  configure(settings, "display_cap", 4);
  configure(settings, "buffer_size", 16 * 1024);
  configure(settings, "finished_linger_ms", 300);

  init(false);
  CopyEngine engine(settings);
  auto summary = engine.run({base / "source"}, base / "copy");
  std::cout << "copied " << summary.items_copied << "/" << summary.items_planned
            << " items, " << summary.bytes_copied << " bytes\n";

  fs::remove_all(base, ec);
  return engine.exit_code(summary);
}
