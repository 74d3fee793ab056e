#include <cstdint>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "api/migrate/mongodb/v1.hpp"
#include "internal/observability/spans.hpp"

namespace v1 = migrate::mongodb::v1;

int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "usage: " << argv[0] << " <mongodb-uri> <script.json> <version>\n"
              << "  e.g. " << argv[0] << " 'mongodb://localhost:27017/app?x-advisory-lock-timeout=30' 0001_users.json 1\n";
    return 2;
  }

  const std::string  uri         = argv[1];
  const std::string  script_path = argv[2];
  std::int64_t       version     = 0;
  try {
    version = std::stoll(argv[3]);
  } catch (const std::logic_error&) {
    std::cerr << "invalid version: " << argv[3] << '\n';
    return 2;
  }

  std::ifstream script(script_path);
  if (!script) {
    std::cerr << "cannot open " << script_path << '\n';
    return 1;
  }

  // URI-configured drivers carry no tracing section; endpoint from OTEL_EXPORTER_OTLP_ENDPOINT
  migrate::observability::InitializeTracing();

  int status = 0;
  try {
    auto driver = v1::Driver::Open(uri);

    const auto before = driver->Version();
    std::cout << "current version=" << before.version << (before.dirty ? " (dirty)" : "") << '\n';

    driver->Run(script, version);

    const auto after = driver->Version();
    std::cout << "applied " << script_path << ", version=" << after.version << '\n';
    driver->Close();
  } catch (const v1::DirtyVersion& e) {
    // a previous run failed half way; fix the data by hand, then SetVersion(v, false)
    std::cerr << e.what() << '\n';
    status = 1;
  } catch (const v1::CommandError& e) {
    std::cerr << "command " << e.Index() << " (" << e.Command() << ") failed: " << e.what() << '\n';
    status = 1;
  } catch (const v1::MigrateError& e) {
    std::cerr << e.what() << '\n';
    status = 1;
  }

  migrate::observability::ShutdownTracing();
  return status;
}
