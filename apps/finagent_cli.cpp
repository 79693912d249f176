#include "finagent/agent_service.hpp"
#include "finagent/config.hpp"
#include "finagent/error.hpp"
#include "finagent/logging.hpp"
#include "finagent/metadata_recorder.hpp"
#include "finagent/metadata_store.hpp"
#include "finagent/provider_client.hpp"
#include "finagent/schema_profiles.hpp"
#include "finagent/utils/to_file.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 2;
constexpr int kExitConfiguration = 3;
constexpr int kExitGateway = 4;

class UsageError : public std::runtime_error {
public:
  explicit UsageError(const std::string& message) : std::runtime_error(message) {}
};

void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " upload <path> [--provider NAME] [--content-type TYPE]\n"
            << "  " << argv0 << " run --file ID [--file ID ...] [--instructions TEXT]\n"
            << "      [--schema default|income_cashflow_expense] [--meta KEY=VALUE ...]\n"
            << "  " << argv0 << " status <run_id> <queued|running|completed|failed|cancelled>\n"
            << "  " << argv0 << " health\n";
}

void print_json(const nlohmann::json& value) {
  std::cout << value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

std::string take_value(const std::vector<std::string>& args, std::size_t& index) {
  if (index + 1 >= args.size()) {
    throw UsageError("missing value for " + args[index]);
  }
  return args[++index];
}

int command_upload(const finagent::AgentService& service, const std::vector<std::string>& args) {
  std::optional<std::string> path;
  std::optional<std::string> provider;
  std::optional<std::string> content_type;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--provider") {
      provider = take_value(args, i);
    } else if (args[i] == "--content-type") {
      content_type = take_value(args, i);
    } else if (!path) {
      path = args[i];
    } else {
      throw UsageError("unexpected argument: " + args[i]);
    }
  }
  if (!path) {
    throw UsageError("upload requires a file path");
  }

  if (!content_type) {
    content_type = finagent::utils::spreadsheet_content_type(*path);
  }
  if (!content_type || !finagent::utils::is_spreadsheet_content_type(*content_type)) {
    throw UsageError("Only CSV or XLSX files are supported.");
  }

  auto source = finagent::utils::to_file(*path, *content_type);
  auto result = service.upload_source(source, provider);
  print_json(finagent::upload_result_to_json(result));
  return kExitOk;
}

int command_run(const finagent::AgentService& service, const std::vector<std::string>& args) {
  finagent::AgentRunRequest request;
  std::map<std::string, std::string> metadata;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--file") {
      request.file_ids.push_back(take_value(args, i));
    } else if (args[i] == "--instructions") {
      request.instructions = take_value(args, i);
    } else if (args[i] == "--schema") {
      auto name = take_value(args, i);
      auto profile = finagent::parse_schema_profile(name);
      if (!profile) {
        throw UsageError("unknown schema profile: " + name);
      }
      request.schema_profile = finagent::to_string(*profile);
    } else if (args[i] == "--meta") {
      auto entry = take_value(args, i);
      auto eq = entry.find('=');
      if (eq == std::string::npos || eq == 0) {
        throw UsageError("--meta expects KEY=VALUE, got: " + entry);
      }
      metadata[entry.substr(0, eq)] = entry.substr(eq + 1);
    } else {
      throw UsageError("unexpected argument: " + args[i]);
    }
  }
  if (request.file_ids.empty()) {
    throw UsageError("run requires at least one --file");
  }
  if (!metadata.empty()) {
    request.metadata = std::move(metadata);
  }

  auto result = service.start_agent_run(request);
  print_json(finagent::run_result_to_json(result));
  return kExitOk;
}

int command_status(const finagent::AgentService& service, const std::vector<std::string>& args) {
  if (args.size() != 2) {
    throw UsageError("status requires <run_id> <status>");
  }
  auto status = finagent::parse_run_status(args[1]);
  if (!status) {
    throw UsageError("unknown run status: " + args[1]);
  }
  service.update_run_status(args[0], *status);
  print_json(nlohmann::json{{"run_id", args[0]}, {"status", finagent::to_string(*status)}});
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage(argv[0]);
    return kExitUsage;
  }
  const std::string command = argv[1];
  const std::vector<std::string> args(argv + 2, argv + argc);

  try {
    finagent::Settings settings = finagent::load_settings();
    if (settings.log_level == finagent::LogLevel::Off) {
      settings.log_level = finagent::LogLevel::Info;
    }
    finagent::Logger logger(settings.log_level, finagent::make_stderr_logger());

    finagent::MetadataStore store(settings.database_path, logger);
    finagent::MetadataRecorder recorder(store, logger);
    finagent::ProviderClient provider(finagent::provider_options_from(settings, logger));
    finagent::AgentService service(settings, provider, &recorder, logger);

    int code = kExitUsage;
    if (command == "upload") {
      code = command_upload(service, args);
    } else if (command == "run") {
      code = command_run(service, args);
    } else if (command == "status") {
      code = command_status(service, args);
    } else if (command == "health") {
      print_json(service.health());
      code = kExitOk;
    } else {
      print_usage(argv[0]);
    }
    recorder.wait_idle();
    return code;
  } catch (const UsageError& ex) {
    std::cerr << "error: " << ex.what() << "\n";
    print_usage(argv[0]);
    return kExitUsage;
  } catch (const finagent::ConfigurationError& ex) {
    std::cerr << "configuration error: " << ex.what() << "\n";
    return kExitConfiguration;
  } catch (const finagent::GatewayError& ex) {
    std::cerr << "gateway error: " << ex.what() << "\n";
    return kExitGateway;
  } catch (const std::exception& ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
