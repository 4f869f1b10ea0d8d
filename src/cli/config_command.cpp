#include "cli/config_command.hpp"

#include <ostream>
#include <stdexcept>

#include "core/config.hpp"

namespace grok_mcp::cli {

namespace {

int list_models(const std::filesystem::path& config_path, std::ostream& out) {
  const std::string current = core::resolve_model(core::load_config_file(config_path));

  out << "Available Grok models:\n";
  out << std::string(50, '-') << '\n';
  for (const auto& model : core::available_models()) {
    out << "  " << model.id << (model.id == current ? " *" : "") << '\n';
    out << "    " << model.description << '\n';
  }
  out << '\n';
  out << "* = currently selected\n";
  return 0;
}

int show_config(const std::filesystem::path& config_path, std::ostream& out) {
  const auto config = core::load_config_file(config_path);

  out << "Current model: " << core::resolve_model(config) << '\n';
  out << "Config file: " << config_path.string() << '\n';
  if (!config.empty()) {
    out << "Config contents: " << config.dump(2) << '\n';
  }
  return 0;
}

int set_model(const std::string& model, const std::filesystem::path& config_path, std::ostream& out,
              std::ostream& err) {
  if (!core::is_known_model(model)) {
    err << "Error: Unknown model '" << model << "'\n";
    err << "Run 'grok-mcp config --list-models' to see available models\n";
    return 1;
  }

  auto config = core::load_config_file(config_path);
  config["model"] = model;
  try {
    core::save_config_file(config_path, config);
  } catch (const std::runtime_error& ex) {
    err << "Error saving config: " << ex.what() << '\n';
    return 1;
  }

  out << "Default model set to: " << model << '\n';
  out << "Restart Claude Code for changes to take effect.\n";
  return 0;
}

}  // namespace

ConfigOptions parse_config_options(const std::vector<std::string>& args) {
  ConfigOptions options{};

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "--show" || arg == "-s") {
      options.show = true;
      continue;
    }

    if (arg == "--list-models" || arg == "-l") {
      options.list_models = true;
      continue;
    }

    if (arg == "--model" || arg == "-m") {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument(arg + " requires a model name");
      }
      options.model = args[++i];
      continue;
    }

    if (arg.rfind("--model=", 0) == 0) {
      options.model = arg.substr(std::string("--model=").size());
      continue;
    }

    throw std::invalid_argument("unrecognized argument: " + arg);
  }

  return options;
}

void print_config_usage(std::ostream& out) {
  out << "Usage:\n";
  out << "  grok-mcp config --model <model>  Set default model\n";
  out << "  grok-mcp config --show           Show current config\n";
  out << "  grok-mcp config --list-models    List available models\n";
}

int run_config_command(const std::vector<std::string>& args, const std::filesystem::path& config_path,
                       std::ostream& out, std::ostream& err) {
  ConfigOptions options{};
  try {
    options = parse_config_options(args);
  } catch (const std::invalid_argument& ex) {
    err << "config error: " << ex.what() << '\n';
    print_config_usage(err);
    return 2;
  }

  if (options.list_models) {
    return list_models(config_path, out);
  }
  if (options.show) {
    return show_config(config_path, out);
  }
  if (options.model.has_value()) {
    return set_model(*options.model, config_path, out, err);
  }

  print_config_usage(out);
  return 0;
}

}  // namespace grok_mcp::cli
