#include "util/common.h++"
#include "util/asio_common.h++"
#include "services/database_resolver.h++"
#include "controllers/dump_controller.h++"
#include <optparse.h>
#include <cstdio>

using namespace Stowage;
using std::make_shared, std::shared_ptr, std::string;

int main(int argc, char** argv) {
  auto parser = optparse::OptionParser()
    .version(string(VERSION))
    .description("Copies every table of one configured database into another");
  parser.add_option("-c", "--config")
    .dest("config")
    .type("FILE.json")
    .help("configuration file with type definitions and database sections (required)");
  parser.add_option("--from")
    .dest("from")
    .type("SECTION")
    .help("config section of the database to copy from (default = source)")
    .set_default("source");
  parser.add_option("--to")
    .dest("to")
    .type("SECTION")
    .help("config section of the database to copy into (default = destination)")
    .set_default("destination");
  parser.add_option("--manifest")
    .dest("manifest")
    .type("FILE")
    .help("type manifest used by sections that set autoscan");
  parser.add_option("--data-dir")
    .dest("data_dir")
    .type("DIR")
    .help("directory that relative database files are resolved against (default = .)")
    .set_default(".");
  parser.add_option("--log-level")
    .dest("log_level")
    .help("log level (debug, info, warn, error, critical)")
    .set_default("info");
  parser.add_option("--list-providers")
    .dest("list_providers")
    .nargs(0)
    .help("prints the registered provider names and exits");
  parser.add_help_option();

  const optparse::Values options = parser.parse_args(argc, argv);
  spdlog::set_level(spdlog::level::from_str(options["log_level"]));
  auto& registry = ProviderRegistry::global();

  if (options.is_set_by_user("list_providers")) {
    for (const auto& name : registry.provider_names()) puts(name.c_str());
    return EXIT_SUCCESS;
  }
  if (!options.is_set_by_user("config")) {
    spdlog::critical("--config is required");
    return EXIT_FAILURE;
  }

  try {
    auto context = make_shared<PluginContext>();
    context->name = "stowage";
    context->data_dir = options["data_dir"];
    context->config = ConfigValue::load_json_file(options["config"]);
    if (auto types = context->config.get("types")) {
      context->types = TypeCatalog::from_config(*types);
    }
    if (options.is_set_by_user("manifest")) {
      context->code_source = make_shared<ManifestCodeSource>(options["manifest"]);
    }

    PluginDatabases databases{shared_ptr<const PluginContext>(context), registry};
    auto from = databases.get<RelationalDatabase>(options["from"]);
    auto to = databases.get<RelationalDatabase>(options["to"]);

    AsioThreadPool pool(1);
    auto task = DumpController::dump_async(pool.executor(), from, to,
      [](OptRef<Table> table, size_t remaining) {
        if (table) spdlog::info("{}: {:d} rows remaining", table->get().name(), remaining);
      }
    );
    task.get();
    pool.drain();
    from->close();
    to->close();
    spdlog::info("Copied {} into {}", options["from"], options["to"]);
    return EXIT_SUCCESS;
  } catch (const StowageError& e) {
    spdlog::critical("Dump failed: {}", e.what());
    return EXIT_FAILURE;
  }
}
