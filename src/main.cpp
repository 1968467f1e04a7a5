#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>
#include <adjuster/cli/commands.hpp>
#include <adjuster/cli/options.hpp>
#include <adjuster/registry/claim_registry.hpp>
#include <filesystem>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
  auto logger = spdlog::stderr_color_mt("adjuster");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::warn);

  auto parsed = adjuster::cli::parse_options(argc, argv);
  if (parsed.help_requested) {
    std::cout << parsed.usage;
    return adjuster::cli::kExitSuccess;
  }
  if (!parsed.options) {
    std::cerr << parsed.error << "\n\n" << parsed.usage;
    return adjuster::cli::kExitUsage;
  }
  const auto& options = *parsed.options;
  if (options.verbose) {
    spdlog::set_level(spdlog::level::debug);
  }

  // Checked before and after opening: a missing path must not be created,
  // and an existing directory may still hold no registry.
  auto deployer = adjuster::cli::resolve_deployer(options);
  if (!deployer && !std::filesystem::exists(options.db_path)) {
    std::cerr << "creating a registry at '" << options.db_path
              << "' requires --deployer or --caller\n";
    return adjuster::cli::kExitUsage;
  }

  auto encoder = adjuster::schema::encoding::encoder<
      adjuster::schema::encoding::scale_encoder_tag>{};
  auto storage = adjuster::storage::make_storage<
      adjuster::storage::rocksdb_storage_tag>(options.db_path);
  if (!deployer && !adjuster::registry::has_registry(encoder, storage)) {
    std::cerr << "'" << options.db_path
              << "' holds no registry; creating one requires --deployer or "
                 "--caller\n";
    spdlog::shutdown();
    return adjuster::cli::kExitUsage;
  }
  auto registry = adjuster::registry::claim_registry{
      encoder, storage,
      deployer.value_or(adjuster::schema::make_zero_hash())};

  auto code = adjuster::cli::run_command(options, registry, std::cout, std::cerr);
  spdlog::shutdown();
  return code;
}
