#include "test_framework.hpp"

#include "synmem/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>

namespace {

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(const std::filesystem::path &path) {
    synmem::config::set_config_path_override(path);
  }
  ~ConfigOverrideGuard() { synmem::config::clear_config_path_override(); }

  ConfigOverrideGuard(const ConfigOverrideGuard &) = delete;
  ConfigOverrideGuard &operator=(const ConfigOverrideGuard &) = delete;
};

} // namespace

void register_config_tests(std::vector<synmem::tests::TestCase> &tests) {
  using synmem::tests::require;
  using synmem::tests::require_contains;
  using synmem::testing::EnvGuard;
  using synmem::testing::TempDir;
  namespace cfg = synmem::config;
  namespace c = synmem::common;

  tests.push_back({"config_parse_reads_every_section", [] {
                     const auto parsed = cfg::parse_config("[store]\npath = \"/tmp/s.db\"\n"
                                                           "[context]\nrecent_sessions = 5\n"
                                                           "knowledge_items = 7\n"
                                                           "important_files = 2\n"
                                                           "[value]\nhourly_rate = 80\n"
                                                           "[observability]\nbackend = \"log\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.store.path == "/tmp/s.db", "store path");
                     require(config.context.recent_sessions == 5, "recent sessions");
                     require(config.context.knowledge_items == 7, "knowledge items");
                     require(config.context.important_files == 2, "important files");
                     require(config.value.hourly_rate == 80.0, "hourly rate");
                     require(config.observability.backend == "log", "backend");
                   }});

  tests.push_back({"config_parse_keeps_defaults_for_missing_keys", [] {
                     const auto parsed = cfg::parse_config("");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().context.recent_sessions == 3, "default recent");
                     require(parsed.value().context.knowledge_items == 10, "default knowledge");
                     require(parsed.value().context.important_files == 5, "default files");
                     require(parsed.value().value.hourly_rate == 50.0, "default rate");
                     require(parsed.value().observability.backend == "none", "default backend");
                     require(cfg::validate_config(parsed.value()).empty(), "defaults are valid");
                   }});

  tests.push_back({"config_validate_reports_each_problem", [] {
                     const auto parsed = cfg::parse_config("[context]\nrecent_sessions = 0\n"
                                                           "knowledge_items = -3\n"
                                                           "[value]\nhourly_rate = -1\n"
                                                           "[observability]\nbackend = \"otel\"\n");
                     require(parsed.ok(), parsed.error());
                     const auto problems = cfg::validate_config(parsed.value());
                     require(problems.size() == 4,
                             "expected four problems, got " + std::to_string(problems.size()));
                   }});

  tests.push_back({"config_parse_rejects_wrongly_typed_values", [] {
                     const auto count = cfg::parse_config("[context]\nrecent_sessions = \"5\"\n");
                     require(!count.ok(), "quoted count should be rejected");
                     require(count.code() == c::ErrorCode::InvalidArgument, "argument error");
                     require_contains(count.error(), "context.recent_sessions (line 2)",
                                      "type error names key and line");

                     const auto rate = cfg::parse_config("[value]\nhourly_rate = lots\n");
                     require(!rate.ok(), "bare word rate should be rejected");
                     require_contains(rate.error(), "value.hourly_rate", "rate error");

                     const auto backend = cfg::parse_config("[observability]\nbackend = log\n");
                     require(!backend.ok(), "unquoted backend should be rejected");
                   }});

  tests.push_back({"config_load_missing_file_yields_defaults", [] {
                     TempDir dir;
                     EnvGuard observability("SYNMEM_OBSERVABILITY", std::nullopt);
                     ConfigOverrideGuard guard(dir.path() / "absent.toml");
                     require(!cfg::config_exists(), "file should not exist");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().context.recent_sessions == 3, "defaults expected");
                   }});

  tests.push_back({"config_load_rejects_invalid_values", [] {
                     TempDir dir;
                     dir.create_file("config.toml", "[context]\nimportant_files = 0\n");
                     ConfigOverrideGuard guard(dir.path() / "config.toml");
                     const auto loaded = cfg::load_config();
                     require(!loaded.ok(), "zero limit should be rejected");
                     require(loaded.code() == c::ErrorCode::InvalidArgument,
                             "invalid config is an argument error");
                     require_contains(loaded.error(), "important_files",
                                      "message should name the key");
                   }});

  tests.push_back({"config_directory_override_resolves_config_toml", [] {
                     TempDir dir;
                     dir.create_file("config.toml", "[value]\nhourly_rate = 120\n");
                     ConfigOverrideGuard guard(dir.path());
                     const auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == dir.path() / "config.toml", "config.toml expected");
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().value.hourly_rate == 120.0, "rate from file");
                   }});

  tests.push_back({"config_observability_env_override", [] {
                     TempDir dir;
                     dir.create_file("config.toml", "[observability]\nbackend = \"none\"\n");
                     ConfigOverrideGuard guard(dir.path() / "config.toml");
                     EnvGuard env("SYNMEM_OBSERVABILITY", std::string("log"));
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().observability.backend == "log", "env should win");
                   }});

  tests.push_back({"config_store_path_resolution_order", [] {
                     TempDir dir;
                     cfg::Config config;

                     {
                       EnvGuard env("SYNMEM_DIR", (dir.path() / "data").string());
                       config.store.path = (dir.path() / "ignored.db").string();
                       const auto path = cfg::store_path(config);
                       require(path.ok(), path.error());
                       require(path.value() == dir.path() / "data" / "memory.db",
                               "SYNMEM_DIR should win: " + path.value().string());
                       require(std::filesystem::is_directory(dir.path() / "data"),
                               "data dir should be created");
                     }

                     EnvGuard env("SYNMEM_DIR", std::nullopt);
                     config.store.path = (dir.path() / "nested" / "custom.db").string();
                     const auto custom = cfg::store_path(config);
                     require(custom.ok(), custom.error());
                     require(custom.value() == dir.path() / "nested" / "custom.db",
                             "configured path expected");
                     require(std::filesystem::is_directory(dir.path() / "nested"),
                             "parent should be created");

                     config.store.path = ":memory:";
                     const auto memory = cfg::store_path(config);
                     require(memory.ok() && memory.value() == ":memory:", ":memory: passes through");
                   }});
}
