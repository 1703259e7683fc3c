#include <catch2/catch.hpp>

#include <optional>
#include <string>

#include "pgvec/config.hpp"
#include "pgvec/core/platform_utils.hpp"
#include "tests/support/codec_test_helpers.hpp"

using pgvec::load_codec_config_from_env;
using pgvec::core::error_code;
using test_support::set_env_var;
using test_support::unset_env_var;

namespace {

struct EnvGuard {
  EnvGuard() { clear(); }
  ~EnvGuard() { clear(); }
  static void clear() {
    unset_env_var("PGVEC_SCHEMA");
    unset_env_var("PGVEC_SPARSE_ASCENDING");
  }
};

} // namespace

TEST_CASE("defaults when nothing is set", "[config]") {
  EnvGuard guard;
  auto cfg = load_codec_config_from_env();
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->schema == "public");
  REQUIRE_FALSE(cfg->sparse_require_ascending);
  REQUIRE_FALSE(pgvec::sparse_decode_options(*cfg).require_ascending_indices);
}

TEST_CASE("environment overrides", "[config]") {
  EnvGuard guard;
  set_env_var("PGVEC_SCHEMA", "vec_store");
  set_env_var("PGVEC_SPARSE_ASCENDING", "true");
  auto cfg = load_codec_config_from_env();
  REQUIRE(cfg.has_value());
  REQUIRE(cfg->schema == "vec_store");
  REQUIRE(cfg->sparse_require_ascending);
  REQUIRE(pgvec::sparse_decode_options(*cfg).require_ascending_indices);
}

TEST_CASE("malformed values are config_invalid", "[config][errors]") {
  EnvGuard guard;
  SECTION("schema") {
    set_env_var("PGVEC_SCHEMA", "public; drop table x");
    auto cfg = load_codec_config_from_env();
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == error_code::config_invalid);
    REQUIRE(cfg.error().component == "config");
  }
  SECTION("boolean") {
    set_env_var("PGVEC_SPARSE_ASCENDING", "maybe");
    auto cfg = load_codec_config_from_env();
    REQUIRE_FALSE(cfg.has_value());
    REQUIRE(cfg.error().code == error_code::config_invalid);
  }
}

TEST_CASE("sql identifier check", "[config]") {
  REQUIRE(pgvec::is_sql_identifier("public"));
  REQUIRE(pgvec::is_sql_identifier("_v2"));
  REQUIRE_FALSE(pgvec::is_sql_identifier(""));
  REQUIRE_FALSE(pgvec::is_sql_identifier("2fast"));
  REQUIRE_FALSE(pgvec::is_sql_identifier("a-b"));
}

TEST_CASE("env flag parsing", "[config][env]") {
  const char* key = "PGVEC_TEST_FLAG";
  unset_env_var(key);
  REQUIRE_FALSE(pgvec::core::env_flag_enabled(key));
  set_env_var(key, "1");
  REQUIRE(pgvec::core::env_flag_enabled(key));
  set_env_var(key, "0");
  REQUIRE_FALSE(pgvec::core::env_flag_enabled(key));
  unset_env_var(key);
}

TEST_CASE("read_env distinguishes unset from empty", "[config][env]") {
  const char* key = "PGVEC_TEST_VALUE";
  unset_env_var(key);
  REQUIRE_FALSE(pgvec::core::read_env(key).has_value());
  REQUIRE_FALSE(pgvec::core::read_env("").has_value());
  REQUIRE_FALSE(pgvec::core::read_env(nullptr).has_value());
  set_env_var(key, "");
  auto empty = pgvec::core::read_env(key);
  REQUIRE(empty.has_value());
  REQUIRE(empty->empty());
  REQUIRE_FALSE(pgvec::core::env_flag_enabled(key));
  set_env_var(key, "abc");
  REQUIRE(pgvec::core::read_env(key) == std::optional<std::string>{"abc"});
  unset_env_var(key);
}
