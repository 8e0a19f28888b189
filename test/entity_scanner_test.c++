#include "test_common.h++"
#include "services/entity_scanner.h++"
#include <catch2/matchers/catch_matchers_string.hpp>

using Catch::Matchers::ContainsSubstring;

static auto type_names(const vector<Table>& tables) -> vector<string> {
  vector<string> out;
  for (const auto& t : tables) out.push_back(t.type_name());
  return out;
}

TEST_CASE("resolve explicit table list", "[scanner]") {
  EntityScanner scanner(TypeCatalog::global());
  const auto tables = scanner.resolve({ "test.Log", "test.User", "test.Log" });
  CHECK(type_names(tables) == vector<string>{"test.Log", "test.User"});
}

TEST_CASE("explicit list with an unknown type", "[scanner]") {
  EntityScanner scanner(TypeCatalog::global());
  try {
    scanner.resolve({ "test.User", "test.Missing" });
    FAIL("resolve should have thrown");
  } catch (const UnknownTable& e) {
    CHECK(e.type_name() == "test.Missing");
  }
}

TEST_CASE("explicit list with a type that is not a table", "[scanner]") {
  EntityScanner scanner(TypeCatalog::global());
  try {
    scanner.resolve({ "test.Helper" });
    FAIL("resolve should have thrown");
  } catch (const UnknownTable& e) {
    CHECK(e.type_name() == "test.Helper");
    CHECK_THAT(e.what(), ContainsSubstring("not a table"));
  }
}

TEST_CASE("unknown table in lmdb config constructs no database", "[scanner][lmdb]") {
  TempDir dir;
  PluginContext ctx { .name = "shop", .data_dir = dir.path };
  const ConfigValue conn(ConfigMapping{
    {"file", "sub/shop.mdb"},
    {"tables", ConfigSequence{"test.User", "test.Missing"}}
  });
  try {
    ProviderRegistry::global().resolve("lmdb", ctx, std::cref(conn.as_mapping()));
    FAIL("resolve should have thrown");
  } catch (const UnknownTable& e) {
    CHECK(e.type_name() == "test.Missing");
  }
  CHECK(!std::filesystem::exists(dir.path / "sub"));
}

TEST_CASE("autoscan keeps loadable table types in discovery order", "[scanner]") {
  EntityScanner scanner(TypeCatalog::global());
  const StaticCodeSource source({ "test.Audit", "test.Helper", "test.Unloadable", "test.User" });
  CHECK(type_names(scanner.autoscan(source)) == vector<string>{"test.Audit", "test.User"});
}

TEST_CASE("autoscan package filter", "[scanner]") {
  TypeCatalog catalog;
  catalog.add_record<TestUser>();
  catalog.add({ "other.Thing", Table("other.Thing", "things", {}) });
  EntityScanner scanner(catalog);
  const StaticCodeSource source({ "other.Thing", "test.User" });
  CHECK(type_names(scanner.autoscan(source, "test.")) == vector<string>{"test.User"});
  CHECK(type_names(scanner.autoscan(source)).size() == 2);
}

TEST_CASE("autoscan returns no duplicates across manifest includes", "[scanner][manifest]") {
  TempDir dir;
  write_file(dir.path / "root.manifest",
    "# root manifest\n"
    "test.User\n"
    "@include models/a.manifest\n"
    "@include models/b.manifest\n"
    "test.User  # listed twice\n"
  );
  std::filesystem::create_directories(dir.path / "models");
  write_file(dir.path / "models" / "a.manifest", "test.Log\ntest.User\n@include b.manifest\n");
  write_file(dir.path / "models" / "b.manifest", "\n  test.Log\ntest.Audit\n@include ../root.manifest\n");

  const ManifestCodeSource source(dir.path / "root.manifest");
  const auto names = source.type_names();
  CHECK(std::count(names.begin(), names.end(), "test.User") >= 2);

  EntityScanner scanner(TypeCatalog::global());
  CHECK(type_names(scanner.autoscan(source)) == vector<string>{"test.User", "test.Log", "test.Audit"});
}

TEST_CASE("missing manifest", "[scanner][manifest]") {
  const ManifestCodeSource source("/nonexistent/types.manifest");
  CHECK_THROWS_AS(source.type_names(), ScanIOFailure);
}

TEST_CASE("missing included manifest", "[scanner][manifest]") {
  TempDir dir;
  write_file(dir.path / "root.manifest", "test.User\n@include gone.manifest\n");
  const ManifestCodeSource source(dir.path / "root.manifest");
  CHECK_THROWS_AS(source.type_names(), ScanIOFailure);
}

TEST_CASE("malformed manifest line", "[scanner][manifest]") {
  TempDir dir;
  write_file(dir.path / "root.manifest", "test.User\nnot a type name\n");
  const ManifestCodeSource source(dir.path / "root.manifest");
  try {
    source.type_names();
    FAIL("type_names should have thrown");
  } catch (const ScanIOFailure& e) {
    CHECK_THAT(e.what(), ContainsSubstring("root.manifest:2"));
  }
  write_file(dir.path / "empty_include.manifest", "@include\n");
  CHECK_THROWS_AS(ManifestCodeSource(dir.path / "empty_include.manifest").type_names(), ScanIOFailure);
}

TEST_CASE("scan tables from config", "[scanner]") {
  SECTION("explicit mode needs no context") {
    ScanConfig cfg { .tables = { "test.User" } };
    CHECK(type_names(scan_tables({}, cfg)) == vector<string>{"test.User"});
  }
  SECTION("autoscan needs a code source") {
    ScanConfig cfg { .autoscan = true };
    CHECK_THROWS_AS(scan_tables({}, cfg), ConfigError);
    PluginContext ctx { .name = "shop" };
    CHECK_THROWS_AS(scan_tables(ctx, cfg), ConfigError);
  }
  SECTION("autoscan uses the context's code source and catalog") {
    auto catalog = make_shared<TypeCatalog>();
    catalog->add_record<TestLog>();
    PluginContext ctx {
      .name = "shop",
      .code_source = make_shared<StaticCodeSource>(vector<string>{ "test.User", "test.Log" }),
      .types = catalog
    };
    ScanConfig cfg { .autoscan = true };
    CHECK(type_names(scan_tables(ctx, cfg)) == vector<string>{"test.Log"});
  }
}
