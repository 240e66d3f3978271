#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "index_cache.hpp"
#include "temp_tree.hpp"

namespace
{

namespace fs = std::filesystem;
using adx::entry_origin;
using adx::test::temp_tree;

class IndexCache : public ::testing::Test
{
protected:
  void SetUp() override
  {
    m_tree.write("apps/editor.exe");
    m_tree.write("apps/tools/calc.exe");
  }

  auto roots() const -> std::vector<adx::scan_root>
  {
    return {{m_tree.path("apps"), entry_origin::extra_path}};
  }

  auto stamp(const std::vector<fs::path>& excludes = {}) const
      -> adx::fingerprint
  {
    return adx::compute_fingerprint(roots(), excludes, {"setup"});
  }

  auto cache() const -> adx::index_cache
  {
    return adx::index_cache {m_tree.path("cache/index_cache.json")};
  }

  static auto sample() -> std::vector<adx::entry>
  {
    return {
        adx::make_entry("Calc", "/apps/calc.exe", entry_origin::start_menu,
                        "/menu/Calc.lnk", "calc"),
        adx::make_entry("Editor", "/apps/editor.exe", entry_origin::extra_path,
                        "/apps/editor.exe"),
    };
  }

  temp_tree m_tree;
};

TEST_F(IndexCache, RoundTrip)
{
  const auto current = stamp();
  ASSERT_TRUE(cache().save(sample(), current));

  const auto record = cache().load(current);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->stamp, current);
  ASSERT_EQ(record->entries.size(), 2U);
  const auto& calc = record->entries[0];
  EXPECT_EQ(calc.name, "Calc");
  EXPECT_EQ(calc.normalized_name, "calc");
  EXPECT_EQ(calc.launch_target, fs::path {"/apps/calc.exe"});
  EXPECT_EQ(calc.origin, entry_origin::start_menu);
  EXPECT_EQ(calc.source_path, fs::path {"/menu/Calc.lnk"});
  EXPECT_EQ(calc.icon_name, "calc");
}

TEST_F(IndexCache, NonUtf8NamesSurviveByteForByte)
{
  auto latin1 = adx::make_entry("caf\xe9", "/opt/caf\xe9", entry_origin::program_files,
                                "/opt/caf\xe9", "ic\xf4ne");
  latin1.icon = adx::bitmap_icon {m_tree.write("cache/icons/caf\xe9.png")};
  const auto current = stamp();
  ASSERT_TRUE(cache().save({latin1}, current));

  const auto text = m_tree.read("cache/index_cache.json");
  EXPECT_NE(text.find("\"hex\":\"636166e9\""), std::string::npos);
  EXPECT_EQ(text.find("\xef\xbf\xbd"), std::string::npos);

  const auto record = cache().load(current);
  ASSERT_TRUE(record.has_value());
  ASSERT_EQ(record->entries.size(), 1U);
  const auto& loaded = record->entries[0];
  EXPECT_EQ(loaded.name, "caf\xe9");
  EXPECT_EQ(loaded.normalized_name, latin1.normalized_name);
  EXPECT_EQ(loaded.launch_target, fs::path {"/opt/caf\xe9"});
  EXPECT_EQ(loaded.source_path, fs::path {"/opt/caf\xe9"});
  EXPECT_EQ(loaded.icon_name, "ic\xf4ne");
  EXPECT_EQ(loaded.icon, latin1.icon);
}

TEST_F(IndexCache, DamagedHexIsAMiss)
{
  const auto current = stamp();
  ASSERT_TRUE(cache().save({adx::make_entry("caf\xe9", "/opt/app",
                                            entry_origin::program_files)},
                           current));
  auto text = m_tree.read("cache/index_cache.json");
  const auto pos = text.find("636166e9");
  ASSERT_NE(pos, std::string::npos);
  text.replace(pos, 8, "63616");
  m_tree.write("cache/index_cache.json", text);
  EXPECT_FALSE(cache().load(current).has_value());
}

TEST_F(IndexCache, FingerprintIsStable)
{
  EXPECT_EQ(stamp(), stamp());
  EXPECT_EQ(stamp().directory_count, 2U);
}

TEST_F(IndexCache, NewDirectoryInvalidates)
{
  const auto before = stamp();
  ASSERT_TRUE(cache().save(sample(), before));

  m_tree.dir("apps/newly-installed");
  const auto after = stamp();
  EXPECT_NE(after, before);
  EXPECT_FALSE(cache().load(after).has_value());
}

TEST_F(IndexCache, ConfigurationIsPartOfTheFingerprint)
{
  EXPECT_NE(stamp(), stamp({m_tree.path("apps/tools")}));
  EXPECT_NE(adx::compute_fingerprint(roots(), {}, {"setup"}),
            adx::compute_fingerprint(roots(), {}, {"update"}));

  auto moved = roots();
  moved[0].origin = entry_origin::program_files;
  EXPECT_NE(adx::compute_fingerprint(moved, {}, {"setup"}), stamp());
}

TEST_F(IndexCache, MissingRootStillFingerprints)
{
  const std::vector<adx::scan_root> absent {
      {m_tree.path("nowhere"), entry_origin::start_menu}};
  const auto first = adx::compute_fingerprint(absent, {}, {});
  EXPECT_EQ(first.directory_count, 0U);
  m_tree.dir("nowhere");
  EXPECT_NE(adx::compute_fingerprint(absent, {}, {}), first);
}

TEST_F(IndexCache, CorruptFilesAreMisses)
{
  const auto current = stamp();
  for (const std::string content :
       {"", "{", "[]", "{\"schema\": 1}", "not json at all",
        "{\"schema\":1,\"fingerprint\":{\"digest\":\"zz\",\"directories\":2},"
        "\"entries\":[]}",
        "{\"schema\":1,\"fingerprint\":{\"digest\":\"0\",\"directories\":2},"
        "\"entries\":[{\"name\":3}]}"})
  {
    m_tree.write("cache/index_cache.json", content);
    EXPECT_FALSE(cache().load(current).has_value()) << content;
  }
}

TEST_F(IndexCache, SchemaMismatchIsAMiss)
{
  const auto current = stamp();
  ASSERT_TRUE(cache().save(sample(), current));
  auto text = m_tree.read("cache/index_cache.json");
  const auto pos = text.find("\"schema\":1");
  ASSERT_NE(pos, std::string::npos);
  text.replace(pos, 10, "\"schema\":2");
  m_tree.write("cache/index_cache.json", text);
  EXPECT_FALSE(cache().load(current).has_value());
}

TEST_F(IndexCache, MissingFileIsAMiss)
{
  EXPECT_FALSE(cache().load(stamp()).has_value());
}

TEST_F(IndexCache, SaveIsAtomicAndIdempotent)
{
  const auto current = stamp();
  ASSERT_TRUE(cache().save(sample(), current));
  const auto first = m_tree.read("cache/index_cache.json");
  ASSERT_TRUE(cache().save(sample(), current));
  EXPECT_EQ(m_tree.read("cache/index_cache.json"), first);

  std::vector<std::string> files;
  for (const auto& item : fs::directory_iterator {m_tree.path("cache")}) {
    files.push_back(item.path().filename().string());
  }
  EXPECT_EQ(files, (std::vector<std::string> {"index_cache.json"}));
}

TEST_F(IndexCache, BitmapsSurviveOnlyWhileTheFileExists)
{
  const auto image = m_tree.write("cache/icons/abc.png");
  auto entries = sample();
  entries[0].icon = adx::bitmap_icon {image};
  const auto current = stamp();
  ASSERT_TRUE(cache().save(entries, current));

  auto record = cache().load(current);
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->entries[0].icon, adx::icon_reference {adx::bitmap_icon {image}});
  EXPECT_TRUE(std::holds_alternative<adx::placeholder_icon>(record->entries[1].icon));

  fs::remove(image);
  record = cache().load(current);
  ASSERT_TRUE(record.has_value());
  const auto* placeholder =
      std::get_if<adx::placeholder_icon>(&record->entries[0].icon);
  ASSERT_NE(placeholder, nullptr);
  EXPECT_EQ(placeholder->letter, "C");
}

TEST_F(IndexCache, UnwritableLocationFails)
{
  m_tree.write("blocker", "file, not a directory");
  const adx::index_cache blocked {m_tree.path("blocker/index_cache.json")};
  EXPECT_FALSE(blocked.save(sample(), stamp()));
}

}  // namespace
