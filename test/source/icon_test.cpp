#include <cstdlib>
#include <memory>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "icon.hpp"
#include "temp_tree.hpp"

namespace
{

namespace fs = std::filesystem;
using adx::entry_origin;
using adx::test::temp_tree;

TEST(Placeholder, LetterAndColorFollowTheName)
{
  const auto visual = adx::icon_resolver::placeholder_for("visual studio");
  EXPECT_EQ(visual.letter, "V");
  EXPECT_NE(visual.color, 0U);
  EXPECT_EQ(adx::icon_resolver::placeholder_for("visual studio"), visual);

  EXPECT_EQ(adx::icon_resolver::placeholder_for("  7zip").letter, "7");
  EXPECT_EQ(adx::icon_resolver::placeholder_for("@@@").letter, "?");
  EXPECT_EQ(adx::icon_resolver::placeholder_for("").letter, "?");
}

TEST(Placeholder, LetterIsTheFirstAlphanumericCodePoint)
{
  // "Émile" -> "É"
  EXPECT_EQ(adx::icon_resolver::placeholder_for("\xc3\x89mile").letter,
            "\xc3\x89");
  // "élan" -> "É"
  EXPECT_EQ(adx::icon_resolver::placeholder_for("\xc3\xa9lan").letter,
            "\xc3\x89");
  // "«ωmega»" -> "Ω"
  EXPECT_EQ(adx::icon_resolver::placeholder_for("\xc2\xab\xcf\x89mega\xc2\xbb").letter,
            "\xce\xa9");
  // stray Latin-1 bytes are skipped
  EXPECT_EQ(adx::icon_resolver::placeholder_for("\xe9t\xe9").letter, "T");
}

TEST(IconLocation, SplitsNumericIndexSuffix)
{
  const auto exe = adx::parse_icon_location("C:\\Program Files\\App\\app.exe,0");
  EXPECT_EQ(exe.file, fs::path {"C:\\Program Files\\App\\app.exe"});
  EXPECT_EQ(exe.index, 0);

  const auto dll = adx::parse_icon_location("/lib/shell32.dll,-101");
  EXPECT_EQ(dll.file, fs::path {"/lib/shell32.dll"});
  EXPECT_EQ(dll.index, -101);

  const auto comma = adx::parse_icon_location("/icons/a,b.png");
  EXPECT_EQ(comma.file, fs::path {"/icons/a,b.png"});
  EXPECT_EQ(comma.index, 0);

  const auto plain = adx::parse_icon_location("/icons/app.png");
  EXPECT_EQ(plain.file, fs::path {"/icons/app.png"});
  EXPECT_EQ(plain.index, 0);
}

TEST(IconExtractor, DefaultMatchesThePlatform)
{
  const auto extractor = adx::make_default_icon_extractor(32);
  ASSERT_NE(extractor, nullptr);
#ifdef _WIN32
  EXPECT_NE(dynamic_cast<const adx::shell_icon_extractor*>(extractor.get()), nullptr);
#else
  EXPECT_NE(dynamic_cast<const adx::theme_icon_extractor*>(extractor.get()), nullptr);
#endif
}

class ThemeLookup : public ::testing::Test
{
protected:
  auto extractor(std::uint16_t size = 32) const -> adx::theme_icon_extractor
  {
    return adx::theme_icon_extractor {
        size, {m_tree.path("icons")}, {m_tree.path("pixmaps")}};
  }

  temp_tree m_tree;
};

TEST_F(ThemeLookup, PrefersRequestedSize)
{
  m_tree.write("icons/hicolor/48x48/apps/editor.png");
  const auto wanted = m_tree.write("icons/hicolor/32x32/apps/editor.png");
  auto item = adx::make_entry("Editor", "/nowhere/ed", entry_origin::start_menu);
  item.icon_name = "editor";
  EXPECT_EQ(extractor(32).locate(item), wanted);
  EXPECT_EQ(extractor(48).locate(item),
            m_tree.path("icons/hicolor/48x48/apps/editor.png"));
}

TEST_F(ThemeLookup, FallsBackToScalableAndPixmaps)
{
  const auto svg = m_tree.write("icons/hicolor/scalable/apps/draw.svg");
  const auto xpm = m_tree.write("pixmaps/tool.xpm");
  auto draw = adx::make_entry("Draw", "/nowhere/draw", entry_origin::start_menu);
  draw.icon_name = "draw";
  auto tool = adx::make_entry("Tool", "/nowhere/tool", entry_origin::start_menu);
  tool.icon_name = "tool";
  EXPECT_EQ(extractor().locate(draw), svg);
  EXPECT_EQ(extractor().locate(tool), xpm);
}

TEST_F(ThemeLookup, AbsoluteHintWithIndex)
{
  const auto ico = m_tree.write("img/app.ico");
  auto item = adx::make_entry("App", "/nowhere/app.exe", entry_origin::start_menu);
  item.icon_name = ico.u8string() + ",0";
  EXPECT_EQ(extractor().locate(item), ico);
}

TEST_F(ThemeLookup, ImageBesideTheProgram)
{
  const auto program = m_tree.write("apps/prog.exe");
  const auto image = m_tree.write("apps/prog.png");
  const auto item =
      adx::make_entry("Prog", program, entry_origin::program_files, program);
  EXPECT_EQ(extractor().locate(item), image);
}

TEST_F(ThemeLookup, ProgramStemInTheme)
{
  const auto image = m_tree.write("icons/hicolor/64x64/apps/gimp.png");
  const auto item =
      adx::make_entry("GIMP", "/usr/bin/GIMP", entry_origin::program_files);
  EXPECT_EQ(extractor().locate(item), image);
}

TEST_F(ThemeLookup, NothingFound)
{
  const auto item =
      adx::make_entry("Ghost", "/nowhere/ghost", entry_origin::extra_path);
  EXPECT_FALSE(extractor().locate(item).has_value());
}

TEST_F(ThemeLookup, ResolverCopiesIntoCache)
{
  m_tree.write("icons/hicolor/32x32/apps/editor.png", "png-bytes");
  auto item = adx::make_entry("Editor", "/nowhere/ed", entry_origin::start_menu);
  item.icon_name = "editor";

  const adx::icon_resolver resolver {
      m_tree.path("cache"),
      std::make_unique<adx::theme_icon_extractor>(
          32,
          std::vector<fs::path> {m_tree.path("icons")},
          std::vector<fs::path> {})};
  const auto icon = resolver.resolve(item);
  const auto* bitmap = std::get_if<adx::bitmap_icon>(&icon);
  ASSERT_NE(bitmap, nullptr);
  EXPECT_EQ(bitmap->path,
            m_tree.path("cache") / (adx::icon_cache_stem(item) + ".png"));
  EXPECT_EQ(temp_tree::read_file(bitmap->path), "png-bytes");
  EXPECT_EQ(resolver.resolve(item), icon);

  const auto ghost =
      adx::make_entry("Ghost", "/nowhere/ghost", entry_origin::extra_path);
  EXPECT_EQ(resolver.resolve(ghost),
            adx::icon_reference {adx::icon_resolver::placeholder_for("Ghost")});
}

TEST(IconResolver, PruneKeepsReferencedImages)
{
  const temp_tree tree;
  const auto kept = tree.write("cache/aaaa.png");
  const auto stale = tree.write("cache/bbbb.png");
  const auto other = tree.write("cache/index_cache.json", "{}");

  auto item = adx::make_entry("A", "/a", entry_origin::extra_path);
  item.icon = adx::bitmap_icon {kept};
  const adx::icon_resolver resolver {tree.path("cache"), nullptr};
  EXPECT_EQ(resolver.prune({item}), 1U);
  EXPECT_TRUE(fs::exists(kept));
  EXPECT_FALSE(fs::exists(stale));
  EXPECT_TRUE(fs::exists(other));
}

class throwing_extractor final : public adx::icon_extractor
{
public:
  auto extract(const adx::entry& item, const fs::path& /*destination_stem*/) const
      -> std::optional<fs::path> override
  {
    throw fs::filesystem_error {
        "unreadable",
        item.launch_target,
        std::make_error_code(std::errc::permission_denied)};
  }
};

TEST(IconResolver, ExtractionFailureFallsBackToPlaceholder)
{
  const temp_tree tree;
  const adx::icon_resolver resolver {tree.path("cache"),
                                     std::make_unique<throwing_extractor>()};
  const auto item = adx::make_entry("Broken", "/b", entry_origin::extra_path);
  const auto icon = resolver.resolve(item);
  ASSERT_TRUE(std::holds_alternative<adx::placeholder_icon>(icon));
  EXPECT_EQ(std::get<adx::placeholder_icon>(icon).letter, "B");
}

TEST(IconResolver, CacheStemDependsOnTarget)
{
  const auto first = adx::make_entry("Same", "/one", entry_origin::extra_path);
  const auto second = adx::make_entry("Same", "/two", entry_origin::extra_path);
  EXPECT_NE(adx::icon_cache_stem(first), adx::icon_cache_stem(second));
  EXPECT_EQ(adx::icon_cache_stem(first).size(), 16U);
}

#ifdef _WIN32
auto system_file(const char* name) -> fs::path
{
  const char* root = std::getenv("SystemRoot");
  return fs::path {root != nullptr ? root : "C:\\Windows"} / "System32" / name;
}

auto is_png(const fs::path& file) -> bool
{
  return temp_tree::read_file(file).substr(0, 4) == "\x89PNG";
}

TEST(ShellIcon, ProgramIconBecomesPng)
{
  const temp_tree tree;
  const auto notepad = system_file("notepad.exe");
  const auto item =
      adx::make_entry("Notepad", notepad, entry_origin::start_menu, notepad);
  const adx::shell_icon_extractor extractor {32};
  const auto written = extractor.extract(item, tree.path("notepad"));
  ASSERT_TRUE(written.has_value());
  EXPECT_EQ(*written, tree.path("notepad.png"));
  EXPECT_TRUE(is_png(*written));
}

TEST(ShellIcon, IndexedHintNamesTheIconFile)
{
  const temp_tree tree;
  auto item = adx::make_entry(
      "Shortcut", tree.write("apps/tool.exe"), entry_origin::start_menu);
  item.icon_name = system_file("shell32.dll").u8string() + ",3";
  const adx::shell_icon_extractor extractor {48};
  const auto written = extractor.extract(item, tree.path("tool"));
  ASSERT_TRUE(written.has_value());
  EXPECT_TRUE(is_png(*written));
}
#endif

}  // namespace
