#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "program_index.hpp"

namespace
{

auto make_entries(const std::vector<std::string>& names) -> std::vector<adx::entry>
{
  std::vector<adx::entry> entries;
  for (const auto& name : names) {
    entries.push_back(
        adx::make_entry(name, "/apps/" + name, adx::entry_origin::extra_path));
  }
  return entries;
}

auto names_of(const adx::program_index& index) -> std::vector<std::string>
{
  std::vector<std::string> out;
  for (const auto& item : index.entries()) {
    out.push_back(item.name);
  }
  return out;
}

auto alphabet() -> std::vector<std::string>
{
  std::vector<std::string> names;
  for (char letter = 'a'; letter <= 'z'; ++letter) {
    names.emplace_back(1, letter);
  }
  return names;
}

TEST(ProgramIndex, AlphabeticalIsCaseInsensitive)
{
  const adx::program_index index {
      make_entries({"banana", "Apple", "cherry", "apple pie", "Zed", "eMacs"}),
      adx::sort_order::alphabetical};
  EXPECT_EQ(names_of(index),
            (std::vector<std::string> {
                "Apple", "apple pie", "banana", "cherry", "eMacs", "Zed"}));
}

TEST(ProgramIndex, RandomOrderIsStableWithinABuild)
{
  const adx::program_index index {
      make_entries(alphabet()), adx::sort_order::random, 42};
  const auto first = names_of(index);
  EXPECT_EQ(names_of(index), first);
  EXPECT_EQ(index.size(), 26U);
  EXPECT_EQ(index.seed(), 42U);
}

TEST(ProgramIndex, RandomOrderDependsOnlyOnSeed)
{
  auto reversed = alphabet();
  std::reverse(reversed.begin(), reversed.end());
  const adx::program_index forward {
      make_entries(alphabet()), adx::sort_order::random, 7};
  const adx::program_index backward {
      make_entries(reversed), adx::sort_order::random, 7};
  EXPECT_EQ(names_of(forward), names_of(backward));
}

TEST(ProgramIndex, RandomOrderDiffersAcrossBuilds)
{
  const adx::program_index first {
      make_entries(alphabet()), adx::sort_order::random, 1};
  const adx::program_index second {
      make_entries(alphabet()), adx::sort_order::random, 2};
  EXPECT_NE(names_of(first), names_of(second));

  auto sorted = names_of(first);
  std::sort(sorted.begin(), sorted.end());
  EXPECT_EQ(sorted, alphabet());
}

TEST(IndexPublisher, StartsEmpty)
{
  const adx::index_publisher publisher;
  ASSERT_NE(publisher.current(), nullptr);
  EXPECT_TRUE(publisher.current()->empty());
  EXPECT_EQ(publisher.generation(), 0U);
}

TEST(IndexPublisher, SwapKeepsOldSnapshotsReadable)
{
  adx::index_publisher publisher;
  publisher.publish(std::make_shared<const adx::program_index>(
      make_entries({"one", "two"}), adx::sort_order::alphabetical));
  const auto held = publisher.current();

  publisher.publish(std::make_shared<const adx::program_index>(
      make_entries({"three"}), adx::sort_order::alphabetical));
  EXPECT_EQ(publisher.generation(), 2U);
  EXPECT_EQ(publisher.current()->size(), 1U);
  ASSERT_EQ(held->size(), 2U);
  EXPECT_EQ(held->entries()[0].name, "one");
}

TEST(IndexPublisher, IgnoresNull)
{
  adx::index_publisher publisher;
  publisher.publish(nullptr);
  EXPECT_NE(publisher.current(), nullptr);
  EXPECT_EQ(publisher.generation(), 0U);
}

}  // namespace
