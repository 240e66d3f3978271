#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace adx::test
{

// Scratch directory removed on destruction.
class temp_tree
{
public:
  temp_tree()
  {
    static std::atomic<unsigned> counter {0};
    std::random_device device;
    m_root = std::filesystem::temp_directory_path()
        / fmt::format("appdex-test-{:08x}-{}", device(), counter++);
    std::filesystem::create_directories(m_root);
  }

  ~temp_tree()
  {
    std::error_code error;
    std::filesystem::remove_all(m_root, error);
  }

  temp_tree(const temp_tree&) = delete;
  temp_tree(temp_tree&&) = delete;
  auto operator=(const temp_tree&) -> temp_tree& = delete;
  auto operator=(temp_tree&&) -> temp_tree& = delete;

  auto root() const -> const std::filesystem::path& { return m_root; }

  auto path(std::string_view relative) const -> std::filesystem::path
  {
    return m_root / std::filesystem::u8path(std::string {relative});
  }

  auto dir(std::string_view relative) const -> std::filesystem::path
  {
    auto result = path(relative);
    std::filesystem::create_directories(result);
    return result;
  }

  auto write(std::string_view relative, std::string_view content = "x") const
      -> std::filesystem::path
  {
    auto result = path(relative);
    std::filesystem::create_directories(result.parent_path());
    std::ofstream out {result, std::ios::binary | std::ios::trunc};
    out << content;
    return result;
  }

  auto executable(std::string_view relative,
                  std::string_view content = "#!/bin/sh\n") const
      -> std::filesystem::path
  {
    auto result = write(relative, content);
    std::filesystem::permissions(result,
                                 std::filesystem::perms::owner_exec
                                     | std::filesystem::perms::group_exec
                                     | std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::add);
    return result;
  }

  auto read(std::string_view relative) const -> std::string
  {
    return read_file(path(relative));
  }

  static auto read_file(const std::filesystem::path& file) -> std::string
  {
    std::ifstream in {file, std::ios::binary};
    return {std::istreambuf_iterator<char> {in},
            std::istreambuf_iterator<char> {}};
  }

private:
  std::filesystem::path m_root;
};

}  // namespace adx::test
