#pragma once
#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string_view>

namespace quasar
{

  // Backing configuration of a Store: a JSON file, or memory-only.
  class Env
  {
  public:
    static constexpr std::string_view kMemoryPath = ":memory:";

    // memory-only
    Env() = default;
    // an empty path or ":memory:" is memory-only
    explicit Env(const std::filesystem::path &path);

    static Env memory() { return Env{}; }

    bool memoryOnly() const { return !path_.has_value(); }
    // empty when memory-only
    std::filesystem::path path() const;

    // nullopt when memory-only or the file does not exist yet
    std::optional<Value> read() const;
    // no-op when memory-only
    void write(const Value &doc) const;

    static Value readFile(const std::filesystem::path &path);
    // writes <path>.tmp, then renames it over path
    static void writeFile(const std::filesystem::path &path, const Value &doc);

  private:
    std::optional<std::filesystem::path> path_{};
  };

} // namespace quasar
