#include "env.hpp"
#include "errors.hpp"
#include <fstream>
#include <string>
#include <system_error>
#include <kj/debug.h>

namespace quasar
{

  namespace fs = std::filesystem;

  Env::Env(const fs::path &path)
  {
    if (!path.empty() && path.native() != kMemoryPath)
      path_ = path;
  }

  fs::path Env::path() const
  {
    return path_.value_or(fs::path{});
  }

  std::optional<Value> Env::read() const
  {
    if (!path_)
      return std::nullopt;
    std::error_code ec;
    bool present = fs::exists(*path_, ec);
    if (ec)
      throw PersistenceError("cannot stat " + path_->string() + ": " + ec.message());
    if (!present)
    {
      KJ_LOG(INFO, "no graph file yet, starting empty", path_->c_str());
      return std::nullopt;
    }
    return readFile(*path_);
  }

  void Env::write(const Value &doc) const
  {
    if (path_)
      writeFile(*path_, doc);
  }

  Value Env::readFile(const fs::path &path)
  {
    std::ifstream in(path, std::ios::binary);
    if (!in)
      throw PersistenceError("cannot open " + path.string() + " for reading");
    try
    {
      return Value::parse(in);
    }
    catch (const nlohmann::json::parse_error &e)
    {
      throw PersistenceError("invalid JSON in " + path.string() + ": " + e.what());
    }
  }

  void Env::writeFile(const fs::path &path, const Value &doc)
  {
    std::error_code ec;
    if (path.has_parent_path())
    {
      fs::create_directories(path.parent_path(), ec);
      if (ec)
        throw PersistenceError("cannot create " + path.parent_path().string() + ": " + ec.message());
    }

    // replace invalid UTF-8 instead of failing halfway through a dump
    std::string data = doc.dump(2, ' ', false, Value::error_handler_t::replace);

    fs::path tmp = path;
    tmp += ".tmp";
    {
      std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
      if (!out)
        throw PersistenceError("cannot open " + tmp.string() + " for writing");
      out << data << '\n';
      out.flush();
      if (!out)
        throw PersistenceError("short write to " + tmp.string());
    }

    fs::rename(tmp, path, ec);
    if (ec)
    {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throw PersistenceError("cannot replace " + path.string() + ": " + ec.message());
    }
  }

} // namespace quasar
