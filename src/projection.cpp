#include "projection.hpp"
#include <charconv>

namespace quasar
{

  static const Value *step_into(const Value &cur, std::string_view segment)
  {
    if (cur.is_object())
    {
      auto it = cur.find(std::string(segment));
      return it == cur.end() ? nullptr : &*it;
    }
    if (cur.is_array())
    {
      size_t idx = 0;
      const char *b = segment.data();
      const char *e = segment.data() + segment.size();
      auto res = std::from_chars(b, e, idx);
      if (segment.empty() || res.ec != std::errc{} || res.ptr != e || idx >= cur.size())
        return nullptr;
      return &cur[idx];
    }
    return nullptr;
  }

  const Value *resolveField(const Value &mapping, std::string_view field)
  {
    if (!mapping.is_object())
      return nullptr;
    auto exact = mapping.find(std::string(field));
    if (exact != mapping.end())
      return &*exact;
    if (field.find('.') == std::string_view::npos)
      return nullptr;

    const Value *cur = &mapping;
    size_t start = 0;
    while (cur != nullptr)
    {
      size_t dot = field.find('.', start);
      auto segment = field.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start);
      cur = step_into(*cur, segment);
      if (dot == std::string_view::npos)
        break;
      start = dot + 1;
    }
    return cur;
  }

  Value project(const Value &mapping, const std::vector<std::string> &fields)
  {
    if (fields.empty())
      return mapping;
    Value out = Value::object();
    for (const auto &f : fields)
    {
      if (const Value *v = resolveField(mapping, f))
        out[f] = *v;
    }
    return out;
  }

} // namespace quasar
