#pragma once

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace burrow::host::shared::text
{

// -----------------------------------------------------------------------------
// to_lower(s)
// -----------------------------------------------------------------------------
inline std::string to_lower(std::string_view s)
{
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

// -----------------------------------------------------------------------------
// split_ws(s)
//  - Splits on runs of whitespace; never yields empty tokens.
// -----------------------------------------------------------------------------
inline std::vector<std::string> split_ws(const std::string& s)
{
  std::vector<std::string> out;
  std::istringstream iss(s);
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

// -----------------------------------------------------------------------------
// split(s, sep)
//  - Keeps empty fields: "a::b" -> {"a", "", "b"}.
// -----------------------------------------------------------------------------
inline std::vector<std::string> split(std::string_view s, char sep)
{
  std::vector<std::string> out;
  size_t start = 0;
  while (true)
  {
    const size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos)
    {
      out.emplace_back(s.substr(start));
      break;
    }
    out.emplace_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

// -----------------------------------------------------------------------------
// join(parts, sep)
// -----------------------------------------------------------------------------
inline std::string join(const std::vector<std::string>& parts, std::string_view sep)
{
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i)
  {
    if (i) out.append(sep);
    out.append(parts[i]);
  }
  return out;
}

}  // namespace burrow::host::shared::text
