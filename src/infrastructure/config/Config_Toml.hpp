#pragma once
#include <string>

#include "application/ports/IConfigProvider.hpp"

namespace boost
{
namespace filesystem
{
class path;
}
}  // namespace boost

namespace burrow::host::infrastructure::config
{

class Config_Toml : public burrow::host::application::ports::IConfigProvider
{
 public:
  burrow::host::domain::Settings load_or_create(const std::string& path) override;

 private:
  static void write_default(const boost::filesystem::path& path, burrow::host::domain::Settings& s);
};

}  // namespace burrow::host::infrastructure::config
