#pragma once
#include <string>
#include "domain/Settings.hpp"

namespace burrow::host::application::ports {

struct IConfigProvider {
    virtual ~IConfigProvider() = default;
    virtual burrow::host::domain::Settings load_or_create(const std::string& path) = 0;
};

} // namespace burrow::host::application::ports
