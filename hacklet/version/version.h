#pragma once

#include <string>

namespace hacklet::version {

    extern const std::string app_name;
    extern const std::string app_ver;
}
