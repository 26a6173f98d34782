#include "version.h"

#ifndef HACKLET_APP_NAME
#define HACKLET_APP_NAME "hacklet"
#endif

#ifndef HACKLET_APP_VER
#define HACKLET_APP_VER "0.1.0"
#endif

const std::string hacklet::version::app_name = HACKLET_APP_NAME;
const std::string hacklet::version::app_ver = HACKLET_APP_VER;
