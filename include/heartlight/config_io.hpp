#pragma once

#include "config.hpp"

namespace heartlight {

bool load_config(const char* path, Config& cfg);
bool save_config(const char* path, const Config& cfg);

}
