#pragma once

#include "config/config.pb.h"
#include "execmon/v1/execution.pb.h"

namespace execmon::v1 {
using RuntimeConfig = ::execmon::runtime::config::RuntimeConfig;
}
