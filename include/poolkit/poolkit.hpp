#pragma once

#include "poolkit/api/factory.hpp"
#include "poolkit/api/status.hpp"
#include "poolkit/api/version.hpp"
#include "poolkit/json/json_codec.hpp"
#include "poolkit/log/log_manager.hpp"
#include "poolkit/pool/pool.hpp"
#include "poolkit/pool/pool_options.hpp"
#include "poolkit/pool/pool_stats.hpp"
#include "poolkit/proxy/context.hpp"
#include "poolkit/proxy/proxy.hpp"
#include "poolkit/task/iexecutor.hpp"
