#pragma once

#include "config/config.pb.h"

#include "internal/db/api/client.hpp"
#include "internal/db/mongo/mongo_client.hpp"
#include "internal/driver/mongo_driver.hpp"
#include "internal/model/run_state.hpp"
#include "internal/util/errors.hpp"

namespace migrate::mongodb::v1 {
using ::migrate::connection::ClientFactory;
using ::migrate::config::DriverConfig;
using ::migrate::config::LockingConfig;
using ::migrate::config::LoggingConfig;
using ::migrate::model::RunOutcome;
using ::migrate::mongodb::Driver;
using ::migrate::mongodb::kNilVersion;
using ::migrate::mongodb::RunOptions;
using ::migrate::mongodb::VersionRecord;
using namespace ::migrate::util;
} // namespace migrate::mongodb::v1
