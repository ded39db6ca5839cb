#pragma once

#include <glog/logging.h>

// Logging goes through glog. Library code logs at session boundaries only; verbose
// messages are enabled with --v=1 (or GLOG_v=1).
#define DASL_DOMAIN_NAME "[DRISL] "

#define DASL_LOG_DEBUG   VLOG(1) << DASL_DOMAIN_NAME
#define DASL_LOG_INFO    LOG(INFO) << DASL_DOMAIN_NAME
#define DASL_LOG_WARNING LOG(WARNING) << DASL_DOMAIN_NAME
#define DASL_LOG_ERROR   LOG(ERROR) << DASL_DOMAIN_NAME
