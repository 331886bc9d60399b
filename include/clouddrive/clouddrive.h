#pragma once

#include <clouddrive/api_service.h>
#include <clouddrive/call.h>
#include <clouddrive/callback_executor.h>
#include <clouddrive/canceller.h>
#include <clouddrive/connection_pool.h>
#include <clouddrive/data_sink.h>
#include <clouddrive/data_source.h>
#include <clouddrive/dispatcher.h>
#include <clouddrive/http.h>
#include <clouddrive/logging.h>
#include <clouddrive/progress_listener.h>
#include <clouddrive/remote_entry.h>
#include <clouddrive/response_cache.h>
#include <clouddrive/types.h>
