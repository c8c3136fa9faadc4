#pragma once

// Main include file for fileserve

// Utilities
#include "fileserve/util/expected.hpp"

// Core
#include "fileserve/core/conditional.hpp"
#include "fileserve/core/error.hpp"
#include "fileserve/core/etag.hpp"
#include "fileserve/core/file.hpp"
#include "fileserve/core/file_stream.hpp"
#include "fileserve/core/http_date.hpp"
#include "fileserve/core/logging.hpp"
#include "fileserve/core/poll.hpp"
#include "fileserve/core/range.hpp"
#include "fileserve/core/request.hpp"
#include "fileserve/core/response.hpp"
#include "fileserve/core/source.hpp"
#include "fileserve/core/static_files.hpp"
