#pragma once

// Umbrella header for the salvage response parsing library.

#include "salvage/balance.hpp"
#include "salvage/code_cleaner.hpp"
#include "salvage/config.hpp"
#include "salvage/errors.hpp"
#include "salvage/extractors.hpp"
#include "salvage/format.hpp"
#include "salvage/json_repair.hpp"
#include "salvage/manifest.hpp"
#include "salvage/markers.hpp"
#include "salvage/parser.hpp"
#include "salvage/path_utils.hpp"
#include "salvage/result_json.hpp"
#include "salvage/streaming.hpp"
#include "salvage/syntax_repair.hpp"
#include "salvage/text_utils.hpp"
#include "salvage/types.hpp"
