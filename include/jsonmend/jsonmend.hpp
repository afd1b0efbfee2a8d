// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "core/config_loader.hpp"
#include "core/logger.hpp"
#include "parsers/json.hpp"
#include "parsers/minimal_toml.hpp"
#include "processing/json_processor.hpp"
#include "processing/processing_error.hpp"
#include "processing/processing_logger.hpp"
#include "processing/processor_result.hpp"
#include "processing/processor_settings.hpp"
#include "processing/shape_validator.hpp"
#include "sanitizers/json_scanner.hpp"
#include "sanitizers/sanitizer_pipeline.hpp"
#include "sanitizers/sanitizer_registry.hpp"
#include "sanitizers/sanitizer_types.hpp"
#include "sanitizers/text_edit.hpp"

#define JSONMEND_DEFAULT_CONFIG_FILE_PATH "/etc/jsonmend/jsonmend.toml"
