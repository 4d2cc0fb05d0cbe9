/**
 * @file sidfile.hpp
 * @brief Header file to facilitate the inclusion of the sidfile library
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

// Include the format enums and status codes
#include "enums/protocol.hpp"
#include "enums/error.hpp"
// Include exception hierarchy
#include "exception/sidfile_exception.hpp"
// Include the header traits
#include "template/header_traits.hpp"
// Include the header model
#include "header/tune_header.hpp"
#include "header/diagnostic.hpp"
// Include the field codecs
#include "interface/serialization_helpers.hpp"
#include "interface/multi_sid.hpp"
#include "interface/version_dispatcher.hpp"
#include "interface/validator/header_validator.hpp"
// Include decode/encode entry points
#include "header/header_codec.hpp"
// Include the header builder
#include "pattern/header_builder.hpp"
// Include configuration, the configured codec and JSON export
#include "pattern/codec_config.hpp"
#include "pattern/tune_codec.hpp"
#include "pattern/header_json.hpp"
