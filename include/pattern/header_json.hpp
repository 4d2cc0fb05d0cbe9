/**
 * @file header_json.hpp
 * @brief JSON dump and import of TuneHeader
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 * Key names follow the field names used in diagnostics (loadAddress,
 * songCount, ...). Enums are written as their to_string() names.
 *
 * @code
 * std::cout << to_json(result.header).dump(2) << std::endl;
 *
 * auto header = header_from_json(nlohmann::json::parse(text))
 *     .with_name("Edited")
 *     .build();
 * @endcode
 */

#pragma once

#include <nlohmann/json.hpp>

#include "../header/tune_header.hpp"
#include "../header/diagnostic.hpp"
#include "header_builder.hpp"

namespace sidfile {

    /**
     * @brief Dump every header field, derived chip information included
     */
    nlohmann::json to_json(const TuneHeader& header);

    nlohmann::json to_json(const Diagnostic& diagnostic);

    nlohmann::json to_json(const Diagnostics& diagnostics);

    /**
     * @brief Builder pre-filled from a JSON dump
     *
     * Missing keys keep the builder defaults. Derived keys (dataOffset,
     * baseAddress, present, effectiveModel) are ignored.
     * @throws std::invalid_argument for unknown enum names, a missing variant
     *         or an integer outside its field width
     * @throws nlohmann::json::exception for values of the wrong JSON type
     */
    TuneHeaderBuilder header_from_json(const nlohmann::json& j);

} // namespace sidfile
