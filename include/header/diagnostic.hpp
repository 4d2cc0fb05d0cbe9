/**
 * @file diagnostic.hpp
 * @brief Constraint violation record produced by the validator
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

#include "../enums/error.hpp"
#include "../enums/protocol.hpp"

namespace sidfile {

    /**
     * @brief One constraint violation
     *
     * Names the offending field, its byte offset in the header and the
     * observed value against the expected value or range.
     */
    struct Diagnostic {
        Severity severity = Severity::FATAL;
        Status status = Status::UNKNOWN;
        std::string field;
        std::size_t offset = 0;
        std::string observed;
        std::string expected;
        std::string message;

        bool is_fatal() const {
            return severity == Severity::FATAL;
        }

        std::string to_string() const {
            std::ostringstream oss;
            oss << sidfile::to_string(severity) << " " << field
                << " @0x" << std::hex << offset << std::dec
                << ": " << message
                << " (observed " << observed << ", expected " << expected << ")";
            return oss.str();
        }
    };

    using Diagnostics = std::vector<Diagnostic>;

    inline bool has_fatal(const Diagnostics& diagnostics) {
        return std::any_of(diagnostics.begin(), diagnostics.end(),
                [](const Diagnostic& d) { return d.is_fatal(); });
    }

    inline bool has_warnings(const Diagnostics& diagnostics) {
        return std::any_of(diagnostics.begin(), diagnostics.end(),
                [](const Diagnostic& d) { return !d.is_fatal(); });
    }

    /**
     * @brief Find the first diagnostic for a field
     * @return Pointer into diagnostics or nullptr
     */
    inline const Diagnostic* find_diagnostic(const Diagnostics& diagnostics,
        const std::string& field) {
        auto it = std::find_if(diagnostics.begin(), diagnostics.end(),
                [&field](const Diagnostic& d) { return d.field == field; });
        return it == diagnostics.end() ? nullptr : &*it;
    }

} // namespace sidfile
