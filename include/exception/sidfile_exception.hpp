/**
 * @file sidfile_exception.hpp
 * @brief Exception hierarchy for the sidfile codec
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdexcept>
#include <string>
#include "../enums/error.hpp"

namespace sidfile {

    /**
     * @class SidFileException
     * @brief Base exception class for all sidfile errors
     *
     * This exception stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what().
     */
    class SidFileException : public std::runtime_error {
        protected:
            Status status_;     ///< Original error status code
            std::string context_; ///< Field or operation context

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            SidFileException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context)),
                status_(status),
                context_(context) {}

            /**
             * @brief Get the status code
             * @return Status code associated with this exception
             */
            Status status() const noexcept { return status_; }

            /**
             * @brief Get the operation context
             * @return Context string describing where error occurred
             */
            const std::string& context() const noexcept { return context_; }

        private:
            static std::string format_message(Status status, const std::string& context) {
                SidFileErrorCategory category;
                return "[" + category.message(static_cast<int>(status)) + "] in " + context;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class StructuralException
     * @brief The buffer cannot be read as a header at all
     *
     * Raised by decode for short buffers, unknown magic, unsupported versions
     * and dataOffset mismatches. No header is produced.
     * Corresponds to S* status codes.
     */
    class StructuralException : public SidFileException {
        public:
            using SidFileException::SidFileException;
    };

    /**
     * @class EncodingException
     * @brief A header cannot be serialized without losing data
     *
     * Raised by encode and by the builder. Corresponds to E* status codes.
     */
    class EncodingException : public SidFileException {
        public:
            using SidFileException::SidFileException;
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     * @throws StructuralException for S* codes
     * @throws EncodingException for E* codes
     * @throws SidFileException for other codes
     */
    inline void throw_error(Status status, const std::string& context) {
        switch (status) {
        case Status::SHEADER_TOO_SHORT:
        case Status::SUNKNOWN_MAGIC:
        case Status::SUNSUPPORTED_VERSION:
        case Status::SDATA_OFFSET_MISMATCH:
            throw StructuralException(status, context);

        case Status::ETEXT_TOO_LONG:
        case Status::EUNREPRESENTABLE:
        case Status::ECHIP_CAPACITY:
            throw EncodingException(status, context);

        default:
            throw SidFileException(status, context);
        }
    }

    /**
     * @brief Throw if status indicates an error (not SUCCESS)
     * @param status The status code to check
     * @param context Description of where the error occurred
     */
    inline void throw_if_error(Status status, const std::string& context) {
        if (status != Status::SUCCESS) {
            throw_error(status, context);
        }
    }

} // namespace sidfile
