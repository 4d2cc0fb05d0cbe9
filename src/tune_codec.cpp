/**
 * @file tune_codec.cpp
 * @brief TuneCodec implementation
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 */

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

#include "../include/pattern/tune_codec.hpp"
#include "../include/exception/sidfile_exception.hpp"

namespace sidfile {

    DecodeResult decode(span<const std::uint8_t> buffer, const CodecConfig& config) {
        return decode(buffer, config.accept_multisid);
    }

    TuneCodec::TuneCodec(CodecConfig config, std::ostream& log)
        : config_(std::move(config)), log_(&log) {
        config_.validate();
    }

    void TuneCodec::log_diagnostics(const std::string& source,
        const Diagnostics& diagnostics) const {
        if (!config_.log_diagnostics) {
            return;
        }
        for (const auto& d : diagnostics) {
            *log_ << "[SIDFILE] " << source << ": " << d.to_string() << std::endl;
        }
    }

    // === Memory Operations ===

    DecodeResult TuneCodec::decode(span<const std::uint8_t> buffer) const {
        try {
            auto result = sidfile::decode(buffer, config_);
            log_diagnostics("decode", result.diagnostics);
            return result;
        } catch (const StructuralException& e) {
            if (config_.log_diagnostics) {
                *log_ << "[SIDFILE] decode: " << e.what() << std::endl;
            }
            throw;
        }
    }

    std::vector<std::uint8_t> TuneCodec::encode(const TuneHeader& header,
        span<const std::uint8_t> payload) const {
        return sidfile::encode(header, payload);
    }

    Diagnostics TuneCodec::validate(const TuneHeader& header,
        span<const std::uint8_t> payload) const {
        auto diagnostics = sidfile::validate(header, payload);
        log_diagnostics("validate", diagnostics);
        return diagnostics;
    }

    // === File Operations ===

    std::vector<std::uint8_t> TuneCodec::read_file(const std::string& path) const {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open SID file: " + path);
        }

        const std::streamoff size = file.tellg();
        if (size < 0) {
            throw std::runtime_error("Cannot determine size of SID file: " + path);
        }
        if (static_cast<std::size_t>(size) > config_.max_file_size) {
            throw std::runtime_error("SID file too large: " + path + " (" +
                std::to_string(size) + " bytes, max " +
                std::to_string(config_.max_file_size) + ")");
        }

        std::vector<std::uint8_t> bytes(static_cast<std::size_t>(size));
        file.seekg(0, std::ios::beg);
        if (!bytes.empty() &&
            !file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size))) {
            throw std::runtime_error("Read error on SID file: " + path);
        }
        return bytes;
    }

    void TuneCodec::write_file(const std::string& path,
        const std::vector<std::uint8_t>& bytes) const {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot create SID file: " + path);
        }
        file.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            throw std::runtime_error("Write error on SID file: " + path);
        }
    }

    DecodeResult TuneCodec::load(const std::string& path) const {
        const auto bytes = read_file(path);
        return decode(bytes);
    }

    void TuneCodec::save(const std::string& path, const TuneHeader& header,
        span<const std::uint8_t> payload) const {
        write_file(path, encode(header, payload));
    }

} // namespace sidfile
