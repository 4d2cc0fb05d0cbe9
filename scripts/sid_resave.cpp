/**
 * @file sid_resave.cpp
 * @brief Load a SID file and save it again, optionally as another variant
 * @version 0.1
 * @date 2026-10-18
 *
 * @copyright Copyright (c) 2026
 *
 */
#include "script_utils.hpp"

using namespace sidfile;

int main(int argc, char* argv[]) {
    try {
        ScriptConfig script = parse_arguments(argc, argv, ScriptType::RESAVE);
        TuneCodec codec = make_codec(script);

        const std::string& in_path = script.files[0];
        const std::string& out_path = script.files[1];

        auto result = codec.load(in_path);
        for (const auto& d : result.diagnostics) {
            std::cerr << "[RESAVE] " << d.to_string() << "\n";
        }
        if (!codec.is_acceptable(result.diagnostics) && !script.force) {
            std::cerr << "[RESAVE] " << in_path << " is not acceptable, use -f to write anyway\n";
            return 1;
        }

        TuneHeader header = result.header;
        if (script.target_variant && *script.target_variant != header.get_variant()) {
            header = TuneHeaderBuilder::from(header)
                .with_variant(*script.target_variant)
                .build();
            std::cout << "[RESAVE] converted to " << to_string(header.get_variant()) << "\n";
        }

        codec.save(out_path, header, result.payload);
        std::cout << "[RESAVE] " << header.to_string() << "\n";
        std::cout << "file written to " << out_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
