/**
 * @file sid_info.cpp
 * @brief Print the header of SID files as JSON, with their diagnostics
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
        ScriptConfig script = parse_arguments(argc, argv, ScriptType::INFO);
        TuneCodec codec = make_codec(script);

        int exit_code = 0;
        for (const auto& path : script.files) {
            nlohmann::json report;
            report["file"] = path;

            try {
                auto result = codec.load(path);
                report["header"] = to_json(result.header);
                report["payloadSize"] = result.payload.size();
                report["diagnostics"] = to_json(result.diagnostics);
                report["acceptable"] = codec.is_acceptable(result.diagnostics);
                if (!codec.is_acceptable(result.diagnostics)) {
                    exit_code = 1;
                }
            } catch (const StructuralException& e) {
                report["error"] = e.what();
                report["acceptable"] = false;
                exit_code = 1;
            }

            std::cout << report.dump(2) << "\n";
        }

        return exit_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
