#include "cli_common.hpp"
#include <process/step_process.hpp>
#include <common/logging.hpp>

namespace lasercut::cli {

namespace {

void print_convert_usage() {
    std::cerr << "Usage: lasercut convert <input.step> [-o <output.svg>] [options]\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o, --output <path>      Output SVG (default: input with .svg suffix)\n";
    std::cerr << "  -c, --config <path>      Processing options as JSON\n";
    std::cerr << "  -t, --thickness <mm>     Target material thickness (default 3)\n";
    std::cerr << "      --tolerance <mm>     Accepted thickness deviation (default 0.5)\n";
    std::cerr << "  -j, --threads <n>        Worker threads for layout (0 = all)\n";
    std::cerr << "  -d, --debug              Print debug-only progress messages\n";
    std::cerr << "      --report <path>      Write a JSON report of the run\n";
    std::cerr << "  -v, --verbose            Verbose logging\n";
}

}  // namespace

int command_convert(int argc, char** argv) {
    auto log = lasercut::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help) {
            print_convert_usage();
            return 0;
        }
        if (ctx.input_path.empty()) {
            print_convert_usage();
            return 1;
        }
        logging::set_verbose(ctx.verbose);

        ProcessingOptions options = build_options(ctx);
        options.on_message = [](const std::string& text, bool) {
            std::cout << text << "\n";
        };

        log->info("Converting: {}", ctx.input_path);
        std::string contents = read_file(ctx.input_path);

        ProcessResult result = process(contents, options);

        std::string output_path;
        if (result.return_code == ReturnCode::Success) {
            output_path = resolve_output_path(ctx.input_path, ".svg", ctx.output_path);
            write_file(output_path, result.document_text);
            log->info("Wrote SVG to {}", output_path);
            std::cerr << "Wrote " << output_path << " (" << result.group_count << " parts)\n";
        }

        if (ctx.report_path) {
            json::Report report;
            report.step = "convert";
            report.timestamp = json::get_timestamp();
            report.source_file = ctx.input_path;
            report.config = nlohmann::json(options);
            report.stats = {
                {"solid_count", result.solid_count},
                {"thin_solid_count", result.thin_solid_count},
                {"group_count", result.group_count}
            };
            report.data = nlohmann::json(result);
            if (!output_path.empty()) {
                report.data["output_file"] = output_path;
            }
            json::write_json_file(*ctx.report_path, report);
            log->info("Wrote report to {}", *ctx.report_path);
        }

        switch (result.return_code) {
            case ReturnCode::Success:
                return 0;
            case ReturnCode::NoOutput:
                log->warn("No cuttable parts found in {}", ctx.input_path);
                return 2;
            case ReturnCode::Error:
                return 1;
        }
        return 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace lasercut::cli
