#include "cli_common.hpp"
#include <step/parser.hpp>
#include <step/step_model.hpp>
#include <topology/step_topology_resolver.hpp>
#include <layout/dimensions.hpp>
#include <layout/layout_engine.hpp>
#include <common/logging.hpp>

namespace lasercut::cli {

namespace {

double closed_perimeter(const std::vector<Vec3>& points) {
    double total = 0.0;
    for (size_t i = 0; i < points.size(); ++i) {
        total += points[i].distance_to(points[(i + 1) % points.size()]);
    }
    return total;
}

nlohmann::json inspect_solid(const StepTopologyResolver& resolver,
                             const SolidFaces& solid,
                             const ProcessingOptions& options) {
    BoundingInfo bounds = resolver.extract_bounding_dimensions(solid.faces);
    Dimensions dimensions{bounds.width, bounds.height, bounds.depth};

    size_t planar = 0;
    size_t curved_edges = 0;
    double largest_area = 0.0;
    double largest_perimeter = 0.0;
    for (FaceId face : solid.faces) {
        curved_edges += resolver.curved_edge_count(face);
        if (!resolver.is_planar(face)) {
            continue;
        }
        ++planar;
        std::vector<Vec3> outline = resolver.sample_outer_loop(face, options.samples_per_curve);
        if (outline.size() < 3) {
            continue;
        }
        double area = projected_area(outline);
        if (area > largest_area) {
            largest_area = area;
            largest_perimeter = closed_perimeter(outline);
        }
    }

    nlohmann::json j = {
        {"name", solid.name},
        {"face_count", solid.faces.size()},
        {"planar_face_count", planar},
        {"curved_edge_count", curved_edges},
        {"dimensions", dimensions},
        {"thin", dimensions.has_thin_dimension(options.min_thickness(), options.max_thickness())},
        {"largest_face_area", largest_area},
        {"largest_face_perimeter", largest_perimeter}
    };
    if (bounds.thin_pair_separation) {
        j["thin_pair_separation"] = *bounds.thin_pair_separation;
    }
    return j;
}

}  // namespace

int command_inspect(int argc, char** argv) {
    auto log = lasercut::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: lasercut inspect <input.step> [-o <report.json>] "
                         "[-c <config.json>] [-t <mm>] [--tolerance <mm>]\n";
            return ctx.help ? 0 : 1;
        }
        logging::set_verbose(ctx.verbose);

        ProcessingOptions options = build_options(ctx);

        log->info("Inspecting: {}", ctx.input_path);
        std::string contents = read_file(ctx.input_path);

        step::Tokenizer tokenizer(contents);
        step::Parser parser(tokenizer);
        step::EntityTable table = parser.parse();
        for (const auto& error : parser.errors()) {
            log->warn("Parse error: {}", error);
        }

        StepTopologyResolver resolver(step::StepModel::build(table));
        std::vector<SolidFaces> solids = resolver.resolve_solids();

        nlohmann::json solids_json = nlohmann::json::array();
        size_t thin_count = 0;
        for (const auto& solid : solids) {
            nlohmann::json entry = inspect_solid(resolver, solid, options);
            if (entry["thin"].get<bool>()) {
                ++thin_count;
            }
            solids_json.push_back(std::move(entry));
        }

        json::Report report;
        report.step = "inspect";
        report.timestamp = json::get_timestamp();
        report.source_file = ctx.input_path;
        report.config = nlohmann::json(options);
        report.stats = {
            {"entity_count", table.size()},
            {"face_count", resolver.model().advanced_faces().size()},
            {"solid_count", solids.size()},
            {"thin_solid_count", thin_count},
            {"parse_error_count", parser.errors().size()}
        };
        report.data = {{"solids", solids_json}};

        if (ctx.output_path.empty()) {
            std::cout << json::dump_json(report) << "\n";
        } else {
            json::write_json_file(ctx.output_path, report);
            log->info("Wrote inspection report to {}", ctx.output_path);
            std::cerr << "Wrote " << ctx.output_path << " (" << solids.size() << " solids)\n";
        }

        return parser.has_errors() ? 1 : 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace lasercut::cli
