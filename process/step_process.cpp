#include "step_process.hpp"
#include <common/logging.hpp>
#include <common/number_format.hpp>
#include <layout/dimensions.hpp>
#include <layout/layout_engine.hpp>
#include <step/parser.hpp>
#include <step/step_model.hpp>
#include <svg/svg_builder.hpp>
#include <topology/step_topology_resolver.hpp>
#include <exception>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace lasercut {

namespace {

// Lay out every solid, concurrently when OpenMP is available. Results come
// back in solid order; the first failure in that order is rethrown.
std::vector<SolidLayoutResult> layout_solids(const LayoutEngine& engine,
                                             const std::vector<SolidFaces>& solids,
                                             int num_threads) {
    auto log = logging::get_logger();
    const int count = static_cast<int>(solids.size());
    std::vector<SolidLayoutResult> results(solids.size());
    std::vector<std::exception_ptr> failures(solids.size());

    #ifdef _OPENMP
    int use_threads = (num_threads > 0) ? num_threads : omp_get_max_threads();
    omp_set_num_threads(use_threads);
    log->debug("Laying out {} solids with up to {} OpenMP threads", count, use_threads);
    #else
    (void)num_threads;
    log->debug("Laying out {} solids single-threaded (OpenMP not available)", count);
    #endif

    #pragma omp parallel for schedule(static) if(count > 1)
    for (int i = 0; i < count; ++i) {
        try {
            results[i] = engine.layout_solid(solids[i]);
        } catch (...) {
            failures[i] = std::current_exception();
        }
    }

    for (const auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }
    return results;
}

}  // namespace

ProcessResult process(std::string_view file_contents, const ProcessingOptions& options) {
    ProcessResult result;
    CallbackSink callback(options.on_message, options.debug_mode);
    RecordingSink recording(callback);
    MessageLog log(recording);

    try {
        log.always("Parsing STEP file contents...");
        options.validate();
        step::EntityTable table = step::parse_step_text(file_contents);
        StepTopologyResolver resolver(step::StepModel::build(table));
        log.debug("File loaded. Total items: " + std::to_string(table.size()));
        log.debug("Processing with thickness=" + format_trimmed3(options.thickness) +
                  "mm, tolerance=" + format_trimmed3(options.thickness_tolerance) +
                  "mm (range: " + format_trimmed3(options.min_thickness()) + "-" +
                  format_trimmed3(options.max_thickness()) + "mm)");

        std::vector<SolidFaces> solids = resolver.resolve_solids();
        result.solid_count = solids.size();
        log.debug("Found " + std::to_string(solids.size()) + " solids");
        if (solids.empty()) {
            log.debug("No solids found in STEP file.");
            result.messages = recording.take_messages();
            return result;
        }

        std::string target = "(target thickness: " + format_trimmed3(options.thickness) + "mm)";
        std::vector<SolidFaces> thin_solids;
        for (const auto& solid : solids) {
            BoundingInfo bounds = resolver.extract_bounding_dimensions(solid.faces);
            Dimensions dimensions{bounds.width, bounds.height, bounds.depth};
            if (dimensions.has_thin_dimension(options.min_thickness(), options.max_thickness())) {
                log.debug("[FILTER] " + solid.name + ": dimensions " + dimensions.to_string() + " - PASS " + target);
                thin_solids.push_back(solid);
            } else {
                log.always("Warning! [FILTER] " + solid.name + ": dimensions " + dimensions.to_string() +
                           " - FAIL " + target);
            }
        }
        result.thin_solid_count = thin_solids.size();

        if (thin_solids.empty()) {
            log.always("Warning! No thin solids found matching thickness " + format_trimmed3(options.thickness) +
                       "mm (+/- " + format_trimmed3(options.thickness_tolerance) + "mm).");
            result.messages = recording.take_messages();
            return result;
        }

        LayoutEngine engine(resolver, options);
        std::vector<SolidLayoutResult> layouts = layout_solids(engine, thin_solids, options.num_threads);

        SvgBuilder svg;
        for (const auto& layout : layouts) {
            for (const auto& message : layout.messages) {
                log.write(message);
            }
            svg.add_group(layout.group);
        }
        result.group_count = layouts.size();
        result.document_text = svg.build();
        result.return_code = ReturnCode::Success;
    } catch (const std::exception& e) {
        log.always(std::string("Error: ") + e.what());
        result.document_text.clear();
        result.return_code = ReturnCode::Error;
    }

    result.messages = recording.take_messages();
    return result;
}

}  // namespace lasercut
