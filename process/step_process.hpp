#ifndef LASERCUT_PROCESS_STEP_PROCESS_HPP
#define LASERCUT_PROCESS_STEP_PROCESS_HPP

#include "process_result.hpp"
#include "processing_options.hpp"
#include <string_view>

namespace lasercut {

// Convert the contents of a STEP file into an SVG cutting layout.
//
// Every solid with an extent inside [min_thickness, max_thickness] becomes
// one group in the document. Processing failures are reported through
// ReturnCode::Error and an "Error: ..." message; only an exception raised
// by options.on_message itself can escape.
ProcessResult process(std::string_view file_contents, const ProcessingOptions& options);

}  // namespace lasercut

#endif // LASERCUT_PROCESS_STEP_PROCESS_HPP
