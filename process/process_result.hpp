#ifndef LASERCUT_PROCESS_PROCESS_RESULT_HPP
#define LASERCUT_PROCESS_PROCESS_RESULT_HPP

#include "message_sink.hpp"
#include <string>
#include <vector>

namespace lasercut {

enum class ReturnCode : int {
    NoOutput = 0,  // parsed, but nothing cuttable
    Success = 1,
    Error = 2
};

struct ProcessResult {
    ReturnCode return_code = ReturnCode::NoOutput;
    std::string document_text;                 // SVG on success, empty otherwise
    std::vector<ProcessMessage> messages;      // every message, debug-only included

    // Counters for reports
    size_t solid_count = 0;
    size_t thin_solid_count = 0;
    size_t group_count = 0;
};

}  // namespace lasercut

#endif // LASERCUT_PROCESS_PROCESS_RESULT_HPP
