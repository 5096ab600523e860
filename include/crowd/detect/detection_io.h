#pragma once

#include <map>
#include <string>
#include <vector>
#include "crowd/detection.h"

namespace crowd::detect {

    struct CsvLoadResult {
        std::map<int, std::vector<Detection>> frames; // frame_id -> detections
        int skipped_lines = 0;                        // malformed lines
        bool opened = false;
    };

    /**
     * Load per-frame detections from a CSV:
     *   frame_id,x,y,w,h,confidence[,method]
     * method is "YOLOv8" or "HOG" (anything else -> Unknown).
     * Blank lines and lines starting with '#' are ignored.
     */
    CsvLoadResult load_detections_csv(const std::string& path);

    // Parses one CSV line; false if the line is malformed.
    bool parse_detection_line(const std::string& line, int& frame_id, Detection& out);

} // namespace crowd::detect
