#include "crowd/detect/detection_io.h"

#include <fstream>
#include <iostream>
#include <sstream>

namespace crowd::detect {

    bool parse_detection_line(const std::string& line, int& frame_id, Detection& out) {
        std::istringstream ss(line);
        char comma = 0;
        float x = 0.f, y = 0.f, w = 0.f, h = 0.f, conf = 0.f;
        if (!(ss >> frame_id >> comma >> x >> comma >> y >> comma >> w >> comma >> h >> comma >> conf)) {
            return false;
        }
        if (frame_id < 0) return false;

        out = Detection{};
        out.bbox = cv::Rect2f(x, y, w, h);
        out.confidence = conf;

        std::string method;
        if (ss >> comma && comma == ',' && std::getline(ss, method)) {
            out.method = method_from_string(method);
        }
        return true;
    }

    CsvLoadResult load_detections_csv(const std::string& path) {
        CsvLoadResult res;
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "[DET] cannot open detections file " << path << std::endl;
            return res;
        }
        res.opened = true;

        std::string line;
        while (std::getline(f, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty() || line[0] == '#') continue;

            int frame_id = 0;
            Detection d;
            if (!parse_detection_line(line, frame_id, d)) {
                res.skipped_lines++;
                continue;
            }
            res.frames[frame_id].push_back(d);
        }
        return res;
    }

} // namespace crowd::detect
