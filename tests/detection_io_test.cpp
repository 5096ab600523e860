#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include "crowd/detect/detection_io.h"

using namespace crowd;
using namespace crowd::detect;

TEST(DetectionIoTest, ParsesLineWithMethod) {
    int frame_id = -1;
    Detection d;
    ASSERT_TRUE(parse_detection_line("3,10.5,20,40,80,0.75,HOG", frame_id, d));
    EXPECT_EQ(frame_id, 3);
    EXPECT_FLOAT_EQ(d.bbox.x, 10.5f);
    EXPECT_FLOAT_EQ(d.bbox.y, 20.0f);
    EXPECT_FLOAT_EQ(d.bbox.width, 40.0f);
    EXPECT_FLOAT_EQ(d.bbox.height, 80.0f);
    EXPECT_FLOAT_EQ(d.confidence, 0.75f);
    EXPECT_EQ(d.method, DetectionMethod::HOG);
}

TEST(DetectionIoTest, MethodIsOptional) {
    int frame_id = -1;
    Detection d;
    ASSERT_TRUE(parse_detection_line("0,1,2,3,4,0.5", frame_id, d));
    EXPECT_EQ(d.method, DetectionMethod::Unknown);

    ASSERT_TRUE(parse_detection_line("0,1,2,3,4,0.5, yolov8 ", frame_id, d));
    EXPECT_EQ(d.method, DetectionMethod::YOLOv8);
}

TEST(DetectionIoTest, RejectsMalformedLines) {
    int frame_id = 0;
    Detection d;
    EXPECT_FALSE(parse_detection_line("", frame_id, d));
    EXPECT_FALSE(parse_detection_line("1,2,3", frame_id, d));
    EXPECT_FALSE(parse_detection_line("a,b,c,d,e,f", frame_id, d));
    EXPECT_FALSE(parse_detection_line("-1,0,0,10,10,0.5", frame_id, d));
}

TEST(DetectionIoTest, MethodNames) {
    EXPECT_EQ(method_from_string("YOLO"), DetectionMethod::YOLOv8);
    EXPECT_EQ(method_from_string("Hog"), DetectionMethod::HOG);
    EXPECT_EQ(method_from_string("ssd"), DetectionMethod::Unknown);
    EXPECT_STREQ(to_string(DetectionMethod::YOLOv8), "YOLOv8");
    EXPECT_STREQ(to_string(DetectionMethod::Unknown), "Unknown");
}

TEST(DetectionIoTest, LoadsFileGroupedByFrame) {
    const std::filesystem::path path =
            std::filesystem::temp_directory_path() / "crowd_detection_io_test.csv";
    {
        std::ofstream f(path);
        f << "# frame_id,x,y,w,h,confidence,method\n";
        f << "0,10,10,40,80,0.9,YOLOv8\r\n";
        f << "\n";
        f << "0,100,10,40,80,0.8,HOG\n";
        f << "2,12,10,40,80,0.9\n";
        f << "garbage line\n";
    }

    const CsvLoadResult res = load_detections_csv(path.string());
    std::filesystem::remove(path);

    ASSERT_TRUE(res.opened);
    EXPECT_EQ(res.skipped_lines, 1);
    ASSERT_EQ(res.frames.size(), 2u);
    ASSERT_EQ(res.frames.at(0).size(), 2u);
    EXPECT_EQ(res.frames.at(0)[0].method, DetectionMethod::YOLOv8);
    EXPECT_EQ(res.frames.at(0)[1].method, DetectionMethod::HOG);
    EXPECT_EQ(res.frames.at(2).size(), 1u);
}

TEST(DetectionIoTest, MissingFileIsReported) {
    const CsvLoadResult res = load_detections_csv("/nonexistent/crowd/detections.csv");
    EXPECT_FALSE(res.opened);
    EXPECT_TRUE(res.frames.empty());
}
