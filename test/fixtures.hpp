#pragma once

#include "parcelkit/types.hpp"

#include <string>

namespace fixtures {

    inline std::string file_header(const std::string &coord_system = "2000国家大地坐标系", const std::string &degree = "3",
                                   const std::string &band = "39") {
        return "[属性描述]\n"
               "格式版本号=1.0\n"
               "数据产生单位=测绘院\n"
               "数据产生日期=2024-01-01\n"
               "坐标系=" +
               coord_system +
               "\n"
               "几度分带=" +
               degree +
               "\n"
               "投影类型=高斯克吕格\n"
               "计量单位=米\n"
               "带号=" +
               band +
               "\n"
               "精度=0.0001\n"
               "转换参数=,,,,,,\n";
    }

    // Square parcel KD001 in 3-degree zone 39, explicitly closed on J1.
    inline std::string sample_document() {
        return file_header() + "[地块坐标]\n"
                               "5,1200.5,KD001,地块一,面,,旱地,,@\n"
                               "J1,1,3400000.000,39500000.000\n"
                               "J2,1,3400000.000,39500100.000\n"
                               "J3,1,3400100.000,39500100.000\n"
                               "J4,1,3400100.000,39500000.000\n"
                               "J1,1,3400000.000,39500000.000\n";
    }

    inline parcelkit::Point pt(int id, double x, double y, int ring_id = 1) { return parcelkit::Point{id, ring_id, x, y}; }

} // namespace fixtures
