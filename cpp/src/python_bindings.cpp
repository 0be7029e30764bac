#include "sightline/intersect.hpp"
#include "sightline/occlusion.hpp"
#include "sightline/tangents.hpp"
#include "sightline/visibility.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <tuple>
#include <vector>

namespace py = pybind11;

namespace {

using CircleTuple = std::tuple<double, double, double>;
using SegmentTuple = std::tuple<double, double, double, double>;
using PointTuple = std::tuple<double, double>;

sl::Circle to_circle(const CircleTuple& c) {
    return {{std::get<0>(c), std::get<1>(c)}, std::get<2>(c)};
}

sl::Segment to_segment(const SegmentTuple& s) {
    return {{std::get<0>(s), std::get<1>(s)}, {std::get<2>(s), std::get<3>(s)}};
}

std::vector<sl::Circle> to_circles(const std::vector<CircleTuple>& circles) {
    std::vector<sl::Circle> out;
    out.reserve(circles.size());
    for (const auto& c : circles) {
        out.push_back(to_circle(c));
    }
    return out;
}

std::vector<SegmentTuple> py_tangents(const CircleTuple& a, const CircleTuple& b) {
    std::vector<SegmentTuple> out;
    for (const auto& s : sl::tangents(to_circle(a), to_circle(b))) {
        out.emplace_back(s.p0.x, s.p0.y, s.p1.x, s.p1.y);
    }
    return out;
}

std::vector<PointTuple> py_intersect(const CircleTuple& circle, const SegmentTuple& segment, bool lower_bounded,
                                     bool upper_bounded) {
    std::vector<PointTuple> out;
    for (const auto& p : sl::intersect(to_circle(circle), to_segment(segment), {lower_bounded, upper_bounded})) {
        out.emplace_back(p.x, p.y);
    }
    return out;
}

py::object py_first_hit(const std::vector<CircleTuple>& circles, const SegmentTuple& ray, bool rank_x) {
    const auto hit = sl::first_hit(to_segment(ray), to_circles(circles),
                                   rank_x ? sl::HitRanking::AxisX : sl::HitRanking::Parametric);
    if (!hit.has_value()) {
        return py::none();
    }
    return py::make_tuple(py::make_tuple(hit->point.x, hit->point.y),
                          py::make_tuple(hit->obstacle.center.x, hit->obstacle.center.y, hit->obstacle.r));
}

bool py_is_visible(const CircleTuple& target, const CircleTuple& source, const std::vector<CircleTuple>& obstacles,
                   bool bounded) {
    sl::VisibilityOptions options{};
    options.extent = bounded ? sl::OcclusionExtent::Segment : sl::OcclusionExtent::Ray;
    return sl::is_visible(to_circle(target), to_circle(source), to_circles(obstacles), options);
}

} // namespace

PYBIND11_MODULE(sightline_core, m) {
    py::register_exception<sl::InvalidGeometry>(m, "InvalidGeometry", PyExc_ValueError);

    m.def("tangents", &py_tangents, py::arg("a"), py::arg("b"));
    m.def("intersect", &py_intersect, py::arg("circle"), py::arg("segment"), py::arg("lower_bounded") = true,
          py::arg("upper_bounded") = true);
    m.def("first_hit", &py_first_hit, py::arg("circles"), py::arg("ray"), py::arg("rank_x") = false);
    m.def("is_visible", &py_is_visible, py::arg("target"), py::arg("source"), py::arg("obstacles"),
          py::arg("bounded") = true);
}
