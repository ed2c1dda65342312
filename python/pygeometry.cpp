#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "basis.hpp"
#include "eigen.hpp"
#include "format.hpp"
#include "quaternion.hpp"

namespace py = pybind11;
using namespace wetmelon::geometry;

namespace {

// Vectors cross the boundary as numpy arrays
Vec2<double> vec2(const Eigen::Vector2d& v) { return vec_from_eigen(v); }
Vec3<double> vec3(const Eigen::Vector3d& v) { return vec_from_eigen(v); }

void bind_basis2(py::module_& m) {
    py::class_<Basis2d>(m, "Basis2", "2D rotation matrix")
        .def(py::init<>())
        .def_static("one", &Basis2d::one)
        .def_static("from_angle", [](double theta) { return Basis2d::from_angle(Radd{theta}); }, py::arg("theta"))
        .def_static(
            "look_at", [](const Eigen::Vector2d& dir, const Eigen::Vector2d& up) { return Basis2d::look_at(vec2(dir), vec2(up)); },
            py::arg("dir"), py::arg("up"))
        .def_static(
            "between_vectors",
            [](const Eigen::Vector2d& a, const Eigen::Vector2d& b) { return Basis2d::between_vectors(vec2(a), vec2(b)); },
            py::arg("a"), py::arg("b"))
        .def_static(
            "from_array",
            [](const std::array<double, 4>& coeffs, double eps) { return Basis2d::from_array(coeffs, eps); },
            py::arg("coeffs"), py::arg("eps") = approx_epsilon<double>())
        .def("rotate_vector", [](const Basis2d& r, const Eigen::Vector2d& v) { return to_eigen(r.rotate_vector(vec2(v))); })
        .def("rotate_point", [](const Basis2d& r, const Eigen::Vector2d& p) {
            return to_eigen(r.rotate_point(Point2<double>::from_vec(vec2(p))).to_vec());
        })
        .def("concat", &Basis2d::concat)
        .def("invert", &Basis2d::invert)
        .def("approx_eq", &Basis2d::approx_eq, py::arg("other"), py::arg("eps") = approx_epsilon<double>())
        .def("matrix", [](const Basis2d& r) { return to_eigen(r); })
        .def("to_array", &Basis2d::to_array)
        .def("__mul__", &Basis2d::concat)
        .def("__eq__", [](const Basis2d& a, const Basis2d& b) { return a == b; })
        .def("__repr__", [](const Basis2d& r) { return fmt::format("{}", r); });
}

void bind_basis3(py::module_& m) {
    py::class_<Basis3d>(m, "Basis3", "3D rotation matrix")
        .def(py::init<>())
        .def_static("one", &Basis3d::one)
        .def_static(
            "from_axis_angle",
            [](const Eigen::Vector3d& axis, double angle) { return Basis3d::from_axis_angle(vec3(axis), Radd{angle}); },
            py::arg("axis"), py::arg("angle"))
        .def_static(
            "from_euler", [](double x, double y, double z) { return Basis3d::from_euler(Radd{x}, Radd{y}, Radd{z}); },
            py::arg("x"), py::arg("y"), py::arg("z"))
        .def_static("from_angle_x", [](double theta) { return Basis3d::from_angle_x(Radd{theta}); })
        .def_static("from_angle_y", [](double theta) { return Basis3d::from_angle_y(Radd{theta}); })
        .def_static("from_angle_z", [](double theta) { return Basis3d::from_angle_z(Radd{theta}); })
        .def_static("from_quaternion", &Basis3d::from_quaternion)
        .def_static(
            "look_at", [](const Eigen::Vector3d& dir, const Eigen::Vector3d& up) { return Basis3d::look_at(vec3(dir), vec3(up)); },
            py::arg("dir"), py::arg("up"))
        .def_static(
            "between_vectors",
            [](const Eigen::Vector3d& a, const Eigen::Vector3d& b) { return Basis3d::between_vectors(vec3(a), vec3(b)); },
            py::arg("a"), py::arg("b"))
        .def_static(
            "from_array",
            [](const std::array<double, 9>& coeffs, double eps) { return Basis3d::from_array(coeffs, eps); },
            py::arg("coeffs"), py::arg("eps") = approx_epsilon<double>())
        .def_static(
            "from_matrix", [](const Eigen::Matrix3d& mat, double eps) { return basis_from_eigen(mat, eps); },
            py::arg("matrix"), py::arg("eps") = approx_epsilon<double>())
        .def("rotate_vector", [](const Basis3d& r, const Eigen::Vector3d& v) { return to_eigen(r.rotate_vector(vec3(v))); })
        .def("rotate_point", [](const Basis3d& r, const Eigen::Vector3d& p) {
            return to_eigen(r.rotate_point(Point3<double>::from_vec(vec3(p))).to_vec());
        })
        .def("concat", &Basis3d::concat)
        .def("invert", &Basis3d::invert)
        .def("approx_eq", &Basis3d::approx_eq, py::arg("other"), py::arg("eps") = approx_epsilon<double>())
        .def("matrix", [](const Basis3d& r) { return to_eigen(r); })
        .def("to_quaternion", &Basis3d::to_quaternion)
        .def("to_array", &Basis3d::to_array)
        .def("__mul__", &Basis3d::concat)
        .def("__eq__", [](const Basis3d& a, const Basis3d& b) { return a == b; })
        .def("__repr__", [](const Basis3d& r) { return fmt::format("{}", r); });
}

void bind_quaternion(py::module_& m) {
    py::class_<Quatd>(m, "Quaternion", "Unit quaternion rotation")
        .def(py::init<>())
        .def(py::init<double, double, double, double>(), py::arg("w"), py::arg("x"), py::arg("y"), py::arg("z"))
        .def_property_readonly("w", [](const Quatd& q) { return q.w(); })
        .def_property_readonly("x", [](const Quatd& q) { return q.x(); })
        .def_property_readonly("y", [](const Quatd& q) { return q.y(); })
        .def_property_readonly("z", [](const Quatd& q) { return q.z(); })
        .def_static("one", &Quatd::one)
        .def_static(
            "from_axis_angle",
            [](const Eigen::Vector3d& axis, double angle) { return Quatd::from_axis_angle(vec3(axis), Radd{angle}); },
            py::arg("axis"), py::arg("angle"))
        .def_static(
            "from_euler", [](double x, double y, double z) { return Quatd::from_euler(Radd{x}, Radd{y}, Radd{z}); },
            py::arg("x"), py::arg("y"), py::arg("z"))
        .def_static(
            "between_vectors",
            [](const Eigen::Vector3d& a, const Eigen::Vector3d& b) { return Quatd::between_vectors(vec3(a), vec3(b)); },
            py::arg("a"), py::arg("b"))
        .def_static(
            "look_at", [](const Eigen::Vector3d& dir, const Eigen::Vector3d& up) { return Quatd::look_at(vec3(dir), vec3(up)); },
            py::arg("dir"), py::arg("up"))
        .def_static("slerp", &Quatd::slerp, py::arg("a"), py::arg("b"), py::arg("t"))
        .def("rotate_vector", [](const Quatd& q, const Eigen::Vector3d& v) { return to_eigen(q.rotate_vector(vec3(v))); })
        .def("concat", &Quatd::concat)
        .def("invert", &Quatd::invert)
        .def("conjugate", &Quatd::conjugate)
        .def("norm", &Quatd::norm)
        .def("normalized", [](const Quatd& q) { return q.normalized(); })
        .def("approx_eq", &Quatd::approx_eq, py::arg("other"), py::arg("eps") = approx_epsilon<double>())
        .def("to_matrix", [](const Quatd& q) { return to_eigen(q.to_matrix()); })
        .def("to_basis", &Quatd::to_basis)
        .def("to_array", &Quatd::to_array)
        .def("__mul__", &Quatd::concat)
        .def("__eq__", [](const Quatd& a, const Quatd& b) { return a == b; })
        .def("__repr__", [](const Quatd& q) { return fmt::format("{}", q); });
}

} // namespace

PYBIND11_MODULE(pygeometry, m) {
    m.doc() = "Python bindings for the wetmelon::geometry rotation library";

    // Quaternion first: Basis3 signatures refer to it
    bind_quaternion(m);
    bind_basis2(m);
    bind_basis3(m);
}
