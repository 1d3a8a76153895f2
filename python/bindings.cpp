#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "python/reach_env.hpp"
#include "core/errors.hpp"

namespace py = pybind11;

PYBIND11_MODULE(larcc_reach, m) {
    m.doc() = "Python bindings for the LARCC reaching task";

    // Error types
    auto larcc_error = py::register_exception<larcc::LarccError>(m, "LarccError", PyExc_RuntimeError);
    py::register_exception<larcc::InvalidPoseShape>(m, "InvalidPoseShape", larcc_error.ptr());
    py::register_exception<larcc::InvalidActionShape>(m, "InvalidActionShape", larcc_error.ptr());
    py::register_exception<larcc::SamplingTimeout>(m, "SamplingTimeout", larcc_error.ptr());
    py::register_exception<larcc::ResetTimeout>(m, "ResetTimeout", larcc_error.ptr());
    py::register_exception<larcc::ConfigurationInvalid>(m, "ConfigurationInvalid", larcc_error.ptr());
    py::register_exception<larcc::PhysicsError>(m, "PhysicsError", larcc_error.ptr());

    py::class_<larcc::ReachEnvironment::StepResult>(m, "StepResult")
        .def(py::init<>())
        .def_readwrite("achieved_goal", &larcc::ReachEnvironment::StepResult::achieved_goal)
        .def_readwrite("desired_goal", &larcc::ReachEnvironment::StepResult::desired_goal)
        .def_readwrite("reward", &larcc::ReachEnvironment::StepResult::reward)
        .def_readwrite("terminated", &larcc::ReachEnvironment::StepResult::terminated)
        .def_readwrite("truncated", &larcc::ReachEnvironment::StepResult::truncated)
        .def_readwrite("info", &larcc::ReachEnvironment::StepResult::info)
        .def("__repr__",
            [](const larcc::ReachEnvironment::StepResult& r) {
                return "<StepResult reward=" + std::to_string(r.reward) +
                       (r.terminated ? " terminated" : "") + (r.truncated ? " truncated" : "") + ">";
            }
        );

    py::class_<larcc::ReachEnvironment>(m, "ReachEnvironment")
        .def(py::init<const std::string&, const std::string&>(),
             py::arg("xml_path"), py::arg("config_path"))
        .def("reset", &larcc::ReachEnvironment::reset, py::arg("random_start"),
             "Start a new episode. Returns the end-effector pose [x, y, z, qw, qx, qy, qz].")
        .def("reset_default", &larcc::ReachEnvironment::reset_default,
             "Start a new episode using the configured start mode.")
        .def("step", &larcc::ReachEnvironment::step, py::arg("action"),
             "Apply 6 normalized joint deltas and score the new end-effector pose.")
        .def("compute_reward", &larcc::ReachEnvironment::compute_reward,
             py::arg("achieved_goal"), py::arg("desired_goal"))
        .def("is_success", &larcc::ReachEnvironment::is_success)
        .def("validate", &larcc::ReachEnvironment::validate, py::arg("pose"))
        .def("sample_goal", &larcc::ReachEnvironment::sample_goal)
        .def("get_goal", &larcc::ReachEnvironment::get_goal)
        .def("set_goal", &larcc::ReachEnvironment::set_goal, py::arg("goal"))
        .def("get_end_effector_pose", &larcc::ReachEnvironment::get_end_effector_pose)
        .def("get_joint_positions", &larcc::ReachEnvironment::get_joint_positions)
        .def("get_workspace_bounds", &larcc::ReachEnvironment::get_workspace_bounds,
             "Returns [x_min, x_max, y_min, y_max, z_min, z_max] of the goal box.");
}
