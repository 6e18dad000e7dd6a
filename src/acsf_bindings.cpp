// C++ standard library
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Third-party libraries
#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

// Project headers
#include "acsf_config.hpp"
#include "acsf_engine.hpp"
#include "acsf_errors.hpp"
#include "structure.hpp"

namespace py = pybind11;
using af::acsf::AngularParam;
using af::acsf::ConfigLocked;
using af::acsf::DescriptorConfig;
using af::acsf::DescriptorEngine;
using af::acsf::InvalidConfig;
using af::acsf::RadialParam;
using af::acsf::Structure;

using dense_array = py::array_t<double, py::array::c_style | py::array::forcecast>;
using int_array = py::array_t<int, py::array::c_style | py::array::forcecast>;

// Convert a 2D NumPy array (n,3) or 1D (n*3,) to std::vector<double>
static std::vector<double> as_coords_vector(const py::object &obj, size_t natoms) {
    auto buf = dense_array::ensure(obj);
    if (!buf)
        throw std::invalid_argument("positions must be convertible to a float array");
    if (buf.ndim() == 2) {
        if (static_cast<size_t>(buf.shape(0)) != natoms || buf.shape(1) != 3)
            throw std::invalid_argument("positions must have shape (n_atoms, 3)");
    } else if (buf.ndim() == 1) {
        if (static_cast<size_t>(buf.shape(0)) != natoms * 3)
            throw std::invalid_argument("positions 1D length must be n_atoms*3");
    } else {
        throw std::invalid_argument("positions must be a 1D or 2D NumPy array");
    }
    return std::vector<double>(buf.data(), buf.data() + natoms * 3);
}

static std::vector<double> as_distance_vector(const py::object &obj, size_t natoms) {
    auto buf = dense_array::ensure(obj);
    if (!buf || buf.ndim() != 2 || static_cast<size_t>(buf.shape(0)) != natoms ||
        static_cast<size_t>(buf.shape(1)) != natoms)
        throw std::invalid_argument("distance matrix must have shape (n_atoms, n_atoms)");
    return std::vector<double>(buf.data(), buf.data() + natoms * natoms);
}

static std::vector<int> as_int_vector(const py::object &obj) {
    auto buf = int_array::ensure(obj);
    if (!buf || buf.ndim() != 1)
        throw std::invalid_argument("atomic numbers must be a 1D integer array");
    return std::vector<int>(buf.data(), buf.data() + buf.shape(0));
}

// ---- constructor argument parsing; None or an empty sequence disables a family ----

static std::vector<int> parse_types(const py::object &value) {
    if (value.is_none())
        throw InvalidConfig("Atomic types cannot be None.");
    auto buf = int_array::ensure(value);
    if (!buf || buf.ndim() != 1)
        throw InvalidConfig("Atomic types should be a vector of integers.");
    return std::vector<int>(buf.data(), buf.data() + buf.shape(0));
}

static dense_array parse_matrix(const py::object &value, py::ssize_t ncols, const char *msg) {
    auto buf = dense_array::ensure(value);
    if (!buf)
        throw InvalidConfig(msg);
    if (buf.size() == 0)
        return buf;
    if (buf.ndim() != 2 || buf.shape(1) != ncols)
        throw InvalidConfig(msg);
    return buf;
}

static std::vector<RadialParam> parse_bond_params(const py::object &value) {
    std::vector<RadialParam> out;
    if (value.is_none())
        return out;
    auto buf = parse_matrix(value, 2, "bond_params should be a matrix with two columns (eta, Rs).");
    if (buf.size() == 0)
        return out;
    auto r = buf.unchecked<2>();
    for (py::ssize_t i = 0; i < r.shape(0); ++i)
        out.push_back({r(i, 0), r(i, 1)});
    return out;
}

static std::vector<double> parse_bond_cos_params(const py::object &value) {
    std::vector<double> out;
    if (value.is_none())
        return out;
    auto buf = dense_array::ensure(value);
    if (!buf || (buf.size() != 0 && buf.ndim() != 1))
        throw InvalidConfig("bond_cos_params should be a vector.");
    return std::vector<double>(buf.data(), buf.data() + buf.size());
}

static std::vector<AngularParam> parse_ang_params(const py::object &value) {
    std::vector<AngularParam> out;
    if (value.is_none())
        return out;
    auto buf = parse_matrix(value, 3,
                            "ang_params should be a matrix with three columns (eta, zeta, lambda).");
    if (buf.size() == 0)
        return out;
    auto r = buf.unchecked<2>();
    for (py::ssize_t i = 0; i < r.shape(0); ++i)
        out.push_back({r(i, 0), r(i, 1), r(i, 2)});
    return out;
}

// Python-facing descriptor object. Parameters are fixed at construction; the property
// setters exist only to reject assignment with ConfigLocked.
class PyACSF {
  public:
    PyACSF(long long n_atoms_max, const py::object &types, const py::object &bond_params,
           const py::object &bond_cos_params, const py::object &ang_params, double rcut,
           bool flatten)
        : engine_(DescriptorConfig(n_atoms_max, parse_types(types), parse_bond_params(bond_params),
                                   parse_bond_cos_params(bond_cos_params),
                                   parse_ang_params(ang_params), rcut),
                  flatten) {}

    const DescriptorEngine &engine() const { return engine_; }

    py::array_t<int> types() const {
        const std::vector<int> &t = engine_.config().types();
        py::array_t<int> out(static_cast<py::ssize_t>(t.size()));
        std::copy(t.begin(), t.end(), out.mutable_data());
        return out;
    }

    py::object bond_params() const {
        const auto &p = engine_.config().radial_params();
        if (p.empty())
            return py::none();
        py::array_t<double> out({static_cast<py::ssize_t>(p.size()), py::ssize_t(2)});
        auto w = out.mutable_unchecked<2>();
        for (size_t i = 0; i < p.size(); ++i) {
            w(i, 0) = p[i].eta;
            w(i, 1) = p[i].rs;
        }
        return std::move(out);
    }

    py::object bond_cos_params() const {
        const auto &p = engine_.config().radial_cos_params();
        if (p.empty())
            return py::none();
        py::array_t<double> out(static_cast<py::ssize_t>(p.size()));
        std::copy(p.begin(), p.end(), out.mutable_data());
        return std::move(out);
    }

    py::object ang_params() const {
        const auto &p = engine_.config().angular_params();
        if (p.empty())
            return py::none();
        py::array_t<double> out({static_cast<py::ssize_t>(p.size()), py::ssize_t(3)});
        auto w = out.mutable_unchecked<2>();
        for (size_t i = 0; i < p.size(); ++i) {
            w(i, 0) = p[i].eta;
            w(i, 1) = p[i].zeta;
            w(i, 2) = p[i].lambda;
        }
        return std::move(out);
    }

    py::array_t<double> describe_structure(const Structure &structure) const {
        std::vector<double> values;
        {
            py::gil_scoped_release release;
            values = engine_.describe_values(structure);
        }

        std::vector<py::ssize_t> shape;
        for (std::size_t extent : engine_.shape())
            shape.push_back(static_cast<py::ssize_t>(extent));
        py::array_t<double> out(shape);
        std::copy(values.begin(), values.end(), out.mutable_data());
        return out;
    }

    py::array_t<double> describe_arrays(const py::object &atomic_numbers,
                                        const py::object &positions,
                                        const py::object &distances) const {
        std::vector<int> z = as_int_vector(atomic_numbers);
        const size_t natoms = z.size();
        std::vector<double> coords, dist;
        if (!distances.is_none())
            dist = as_distance_vector(distances, natoms);
        else if (!positions.is_none())
            coords = as_coords_vector(positions, natoms);
        return describe_structure(Structure(std::move(z), std::move(coords), std::move(dist)));
    }

    // system: any object with get_atomic_numbers() and get_positions(), and optionally
    // get_distance_matrix() (used in preference to positions when present)
    py::array_t<double> describe(const py::object &system) const {
        py::object z = system.attr("get_atomic_numbers")();
        if (py::hasattr(system, "get_distance_matrix"))
            return describe_arrays(z, py::none(), system.attr("get_distance_matrix")());
        return describe_arrays(z, system.attr("get_positions")(), py::none());
    }

  private:
    DescriptorEngine engine_;
};

// Setter that always rejects assignment
static py::cpp_function locked(const char *message) {
    return py::cpp_function([message](PyACSF &, const py::object &) { throw ConfigLocked(message); });
}

PYBIND11_MODULE(acsf, m) {
    m.doc() = "Atom-centered symmetry function (ACSF) descriptors";

    py::register_exception<af::acsf::InvalidConfig>(m, "InvalidConfig", PyExc_ValueError);
    py::register_exception<af::acsf::UnknownType>(m, "UnknownType", PyExc_ValueError);
    py::register_exception<af::acsf::TooManyAtoms>(m, "TooManyAtoms", PyExc_ValueError);
    py::register_exception<af::acsf::ConfigLocked>(m, "ConfigLocked", PyExc_AttributeError);

    m.def("compute_rep_size", &af::acsf::compute_rep_size, py::arg("n_types"), py::arg("n_g2"),
          py::arg("n_g3"), "Number of features per atom.");

    py::class_<PyACSF>(m, "ACSF")
        .def(py::init<long long, const py::object &, const py::object &, const py::object &,
                      const py::object &, double, bool>(),
             py::arg("n_atoms_max"), py::arg("types"), py::arg("bond_params") = py::none(),
             py::arg("bond_cos_params") = py::none(), py::arg("ang_params") = py::none(),
             py::arg("rcut") = af::DEFAULT_CUTOFF, py::arg("flatten") = true,
             R"pbdoc(
Atom-centered symmetry function descriptor.

Parameters
----------
n_atoms_max : int
    Number of rows in every output; structures may not exceed it.
types : sequence of int
    Atomic numbers that may appear. Deduplicated and sorted.
bond_params : (n, 2) array of (eta, Rs), optional
    Gaussian 2-body terms exp(-eta*(r - Rs)^2) * fc(r). None disables.
bond_cos_params : (n,) array of eta, optional
    Cosine 2-body terms cos(eta*r) * fc(r). None disables.
ang_params : (n, 3) array of (eta, zeta, lambda), optional
    3-body terms. zeta must be a positive integer, lambda +1 or -1. None disables.
rcut : float, default 5.0
    Cutoff radius.
flatten : bool, default True
    Return describe() output as a 1D array.
)pbdoc")
        .def_property("types", &PyACSF::types, locked("Cannot change the atomic types."))
        .def_property("bond_params", &PyACSF::bond_params,
                      locked("Cannot change 2-body ACSF parameters."))
        .def_property("bond_cos_params", &PyACSF::bond_cos_params,
                      locked("Cannot change 2-body Cos-type ACSF parameters."))
        .def_property("ang_params", &PyACSF::ang_params,
                      locked("Cannot change 3-body ACSF parameters."))
        .def_property(
            "n_atoms_max", [](const PyACSF &self) { return self.engine().config().max_atoms(); },
            locked("Cannot change n_atoms_max."))
        .def_property(
            "rcut", [](const PyACSF &self) { return self.engine().config().cutoff(); },
            locked("Cannot change the cutoff radius."))
        .def_property_readonly("flatten",
                               [](const PyACSF &self) { return self.engine().flatten(); })
        .def_property_readonly("n_g2",
                               [](const PyACSF &self) { return self.engine().config().n_g2(); })
        .def_property_readonly("n_g3",
                               [](const PyACSF &self) { return self.engine().config().n_g3(); })
        .def("describe", &PyACSF::describe, py::arg("system"),
             R"pbdoc(
Describe a structure.

system must provide get_atomic_numbers() and get_positions(); get_distance_matrix()
is used instead of positions when available.

Returns
-------
ndarray, shape (n_atoms_max, n_features_per_atom), or flattened when flatten=True.
)pbdoc")
        .def("describe_arrays", &PyACSF::describe_arrays, py::arg("atomic_numbers"),
             py::arg("positions") = py::none(), py::arg("distances") = py::none(),
             "Describe a structure given as arrays; distances take precedence over positions.")
        .def("get_number_of_features",
             [](const PyACSF &self) { return self.engine().number_of_features(); },
             "Total number of features, n_atoms_max * features per atom.");
}
