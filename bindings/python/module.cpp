/*
  Pybind11 module exposing RoadNet-Core C++ APIs to Python.

  Notes:
    - Edge attributes convert between Python values and AttrValue:
      None <-> null, int/float -> number, str <-> text, list[str] <-> text list.
    - shortest_path accepts single node ids or sequences, returning a list of
      node ids (or None) or a list of those.
    - Error types map onto ValueError, TypeError and KeyError.
    - The GIL is released around searches; imputation keeps it because the
      aggregation function may be a Python callable.
*/
#include <pybind11/pybind11.h>
#include <pybind11/functional.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <vector>

#include "roadnet/core/attribute.hpp"
#include "roadnet/core/error.hpp"
#include "roadnet/core/k_shortest_paths.hpp"
#include "roadnet/core/log.hpp"
#include "roadnet/core/multidigraph.hpp"
#include "roadnet/core/options.hpp"
#include "roadnet/core/route.hpp"
#include "roadnet/core/shortest_paths.hpp"
#include "roadnet/core/speeds.hpp"
#include "roadnet/core/travel_times.hpp"
#include "roadnet/core/verify.hpp"

namespace py = pybind11;
using namespace roadnet::core;

namespace {

AttrValue to_attr(const py::handle& obj) {
  if (obj.is_none()) return Null{};
  if (py::isinstance<py::bool_>(obj) || py::isinstance<py::int_>(obj) || py::isinstance<py::float_>(obj)) {
    return py::cast<double>(obj);
  }
  if (py::isinstance<py::str>(obj)) return py::cast<std::string>(obj);
  if (py::isinstance<py::list>(obj) || py::isinstance<py::tuple>(obj)) {
    TextList out;
    for (auto item : obj) {
      // Mixed lists (e.g. numeric maxspeed values) are carried as text.
      out.push_back(py::isinstance<py::str>(item) ? py::cast<std::string>(item)
                                                  : py::cast<std::string>(py::str(item)));
    }
    return out;
  }
  throw py::type_error("unsupported edge attribute value type");
}

py::object from_attr(const AttrValue& v) {
  return std::visit(overloaded{
      [](const Null&) -> py::object { return py::none(); },
      [](double d) -> py::object { return py::float_(d); },
      [](const Text& t) -> py::object { return py::str(t); },
      [](const TextList& l) -> py::object { return py::cast(l); },
  }, v);
}

py::dict attrs_to_dict(const AttributeMap& attrs) {
  py::dict d;
  for (const auto& [name, value] : attrs) d[py::str(name)] = from_attr(value);
  return d;
}

AttributeMap kwargs_to_attrs(const py::kwargs& kw) {
  AttributeMap attrs;
  for (auto item : kw) attrs.emplace(py::cast<std::string>(item.first), to_attr(item.second));
  return attrs;
}

NodeSelector to_selector(const py::object& obj) {
  if (py::isinstance<py::int_>(obj)) return py::cast<NodeId>(obj);
  if (py::isinstance<py::iterable>(obj) && !py::isinstance<py::str>(obj)) {
    std::vector<NodeId> ids;
    for (auto item : obj) ids.push_back(py::cast<NodeId>(item));
    return ids;
  }
  throw py::type_error("node ids must be an int or an iterable of ints");
}

py::object result_to_py(const PathResult& r) {
  if (const auto* p = std::get_if<Path>(&r)) return py::cast(*p);
  return py::none();
}

} // namespace

PYBIND11_MODULE(_roadnet_core, m) {
  m.doc() = "RoadNet-Core C++ bindings";

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const TypeError& e) {
      PyErr_SetString(PyExc_TypeError, e.what());
    } catch (const KeyError& e) {
      PyErr_SetString(PyExc_KeyError, e.what());
    } catch (const ValueError& e) {
      PyErr_SetString(PyExc_ValueError, e.what());
    }
  });

  py::class_<MultiDiGraph>(m, "MultiDiGraph")
      .def(py::init<>())
      .def("add_node", [](MultiDiGraph& g, NodeId id){ (void)g.add_node(id); }, py::arg("node"))
      .def("add_edge", [](MultiDiGraph& g, NodeId u, NodeId v, py::object key, py::kwargs kw){
        auto attrs = kwargs_to_attrs(kw);
        if (key.is_none()) return g.add_edge(u, v, std::move(attrs));
        return g.add_edge(u, v, py::cast<EdgeKey>(key), std::move(attrs));
      }, py::arg("u"), py::arg("v"), py::arg("key") = py::none())
      .def("has_node", &MultiDiGraph::has_node)
      .def("number_of_nodes", &MultiDiGraph::num_nodes)
      .def("number_of_edges", &MultiDiGraph::num_edges)
      .def("nodes", [](const MultiDiGraph& g){
        auto ids = g.node_ids_view();
        return std::vector<NodeId>(ids.begin(), ids.end());
      })
      .def("edges", [](const MultiDiGraph& g){
        py::list out;
        for (EdgeIndex e = 0; e < g.num_edges(); ++e) {
          auto ref = g.edge_ref(e);
          out.append(py::make_tuple(ref.u, ref.v, ref.key, attrs_to_dict(g.edge(e).attrs)));
        }
        return out;
      })
      .def("get_edge_data", [](const MultiDiGraph& g, NodeId u, NodeId v, EdgeKey key) -> py::object {
        auto e = g.find_edge(u, v, key);
        if (!e) return py::none();
        return attrs_to_dict(g.edge(*e).attrs);
      }, py::arg("u"), py::arg("v"), py::arg("key") = 0);

  m.def("verify_edge_attribute", &verify_edge_attribute, py::arg("G"), py::arg("attr"));

  m.def("add_edge_speeds",
        [](MultiDiGraph& g, std::optional<SpeedTable> hwy_speeds, std::optional<double> fallback,
           std::optional<std::function<double(std::vector<double>)>> agg, bool convert_units) {
          SpeedOptions opts;
          if (hwy_speeds) opts.hwy_speeds = std::move(*hwy_speeds);
          opts.fallback = fallback;
          opts.convert_units = convert_units;
          if (agg) {
            auto fn = std::move(*agg);
            opts.agg = [fn](std::span<const double> values) {
              return fn(std::vector<double>(values.begin(), values.end()));
            };
          }
          add_edge_speeds(g, opts);
        }, py::arg("G"), py::kw_only(), py::arg("hwy_speeds") = py::none(),
        py::arg("fallback") = py::none(), py::arg("agg") = py::none(), py::arg("convert_units") = true);

  m.def("add_edge_travel_times", &add_edge_travel_times, py::arg("G"));

  m.def("shortest_path",
        [](const MultiDiGraph& g, py::object orig, py::object dest, std::string weight,
           std::optional<int> cpus) -> py::object {
          RoutingOptions opts;
          opts.weight = std::move(weight);
          opts.cpus = cpus;
          auto o = to_selector(orig);
          auto d = to_selector(dest);
          ShortestPathOutput out;
          {
            py::gil_scoped_release release;
            out = shortest_path(g, o, d, opts);
          }
          if (const auto* single = std::get_if<PathResult>(&out)) return result_to_py(*single);
          py::list paths;
          for (const auto& r : std::get<std::vector<PathResult>>(out)) paths.append(result_to_py(r));
          return paths;
        }, py::arg("G"), py::arg("orig"), py::arg("dest"), py::kw_only(),
        py::arg("weight") = std::string(kLengthAttr), py::arg("cpus") = 1);

  py::class_<KShortestPaths>(m, "KShortestPaths")
      .def("__iter__", [](KShortestPaths& self) -> KShortestPaths& { return self; })
      .def("__next__", [](KShortestPaths& self){
        std::optional<Path> p;
        {
          py::gil_scoped_release release;
          p = self.next();
        }
        if (!p) throw py::stop_iteration();
        return *p;
      })
      .def_property_readonly("last_weight", &KShortestPaths::last_weight);

  m.def("k_shortest_paths",
        [](const MultiDiGraph& g, NodeId orig, NodeId dest, int k, std::string weight) {
          return k_shortest_paths(g, orig, dest, k, weight);
        }, py::arg("G"), py::arg("orig"), py::arg("dest"), py::arg("k"), py::kw_only(),
        py::arg("weight") = std::string(kLengthAttr));

  m.def("route_to_edges",
        [](const MultiDiGraph& g, const std::vector<NodeId>& route, std::string weight) {
          py::list out;
          for (const auto& ref : route_to_edges(g, route, weight)) out.append(py::make_tuple(ref.u, ref.v, ref.key));
          return out;
        }, py::arg("G"), py::arg("route"), py::kw_only(), py::arg("weight") = std::string(kLengthAttr));

  m.def("route_weight",
        [](const MultiDiGraph& g, const std::vector<NodeId>& route, std::string weight) {
          return route_weight(g, route, weight);
        }, py::arg("G"), py::arg("route"), py::kw_only(), py::arg("weight") = std::string(kLengthAttr));

  m.def("set_log_level", [](const std::string& level){ set_log_level(spdlog::level::from_str(level)); },
        py::arg("level"));
}
