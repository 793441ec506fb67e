#include "../include/study/study_engine.hpp"
#include "../include/study/calibration.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <map>
#include <stdexcept>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      auto key = py::cast<std::string>(item.first);
      json_obj[key] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw std::runtime_error("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_unsigned()) {
    return py::int_(json_value.get<unsigned long long>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  if (json_value.is_object()) {
    py::dict dict;
    for (const auto& entry : json_value.items()) {
      dict[py::str(entry.key())] = json_to_py(entry.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

py::object next_to_py(const study::StudyEngine::Next& next) {
  if (auto presentation = std::get_if<study::ItemPresentation>(&next)) {
    return json_to_py(study::bridge::to_json(*presentation));
  }
  return json_to_py(study::bridge::to_json(std::get<study::SessionSummary>(next)));
}

// The engine mutates learner state in place; the wrapper owns one copy per
// learner and hands it back as a dict on request.
class PyStudyEngine {
public:
  PyStudyEngine(py::object bank_obj, py::object blueprint_obj, py::object config_obj,
                py::object telemetry_path) {
    auto bank = study::bridge::item_bank_from_json(py_to_json(bank_obj));
    study::BlueprintConfig blueprint;
    if (!blueprint_obj.is_none()) {
      blueprint = study::bridge::blueprint_from_json(py_to_json(blueprint_obj));
    }
    study::EngineConfig config;
    if (!config_obj.is_none()) {
      config = study::bridge::engine_config_from_json(py_to_json(config_obj));
    }
    std::shared_ptr<study::TelemetrySink> sink;
    if (!telemetry_path.is_none()) {
      sink = std::make_shared<study::JsonLinesSink>(telemetry_path.cast<std::string>());
    }
    engine_ = study::make_engine(std::move(bank), std::move(blueprint), std::move(config), sink);
  }

  std::string load_learner(py::object learner_obj) {
    auto learner = study::bridge::learner_state_from_json(py_to_json(learner_obj));
    if (learner.learner_id.empty()) {
      throw std::invalid_argument("Learner state needs a learner_id");
    }
    const std::string id = learner.learner_id;
    learners_[id] = std::move(learner);
    return id;
  }

  py::object learner_state(const std::string& learner_id) {
    return json_to_py(study::bridge::to_json(learner(learner_id)));
  }

  std::string create_session(py::object spec_obj) {
    auto spec = study::bridge::session_spec_from_json(py_to_json(spec_obj));
    if (spec.learner_id.empty()) {
      throw std::invalid_argument("Session spec needs a learner_id");
    }
    auto& state = learners_[spec.learner_id];
    auto session_id = engine_->create_session(spec, state);
    session_learners_[session_id] = spec.learner_id;
    return session_id;
  }

  py::object next_item(const std::string& session_id, long long now_ms) {
    return next_to_py(engine_->next_item(session_id, session_learner(session_id), now_ms));
  }

  py::object submit_response(const std::string& session_id, py::object report_obj) {
    auto report = study::bridge::response_report_from_json(py_to_json(report_obj));
    return next_to_py(engine_->submit_response(session_id, session_learner(session_id), report));
  }

  py::object end_session(const std::string& session_id) {
    auto summary = engine_->end_session(session_id, session_learner(session_id));
    session_learners_.erase(session_id);
    return json_to_py(study::bridge::to_json(summary));
  }

  py::object debug_state(const std::string& session_id) {
    return json_to_py(engine_->debug_state(session_id));
  }

  void publish_item_bank(py::object bank_obj) {
    engine_->publish_item_bank(study::bridge::item_bank_from_json(py_to_json(bank_obj)));
  }

  std::uint64_t item_bank_version() const { return engine_->item_bank_version(); }

  py::object telemetry_stats() const {
    const auto stats = engine_->telemetry_stats();
    nlohmann::json json_stats = {{"emitted", stats.emitted},
                                 {"written", stats.written},
                                 {"retries", stats.retries},
                                 {"dropped_overflow", stats.dropped_overflow},
                                 {"dropped_failed", stats.dropped_failed}};
    return json_to_py(json_stats);
  }

  void flush_telemetry() { engine_->flush_telemetry(); }

private:
  study::LearnerState& learner(const std::string& learner_id) {
    auto it = learners_.find(learner_id);
    if (it == learners_.end()) {
      throw std::invalid_argument("Unknown learner id: " + learner_id);
    }
    return it->second;
  }

  study::LearnerState& session_learner(const std::string& session_id) {
    auto it = session_learners_.find(session_id);
    if (it == session_learners_.end()) {
      throw std::invalid_argument("Unknown session id: " + session_id);
    }
    return learner(it->second);
  }

  std::unique_ptr<study::StudyEngine> engine_;
  std::map<std::string, study::LearnerState> learners_;
  std::map<std::string, std::string> session_learners_;
};

py::object calibrate(py::object bank_obj, py::object responses_obj) {
  auto bank = study::bridge::item_bank_from_json(py_to_json(bank_obj));
  auto responses_json = py_to_json(responses_obj);
  if (!responses_json.is_array()) {
    throw std::invalid_argument("Calibration responses must be a list");
  }
  std::vector<study::CalibrationResponse> responses;
  responses.reserve(responses_json.size());
  for (const auto& entry : responses_json) {
    study::CalibrationResponse response;
    response.learner_id = entry.at("learner_id").get<std::string>();
    response.item_id = entry.at("item_id").get<std::string>();
    response.score_fraction = entry.at("score_fraction").get<double>();
    responses.push_back(std::move(response));
  }
  auto report = study::calibrate_item_bank(bank, responses);
  nlohmann::json json_report = nlohmann::json::object();
  json_report["bank"] = study::bridge::to_json(report.bank);
  json_report["iterations"] = report.iterations;
  json_report["converged"] = report.converged;
  json_report["last_change"] = report.last_change;
  json_report["responses_used"] = report.responses_used;
  json_report["unknown_items"] = report.unknown_items;
  return json_to_py(json_report);
}

} // namespace

PYBIND11_MODULE(_studycore, m) {
  py::class_<PyStudyEngine>(m, "StudyEngine")
      .def(py::init<py::object, py::object, py::object, py::object>(), py::arg("item_bank"),
           py::arg("blueprint") = py::none(), py::arg("config") = py::none(),
           py::arg("telemetry_path") = py::none())
      .def("load_learner", &PyStudyEngine::load_learner)
      .def("learner_state", &PyStudyEngine::learner_state)
      .def("create_session", &PyStudyEngine::create_session)
      .def("next_item", &PyStudyEngine::next_item, py::arg("session_id"), py::arg("now_ms"))
      .def("submit_response", &PyStudyEngine::submit_response)
      .def("end_session", &PyStudyEngine::end_session)
      .def("debug_state", &PyStudyEngine::debug_state)
      .def("publish_item_bank", &PyStudyEngine::publish_item_bank)
      .def("item_bank_version", &PyStudyEngine::item_bank_version)
      .def("telemetry_stats", &PyStudyEngine::telemetry_stats)
      .def("flush_telemetry", &PyStudyEngine::flush_telemetry);

  m.def("calibrate", &calibrate, py::arg("item_bank"), py::arg("responses"));
}
