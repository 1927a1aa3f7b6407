#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "completion_repair.hpp"

namespace py = pybind11;

using completion_repair::ConfigurationError;
using completion_repair::Json;
using completion_repair::JsonArray;
using completion_repair::JsonObject;
using completion_repair::PipelineStep;
using completion_repair::SanitizerConfig;
using completion_repair::ValidationError;

static py::object ToPy(const Json& v);

static bool FromPy(py::handle v, Json& out);

static py::object ToPyObject(const JsonObject& o) {
  py::dict d;
  for (const auto& kv : o) {
    d[py::str(kv.first)] = ToPy(kv.second);
  }
  return std::move(d);
}

static py::object ToPyArray(const JsonArray& a) {
  py::list out;
  for (const auto& el : a) {
    out.append(ToPy(el));
  }
  return std::move(out);
}

static py::object ToPyNumber(double n) {
  if (std::isfinite(n)) {
    const double ip = std::trunc(n);
    if (ip == n && ip >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
        ip <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
      return py::int_(static_cast<int64_t>(ip));
    }
  }
  return py::float_(n);
}

static py::object ToPy(const Json& v) {
  if (v.is_null()) return py::none();
  if (v.is_bool()) return py::bool_(v.as_bool());
  if (v.is_number()) return ToPyNumber(v.as_number());
  if (v.is_string()) return py::str(v.as_string());
  if (v.is_array()) return ToPyArray(v.as_array());
  return ToPyObject(v.as_object());
}

static bool FromPyObject(py::handle v, Json& out) {
  py::dict d = py::reinterpret_borrow<py::dict>(v);
  JsonObject obj;
  for (auto item : d) {
    if (!py::isinstance<py::str>(item.first)) return false;
    std::string key = py::cast<std::string>(item.first);
    Json child;
    if (!FromPy(item.second, child)) return false;
    obj.emplace(std::move(key), std::move(child));
  }
  out = Json(std::move(obj));
  return true;
}

static bool FromPyArray(py::handle v, Json& out) {
  py::sequence seq = py::reinterpret_borrow<py::sequence>(v);
  JsonArray arr;
  arr.reserve(seq.size());
  for (auto item : seq) {
    Json child;
    if (!FromPy(item, child)) return false;
    arr.push_back(std::move(child));
  }
  out = Json(std::move(arr));
  return true;
}

static bool FromPy(py::handle v, Json& out) {
  if (v.is_none()) {
    out = Json(nullptr);
    return true;
  }
  if (py::isinstance<py::bool_>(v)) {
    out = Json(py::cast<bool>(v));
    return true;
  }
  if (py::isinstance<py::int_>(v)) {
    out = Json(py::cast<int64_t>(v));
    return true;
  }
  if (py::isinstance<py::float_>(v)) {
    out = Json(py::cast<double>(v));
    return true;
  }
  if (py::isinstance<py::str>(v)) {
    out = Json(py::cast<std::string>(v));
    return true;
  }
  if (py::isinstance<py::dict>(v)) {
    return FromPyObject(v, out);
  }
  if (py::isinstance<py::list>(v) || py::isinstance<py::tuple>(v)) {
    return FromPyArray(v, out);
  }
  return false;
}

// Accepts a dict/list or a JSON string.
static Json DocumentFromPy(py::handle doc, const char* what) {
  if (py::isinstance<py::str>(doc)) {
    return completion_repair::parse_json(py::cast<std::string>(doc));
  }
  Json out;
  if (!FromPy(doc, out)) {
    throw ConfigurationError(std::string(what) + " must be a JSON-serializable dict/list or a JSON string");
  }
  return out;
}

static SanitizerConfig ConfigFromPy(py::object o) {
  if (o.is_none()) return SanitizerConfig{};
  return completion_repair::sanitizer_config_from_json(DocumentFromPy(o, "config"));
}

static py::list StepsToPy(const std::vector<PipelineStep>& steps) {
  py::list out;
  for (const auto& s : steps) out.append(ToPy(completion_repair::to_json(s)));
  return out;
}

static py::dict IssueToPy(const ValidationError& e) {
  py::dict d;
  d["message"] = e.message;
  d["path"] = e.path;
  d["kind"] = e.kind;
  return d;
}

static py::object ValidationErrorType;
static py::object ConfigurationErrorType;

static void TranslateValidationError(const ValidationError& e) {
  const std::string msg = std::string(e.what());
  const std::string full = e.path.empty() ? msg : (e.path + ": " + msg);
  py::object exc = ValidationErrorType(py::str(full));
  exc.attr("message") = py::str(msg);
  exc.attr("path") = py::str(e.path);
  exc.attr("kind") = py::str(e.kind);
  PyErr_SetObject(ValidationErrorType.ptr(), exc.ptr());
}

PYBIND11_MODULE(_native, m) {
  m.doc() = "C++17-backed LLM completion repair and classification (pybind11)";

  ValidationErrorType = py::reinterpret_steal<py::object>(
      PyErr_NewException("completion_repair.ValidationError", PyExc_Exception, nullptr));
  ConfigurationErrorType = py::reinterpret_steal<py::object>(
      PyErr_NewException("completion_repair.ConfigurationError", PyExc_Exception, nullptr));
  m.attr("ValidationError") = ValidationErrorType;
  m.attr("ConfigurationError") = ConfigurationErrorType;

  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) std::rethrow_exception(p);
    } catch (const ValidationError& e) {
      TranslateValidationError(e);
    } catch (const ConfigurationError& e) {
      PyErr_SetString(ConfigurationErrorType.ptr(), e.what());
    }
  });

  m.def("is_in_string_at", &completion_repair::is_in_string_at, py::arg("position"), py::arg("content"));

  m.def(
      "sanitize",
      [](const std::string& text, py::object config) {
        auto run = completion_repair::sanitize_completion(text, ConfigFromPy(config));
        py::dict d;
        d["content"] = run.content;
        d["repaired"] = run.repaired;
        d["steps"] = StepsToPy(run.steps);
        d["diagnostics"] = run.diagnostics;
        return d;
      },
      py::arg("text"), py::arg("config") = py::none());

  m.def(
      "parse_and_validate",
      [](const std::string& text, py::object schema, const std::string& resource, py::object config) {
        completion_repair::LlmContext context;
        context.resource = resource;
        Json s = schema.is_none() ? Json() : DocumentFromPy(schema, "schema");
        auto r = completion_repair::parse_and_validate(text, s, context, ConfigFromPy(config));

        py::dict d;
        d["success"] = r.success;
        d["data"] = r.success ? ToPy(r.data) : py::none();
        d["repairs"] = r.repairs;
        d["steps"] = StepsToPy(r.steps);
        if (r.error) {
          py::dict err;
          err["kind"] = r.error->kind == completion_repair::ErrorDetail::Kind::Parse ? "parse" : "validation";
          err["message"] = r.error->message;
          err["cause"] = r.error->cause;
          py::list issues;
          for (const auto& issue : r.error->issues) issues.append(IssueToPy(issue));
          err["issues"] = issues;
          err["diagnostics"] = r.error->diagnostics;
          d["error"] = err;
        } else {
          d["error"] = py::none();
        }
        return d;
      },
      py::arg("text"), py::arg("schema") = py::none(), py::arg("resource") = "python", py::arg("config") = py::none());

  m.def(
      "classify",
      [](py::handle content, py::object schema, const std::string& output_format, const std::string& purpose,
         const std::string& resource, py::object config, py::object error_dir) {
        completion_repair::CompletionOptions options;
        if (output_format == "json") {
          options.output_format = completion_repair::OutputFormat::Json;
        } else if (output_format == "text") {
          options.output_format = completion_repair::OutputFormat::Text;
        } else {
          throw ConfigurationError("Configuration error: output_format must be 'json' or 'text'");
        }
        if (purpose != "completions" && purpose != "embeddings") {
          throw ConfigurationError("Configuration error: purpose must be 'completions' or 'embeddings'");
        }
        if (!schema.is_none()) options.json_schema = DocumentFromPy(schema, "schema");
        if (!config.is_none()) options.sanitizer_config = ConfigFromPy(config);

        std::shared_ptr<completion_repair::ErrorLogger> error_logger;
        if (error_dir.is_none()) {
          error_logger = std::make_shared<completion_repair::LogErrorLogger>();
        } else {
          error_logger = std::make_shared<completion_repair::FileErrorLogger>(py::cast<std::string>(error_dir));
        }
        completion_repair::ResponseClassifier classifier(error_logger);

        Json value;
        if (!FromPy(content, value)) throw ConfigurationError("content must be a str or a JSON-serializable value");

        completion_repair::ResponseBase base;
        base.request = "python";
        base.context.resource = resource;
        base.model_key = "python";
        auto response = classifier.classify(
            base,
            purpose == "embeddings" ? completion_repair::LlmPurpose::Embeddings
                                    : completion_repair::LlmPurpose::Completions,
            value, options);
        return ToPy(completion_repair::to_json(response));
      },
      py::arg("content"), py::arg("schema") = py::none(), py::arg("output_format") = "json",
      py::arg("purpose") = "completions", py::arg("resource") = "python", py::arg("config") = py::none(),
      py::arg("error_dir") = py::none());

  m.def("dumps_json", [](py::handle v) {
    Json j;
    if (!FromPy(v, j)) throw ConfigurationError("value is not JSON-serializable");
    return completion_repair::dumps_json(j);
  });
}
