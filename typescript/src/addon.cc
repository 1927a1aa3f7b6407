#include <node_api.h>

#include <memory>
#include <string>
#include <utility>

#include "completion_repair.hpp"

using completion_repair::ConfigurationError;
using completion_repair::Json;
using completion_repair::PipelineStep;
using completion_repair::SanitizerConfig;
using completion_repair::ValidationError;

static void ThrowTypeError(napi_env env, const char* msg) { napi_throw_type_error(env, nullptr, msg); }

static napi_value MakeString(napi_env env, const std::string& s) {
  napi_value out;
  napi_create_string_utf8(env, s.c_str(), s.size(), &out);
  return out;
}

static void ThrowErrorWithKind(napi_env env, const std::string& msg, const std::string& kind) {
  napi_value message = MakeString(env, msg);
  napi_value err;
  napi_create_error(env, nullptr, message, &err);
  napi_set_named_property(env, err, "message", message);
  napi_set_named_property(env, err, "kind", MakeString(env, kind));
  napi_throw(env, err);
}

static void ThrowConfigurationError(napi_env env, const ConfigurationError& e) {
  napi_value message = MakeString(env, e.what());
  napi_value err;
  napi_create_error(env, nullptr, message, &err);
  napi_set_named_property(env, err, "message", message);
  napi_set_named_property(env, err, "name", MakeString(env, "ConfigurationError"));
  napi_set_named_property(env, err, "kind", MakeString(env, "configuration"));
  napi_throw(env, err);
}

static void ThrowValidationError(napi_env env, const ValidationError& e) {
  napi_value message = MakeString(env, e.what());
  napi_value err;
  napi_create_error(env, nullptr, message, &err);
  napi_set_named_property(env, err, "message", message);
  napi_set_named_property(env, err, "name", MakeString(env, "ValidationError"));
  napi_set_named_property(env, err, "path", MakeString(env, e.path));
  napi_set_named_property(env, err, "kind", MakeString(env, e.kind));
  napi_throw(env, err);
}

static bool GetStringUtf8(napi_env env, napi_value v, std::string& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;
  if (t != napi_string) return false;

  size_t len = 0;
  if (napi_get_value_string_utf8(env, v, nullptr, 0, &len) != napi_ok) return false;

  out.resize(len);
  size_t written = 0;
  if (napi_get_value_string_utf8(env, v, out.data(), out.size() + 1, &written) != napi_ok) return false;
  out.resize(written);
  return true;
}

static bool IsNullish(napi_env env, napi_value v) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return true;
  return t == napi_null || t == napi_undefined;
}

static napi_value ToNapi(napi_env env, const Json& v);

static bool FromNapi(napi_env env, napi_value v, Json& out);

static bool FromNapiObject(napi_env env, napi_value v, Json& out) {
  napi_value names;
  if (napi_get_property_names(env, v, &names) != napi_ok) return false;

  uint32_t len = 0;
  if (napi_get_array_length(env, names, &len) != napi_ok) return false;

  completion_repair::JsonObject obj;
  for (uint32_t i = 0; i < len; ++i) {
    napi_value keyv;
    if (napi_get_element(env, names, i, &keyv) != napi_ok) return false;
    std::string key;
    if (!GetStringUtf8(env, keyv, key)) return false;

    napi_value val;
    if (napi_get_property(env, v, keyv, &val) != napi_ok) return false;

    Json child;
    if (!FromNapi(env, val, child)) return false;
    obj.emplace(std::move(key), std::move(child));
  }
  out = Json(std::move(obj));
  return true;
}

static bool FromNapiArray(napi_env env, napi_value v, Json& out) {
  uint32_t len = 0;
  if (napi_get_array_length(env, v, &len) != napi_ok) return false;
  completion_repair::JsonArray arr;
  arr.reserve(len);
  for (uint32_t i = 0; i < len; ++i) {
    napi_value el;
    if (napi_get_element(env, v, i, &el) != napi_ok) return false;
    Json child;
    if (!FromNapi(env, el, child)) return false;
    arr.push_back(std::move(child));
  }
  out = Json(std::move(arr));
  return true;
}

static bool FromNapi(napi_env env, napi_value v, Json& out) {
  napi_valuetype t;
  if (napi_typeof(env, v, &t) != napi_ok) return false;

  if (t == napi_null || t == napi_undefined) {
    out = Json(nullptr);
    return true;
  }
  if (t == napi_boolean) {
    bool b = false;
    if (napi_get_value_bool(env, v, &b) != napi_ok) return false;
    out = Json(b);
    return true;
  }
  if (t == napi_number) {
    double n = 0;
    if (napi_get_value_double(env, v, &n) != napi_ok) return false;
    out = Json(n);
    return true;
  }
  if (t == napi_string) {
    std::string s;
    if (!GetStringUtf8(env, v, s)) return false;
    out = Json(std::move(s));
    return true;
  }
  if (t == napi_object) {
    bool is_array = false;
    if (napi_is_array(env, v, &is_array) != napi_ok) return false;
    if (is_array) return FromNapiArray(env, v, out);
    return FromNapiObject(env, v, out);
  }
  return false;
}

static napi_value ToNapiObject(napi_env env, const completion_repair::JsonObject& o) {
  napi_value obj;
  napi_create_object(env, &obj);
  for (const auto& kv : o) {
    napi_value val = ToNapi(env, kv.second);
    napi_set_named_property(env, obj, kv.first.c_str(), val);
  }
  return obj;
}

static napi_value ToNapiArray(napi_env env, const completion_repair::JsonArray& a) {
  napi_value arr;
  napi_create_array_with_length(env, a.size(), &arr);
  for (size_t i = 0; i < a.size(); ++i) {
    napi_value val = ToNapi(env, a[i]);
    napi_set_element(env, arr, static_cast<uint32_t>(i), val);
  }
  return arr;
}

static napi_value ToNapi(napi_env env, const Json& v) {
  if (v.is_null()) {
    napi_value n;
    napi_get_null(env, &n);
    return n;
  }
  if (v.is_bool()) {
    napi_value b;
    napi_get_boolean(env, v.as_bool(), &b);
    return b;
  }
  if (v.is_number()) {
    napi_value n;
    napi_create_double(env, v.as_number(), &n);
    return n;
  }
  if (v.is_string()) {
    return MakeString(env, v.as_string());
  }
  if (v.is_array()) {
    return ToNapiArray(env, v.as_array());
  }
  return ToNapiObject(env, v.as_object());
}

// Schemas and configs arrive either as objects or as JSON text.
static bool DocumentFromNapi(napi_env env, napi_value v, Json& out) {
  std::string text;
  if (GetStringUtf8(env, v, text)) {
    out = completion_repair::parse_json(text);
    return true;
  }
  return FromNapi(env, v, out);
}

static Json StepsJson(const std::vector<PipelineStep>& steps) {
  completion_repair::JsonArray out;
  for (const auto& s : steps) out.push_back(completion_repair::to_json(s));
  return out;
}

static Json StringsJson(const std::vector<std::string>& items) {
  completion_repair::JsonArray out;
  for (const auto& s : items) out.push_back(s);
  return out;
}

static bool ConfigFromNapi(napi_env env, napi_value v, SanitizerConfig& out) {
  if (IsNullish(env, v)) return true;
  Json doc;
  if (!DocumentFromNapi(env, v, doc)) {
    ThrowTypeError(env, "config must be an object or a JSON string");
    return false;
  }
  out = completion_repair::sanitizer_config_from_json(doc);
  return true;
}

static bool GetOptionalProperty(napi_env env, napi_value obj, const char* key, napi_value& out) {
  bool has = false;
  if (napi_has_named_property(env, obj, key, &has) != napi_ok || !has) return false;
  if (napi_get_named_property(env, obj, key, &out) != napi_ok) return false;
  return !IsNullish(env, out);
}

static napi_value Sanitize(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  if (napi_get_cb_info(env, info, &argc, argv, nullptr, nullptr) != napi_ok) return nullptr;
  std::string text;
  if (argc < 1 || !GetStringUtf8(env, argv[0], text)) {
    ThrowTypeError(env, "sanitize(text, config?) expects a string");
    return nullptr;
  }

  try {
    SanitizerConfig config;
    if (argc > 1 && !ConfigFromNapi(env, argv[1], config)) return nullptr;
    auto run = completion_repair::sanitize_completion(text, config);
    completion_repair::JsonObject o;
    o["content"] = run.content;
    o["repaired"] = run.repaired;
    o["steps"] = StepsJson(run.steps);
    o["diagnostics"] = StringsJson(run.diagnostics);
    return ToNapi(env, Json(std::move(o)));
  } catch (const ConfigurationError& e) {
    ThrowConfigurationError(env, e);
    return nullptr;
  } catch (const ValidationError& e) {
    ThrowValidationError(env, e);
    return nullptr;
  } catch (const std::exception& e) {
    ThrowErrorWithKind(env, e.what(), "internal");
    return nullptr;
  }
}

static napi_value ParseAndValidate(napi_env env, napi_callback_info info) {
  size_t argc = 4;
  napi_value argv[4];
  if (napi_get_cb_info(env, info, &argc, argv, nullptr, nullptr) != napi_ok) return nullptr;
  std::string text;
  if (argc < 1 || !GetStringUtf8(env, argv[0], text)) {
    ThrowTypeError(env, "parseAndValidate(text, schema?, resource?, config?) expects a string");
    return nullptr;
  }

  try {
    Json schema;
    if (argc > 1 && !IsNullish(env, argv[1]) && !DocumentFromNapi(env, argv[1], schema)) {
      ThrowTypeError(env, "schema must be an object or a JSON string");
      return nullptr;
    }
    completion_repair::LlmContext context;
    context.resource = "node";
    if (argc > 2 && !IsNullish(env, argv[2]) && !GetStringUtf8(env, argv[2], context.resource)) {
      ThrowTypeError(env, "resource must be a string");
      return nullptr;
    }
    SanitizerConfig config;
    if (argc > 3 && !ConfigFromNapi(env, argv[3], config)) return nullptr;

    auto r = completion_repair::parse_and_validate(text, schema, context, config);
    completion_repair::JsonObject o;
    o["success"] = r.success;
    o["data"] = r.success ? r.data : Json();
    o["repairs"] = StringsJson(r.repairs);
    o["steps"] = StepsJson(r.steps);
    if (r.error) {
      completion_repair::JsonArray issues;
      for (const auto& issue : r.error->issues) {
        issues.push_back(completion_repair::JsonObject{{"path", issue.path}, {"message", issue.message}, {"kind", issue.kind}});
      }
      completion_repair::JsonObject err;
      err["kind"] = r.error->kind == completion_repair::ErrorDetail::Kind::Parse ? "parse" : "validation";
      err["message"] = r.error->message;
      err["cause"] = r.error->cause;
      err["issues"] = std::move(issues);
      err["diagnostics"] = StringsJson(r.error->diagnostics);
      o["error"] = std::move(err);
    } else {
      o["error"] = Json();
    }
    return ToNapi(env, Json(std::move(o)));
  } catch (const ConfigurationError& e) {
    ThrowConfigurationError(env, e);
    return nullptr;
  } catch (const ValidationError& e) {
    ThrowValidationError(env, e);
    return nullptr;
  } catch (const std::exception& e) {
    ThrowErrorWithKind(env, e.what(), "internal");
    return nullptr;
  }
}

// classify(content, { schema, outputFormat, purpose, resource, config, errorDir })
static napi_value Classify(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  if (napi_get_cb_info(env, info, &argc, argv, nullptr, nullptr) != napi_ok) return nullptr;
  if (argc < 1) {
    ThrowTypeError(env, "classify(content, options?) expects at least 1 argument");
    return nullptr;
  }

  try {
    Json content;
    if (!FromNapi(env, argv[0], content)) {
      ThrowTypeError(env, "content must be a string or a JSON-compatible value");
      return nullptr;
    }

    completion_repair::CompletionOptions options;
    completion_repair::ResponseBase base;
    base.request = "node";
    base.model_key = "node";
    base.context.resource = "node";
    std::string purpose = "completions";
    std::string error_dir;

    if (argc > 1 && !IsNullish(env, argv[1])) {
      napi_value v;
      if (GetOptionalProperty(env, argv[1], "schema", v)) {
        Json schema;
        if (!DocumentFromNapi(env, v, schema)) {
          ThrowTypeError(env, "options.schema must be an object or a JSON string");
          return nullptr;
        }
        options.json_schema = std::move(schema);
      }
      std::string format = "json";
      if (GetOptionalProperty(env, argv[1], "outputFormat", v) && !GetStringUtf8(env, v, format)) {
        ThrowTypeError(env, "options.outputFormat must be 'json' or 'text'");
        return nullptr;
      }
      if (format != "json" && format != "text") {
        ThrowTypeError(env, "options.outputFormat must be 'json' or 'text'");
        return nullptr;
      }
      options.output_format = format == "text" ? completion_repair::OutputFormat::Text : completion_repair::OutputFormat::Json;
      if (GetOptionalProperty(env, argv[1], "purpose", v) && !GetStringUtf8(env, v, purpose)) {
        ThrowTypeError(env, "options.purpose must be 'completions' or 'embeddings'");
        return nullptr;
      }
      if (purpose != "completions" && purpose != "embeddings") {
        ThrowTypeError(env, "options.purpose must be 'completions' or 'embeddings'");
        return nullptr;
      }
      if (GetOptionalProperty(env, argv[1], "resource", v) && !GetStringUtf8(env, v, base.context.resource)) {
        ThrowTypeError(env, "options.resource must be a string");
        return nullptr;
      }
      if (GetOptionalProperty(env, argv[1], "config", v)) {
        SanitizerConfig config;
        if (!ConfigFromNapi(env, v, config)) return nullptr;
        options.sanitizer_config = std::move(config);
      }
      if (GetOptionalProperty(env, argv[1], "errorDir", v) && !GetStringUtf8(env, v, error_dir)) {
        ThrowTypeError(env, "options.errorDir must be a string");
        return nullptr;
      }
    }

    std::shared_ptr<completion_repair::ErrorLogger> error_logger;
    if (error_dir.empty()) {
      error_logger = std::make_shared<completion_repair::LogErrorLogger>();
    } else {
      error_logger = std::make_shared<completion_repair::FileErrorLogger>(error_dir);
    }
    completion_repair::ResponseClassifier classifier(error_logger);
    auto response = classifier.classify(
        base,
        purpose == "embeddings" ? completion_repair::LlmPurpose::Embeddings : completion_repair::LlmPurpose::Completions,
        content, options);
    return ToNapi(env, completion_repair::to_json(response));
  } catch (const ConfigurationError& e) {
    ThrowConfigurationError(env, e);
    return nullptr;
  } catch (const ValidationError& e) {
    ThrowValidationError(env, e);
    return nullptr;
  } catch (const std::exception& e) {
    ThrowErrorWithKind(env, e.what(), "internal");
    return nullptr;
  }
}

static napi_value IsInStringAt(napi_env env, napi_callback_info info) {
  size_t argc = 2;
  napi_value argv[2];
  if (napi_get_cb_info(env, info, &argc, argv, nullptr, nullptr) != napi_ok) return nullptr;
  double position = 0;
  std::string content;
  if (argc != 2 || napi_get_value_double(env, argv[0], &position) != napi_ok || !GetStringUtf8(env, argv[1], content)) {
    ThrowTypeError(env, "isInStringAt(position, content) expects a number and a string");
    return nullptr;
  }
  if (position < 0) {
    ThrowTypeError(env, "position must be >= 0");
    return nullptr;
  }
  napi_value out;
  napi_get_boolean(env, completion_repair::is_in_string_at(static_cast<size_t>(position), content), &out);
  return out;
}

static napi_value Init(napi_env env, napi_value exports) {
  napi_property_descriptor props[] = {
      {"sanitize", nullptr, Sanitize, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"parseAndValidate", nullptr, ParseAndValidate, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"classify", nullptr, Classify, nullptr, nullptr, nullptr, napi_default, nullptr},
      {"isInStringAt", nullptr, IsInStringAt, nullptr, nullptr, nullptr, napi_default, nullptr},
  };

  napi_define_properties(env, exports, sizeof(props) / sizeof(props[0]), props);
  return exports;
}

NAPI_MODULE(NODE_GYP_MODULE_NAME, Init)
