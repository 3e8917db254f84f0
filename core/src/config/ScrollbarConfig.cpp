#include "rs/config/ScrollbarConfig.hpp"

#include <cmath>

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

namespace rs {

namespace {

ConfigResult fail(const char* code, const std::string& message) {
  ConfigResult r;
  r.ok = false;
  r.code = code;
  r.message = message;
  return r;
}

bool nonNegative(double v) {
  return std::isfinite(v) && v >= 0.0;
}

bool validColor(const float c[4]) {
  for (int i = 0; i < 4; ++i) {
    if (!std::isfinite(c[i]) || c[i] < 0.0f || c[i] > 1.0f) return false;
  }
  return true;
}

void addMotion(rapidjson::Document& doc, const char* key, double durationMs, Curve curve) {
  auto& alloc = doc.GetAllocator();
  rapidjson::Value m(rapidjson::kObjectType);
  m.AddMember("durationMs", durationMs, alloc);
  m.AddMember("curve", rapidjson::StringRef(curveName(curve)), alloc);
  doc.AddMember(rapidjson::StringRef(key), m, alloc);
}

void addColor(rapidjson::Document& doc, const char* key, const float c[4]) {
  auto& alloc = doc.GetAllocator();
  rapidjson::Value arr(rapidjson::kArrayType);
  for (int i = 0; i < 4; ++i) arr.PushBack(static_cast<double>(c[i]), alloc);
  doc.AddMember(rapidjson::StringRef(key), arr, alloc);
}

// Each reader returns false only when the key is present with a bad value.
bool readNumber(const rapidjson::Value& obj, const char* key, double& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsNumber()) return false;
  out = v.GetDouble();
  return true;
}

bool readFloat(const rapidjson::Value& obj, const char* key, float& out) {
  double d = out;
  if (!readNumber(obj, key, d)) return false;
  out = static_cast<float>(d);
  return true;
}

bool readBool(const rapidjson::Value& obj, const char* key, bool& out) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (!v.IsBool()) return false;
  out = v.GetBool();
  return true;
}

bool readMotion(const rapidjson::Value& obj, const char* key, double& durationMs, Curve& curve) {
  if (!obj.HasMember(key)) return true;
  const auto& m = obj[key];
  if (!m.IsObject()) return false;
  if (!readNumber(m, "durationMs", durationMs)) return false;
  if (m.HasMember("curve")) {
    if (!m["curve"].IsString()) return false;
    if (!curveFromName(m["curve"].GetString(), curve)) return false;
  }
  return true;
}

bool readColor(const rapidjson::Value& obj, const char* key, bool& has, float c[4]) {
  if (!obj.HasMember(key)) return true;
  const auto& v = obj[key];
  if (v.IsNull()) {
    has = false;
    return true;
  }
  if (!v.IsArray() || v.Size() != 4) return false;
  for (rapidjson::SizeType i = 0; i < 4; ++i) {
    if (!v[i].IsNumber()) return false;
    c[i] = static_cast<float>(v[i].GetDouble());
  }
  has = true;
  return true;
}

} // namespace

ConfigResult validateConfig(const RoundScrollbarConfig& config) {
  if (!nonNegative(config.padding))
    return fail("BAD_PADDING", "padding must be a finite value >= 0");
  if (!nonNegative(config.strokeWidth))
    return fail("BAD_STROKE_WIDTH", "strokeWidth must be a finite value >= 0");
  if (!nonNegative(config.opacityDurationMs))
    return fail("BAD_DURATION", "opacity animation duration must be >= 0");
  if (!nonNegative(config.autoHideDelayMs))
    return fail("BAD_DURATION", "autoHide delay must be >= 0");
  if (!nonNegative(config.pageTransitionDurationMs))
    return fail("BAD_DURATION", "page transition duration must be >= 0");
  if (!nonNegative(config.scrollAnimationDurationMs))
    return fail("BAD_DURATION", "scroll animation duration must be >= 0");
  if (!std::isfinite(config.scrollMagnitude) || config.scrollMagnitude <= 0.0)
    return fail("BAD_SCROLL_MAGNITUDE", "scrollMagnitude must be a finite value > 0");
  if (config.hasTrackColor && !validColor(config.trackColor))
    return fail("BAD_COLOR", "trackColor components must be in [0,1]");
  if (config.hasThumbColor && !validColor(config.thumbColor))
    return fail("BAD_COLOR", "thumbColor components must be in [0,1]");
  return ConfigResult{};
}

VisibilityConfig toVisibilityConfig(const RoundScrollbarConfig& config) {
  VisibilityConfig v;
  v.autoHide = config.autoHide;
  v.fadeDurationMs = config.opacityDurationMs;
  v.fadeCurve = config.opacityCurve;
  v.autoHideDelayMs = config.autoHideDelayMs;
  return v;
}

RotaryInputConfig toRotaryConfig(const RoundScrollbarConfig& config) {
  RotaryInputConfig r;
  r.hapticFeedback = config.hapticFeedback;
  r.scrollMagnitude = config.scrollMagnitude;
  r.scrollMotion = MotionSpec{config.scrollAnimationDurationMs, config.scrollAnimationCurve};
  r.pageMotion = MotionSpec{config.pageTransitionDurationMs, config.pageTransitionCurve};
  return r;
}

std::string serializeScrollbarConfig(const RoundScrollbarConfig& config) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("padding", static_cast<double>(config.padding), alloc);
  doc.AddMember("strokeWidth", static_cast<double>(config.strokeWidth), alloc);

  doc.AddMember("autoHide", config.autoHide, alloc);
  addMotion(doc, "opacityAnimation", config.opacityDurationMs, config.opacityCurve);
  doc.AddMember("autoHideDelayMs", config.autoHideDelayMs, alloc);

  if (config.hasTrackColor) addColor(doc, "trackColor", config.trackColor);
  if (config.hasThumbColor) addColor(doc, "thumbColor", config.thumbColor);

  doc.AddMember("hapticFeedback", config.hapticFeedback, alloc);
  addMotion(doc, "pageTransition", config.pageTransitionDurationMs, config.pageTransitionCurve);
  addMotion(doc, "scrollAnimation", config.scrollAnimationDurationMs, config.scrollAnimationCurve);
  doc.AddMember("scrollMagnitude", config.scrollMagnitude, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeScrollbarConfig(const std::string& json, RoundScrollbarConfig& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  RoundScrollbarConfig c = out;

  // Layout
  if (!readFloat(doc, "padding", c.padding)) return false;
  if (!readFloat(doc, "strokeWidth", c.strokeWidth)) return false;

  // Visibility
  if (!readBool(doc, "autoHide", c.autoHide)) return false;
  if (!readMotion(doc, "opacityAnimation", c.opacityDurationMs, c.opacityCurve)) return false;
  if (!readNumber(doc, "autoHideDelayMs", c.autoHideDelayMs)) return false;

  // Colors
  if (!readColor(doc, "trackColor", c.hasTrackColor, c.trackColor)) return false;
  if (!readColor(doc, "thumbColor", c.hasThumbColor, c.thumbColor)) return false;

  // Rotary
  if (!readBool(doc, "hapticFeedback", c.hapticFeedback)) return false;
  if (!readMotion(doc, "pageTransition", c.pageTransitionDurationMs, c.pageTransitionCurve))
    return false;
  if (!readMotion(doc, "scrollAnimation", c.scrollAnimationDurationMs, c.scrollAnimationCurve))
    return false;
  if (!readNumber(doc, "scrollMagnitude", c.scrollMagnitude)) return false;

  out = c;
  return true;
}

} // namespace rs
