#include "utilities/metrics.h"
#include <map>
#include <set>
#include <sstream>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

static std::string makeKey(const std::string &name,
                           const std::map<std::string, std::string> &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

static std::pair<std::string, std::string> splitKey(const std::string &key) {
  auto name_end = key.find('{');
  if (name_end == std::string::npos)
    return {key, ""};
  return {key.substr(0, name_end), key.substr(name_end)};
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(
    const std::string &name, double value,
    const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  h.sum += value;
  h.count += 1;
}

double MetricsRegistry::counterValue(
    const std::string &name,
    const std::map<std::string, std::string> &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricsRegistry::gaugeValue(
    const std::string &name,
    const std::map<std::string, std::string> &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = gauges_.find(makeKey(name, labels));
  return it == gauges_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(
    const std::map<std::string, std::string> &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << kv.second << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::ostringstream oss;
  // Emit one TYPE line per metric family, series sorted for stable output.
  auto emit = [&oss](const std::map<std::string, double> &series,
                     const char *type) {
    std::set<std::string> typed;
    for (const auto &kv : series) {
      auto [name, labels] = splitKey(kv.first);
      if (typed.insert(name).second)
        oss << "# TYPE " << name << ' ' << type << '\n';
      oss << name << labels << ' ' << kv.second << '\n';
    }
  };
  emit(std::map<std::string, double>(gauges_.begin(), gauges_.end()), "gauge");
  emit(std::map<std::string, double>(counters_.begin(), counters_.end()),
       "counter");

  std::map<std::string, Histogram> hists(histograms_.begin(),
                                         histograms_.end());
  std::set<std::string> typed;
  for (const auto &kv : hists) {
    auto [name, labels] = splitKey(kv.first);
    if (typed.insert(name).second)
      oss << "# TYPE " << name << " summary\n";
    oss << name << "_sum" << labels << ' ' << kv.second.sum << '\n';
    oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}
