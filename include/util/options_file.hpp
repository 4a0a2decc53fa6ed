// util/options_file.hpp
#pragma once
#include <type_traits>
#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <glm/vec3.hpp>

namespace nerfgrid::util {

// --------- detection idiom for optional options members ----------
template<typename T, typename = void> struct has_bound : std::false_type{};
template<typename T> struct has_bound<T, std::void_t<decltype(std::declval<T>().bound)>> : std::true_type{};

template<typename T, typename = void> struct has_gridSize : std::false_type{};
template<typename T> struct has_gridSize<T, std::void_t<decltype(std::declval<T>().gridSize)>> : std::true_type{};

template<typename T, typename = void> struct has_densityScale : std::false_type{};
template<typename T> struct has_densityScale<T, std::void_t<decltype(std::declval<T>().densityScale)>> : std::true_type{};

template<typename T, typename = void> struct has_minNear : std::false_type{};
template<typename T> struct has_minNear<T, std::void_t<decltype(std::declval<T>().minNear)>> : std::true_type{};

template<typename T, typename = void> struct has_densityThreshold : std::false_type{};
template<typename T> struct has_densityThreshold<T, std::void_t<decltype(std::declval<T>().densityThreshold)>> : std::true_type{};

template<typename T, typename = void> struct has_backgroundRadius : std::false_type{};
template<typename T> struct has_backgroundRadius<T, std::void_t<decltype(std::declval<T>().backgroundRadius)>> : std::true_type{};

template<typename T, typename = void> struct has_accelerated : std::false_type{};
template<typename T> struct has_accelerated<T, std::void_t<decltype(std::declval<T>().accelerated)>> : std::true_type{};

template<typename T, typename = void> struct has_seed : std::false_type{};
template<typename T> struct has_seed<T, std::void_t<decltype(std::declval<T>().seed)>> : std::true_type{};

// --------- small helpers ----------
inline std::string vec3_to_csv(const glm::vec3& v) {
  std::ostringstream ss; ss << v.x << "," << v.y << "," << v.z; return ss.str();
}
inline glm::vec3 csv_to_vec3(const std::string& s) {
  glm::vec3 v{0}; char c;
  std::istringstream ss(s);
  if (!(ss >> v.x)) return v;
  if (ss >> c && c == ',') ss >> v.y;
  if (ss >> c && c == ',') ss >> v.z;
  return v;
}

inline std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t\r");
  return s.substr(b, e - b + 1);
}

// std::sto* with the key in the error message
template<typename V>
inline V parseValue(const std::string& key, const std::string& v) {
  try {
    std::size_t used = 0;
    V out{};
    if constexpr (std::is_same_v<V, bool>) {
      if (v == "1" || v == "true")  return true;
      if (v == "0" || v == "false") return false;
      throw std::invalid_argument(v);
    } else if constexpr (std::is_floating_point_v<V>) {
      out = static_cast<V>(std::stod(v, &used));
    } else {
      if (!v.empty() && v[0] == '-') throw std::invalid_argument(v);
      out = static_cast<V>(std::stoull(v, &used));
    }
    if (used != v.size()) throw std::invalid_argument(v);
    return out;
  } catch (const std::logic_error&) {
    throw std::invalid_argument("Bad value for option \"" + key + "\": \"" + v + "\"");
  }
}

// --------- main API ----------
template<typename OptionsT>
inline void SaveOptionsToFile(const OptionsT& s, const std::string& path) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) throw std::runtime_error("Failed to open options file for write: " + path);
  out << "# nerfgrid renderer options\n";
  if constexpr (has_bound<OptionsT>::value)            out << "bound=" << s.bound << "\n";
  if constexpr (has_gridSize<OptionsT>::value)         out << "gridSize=" << s.gridSize << "\n";
  if constexpr (has_densityScale<OptionsT>::value)     out << "densityScale=" << s.densityScale << "\n";
  if constexpr (has_minNear<OptionsT>::value)          out << "minNear=" << s.minNear << "\n";
  if constexpr (has_densityThreshold<OptionsT>::value) out << "densityThreshold=" << s.densityThreshold << "\n";
  if constexpr (has_backgroundRadius<OptionsT>::value) out << "backgroundRadius=" << s.backgroundRadius << "\n";
  if constexpr (has_accelerated<OptionsT>::value)      out << "accelerated=" << (s.accelerated ? 1 : 0) << "\n";
  if constexpr (has_seed<OptionsT>::value)             out << "seed=" << s.seed << "\n";
}

// Returns false when the file cannot be opened; unknown keys are ignored,
// malformed values throw std::invalid_argument.
template<typename OptionsT>
inline bool LoadOptionsFromFile(OptionsT& s, const std::string& path) {
  std::ifstream in(path);
  if (!in) return false;

  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    std::string k = trim(line.substr(0, eq));
    std::string v = trim(line.substr(eq + 1));

    if constexpr (has_bound<OptionsT>::value)            { if (k=="bound")            { s.bound = parseValue<decltype(s.bound)>(k, v);                       continue; } }
    if constexpr (has_gridSize<OptionsT>::value)         { if (k=="gridSize")         { s.gridSize = parseValue<decltype(s.gridSize)>(k, v);                 continue; } }
    if constexpr (has_densityScale<OptionsT>::value)     { if (k=="densityScale")     { s.densityScale = parseValue<decltype(s.densityScale)>(k, v);         continue; } }
    if constexpr (has_minNear<OptionsT>::value)          { if (k=="minNear")          { s.minNear = parseValue<decltype(s.minNear)>(k, v);                   continue; } }
    if constexpr (has_densityThreshold<OptionsT>::value) { if (k=="densityThreshold") { s.densityThreshold = parseValue<decltype(s.densityThreshold)>(k, v); continue; } }
    if constexpr (has_backgroundRadius<OptionsT>::value) { if (k=="backgroundRadius") { s.backgroundRadius = parseValue<decltype(s.backgroundRadius)>(k, v); continue; } }
    if constexpr (has_accelerated<OptionsT>::value)      { if (k=="accelerated")      { s.accelerated = parseValue<bool>(k, v);                               continue; } }
    if constexpr (has_seed<OptionsT>::value)             { if (k=="seed")             { s.seed = parseValue<decltype(s.seed)>(k, v);                         continue; } }
  }
  return true;
}

} // namespace nerfgrid::util
