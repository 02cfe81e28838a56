/*
================================================================================
Exports: Sizing Result JSON Serializer (Implementation)
FILE: cpp/engine/exports/result_json.cpp
================================================================================
*/

#include "engine/exports/result_json.hpp"

#include <cmath>
#include <cstddef>
#include <fstream>
#include <sstream>

namespace skid {

static std::string json_escape(const std::string& s) {
  std::ostringstream o;
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          const char* hex = "0123456789ABCDEF";
          const unsigned char u = static_cast<unsigned char>(c);
          o << "\\u00" << hex[u >> 4] << hex[u & 0x0F];
        } else {
          o << c;
        }
    }
  }
  o << '"';
  return o.str();
}

struct J {
  std::ostringstream out;
  int indent = 2;
  int precision = 6;
  int level = 0;

  void nl() {
    out << "\n" << std::string(static_cast<std::size_t>(level * indent), ' ');
  }

  void obj_begin() { out << "{"; level++; }
  void obj_end()   { level--; nl(); out << "}"; }

  void key(const std::string& k) {
    out << json_escape(k) << ": ";
  }

  void comma() { out << ","; }

  void str(const std::string& v) { out << json_escape(v); }
  void b(bool v) { out << (v ? "true" : "false"); }
  void n_null() { out << "null"; }

  void num(double v) {
    if (!std::isfinite(v)) { n_null(); return; }
    out.setf(std::ios::fixed);
    out.precision(precision);
    out << v;
  }

  // "key": value, with a leading newline; `last` suppresses the comma.
  void field(const std::string& k, double v, bool last = false) {
    nl(); key(k); num(v);
    if (!last) comma();
  }

  void dims(const Dimensions& d) {
    out << "[";
    num(d[0]); out << ", ";
    num(d[1]); out << ", ";
    num(d[2]);
    out << "]";
  }
};

static void emit_main_engine(J& j, const MainEngineResult& m) {
  j.obj_begin();
  j.field("input_power", m.input_power_kW);
  j.field("main_loss_power", m.main_loss_power_kW);
  j.field("main_output_power", m.main_output_power_kW);
  j.field("total_power_generation", m.total_power_generation_kW, true);
  j.obj_end();
}

static void emit_utility(J& j, const UtilityResult& u) {
  j.obj_begin();
  j.field("lubrication_oil_amount", u.lubrication_oil_amount);
  j.field("oil_cooler_circulation_water", u.oil_cooler_circulation_water_t_h);
  j.field("oil_pump_power", u.oil_pump_power_kW);
  j.nl(); j.key("oil_pump_clamped"); j.b(u.oil_pump_clamped); j.comma();
  j.field("utility_self_consumption", u.utility_self_consumption_kW);
  j.field("total_power_generation", u.total_power_generation_kW);
  j.field("net_power_output", u.net_power_output_kW);
  j.field("air_demand_nm3_h", u.air_demand_Nm3_h);
  j.field("nitrogen_demand_nm3_h", u.nitrogen_demand_Nm3_h);

  j.nl(); j.key("component_powers"); j.obj_begin();
  j.field("lubrication_pump", u.components.lubrication_pump_kW);
  j.field("lubrication_heater", u.components.lubrication_heater_kW);
  j.field("cooling_loop_pump", u.components.cooling_loop_pump_kW);
  j.field("circulation_pump", u.components.circulation_pump_kW);
  j.field("control_cabinet", u.components.control_cabinet_kW, true);
  j.obj_end();

  j.obj_end();
}

static void emit_economics(J& j, const EconomicResult& e) {
  j.obj_begin();
  j.field("annual_power_generation", e.annual_power_generation);
  j.field("annual_power_income", e.annual_power_income);
  j.field("annual_coal_savings", e.annual_coal_savings);
  j.field("annual_coal_cost_savings", e.annual_coal_cost_savings);
  j.field("annual_co2_reduction", e.annual_co2_reduction, true);
  j.obj_end();
}

static void emit_unit_selection(J& j, const UnitSelectionResult& s) {
  j.obj_begin();
  j.field("unit_selection", s.unit_selection_kW);
  j.nl(); j.key("unit_dimensions"); j.dims(s.unit_dimensions_m); j.comma();
  j.field("unit_weight", s.unit_weight_t);
  j.field("module_weight", s.module_weight_t);
  j.field("lookup_power", s.lookup_power_kW);
  j.nl(); j.key("frame_source"); j.str(to_string(s.frame_source));
  j.obj_end();
}

static void emit_summary(J& j, const CalculationSummary& c) {
  j.obj_begin();
  j.field("input_main_power", c.input_main_power_kW);
  j.field("final_net_power", c.final_net_power_kW);
  j.field("annual_income", c.annual_income);
  j.field("selected_unit_power", c.selected_unit_power_kW, true);
  j.obj_end();
}

static void emit_report(J& j, const SelectionReport& r) {
  j.obj_begin();
  j.nl(); j.key("model"); j.str(r.model); j.comma();
  j.field("installed_power", r.installed_power_kW);
  j.nl(); j.key("unit_dimensions"); j.dims(r.unit_dimensions_m); j.comma();
  j.field("unit_weight", r.unit_weight_t);
  j.field("module_weight", r.module_weight_t);
  j.field("net_power", r.net_power_kW);
  j.field("annual_income", r.annual_income);
  j.field("investment_cost", r.investment_cost);
  j.field("payback_years", r.payback_years);
  j.nl(); j.key("dual_stage"); j.b(r.layout.dual_stage); j.comma();
  j.field("first_stage_power", r.layout.first_stage_kW);
  j.field("second_stage_power", r.layout.second_stage_kW, true);
  j.obj_end();
}

static std::string emit(const CombinedResult& r, const SelectionReport* report, const JsonWriteOptions& opt) {
  J j;
  j.indent = opt.indent_spaces < 0 ? 0 : opt.indent_spaces;
  j.precision = opt.precision < 0 ? 0 : opt.precision;

  j.obj_begin();
  j.nl(); j.key("main_engine"); emit_main_engine(j, r.main_engine); j.comma();
  j.nl(); j.key("utility_power"); emit_utility(j, r.utility_power); j.comma();
  j.nl(); j.key("economic_analysis"); emit_economics(j, r.economic_analysis); j.comma();
  j.nl(); j.key("unit_selection"); emit_unit_selection(j, r.unit_selection); j.comma();
  j.nl(); j.key("calculation_summary"); emit_summary(j, r.calculation_summary);
  if (report) {
    j.comma();
    j.nl(); j.key("selection_report"); emit_report(j, *report);
  }
  j.obj_end();
  return j.out.str();
}

std::string result_to_json(const CombinedResult& r, const JsonWriteOptions& opt) {
  return emit(r, nullptr, opt);
}

std::string result_to_json(const CombinedResult& r,
                           const SelectionReport& report,
                           const JsonWriteOptions& opt) {
  return emit(r, &report, opt);
}

bool write_result_json_file(const CombinedResult& r,
                            const SelectionReport& report,
                            const std::string& file_path,
                            const JsonWriteOptions& opt) {
  std::ofstream ofs(file_path, std::ios::binary | std::ios::trunc);
  if (!ofs.is_open()) return false;
  ofs << result_to_json(r, report, opt) << "\n";
  return ofs.good();
}

} // namespace skid
