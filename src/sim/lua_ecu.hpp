// src/sim/lua_ecu.hpp
#pragma once

#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "plant/ecu.hpp"

namespace sim {

/**
 * LuaEcu - controller strategy written in Lua
 *
 * The script defines
 *
 *   function ecu_command(t_s, signal, state)
 *       return { wheel_torque_nm = ..., brake_torque_nm = ...,
 *                converters = { gearbox = { gear = 2 }, motor = { limit_scale = 0.8 } } }
 *   end
 *
 * and optionally ecu_init(converter_names) called once at bind time.
 * `state` carries step, t_s, v_mps, a_mps2, x_m, wheel_speed_radps and a
 * 1-based `source_fractions` array. Missing fields keep their defaults.
 *
 * Script failures surface as plant::ControllerError.
 */
class LuaEcu : public plant::Ecu {
public:
    explicit LuaEcu(const std::string& lua_script_path);
    ~LuaEcu() override;

    LuaEcu(const LuaEcu&) = delete;
    LuaEcu& operator=(const LuaEcu&) = delete;

    std::string name() const override { return "LuaEcu(" + script_path_ + ")"; }
    void bind(const plant::DriveTrain& drive_train) override;
    plant::CommandSet compute(double control_signal, const plant::MeasuredState& state) override;

private:
    void push_state_table_(const plant::MeasuredState& s);
    void read_cmd_table_(int idx, plant::CommandSet& out_cmd);
    void read_converter_cmds_(int idx, plant::CommandSet& out_cmd);

    lua_State* L_{nullptr};
    std::string script_path_;
    std::vector<std::string> converter_names_;
};

} // namespace sim
