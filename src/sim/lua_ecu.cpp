// src/sim/lua_ecu.cpp
#include "sim/lua_ecu.hpp"
#include "plant/drive_train.hpp"
#include "plant/sim_errors.hpp"
#include "utils/logging.hpp"

namespace sim {

LuaEcu::LuaEcu(const std::string& lua_script_path)
    : script_path_(lua_script_path) {
    L_ = luaL_newstate();
    if (!L_) {
        throw plant::ControllerError("cannot create Lua state");
    }

    luaL_openlibs(L_);

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        const std::string err = lua_tostring(L_, -1);
        lua_close(L_);
        L_ = nullptr;
        throw plant::ControllerError("failed to load script: " + err);
    }

    lua_getglobal(L_, "ecu_command");
    const bool has_command = lua_isfunction(L_, -1);
    lua_pop(L_, 1);
    if (!has_command) {
        lua_close(L_);
        L_ = nullptr;
        throw plant::ControllerError("script '" + lua_script_path + "' defines no ecu_command()");
    }

    LOG_INFO("[Lua] Loaded ECU script %s", lua_script_path.c_str());
}

LuaEcu::~LuaEcu() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

void LuaEcu::bind(const plant::DriveTrain& drive_train) {
    converter_names_.clear();
    for (std::size_t i = 0; i < drive_train.converter_count(); ++i) {
        converter_names_.push_back(drive_train.converter(i).name());
    }

    // Call optional ecu_init(converter_names) if present
    lua_getglobal(L_, "ecu_init");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        return;
    }

    lua_newtable(L_);
    for (std::size_t i = 0; i < converter_names_.size(); ++i) {
        lua_pushstring(L_, converter_names_[i].c_str());
        lua_rawseti(L_, -2, static_cast<int>(i + 1));
    }

    if (lua_pcall(L_, 1, 0, 0) != LUA_OK) {
        const std::string err = lua_tostring(L_, -1);
        lua_pop(L_, 1);
        throw plant::ControllerError("ecu_init failed: " + err);
    }
    LOG_DEBUG("[Lua] ecu_init called with %zu converters", converter_names_.size());
}

void LuaEcu::push_state_table_(const plant::MeasuredState& s) {
    lua_newtable(L_);

    auto set_num = [&](const char* k, double v) {
        lua_pushstring(L_, k);
        lua_pushnumber(L_, v);
        lua_settable(L_, -3);
    };

    set_num("step", static_cast<double>(s.step));
    set_num("t_s", s.time_s);
    set_num("v_mps", s.velocity_mps);
    set_num("a_mps2", s.acceleration_mps2);
    set_num("x_m", s.position_m);
    set_num("wheel_speed_radps", s.wheel_speed_radps);

    lua_pushstring(L_, "source_fractions");
    lua_newtable(L_);
    for (std::size_t i = 0; i < s.source_fractions.size(); ++i) {
        lua_pushnumber(L_, s.source_fractions[i]);
        lua_rawseti(L_, -2, static_cast<int>(i + 1));
    }
    lua_settable(L_, -3);
}

void LuaEcu::read_converter_cmds_(int idx, plant::CommandSet& out_cmd) {
    lua_getfield(L_, idx, "converters");
    if (!lua_istable(L_, -1)) {
        lua_pop(L_, 1);
        return;
    }

    for (std::size_t i = 0; i < converter_names_.size(); ++i) {
        lua_getfield(L_, -1, converter_names_[i].c_str());
        if (lua_istable(L_, -1)) {
            plant::ConverterCommand& c = out_cmd.converters[i];

            lua_getfield(L_, -1, "gear");
            if (lua_isnumber(L_, -1)) c.gear = static_cast<int>(lua_tointeger(L_, -1));
            lua_pop(L_, 1);

            lua_getfield(L_, -1, "limit_scale");
            if (lua_isnumber(L_, -1)) c.limit_scale = lua_tonumber(L_, -1);
            lua_pop(L_, 1);
        }
        lua_pop(L_, 1);
    }
    lua_pop(L_, 1);
}

void LuaEcu::read_cmd_table_(int idx, plant::CommandSet& out_cmd) {
    if (!lua_istable(L_, idx)) {
        throw plant::ControllerError("ecu_command() must return a table");
    }
    idx = lua_absindex(L_, idx);

    auto get_num = [&](const char* k, double def) -> double {
        lua_getfield(L_, idx, k);
        double v = def;
        if (lua_isnumber(L_, -1)) v = lua_tonumber(L_, -1);
        lua_pop(L_, 1);
        return v;
    };

    out_cmd.wheel_torque_nm = get_num("wheel_torque_nm", 0.0);
    out_cmd.brake_torque_nm = get_num("brake_torque_nm", 0.0);
    read_converter_cmds_(idx, out_cmd);
}

plant::CommandSet LuaEcu::compute(double control_signal, const plant::MeasuredState& state) {
    plant::CommandSet cmd;
    cmd.converters.assign(converter_names_.size(), plant::ConverterCommand{});

    // Call ecu_command(t, signal, state)
    lua_getglobal(L_, "ecu_command");
    lua_pushnumber(L_, state.time_s);
    lua_pushnumber(L_, control_signal);
    push_state_table_(state);

    // returns 1 value: cmd table
    if (lua_pcall(L_, 3, 1, 0) != LUA_OK) {
        const std::string err = lua_tostring(L_, -1);
        lua_pop(L_, 1);
        throw plant::ControllerError("ecu_command failed at step " + std::to_string(state.step) + ": " + err);
    }

    try {
        read_cmd_table_(-1, cmd);
    } catch (const plant::ControllerError&) {
        lua_pop(L_, 1);
        throw;
    }
    lua_pop(L_, 1);

    LOG_TRACE("[Lua] t=%.3f signal=%.3f -> T_wheel=%.1f Nm, T_brake=%.1f Nm",
              state.time_s, control_signal, cmd.wheel_torque_nm, cmd.brake_torque_nm);
    return cmd;
}

} // namespace sim
