#pragma once

#include "core/config.hpp"
#include "daemon/process_controller.hpp"
#include "daemon/resource_sampler.hpp"
#include "daemon/supervisor.hpp"

/// Translate the YAML configuration into component options

ControllerOptions controller_options(const Config& config);
SamplerOptions sampler_options(const AppConfig& config);
SupervisorOptions supervisor_options(const AppConfig& config);

/// <server_dir>/<state_name>.sock
std::string daemon_socket_path(const Config& config);
