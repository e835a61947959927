#pragma once

#include "engine/Errors.hpp"
#include "engine/Job.hpp"
#include "engine/Orchestrator.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ft::rpc
{

std::string serialize_job(engine::JobRecord const &job);
std::string serialize_job_list(std::vector<engine::JobRecord> const &jobs);
// Push-channel frame: {"type":"update","torrents":[...]}
std::string serialize_update(std::vector<engine::JobRecord> const &jobs);
std::string serialize_files(std::vector<engine::FileEntry> const &files);

std::string serialize_submit(std::string const &id, std::string_view message);
std::string serialize_action(std::string_view message);
std::string serialize_best_effort(engine::BestEffort const &result,
                                  std::string_view message);
std::string serialize_health(engine::HealthReport const &report);
std::string serialize_info();

std::string serialize_error(std::string_view message,
                            std::optional<std::string_view> remediation =
                                std::nullopt);

} // namespace ft::rpc
