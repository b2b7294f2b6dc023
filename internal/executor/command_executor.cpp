#include "command_executor.hpp"

#include <google/protobuf/util/json_util.h>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <vector>

#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

extern char** environ;

namespace release::executor {

using namespace release::coordinator::v1;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

std::string ConfigJson(const ServiceDeclaration& service) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(service.config(), &json);
  if (!status.ok()) {
    throw util::DeploymentError("service '" + service.name() + "': cannot encode config: " + std::string(status.message()));
  }
  return json;
}

/*
  The environment is assembled before fork(): the coordinator is
  multi-threaded, so the child only calls async-signal-safe functions.
*/
std::vector<std::string> BuildEnvironment(const ServiceDeclaration& service, Environment environment, const std::string* reason) {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    if (std::strncmp(*entry, "RELEASE_", 8) != 0) {
      env.emplace_back(*entry);
    }
  }
  env.push_back("RELEASE_SERVICE=" + service.name());
  env.push_back("RELEASE_VERSION=" + service.version());
  env.push_back("RELEASE_ENVIRONMENT=" + model::EnvironmentName(environment));
  env.push_back("RELEASE_CONFIG=" + ConfigJson(service));
  if (reason) {
    env.push_back("RELEASE_ROLLBACK_REASON=" + *reason);
  }
  return env;
}

// Returns the exit code (128 + signal for signalled children).
int RunCommand(const std::string& command, const std::filesystem::path& working_dir, const std::vector<std::string>& env,
               std::optional<std::chrono::milliseconds> timeout, const std::string& service) {
  std::vector<char*> envp;
  envp.reserve(env.size() + 1);
  for (const auto& entry : env) {
    envp.push_back(const_cast<char*>(entry.c_str()));
  }
  envp.push_back(nullptr);

  const std::string cwd = working_dir.string();
  char              sh[]   = "sh";
  char              flag[] = "-c";
  char*             argv[] = {sh, flag, const_cast<char*>(command.c_str()), nullptr};

  pid_t pid = ::fork();
  if (pid < 0) {
    throw util::DeploymentError("service '" + service + "': fork failed: " + std::strerror(errno));
  }
  if (pid == 0) {
    ::setpgid(0, 0);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      _exit(126);
    }
    ::execve("/bin/sh", argv, envp.data());
    _exit(127);
  }
  // Both sides set the group so a timeout kill never races the child's own setpgid.
  ::setpgid(pid, pid);

  const auto started_at = std::chrono::steady_clock::now();
  int        st         = 0;
  for (;;) {
    pid_t rc = ::waitpid(pid, &st, WNOHANG);
    if (rc == pid) {
      break;
    }
    if (rc < 0 && errno != EINTR) {
      throw util::DeploymentError("service '" + service + "': waitpid failed: " + std::strerror(errno));
    }
    if (timeout && std::chrono::steady_clock::now() - started_at >= *timeout) {
      ::kill(-pid, SIGKILL);
      ::waitpid(pid, &st, 0);
      throw util::DeploymentError("service '" + service + "': command timed out after " + std::to_string(timeout->count()) + "ms");
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  return WIFEXITED(st) ? WEXITSTATUS(st) : 128 + WTERMSIG(st);
}

} // namespace

CommandDeploymentExecutor::CommandDeploymentExecutor(std::string deploy_command, std::string rollback_command, std::filesystem::path working_dir)
    : deploy_command_(std::move(deploy_command)), rollback_command_(std::move(rollback_command)), working_dir_(std::move(working_dir)) {
}

ServiceResult CommandDeploymentExecutor::Deploy(const ServiceDeclaration& service, Environment environment,
                                                std::optional<std::chrono::milliseconds> timeout) {
  if (deploy_command_.empty()) {
    throw util::DeploymentError("service '" + service.name() + "': no deploy command configured");
  }

  const auto env = BuildEnvironment(service, environment, nullptr);
  const int  rc  = RunCommand(deploy_command_, working_dir_, env, timeout, service.name());

  ServiceResult result;
  result.set_service(service.name());
  result.set_version(service.version());
  result.set_deployment_id("deploy-" + util::ToString(util::GenerateUUID()));
  if (rc == 0) {
    result.set_status(SERVICE_STATUS_SUCCESS);
    result.set_health_status(HEALTH_STATUS_HEALTHY);
  } else {
    result.set_status(SERVICE_STATUS_FAILED);
    result.set_health_status(HEALTH_STATUS_UNHEALTHY);
    result.set_message("deploy command exited with code " + std::to_string(rc));
  }
  return result;
}

ServiceResult CommandDeploymentExecutor::Rollback(const ServiceDeclaration& service, Environment environment, const std::string& reason) {
  if (rollback_command_.empty()) {
    throw util::DeploymentError("service '" + service.name() + "': no rollback command configured");
  }

  const auto env = BuildEnvironment(service, environment, &reason);
  const int  rc  = RunCommand(rollback_command_, working_dir_, env, std::nullopt, service.name());

  ServiceResult result;
  result.set_service(service.name());
  result.set_version(service.version());
  result.set_deployment_id("rollback-" + util::ToString(util::GenerateUUID()));
  if (rc == 0) {
    result.set_status(SERVICE_STATUS_ROLLED_BACK);
    result.set_health_status(HEALTH_STATUS_HEALTHY);
  } else {
    RELEASE_LOG_WARN("Rollback command failed", {observability::StringField("service", service.name()), observability::IntField("exit_code", rc)});
    result.set_status(SERVICE_STATUS_FAILED);
    result.set_health_status(HEALTH_STATUS_UNHEALTHY);
    result.set_message("rollback command exited with code " + std::to_string(rc));
  }
  return result;
}

} // namespace release::executor
